/*
 * Copyright (c) 2015 Cryptonomex, Inc., and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once
#include <hireledger/chain/types.hpp>

namespace hireledger { namespace chain {

   class database;
   class job_object;
   class agent_object;

   /**
    * Role checks shared by the evaluators. Each throws unauthorized_exception when who does not
    * hold the role.
    *
    * The signer of a transaction has already been matched against the authority of every
    * operation, these checks decide whether that principal may act on a particular record.
    */
   void verify_job_client( const job_object& job, const owner_type& who );
   void verify_assigned_agent( const job_object& job, const owner_type& who );
   /// the client or the assigned agent
   void verify_job_party( const job_object& job, const owner_type& who );
   const agent_object& verify_registered_agent( const database& db, const owner_type& who );
   void verify_administrator( const database& db, const owner_type& who );

   /// the client, the assigned agent or an agent with a bid
   bool is_job_participant( const job_object& job, const owner_type& who );

} } // hireledger::chain
