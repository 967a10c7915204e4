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
#include <hireledger/protocol/base.hpp>

namespace hireledger { namespace protocol {

   /**
    * @brief The client deposits funds into the escrow of a posted job
    * @ingroup operations
    *
    * A later bid acceptance draws the bid amount from the deposit and refunds the excess.
    */
   struct escrow_fund_operation : public base_operation
   {
      owner_type  client;
      job_id_type job;
      share_type  amount;

      owner_type authority()const { return client; }
      void       validate()const;
   };

   /**
    * @brief The client pays part of the escrow to the assigned agent ahead of completion
    * @ingroup operations
    */
   struct escrow_release_operation : public base_operation
   {
      owner_type  client;
      job_id_type job;
      share_type  amount;

      owner_type authority()const { return client; }
      void       validate()const;
   };

   /**
    * @brief Virtual op recording that funds were locked for a job
    * @ingroup operations
    */
   struct escrow_locked_operation : public base_virtual_operation
   {
      escrow_locked_operation() = default;
      escrow_locked_operation( job_id_type j, escrow_id_type e, const owner_type& c, share_type a )
      : job(j), escrow(e), client(c), amount(a) {}

      job_id_type    job;
      escrow_id_type escrow;
      owner_type     client;
      share_type     amount;

      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    * @brief Virtual op recording a payment from escrow to the agent
    * @ingroup operations
    */
   struct escrow_released_operation : public base_virtual_operation
   {
      escrow_released_operation() = default;
      escrow_released_operation( job_id_type j, escrow_id_type e, const owner_type& a, share_type amt )
      : job(j), escrow(e), agent(a), amount(amt) {}

      job_id_type    job;
      escrow_id_type escrow;
      owner_type     agent;
      share_type     amount;

      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

   /**
    * @brief Virtual op recording a refund from escrow to the client
    * @ingroup operations
    */
   struct escrow_refunded_operation : public base_virtual_operation
   {
      escrow_refunded_operation() = default;
      escrow_refunded_operation( job_id_type j, escrow_id_type e, const owner_type& c, share_type a )
      : job(j), escrow(e), client(c), amount(a) {}

      job_id_type    job;
      escrow_id_type escrow;
      owner_type     client;
      share_type     amount;

      void validate()const { FC_ASSERT( !"virtual operation" ); }
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::escrow_fund_operation, (client)(job)(amount) )
FC_REFLECT( hireledger::protocol::escrow_release_operation, (client)(job)(amount) )
FC_REFLECT( hireledger::protocol::escrow_locked_operation, (job)(escrow)(client)(amount) )
FC_REFLECT( hireledger::protocol::escrow_released_operation, (job)(escrow)(agent)(amount) )
FC_REFLECT( hireledger::protocol::escrow_refunded_operation, (job)(escrow)(client)(amount) )
