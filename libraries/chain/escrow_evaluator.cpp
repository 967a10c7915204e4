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
#include <hireledger/chain/escrow_evaluator.hpp>

#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/escrow_object.hpp>

namespace hireledger { namespace chain {

void_result escrow_fund_evaluator::do_evaluate( const escrow_fund_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_job_client( *job, o.client );

   const escrow_object& escrow = d.get_escrow( *job );
   HIRELEDGER_ASSERT( escrow.status == escrow_status::unfunded, already_funded_exception,
                      "Escrow of job ${job} is already funded", ("job", o.job)("status", escrow.status) );
   HIRELEDGER_ASSERT( job->status == job_status::posted, invalid_state_exception,
                      "Only the escrow of a posted job can be funded, job ${job} is ${status}",
                      ("job", o.job)("status", job->status) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_fund_evaluator::do_apply( const escrow_fund_operation& o )
{ try {
   database& d = db();
   d.escrow_lock( *job, o.amount );
   d.modify( *job, [&d]( job_object& j ) {
      j.updated_at = d.head_time();
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_release_evaluator::do_evaluate( const escrow_release_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_job_client( *job, o.client );

   HIRELEDGER_ASSERT( job->agent.valid(), no_agent_exception,
                      "Job ${job} has no assigned agent", ("job", o.job) );
   HIRELEDGER_ASSERT( job->status == job_status::in_progress, invalid_state_exception,
                      "Funds can only be released while job ${job} is in progress", ("job", o.job)("status", job->status) );

   const escrow_object& escrow = d.get_escrow( *job );
   HIRELEDGER_ASSERT( o.amount <= escrow.remaining(), insufficient_escrow_exception,
                      "Escrow of job ${job} holds ${available}, cannot release ${amount}",
                      ("job", o.job)("available", escrow.remaining())("amount", o.amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result escrow_release_evaluator::do_apply( const escrow_release_operation& o )
{ try {
   database& d = db();
   d.escrow_release( *job, o.amount );
   d.modify( *job, [&d]( job_object& j ) {
      j.updated_at = d.head_time();
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
