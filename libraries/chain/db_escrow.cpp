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
#include <hireledger/chain/database.hpp>

#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

namespace {

   /// status of an escrow after a disbursement
   void settle( escrow_object& e )
   {
      if( e.remaining() == 0 )
         e.status = e.released > 0 ? escrow_status::released : escrow_status::refunded;
      else
         e.status = escrow_status::partially_released;
   }

}

void database::escrow_lock( const job_object& job, share_type amount )
{ try {
   const escrow_object& escrow = get_escrow( job );
   HIRELEDGER_ASSERT( escrow.status == escrow_status::unfunded, already_funded_exception,
                      "Escrow of job ${job} is already funded", ("job", job.id)("status", escrow.status) );
   HIRELEDGER_ASSERT( amount > 0, invalid_amount_exception, "Escrow amount must be positive", ("amount", amount) );

   const auto now = head_time();
   modify( escrow, [amount, now]( escrow_object& e ) {
      e.amount    = amount;
      e.deposited += amount;
      e.status    = escrow_status::locked;
      e.locked_at = now;
   });
   push_applied_operation( escrow_locked_operation( job_id_type(job.id), escrow_id_type(escrow.id), job.client, amount ) );
   dlog( "Locked ${a} in escrow of job ${job}", ("a", amount)("job", job.id) );
} FC_CAPTURE_AND_RETHROW( (job.id)(amount) ) }

void database::escrow_assign( const job_object& job, const owner_type& agent, share_type bid_amount )
{ try {
   const escrow_object& escrow = get_escrow( job );
   if( escrow.status == escrow_status::unfunded )
   {
      escrow_lock( job, bid_amount );
      modify( escrow, [&agent]( escrow_object& e ) {
         e.agent = agent;
      });
      return;
   }

   HIRELEDGER_ASSERT( escrow.status == escrow_status::locked, invalid_state_exception,
                      "Escrow of job ${job} can no longer be assigned", ("job", job.id)("status", escrow.status) );
   const share_type available = escrow.remaining();
   HIRELEDGER_ASSERT( available >= bid_amount, insufficient_escrow_exception,
                      "Escrow of job ${job} holds ${available}, the accepted bid needs ${bid}",
                      ("job", job.id)("available", available)("bid", bid_amount) );

   const share_type excess = available - bid_amount;
   modify( escrow, [&agent, bid_amount, excess]( escrow_object& e ) {
      e.agent    = agent;
      e.amount   = bid_amount;
      e.refunded += excess;
   });
   if( excess > 0 )
   {
      push_applied_operation( escrow_refunded_operation( job_id_type(job.id), escrow_id_type(escrow.id), job.client, excess ) );
      dlog( "Refunded excess deposit ${a} of job ${job}", ("a", excess)("job", job.id) );
   }
} FC_CAPTURE_AND_RETHROW( (job.id)(agent)(bid_amount) ) }

share_type database::escrow_release( const job_object& job, share_type amount )
{ try {
   HIRELEDGER_ASSERT( job.agent.valid(), no_agent_exception,
                      "Job ${job} has no assigned agent to release funds to", ("job", job.id) );
   FC_ASSERT( amount >= 0, "Cannot release a negative amount", ("amount", amount) );
   if( amount == 0 )
      return amount;

   const escrow_object& escrow = get_escrow( job );
   HIRELEDGER_ASSERT( amount <= escrow.remaining(), insufficient_escrow_exception,
                      "Escrow of job ${job} holds ${available}, cannot release ${amount}",
                      ("job", job.id)("available", escrow.remaining())("amount", amount) );

   const auto now = head_time();
   modify( escrow, [amount, now]( escrow_object& e ) {
      e.released   += amount;
      e.released_at = now;
      settle( e );
   });
   push_applied_operation( escrow_released_operation( job_id_type(job.id), escrow_id_type(escrow.id), *job.agent, amount ) );
   dlog( "Released ${a} from escrow of job ${job} to ${agent}", ("a", amount)("job", job.id)("agent", *job.agent) );
   return amount;
} FC_CAPTURE_AND_RETHROW( (job.id)(amount) ) }

share_type database::escrow_refund( const job_object& job, share_type amount )
{ try {
   FC_ASSERT( amount >= 0, "Cannot refund a negative amount", ("amount", amount) );
   if( amount == 0 )
      return amount;

   const escrow_object& escrow = get_escrow( job );
   HIRELEDGER_ASSERT( amount <= escrow.remaining(), insufficient_escrow_exception,
                      "Escrow of job ${job} holds ${available}, cannot refund ${amount}",
                      ("job", job.id)("available", escrow.remaining())("amount", amount) );

   modify( escrow, [amount]( escrow_object& e ) {
      e.refunded += amount;
      settle( e );
   });
   push_applied_operation( escrow_refunded_operation( job_id_type(job.id), escrow_id_type(escrow.id), job.client, amount ) );
   dlog( "Refunded ${a} from escrow of job ${job} to ${client}", ("a", amount)("job", job.id)("client", job.client) );
   return amount;
} FC_CAPTURE_AND_RETHROW( (job.id)(amount) ) }

} }
