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
#include <hireledger/chain/job_evaluator.hpp>

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

void_result job_post_evaluator::do_evaluate( const job_post_operation& o )
{ try {
   const auto& params = db().get_parameters();
   HIRELEDGER_ASSERT( o.milestones.size() <= params.max_milestones_per_job, invalid_milestones_exception,
                      "A job may have at most ${max} milestones", ("max", params.max_milestones_per_job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type job_post_evaluator::do_apply( const job_post_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();

   const escrow_id_type escrow_id( d.get_index_type<escrow_index>().get_next_id() );

   const job_object& job = d.create<job_object>( [&o, &escrow_id, now]( job_object& j ) {
      j.client      = o.client;
      j.title       = o.title;
      j.description = o.description;
      j.payment     = o.payment;
      j.category    = o.category;
      j.tags        = o.tags;
      j.deadline    = o.deadline;
      j.escrow      = escrow_id;
      j.created_at  = now;
      j.updated_at  = now;
      j.milestones.reserve( o.milestones.size() );
      for( const auto& spec : o.milestones )
      {
         milestone_info m;
         m.milestone_id       = static_cast<milestone_id_type>( j.milestones.size() );
         m.title              = spec.title;
         m.description        = spec.description;
         m.payment_percentage = spec.payment_percentage;
         m.due_date           = spec.due_date;
         j.milestones.emplace_back( std::move(m) );
      }
   });

   const escrow_object& escrow = d.create<escrow_object>( [&job]( escrow_object& e ) {
      e.job    = job_id_type( job.id );
      e.client = job.client;
   });
   FC_ASSERT( escrow.id == object_id_type( escrow_id ), "escrow id sequence mismatch" );

   dlog( "Job ${id} posted by ${client}", ("id", job.id)("client", job.client) );
   return job.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_place_evaluator::do_evaluate( const bid_place_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_registered_agent( d, o.agent );

   HIRELEDGER_ASSERT( job->status == job_status::posted, invalid_state_exception,
                      "Job ${job} is not open for bids", ("job", o.job)("status", job->status) );
   HIRELEDGER_ASSERT( !job->is_client( o.agent ), unauthorized_exception,
                      "${agent} cannot bid on a job they posted", ("agent", o.agent) );
   HIRELEDGER_ASSERT( job->find_bid( o.agent ) == nullptr, duplicate_bid_exception,
                      "${agent} already bid on job ${job}", ("agent", o.agent)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_place_evaluator::do_apply( const bid_place_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   d.modify( *job, [&o, now]( job_object& j ) {
      bid_info b;
      b.agent          = o.agent;
      b.bid_id         = static_cast<bid_id_type>( j.bids.size() );
      b.amount         = o.amount;
      b.proposal       = o.proposal;
      b.estimated_days = o.estimated_days;
      b.timestamp      = now;
      j.bids.emplace_back( std::move(b) );
      j.updated_at = now;
   });
   dlog( "${agent} bid ${amount} on job ${job}", ("agent", o.agent)("amount", o.amount)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_accept_evaluator::do_evaluate( const bid_accept_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_job_client( *job, o.client );

   HIRELEDGER_ASSERT( job->status == job_status::posted, invalid_state_exception,
                      "Job ${job} is no longer accepting bids", ("job", o.job)("status", job->status) );

   const bid_info* bid = job->find_bid( o.agent );
   HIRELEDGER_ASSERT( bid != nullptr && bid->amount == o.bid_amount, bid_not_found_exception,
                      "Job ${job} has no bid of ${amount} from ${agent}",
                      ("job", o.job)("amount", o.bid_amount)("agent", o.agent) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result bid_accept_evaluator::do_apply( const bid_accept_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();

   d.modify( *job, [&o, now]( job_object& j ) {
      j.agent               = o.agent;
      j.accepted_bid_amount = o.bid_amount;
      j.status              = job_status::in_progress;
      j.updated_at          = now;
   });

   d.escrow_assign( *job, o.agent, o.bid_amount );

   if( const agent_object* agent = d.find_agent( o.agent ) )
      d.modify( *agent, []( agent_object& a ) {
         ++a.jobs_accepted;
      });

   dlog( "Job ${job} assigned to ${agent} for ${amount}", ("job", o.job)("agent", o.agent)("amount", o.bid_amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result job_complete_evaluator::do_evaluate( const job_complete_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_assigned_agent( *job, o.agent );

   HIRELEDGER_ASSERT( job->status == job_status::in_progress, invalid_state_exception,
                      "Job ${job} is not in progress", ("job", o.job)("status", job->status) );
   HIRELEDGER_ASSERT( job->all_milestones_approved(), invalid_state_exception,
                      "Job ${job} has milestones that are not approved yet", ("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result job_complete_evaluator::do_apply( const job_complete_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();

   d.escrow_release( *job, d.get_escrow( *job ).remaining() );

   d.modify( *job, [now]( job_object& j ) {
      j.status       = job_status::completed;
      j.completed_at = now;
      j.updated_at   = now;
   });

   if( const agent_object* agent = d.find_agent( o.agent ) )
      d.modify( *agent, []( agent_object& a ) {
         ++a.jobs_completed;
      });

   dlog( "Job ${job} completed by ${agent}", ("job", o.job)("agent", o.agent) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result job_cancel_evaluator::do_evaluate( const job_cancel_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_job_client( *job, o.client );

   HIRELEDGER_ASSERT( job->status == job_status::posted, invalid_state_exception,
                      "Only a posted job can be cancelled, job ${job} is ${status}",
                      ("job", o.job)("status", job->status) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result job_cancel_evaluator::do_apply( const job_cancel_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();

   d.escrow_refund( *job, d.get_escrow( *job ).remaining() );

   d.modify( *job, [now]( job_object& j ) {
      j.status       = job_status::cancelled;
      j.completed_at = now;
      j.updated_at   = now;
   });

   dlog( "Job ${job} cancelled by ${client}", ("job", o.job)("client", o.client) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
