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
#include <hireledger/chain/dispute_evaluator.hpp>

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/protocol/amount.hpp>

namespace hireledger { namespace chain {

void_result dispute_open_evaluator::do_evaluate( const dispute_open_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );
   verify_job_party( *job, o.initiator );

   HIRELEDGER_ASSERT( job->status == job_status::in_progress, invalid_state_exception,
                      "Only a job in progress can be disputed, job ${job} is ${status}",
                      ("job", o.job)("status", job->status) );
   HIRELEDGER_ASSERT( d.find_unresolved_dispute( o.job ) == nullptr, invalid_state_exception,
                      "Job ${job} already has an open dispute", ("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type dispute_open_evaluator::do_apply( const dispute_open_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();

   const dispute_object& dispute = d.create<dispute_object>( [&o, now]( dispute_object& obj ) {
      obj.job        = o.job;
      obj.initiator  = o.initiator;
      obj.reason     = o.reason;
      obj.status     = dispute_status::open;
      obj.created_at = now;
   });

   d.modify( *job, [now]( job_object& j ) {
      j.status     = job_status::disputed;
      j.updated_at = now;
   });

   dlog( "Dispute ${id} opened on job ${job} by ${who}", ("id", dispute.id)("job", o.job)("who", o.initiator) );
   return dispute.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result dispute_respond_evaluator::do_evaluate( const dispute_respond_operation& o )
{ try {
   const database& d = db();
   dispute = &d.get_dispute( o.dispute );
   const job_object& job = d.get_job( dispute->job );

   // resolving a dispute for the client clears the job's agent
   HIRELEDGER_ASSERT( !dispute->is_resolved(), already_resolved_exception,
                      "Dispute ${id} is already resolved", ("id", o.dispute)("status", dispute->status) );
   verify_job_party( job, o.responder );
   HIRELEDGER_ASSERT( o.responder != dispute->initiator, unauthorized_exception,
                      "The initiator of dispute ${id} cannot respond to it", ("id", o.dispute) );
   HIRELEDGER_ASSERT( dispute->status == dispute_status::open, invalid_state_exception,
                      "Dispute ${id} already has a response", ("id", o.dispute) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result dispute_respond_evaluator::do_apply( const dispute_respond_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   d.modify( *dispute, [&o, now]( dispute_object& obj ) {
      obj.status       = dispute_status::responded;
      obj.response     = o.response;
      obj.responder    = o.responder;
      obj.responded_at = now;
   });
   dlog( "Dispute ${id} answered by ${who}", ("id", o.dispute)("who", o.responder) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result dispute_resolve_evaluator::do_evaluate( const dispute_resolve_operation& o )
{ try {
   const database& d = db();
   dispute = &d.get_dispute( o.dispute );
   verify_administrator( d, o.arbiter );

   HIRELEDGER_ASSERT( !dispute->is_resolved(), already_resolved_exception,
                      "Dispute ${id} is already resolved", ("id", o.dispute)("status", dispute->status) );

   job = &d.get_job( dispute->job );
   HIRELEDGER_ASSERT( job->status == job_status::disputed, invalid_state_exception,
                      "Job ${job} of dispute ${id} is not disputed", ("job", dispute->job)("id", o.dispute) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result dispute_resolve_evaluator::do_apply( const dispute_resolve_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   const share_type remaining = d.get_escrow( *job ).remaining();

   job_status outcome = job_status::completed;
   switch( o.resolution )
   {
      case dispute_status::resolved_for_client:
         d.escrow_refund( *job, remaining );
         outcome = job_status::cancelled;
         break;
      case dispute_status::resolved_for_agent:
         d.escrow_release( *job, remaining );
         break;
      case dispute_status::resolved_split:
      {
         FC_ASSERT( o.refund_percentage.valid(), "A split resolution needs a refund percentage" );
         const share_type refund = percent_of( remaining, *o.refund_percentage );
         d.escrow_refund( *job, refund );
         d.escrow_release( *job, remaining - refund );
         break;
      }
      default:
         FC_THROW_EXCEPTION( invalid_argument_exception, "${r} is not a resolution", ("r", o.resolution) );
   }

   d.modify( *dispute, [&o, now]( dispute_object& obj ) {
      obj.status            = o.resolution;
      obj.resolved_at       = now;
      obj.resolution_notes  = o.notes;
      obj.resolved_by       = o.arbiter;
      if( o.resolution == dispute_status::resolved_split )
         obj.refund_percentage = o.refund_percentage;
   });

   const optional<owner_type> assigned = job->agent;
   d.modify( *job, [outcome, now]( job_object& j ) {
      j.status       = outcome;
      if( outcome == job_status::cancelled )
         j.agent.reset();
      j.completed_at = now;
      j.updated_at   = now;
   });

   if( outcome == job_status::completed )
   {
      FC_ASSERT( assigned.valid() );
      if( const agent_object* agent = d.find_agent( *assigned ) )
         d.modify( *agent, []( agent_object& a ) {
            ++a.jobs_completed;
         });
   }

   dlog( "Dispute ${id} resolved as ${r} by ${who}", ("id", o.dispute)("r", o.resolution)("who", o.arbiter) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
