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
#include <hireledger/chain/milestone_evaluator.hpp>

#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/protocol/amount.hpp>

#include <algorithm>

namespace hireledger { namespace chain {

namespace detail {

   const milestone_info& get_active_milestone( const job_object& job, milestone_id_type milestone )
   {
      HIRELEDGER_ASSERT( milestone < job.milestones.size(), not_found_exception,
                         "Job ${job} has no milestone ${m}", ("job", job.id)("m", milestone) );
      HIRELEDGER_ASSERT( job.status == job_status::in_progress, invalid_state_exception,
                         "Milestones of job ${job} can only change while it is in progress",
                         ("job", job.id)("status", job.status) );
      return job.milestones[milestone];
   }

} // detail

void_result milestone_submit_evaluator::do_evaluate( const milestone_submit_operation& o )
{ try {
   job = &db().get_job( o.job );
   verify_assigned_agent( *job, o.agent );

   const milestone_info& m = detail::get_active_milestone( *job, o.milestone );
   HIRELEDGER_ASSERT( m.status == milestone_status::pending || m.status == milestone_status::revision_requested,
                      invalid_state_exception, "Milestone ${m} of job ${job} cannot be submitted",
                      ("m", o.milestone)("job", o.job)("status", m.status) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result milestone_submit_evaluator::do_apply( const milestone_submit_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   d.modify( *job, [&o, now]( job_object& j ) {
      milestone_info& m  = j.milestones[o.milestone];
      m.status           = milestone_status::submitted;
      m.submission_notes = o.notes;
      m.submitted_at     = now;
      j.updated_at       = now;
   });
   dlog( "Milestone ${m} of job ${job} submitted", ("m", o.milestone)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result milestone_approve_evaluator::do_evaluate( const milestone_approve_operation& o )
{ try {
   job = &db().get_job( o.job );
   verify_job_client( *job, o.client );

   const milestone_info& m = detail::get_active_milestone( *job, o.milestone );
   HIRELEDGER_ASSERT( m.status == milestone_status::submitted, invalid_state_exception,
                      "Milestone ${m} of job ${job} has not been submitted",
                      ("m", o.milestone)("job", o.job)("status", m.status) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result milestone_approve_evaluator::do_apply( const milestone_approve_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   d.modify( *job, [&o, now]( job_object& j ) {
      milestone_info& m = j.milestones[o.milestone];
      m.status          = milestone_status::approved;
      m.approved_at     = now;
      j.updated_at      = now;
   });

   FC_ASSERT( job->accepted_bid_amount.valid(), "Job ${job} in progress without an accepted bid", ("job", o.job) );
   // earlier manual releases may have paid part of this share already
   const share_type share  = percent_of( *job->accepted_bid_amount, job->milestones[o.milestone].payment_percentage );
   const share_type payout = std::min( share, d.get_escrow( *job ).remaining() );
   d.escrow_release( *job, payout );

   dlog( "Milestone ${m} of job ${job} approved, released ${p}", ("m", o.milestone)("job", o.job)("p", payout) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result milestone_revision_evaluator::do_evaluate( const milestone_revision_operation& o )
{ try {
   job = &db().get_job( o.job );
   verify_job_client( *job, o.client );

   const milestone_info& m = detail::get_active_milestone( *job, o.milestone );
   HIRELEDGER_ASSERT( m.status == milestone_status::submitted, invalid_state_exception,
                      "Milestone ${m} of job ${job} has not been submitted",
                      ("m", o.milestone)("job", o.job)("status", m.status) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result milestone_revision_evaluator::do_apply( const milestone_revision_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   d.modify( *job, [&o, now]( job_object& j ) {
      milestone_info& m   = j.milestones[o.milestone];
      m.status            = milestone_status::revision_requested;
      m.revision_feedback = o.feedback;
      j.updated_at        = now;
   });
   dlog( "Revision of milestone ${m} of job ${job} requested", ("m", o.milestone)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
