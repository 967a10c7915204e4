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
#include <hireledger/chain/rating_evaluator.hpp>

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/rating_object.hpp>

namespace hireledger { namespace chain {

void_result agent_rate_evaluator::do_evaluate( const agent_rate_operation& o )
{ try {
   const database& d = db();
   job = &d.get_job( o.job );

   HIRELEDGER_ASSERT( job->status == job_status::completed, invalid_state_exception,
                      "Only a completed job can be rated, job ${job} is ${status}",
                      ("job", o.job)("status", job->status) );
   HIRELEDGER_ASSERT( job->is_client( o.rater ) || job->is_agent( o.rater ), invalid_state_exception,
                      "${rater} took no part in job ${job}", ("rater", o.rater)("job", o.job) );

   const auto& idx = d.get_index_type<rating_index>().indices().get<by_job_rater>();
   HIRELEDGER_ASSERT( idx.find( boost::make_tuple( o.job, o.rater ) ) == idx.end(), duplicate_rating_exception,
                      "${rater} already rated job ${job}", ("rater", o.rater)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type agent_rate_evaluator::do_apply( const agent_rate_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   const owner_type ratee = job->is_client( o.rater ) ? *job->agent : job->client;

   const rating_object& rating = d.create<rating_object>( [&o, &ratee, now]( rating_object& r ) {
      r.job       = o.job;
      r.rater     = o.rater;
      r.ratee     = ratee;
      r.rating    = o.rating;
      r.review    = o.review;
      r.timestamp = now;
   });

   if( const agent_object* agent = d.find_agent( ratee ) )
      d.modify( *agent, [&o]( agent_object& a ) {
         a.total_rating_points += o.rating;
         ++a.total_ratings;
      });

   dlog( "${rater} rated ${ratee} ${r} for job ${job}", ("rater", o.rater)("ratee", ratee)("r", o.rating)("job", o.job) );
   return rating.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
