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

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/dispute_object.hpp>
#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/chain/job_object.hpp>
#include <hireledger/chain/message_object.hpp>
#include <hireledger/chain/rating_object.hpp>

#include <hireledger/protocol/tokens.hpp>

#include <fc/optional.hpp>

namespace hireledger { namespace app {
   using namespace hireledger::chain;

   enum class job_sort_field : uint8_t
   {
      created_at,
      payment,
      deadline,
      bid_count
   };

   enum class agent_sort_field : uint8_t
   {
      jobs_completed,
      rating,
      registered_at,
      success_rate
   };

   enum class sort_direction : uint8_t
   {
      asc,
      desc
   };

   string to_token( job_sort_field f );
   string to_token( agent_sort_field f );
   string to_token( sort_direction d );

   //////////////////////////////////////////////////////////////////////////////////////////////////
   // Queries. Enum and amount fields arrive as tokens and decimal strings and are parsed on use.   //
   //////////////////////////////////////////////////////////////////////////////////////////////////

   struct job_query
   {
      optional<string>     status;
      optional<string>     category;
      /// every tag must be present on the job
      flat_set<string>     tags;
      /// case insensitive substring of title, description, category or a tag
      optional<string>     search;
      optional<string>     client;
      optional<string>     agent;
      optional<string>     min_payment;
      optional<string>     max_payment;

      optional<string>     sort_by;
      optional<string>     sort_dir;
      optional<uint32_t>   limit;
      uint32_t             offset = 0;
   };

   struct agent_query
   {
      optional<uint32_t>   min_jobs_completed;
      optional<double>     min_rating;
      /// every skill must be present on the profile, compared case insensitively
      flat_set<string>     skills;
      optional<bool>       available;
      optional<string>     min_verification;

      optional<string>     sort_by;
      optional<string>     sort_dir;
      optional<uint32_t>   limit;
      uint32_t             offset = 0;
   };

   struct dispute_query
   {
      optional<string>        status;
      optional<job_id_type>   job;
      optional<uint32_t>      limit;
   };

   //////////////////////////////////////////////////////////////////////////////////////////////////
   // Views. Amounts are decimal strings and enums are tokens.                                     //
   //////////////////////////////////////////////////////////////////////////////////////////////////

   struct bid_view
   {
      bid_view() = default;
      explicit bid_view( const bid_info& b );

      owner_type     agent;
      bid_id_type    bid_id = 0;
      string         amount;
      string         proposal;
      uint32_t       estimated_days = 0;
      time_point_sec timestamp;
   };

   struct milestone_view
   {
      milestone_view() = default;
      explicit milestone_view( const milestone_info& m );

      milestone_id_type        milestone_id = 0;
      string                   title;
      string                   description;
      uint8_t                  payment_percentage = 0;
      string                   status;
      optional<time_point_sec> due_date;
      string                   submission_notes;
      string                   revision_feedback;
      optional<time_point_sec> submitted_at;
      optional<time_point_sec> approved_at;
   };

   struct job_view
   {
      job_view() = default;
      explicit job_view( const job_object& j );

      job_id_type              id;
      owner_type               client;
      string                   title;
      string                   description;
      string                   payment;
      string                   status;
      optional<owner_type>     agent;
      string                   category;
      flat_set<string>         tags;
      optional<time_point_sec> deadline;
      vector<bid_view>         bids;
      vector<milestone_view>   milestones;
      optional<string>         accepted_bid_amount;
      escrow_id_type           escrow;
      time_point_sec           created_at;
      time_point_sec           updated_at;
      optional<time_point_sec> completed_at;
   };

   struct agent_view
   {
      agent_view() = default;
      explicit agent_view( const agent_object& a );

      agent_id_type        id;
      owner_type           owner;
      string               name;
      string               description;
      flat_set<string>     skills;
      vector<string>       portfolio_urls;
      optional<string>     hourly_rate;
      bool                 available = true;
      uint32_t             jobs_completed = 0;
      uint32_t             jobs_accepted = 0;
      uint64_t             total_rating_points = 0;
      uint32_t             total_ratings = 0;
      double               rating = 0;
      double               success_rate = 0;
      string               verification_level;
      time_point_sec       registered_at;
   };

   struct escrow_view
   {
      escrow_view() = default;
      explicit escrow_view( const escrow_object& e );

      escrow_id_type           id;
      job_id_type              job;
      owner_type               client;
      optional<owner_type>     agent;
      string                   amount;
      string                   deposited;
      string                   released;
      string                   refunded;
      string                   remaining;
      string                   status;
      optional<time_point_sec> locked_at;
      optional<time_point_sec> released_at;
   };

   struct dispute_view
   {
      dispute_view() = default;
      explicit dispute_view( const dispute_object& d );

      dispute_id_type          id;
      job_id_type              job;
      owner_type               initiator;
      string                   reason;
      string                   status;
      optional<string>         response;
      optional<owner_type>     responder;
      time_point_sec           created_at;
      optional<time_point_sec> responded_at;
      optional<time_point_sec> resolved_at;
      string                   resolution_notes;
      optional<uint8_t>        refund_percentage;
      optional<owner_type>     resolved_by;
   };

   struct rating_view
   {
      rating_view() = default;
      explicit rating_view( const rating_object& r );

      rating_id_type id;
      job_id_type    job;
      owner_type     rater;
      owner_type     ratee;
      uint8_t        rating = 0;
      string         review;
      time_point_sec timestamp;
   };

   struct message_view
   {
      message_view() = default;
      explicit message_view( const message_object& m );

      message_id_type id;
      job_id_type     job;
      owner_type      sender;
      owner_type      recipient;
      string          content;
      time_point_sec  timestamp;
      bool            read = false;
   };

   struct marketplace_stats
   {
      uint64_t total_jobs = 0;
      uint64_t posted_jobs = 0;
      uint64_t in_progress_jobs = 0;
      uint64_t completed_jobs = 0;
      uint64_t disputed_jobs = 0;
      uint64_t cancelled_jobs = 0;
      uint64_t total_agents = 0;
      uint64_t verified_agents = 0;
      uint64_t total_bids = 0;
      /// sum of the accepted bid amounts of completed jobs
      string   total_payment_volume = "0";
      /// funds still held by active escrows
      string   total_escrow_locked = "0";
      uint64_t open_disputes = 0;
      double   avg_bids_per_job = 0;
   };

   //////////////////////////////////////////////////////////////////////////////////////////////////
   // Mutation arguments, the caller is always passed separately                                   //
   //////////////////////////////////////////////////////////////////////////////////////////////////

   struct milestone_args
   {
      string                   title;
      string                   description;
      uint8_t                  payment_percentage = 0;
      optional<time_point_sec> due_date;
   };

   struct post_job_args
   {
      string                   title;
      string                   description;
      string                   payment;
      string                   category;
      flat_set<string>         tags;
      optional<time_point_sec> deadline;
      vector<milestone_args>   milestones;
   };

   struct place_bid_args
   {
      job_id_type job;
      string      amount;
      string      proposal;
      uint32_t    estimated_days = 0;
   };

   struct accept_bid_args
   {
      job_id_type job;
      string      agent;
      string      bid_amount;
   };

   struct register_agent_args
   {
      string           name;
      string           description;
      flat_set<string> skills;
      vector<string>   portfolio_urls;
      optional<string> hourly_rate;
   };

   struct update_agent_args
   {
      optional<string>           name;
      optional<string>           description;
      optional<flat_set<string>> skills;
      optional<vector<string>>   portfolio_urls;
      optional<string>           hourly_rate;
      optional<bool>             available;
   };

   struct rate_agent_args
   {
      job_id_type job;
      uint8_t     rating = 0;
      string      review;
   };

   struct resolve_dispute_args
   {
      dispute_id_type   dispute;
      string            resolution;
      optional<uint8_t> refund_percentage;
      string            notes;
   };

} } // hireledger::app

namespace hireledger { namespace protocol {
   template<> app::job_sort_field   from_token<app::job_sort_field>( const string& token );
   template<> app::agent_sort_field from_token<app::agent_sort_field>( const string& token );
   template<> app::sort_direction   from_token<app::sort_direction>( const string& token );
} }

FC_REFLECT_ENUM( hireledger::app::job_sort_field, (created_at)(payment)(deadline)(bid_count) )
FC_REFLECT_ENUM( hireledger::app::agent_sort_field, (jobs_completed)(rating)(registered_at)(success_rate) )
FC_REFLECT_ENUM( hireledger::app::sort_direction, (asc)(desc) )

FC_REFLECT( hireledger::app::job_query,
            (status)(category)(tags)(search)(client)(agent)(min_payment)(max_payment)
            (sort_by)(sort_dir)(limit)(offset) )
FC_REFLECT( hireledger::app::agent_query,
            (min_jobs_completed)(min_rating)(skills)(available)(min_verification)
            (sort_by)(sort_dir)(limit)(offset) )
FC_REFLECT( hireledger::app::dispute_query, (status)(job)(limit) )

FC_REFLECT( hireledger::app::bid_view, (agent)(bid_id)(amount)(proposal)(estimated_days)(timestamp) )
FC_REFLECT( hireledger::app::milestone_view,
            (milestone_id)(title)(description)(payment_percentage)(status)(due_date)
            (submission_notes)(revision_feedback)(submitted_at)(approved_at) )
FC_REFLECT( hireledger::app::job_view,
            (id)(client)(title)(description)(payment)(status)(agent)(category)(tags)(deadline)
            (bids)(milestones)(accepted_bid_amount)(escrow)(created_at)(updated_at)(completed_at) )
FC_REFLECT( hireledger::app::agent_view,
            (id)(owner)(name)(description)(skills)(portfolio_urls)(hourly_rate)(available)
            (jobs_completed)(jobs_accepted)(total_rating_points)(total_ratings)(rating)(success_rate)
            (verification_level)(registered_at) )
FC_REFLECT( hireledger::app::escrow_view,
            (id)(job)(client)(agent)(amount)(deposited)(released)(refunded)(remaining)(status)
            (locked_at)(released_at) )
FC_REFLECT( hireledger::app::dispute_view,
            (id)(job)(initiator)(reason)(status)(response)(responder)(created_at)(responded_at)
            (resolved_at)(resolution_notes)(refund_percentage)(resolved_by) )
FC_REFLECT( hireledger::app::rating_view, (id)(job)(rater)(ratee)(rating)(review)(timestamp) )
FC_REFLECT( hireledger::app::message_view, (id)(job)(sender)(recipient)(content)(timestamp)(read) )
FC_REFLECT( hireledger::app::marketplace_stats,
            (total_jobs)(posted_jobs)(in_progress_jobs)(completed_jobs)(disputed_jobs)(cancelled_jobs)
            (total_agents)(verified_agents)(total_bids)(total_payment_volume)(total_escrow_locked)
            (open_disputes)(avg_bids_per_job) )

FC_REFLECT( hireledger::app::milestone_args, (title)(description)(payment_percentage)(due_date) )
FC_REFLECT( hireledger::app::post_job_args, (title)(description)(payment)(category)(tags)(deadline)(milestones) )
FC_REFLECT( hireledger::app::place_bid_args, (job)(amount)(proposal)(estimated_days) )
FC_REFLECT( hireledger::app::accept_bid_args, (job)(agent)(bid_amount) )
FC_REFLECT( hireledger::app::register_agent_args, (name)(description)(skills)(portfolio_urls)(hourly_rate) )
FC_REFLECT( hireledger::app::update_agent_args, (name)(description)(skills)(portfolio_urls)(hourly_rate)(available) )
FC_REFLECT( hireledger::app::rate_agent_args, (job)(rating)(review) )
FC_REFLECT( hireledger::app::resolve_dispute_args, (dispute)(resolution)(refund_percentage)(notes) )
