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
#include <hireledger/db/generic_index.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace hireledger { namespace chain {

   struct bid_info
   {
      owner_type     agent;
      bid_id_type    bid_id = 0;
      share_type     amount;
      string         proposal;
      uint32_t       estimated_days = 0;
      time_point_sec timestamp;
   };

   struct milestone_info
   {
      milestone_id_type        milestone_id = 0;
      string                   title;
      string                   description;
      uint8_t                  payment_percentage = 0;
      milestone_status         status = milestone_status::pending;
      optional<time_point_sec> due_date;
      string                   submission_notes;
      string                   revision_feedback;
      optional<time_point_sec> submitted_at;
      optional<time_point_sec> approved_at;
   };

   /**
    * @brief a job offered by a client and the bids it received
    * @ingroup object
    *
    * The agent is set exactly when the status is in progress, completed or disputed. Bids are
    * only appended while the job is posted, a bid id is its position in the list.
    */
   class job_object : public hireledger::db::abstract_object<job_object, protocol_ids, job_object_type>
   {
      public:
         owner_type               client;
         string                   title;
         string                   description;
         share_type               payment;
         job_status               status = job_status::posted;
         optional<owner_type>     agent;
         string                   category;
         flat_set<string>         tags;
         optional<time_point_sec> deadline;
         vector<bid_info>         bids;
         vector<milestone_info>   milestones;
         optional<share_type>     accepted_bid_amount;
         escrow_id_type           escrow;
         time_point_sec           created_at;
         time_point_sec           updated_at;
         optional<time_point_sec> completed_at;

         const bid_info* find_bid( const owner_type& bidder )const
         {
            for( const auto& b : bids )
               if( b.agent == bidder )
                  return &b;
            return nullptr;
         }

         bool is_client( const owner_type& who )const { return who == client; }
         bool is_agent( const owner_type& who )const  { return agent.valid() && *agent == who; }

         /// the client, the assigned agent or an agent with a bid on the job
         bool is_participant( const owner_type& who )const
         {
            return is_client( who ) || is_agent( who ) || find_bid( who ) != nullptr;
         }

         bool all_milestones_approved()const
         {
            for( const auto& m : milestones )
               if( m.status != milestone_status::approved )
                  return false;
            return true;
         }

         /// sort key for deadlines, jobs without one sort last in ascending order
         time_point_sec deadline_or_max()const
         {
            return deadline.valid() ? *deadline : time_point_sec::maximum();
         }

         /// categories match regardless of case
         struct category_extractor
         {
            using result_type = string;
            result_type operator()( const job_object& o )const { return boost::algorithm::to_lower_copy( o.category ); }
         };

         struct agent_extractor
         {
            using result_type = owner_type;
            result_type operator()( const job_object& o )const { return o.agent.valid() ? *o.agent : owner_type(); }
         };
   };

   struct by_client;
   struct by_status;
   struct by_agent;
   struct by_category;
   using job_multi_index_type = multi_index_container<
      job_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_client >,
            composite_key< job_object,
               member< job_object, owner_type, &job_object::client >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag< by_status >,
            composite_key< job_object,
               member< job_object, job_status, &job_object::status >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag< by_agent >,
            composite_key< job_object,
               job_object::agent_extractor,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag< by_category >,
            composite_key< job_object,
               job_object::category_extractor,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using job_index = generic_index< job_object, job_multi_index_type >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::job_object )

FC_REFLECT( hireledger::chain::bid_info, (agent)(bid_id)(amount)(proposal)(estimated_days)(timestamp) )
FC_REFLECT( hireledger::chain::milestone_info,
            (milestone_id)(title)(description)(payment_percentage)(status)(due_date)
            (submission_notes)(revision_feedback)(submitted_at)(approved_at) )
FC_REFLECT_DERIVED( hireledger::chain::job_object, (hireledger::db::object),
                    (client)(title)(description)(payment)(status)(agent)(category)(tags)(deadline)
                    (bids)(milestones)(accepted_bid_amount)(escrow)(created_at)(updated_at)(completed_at) )
