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

namespace hireledger { namespace chain {

   /**
    * @brief the public profile and track record of an agent
    * @ingroup object
    *
    * There is at most one profile per owner.
    */
   class agent_object : public hireledger::db::abstract_object<agent_object, protocol_ids, agent_object_type>
   {
      public:
         owner_type           owner;
         string               name;
         string               description;
         flat_set<string>     skills;
         vector<string>       portfolio_urls;
         optional<share_type> hourly_rate;
         bool                 available = true;
         uint32_t             jobs_completed = 0;
         uint32_t             jobs_accepted = 0;
         uint64_t             total_rating_points = 0;
         uint32_t             total_ratings = 0;
         verification_level   verification = verification_level::unverified;
         time_point_sec       registered_at;

         /// mean of all ratings received, 0 without ratings
         double rating()const
         {
            if( total_ratings == 0 )
               return 0;
            return double(total_rating_points) / total_ratings;
         }

         /// completed jobs in percent of accepted jobs, 0 before the first acceptance
         double success_rate()const
         {
            if( jobs_accepted == 0 )
               return 0;
            return 100.0 * jobs_completed / jobs_accepted;
         }

         bool has_skill( const string& skill )const;
   };

   struct by_owner;
   using agent_multi_index_type = multi_index_container<
      agent_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_owner >, member< agent_object, owner_type, &agent_object::owner > >
      >
   >;

   using agent_index = generic_index< agent_object, agent_multi_index_type >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::agent_object )

FC_REFLECT_DERIVED( hireledger::chain::agent_object, (hireledger::db::object),
                    (owner)(name)(description)(skills)(portfolio_urls)(hourly_rate)(available)
                    (jobs_completed)(jobs_accepted)(total_rating_points)(total_ratings)
                    (verification)(registered_at) )
