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

#include <hireledger/app/database_api.hpp>

namespace hireledger { namespace app {

class database_api_impl
{
   public:
      database_api_impl( std::shared_ptr<const db::object_database> snapshot, const application_options* app_options );

      // Jobs
      vector<job_view>   get_jobs( const job_query& query )const;
      optional<job_view> get_job( job_id_type id )const;
      vector<job_view>   search_jobs( const string& text )const;
      vector<job_view>   get_jobs_by_category( const string& category )const;
      uint64_t           get_jobs_count( const optional<string>& status )const;

      // Agents
      vector<agent_view>   get_agents( const agent_query& query )const;
      optional<agent_view> get_agent( const string& owner )const;
      vector<agent_view>   get_agents_by_skill( const string& skill )const;
      vector<agent_view>   get_verified_agents( const optional<string>& min_level )const;
      vector<rating_view>  get_agent_ratings( const string& owner )const;
      uint64_t             get_agents_count()const;

      // Stats
      marketplace_stats get_stats()const;

      // Escrow, disputes
      vector<dispute_view>   get_disputes( const dispute_query& query )const;
      optional<dispute_view> get_dispute( dispute_id_type id )const;
      optional<escrow_view>  get_escrow( job_id_type job )const;
      vector<escrow_view>    get_active_escrows()const;

      // Messages
      vector<message_view> get_job_messages( job_id_type job )const;
      uint64_t             get_unread_messages_count( const string& user )const;

   private:
      template<typename IndexType>
      const typename IndexType::index_type& indices()const
      {
         return _db->get_index_type<IndexType>().indices();
      }

      /// page size requested by a query, checked against the configured limit
      uint32_t page_limit( const optional<uint32_t>& requested, uint32_t configured, const char* name )const;

      std::shared_ptr<const db::object_database> _db;
      const application_options*                 _app_options = nullptr;
};

} } // hireledger::app
