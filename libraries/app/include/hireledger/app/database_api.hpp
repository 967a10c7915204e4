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

#include <hireledger/app/api_objects.hpp>
#include <hireledger/app/application.hpp>

#include <hireledger/db/object_database.hpp>

#include <fc/optional.hpp>

#include <memory>
#include <vector>

namespace hireledger { namespace app {

using namespace hireledger::chain;
using std::vector;

class database_api_impl;

/**
 * @brief The database_api class implements the read-only queries of the marketplace.
 *
 * It reads one immutable snapshot of the state, published by the @ref application after a
 * committed transaction. Nothing here takes the write lock or changes the state, all
 * modifications are made by transactions pushed through the @ref marketplace_api.
 *
 * Owners given as query arguments are compared in canonical form, lower case and trimmed.
 */
class database_api
{
   public:
      database_api( std::shared_ptr<const db::object_database> snapshot,
                    const application_options* app_options = nullptr );
      ~database_api();

      //////////
      // Jobs //
      //////////

      /**
       * @brief Get jobs matching a filter
       * @param query filter, sort order and page. The page size defaults to and may not exceed
       *        the api-limit-jobs option.
       * @return The jobs sorted by created_at in ascending order unless the query asks otherwise
       */
      vector<job_view> get_jobs( const job_query& query )const;

      /// @return The job, or null if it does not exist
      optional<job_view> get_job( job_id_type id )const;

      /**
       * @brief Case insensitive search of title, description, category and tags
       * @return At most api-limit-jobs matches in id order
       */
      vector<job_view> search_jobs( const string& text )const;

      vector<job_view> get_jobs_by_category( const string& category )const;

      /// @param status a job status token, every job is counted when absent
      uint64_t get_jobs_count( const optional<string>& status )const;

      ////////////
      // Agents //
      ////////////

      /**
       * @brief Get agent profiles matching a filter
       * @param query filter, sort order and page. The page size defaults to and may not exceed
       *        the api-limit-agents option.
       */
      vector<agent_view> get_agents( const agent_query& query )const;

      optional<agent_view> get_agent( const string& owner )const;

      /// agents with the skill, compared case insensitively
      vector<agent_view> get_agents_by_skill( const string& skill )const;

      /// @param min_level a verification level token, VERIFIED when absent
      vector<agent_view> get_verified_agents( const optional<string>& min_level )const;

      /// every rating the owner received
      vector<rating_view> get_agent_ratings( const string& owner )const;

      uint64_t get_agents_count()const;

      ///////////
      // Stats //
      ///////////

      marketplace_stats get_stats()const;

      //////////////////////
      // Escrow, disputes //
      //////////////////////

      vector<dispute_view>   get_disputes( const dispute_query& query )const;
      optional<dispute_view> get_dispute( dispute_id_type id )const;

      /// the escrow record of a job
      optional<escrow_view> get_escrow( job_id_type job )const;

      /// escrows that are locked or partially released
      vector<escrow_view> get_active_escrows()const;

      //////////////
      // Messages //
      //////////////

      /// the conversation of a job in the order it was written
      vector<message_view> get_job_messages( job_id_type job )const;

      uint64_t get_unread_messages_count( const string& user )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} } // hireledger::app
