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

#include <fc/io/json.hpp>
#include <fc/variant_object.hpp>

#include <boost/program_options.hpp>

#include <boost/test/unit_test.hpp>

#include <hireledger/app/api.hpp>
#include <hireledger/app/application.hpp>
#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/dispute_object.hpp>
#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/chain/exceptions.hpp>
#include <hireledger/chain/job_object.hpp>
#include <hireledger/protocol/amount.hpp>
#include <hireledger/protocol/operations.hpp>

#include <iostream>

using namespace hireledger::db;

#define HIRELEDGER_REQUIRE_THROW( expr, exc_type )        \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "HIRELEDGER_REQUIRE_THROW begin "      \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "HIRELEDGER_REQUIRE_THROW end "        \
         << req_throw_info << std::endl;                  \
}

#define HIRELEDGER_CHECK_THROW( expr, exc_type )          \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "HIRELEDGER_CHECK_THROW begin "        \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "HIRELEDGER_CHECK_THROW end "          \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   HIRELEDGER_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}

namespace hireledger { namespace chain { namespace test {

/// the administrator configured for every fixture
extern const char* const TEST_ADMINISTRATOR;

/// the clock of the fixture starts here
extern const uint32_t TEST_START_TIME;

/**
 * An in-memory marketplace with a fixed clock. Mutations go through the api so the caller is
 * normalized the way the node does it, the database is reachable for direct inspection.
 */
struct database_fixture {
   hireledger::app::application app;
   chain::database& db;
   hireledger::app::marketplace_api api;
   time_point_sec now;

   database_fixture();
   ~database_fixture();

   static boost::program_options::variables_map default_options();

   /// moves the clock that stamps the next transactions
   void advance_time( uint32_t seconds );

   /// whole currency units in fixed point
   static share_type units( int64_t whole );

   processed_transaction push_op( const string& signer, const operation& op );

   hireledger::app::database_api query()const { return api.get_database_api(); }

   job_id_type post_job( const string& client, const string& payment = "100",
                         const vector<hireledger::app::milestone_args>& milestones = {},
                         const string& category = "development",
                         const flat_set<string>& tags = {} );
   static vector<hireledger::app::milestone_args> milestones( const vector<uint8_t>& percentages );

   agent_id_type register_agent( const string& owner, const flat_set<string>& skills = {} );
   void place_bid( const string& agent, job_id_type job, const string& amount );
   void accept_bid( const string& client, job_id_type job, const string& agent, const string& amount );

   /// posts a job for client, registers agent, and accepts its bid of bid_amount
   job_id_type start_job( const string& client, const string& agent, const string& payment = "100",
                          const string& bid_amount = "90",
                          const vector<hireledger::app::milestone_args>& milestones = {} );

   /// submits and approves every milestone, then completes the job
   void finish_job( const string& client, const string& agent, job_id_type job );

   const job_object&    get_job( job_id_type job )const;
   const escrow_object& escrow_of( job_id_type job )const;
   const agent_object&  get_agent( const string& owner )const;
};

} } } // hireledger::chain::test
