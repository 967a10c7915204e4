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
#include <boost/test/unit_test.hpp>

#include "../common/database_fixture.hpp"

#include <fc/filesystem.hpp>

#include <atomic>
#include <thread>

using namespace hireledger::chain;
using namespace hireledger::chain::test;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( failed_transaction_changes_nothing )
{ try {
   job_post_operation post;
   post.client  = "alice";
   post.title   = "Logo";
   post.payment = units(10);

   job_cancel_operation cancel;
   cancel.client = "alice";
   cancel.job    = job_id_type( 7 );

   signed_transaction trx;
   trx.signer = "alice";
   trx.operations.push_back( post );
   trx.operations.push_back( cancel );
   HIRELEDGER_REQUIRE_THROW( app.push_transaction( trx ), not_found_exception );

   BOOST_CHECK( db.find( job_id_type( 0 ) ) == nullptr );
   BOOST_CHECK( db.find( escrow_id_type( 0 ) ) == nullptr );
   BOOST_CHECK( !query().get_job( job_id_type( 0 ) ).valid() );

   // the ids handed out by the failed transaction are reused
   BOOST_CHECK( post_job( "alice" ) == job_id_type( 0 ) );
   BOOST_CHECK( get_job( job_id_type( 0 ) ).escrow == escrow_id_type( 0 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_applies_every_operation )
{ try {
   job_post_operation post;
   post.client  = "alice";
   post.title   = "Logo";
   post.payment = units(10);

   signed_transaction trx;
   trx.signer = "alice";
   trx.operations.push_back( post );
   trx.operations.push_back( post );
   const processed_transaction result = app.push_transaction( trx );

   BOOST_REQUIRE_EQUAL( result.operation_results.size(), 2u );
   BOOST_CHECK( result.operation_results[1].get<object_id_type>() == object_id_type( job_id_type( 1 ) ) );
   BOOST_CHECK( db.find( job_id_type( 1 ) ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( empty_transaction_is_rejected )
{ try {
   signed_transaction trx;
   trx.signer = "alice";
   HIRELEDGER_REQUIRE_THROW( app.push_transaction( trx ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( in_memory_application_is_not_persistent )
{ try {
   BOOST_CHECK( !app.is_persistent() );
   post_job( "alice" );
   // flushing an in-memory marketplace does nothing
   app.flush();
   BOOST_CHECK( db.find( job_id_type( 0 ) ) != nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( concurrent_accepts_pick_one_agent )
{ try {
   const job_id_type job_id = post_job( "alice" );
   const std::vector<string> agents = { "a1", "a2", "a3", "a4", "a5", "a6", "a7", "a8" };
   for( const auto& agent : agents )
   {
      register_agent( agent );
      place_bid( agent, job_id, "90" );
   }

   std::atomic<uint32_t> accepted( 0 );
   std::atomic<uint32_t> rejected( 0 );
   std::atomic<uint32_t> unexpected( 0 );

   std::vector<std::thread> threads;
   for( const auto& agent : agents )
   {
      threads.emplace_back( [&, agent]() {
         try
         {
            hireledger::app::accept_bid_args args;
            args.job        = job_id;
            args.agent      = agent;
            args.bid_amount = "90";
            api.accept_bid( "alice", args );
            ++accepted;
         }
         catch( const invalid_state_exception& )
         {
            ++rejected;
         }
         catch( const fc::exception& e )
         {
            edump( (e.to_detail_string()) );
            ++unexpected;
         }
      });
   }
   for( auto& t : threads )
      t.join();

   BOOST_CHECK_EQUAL( accepted.load(), 1u );
   BOOST_CHECK_EQUAL( rejected.load(), agents.size() - 1 );
   BOOST_CHECK_EQUAL( unexpected.load(), 0u );

   const job_object& job = get_job( job_id );
   BOOST_CHECK( job.status == job_status::in_progress );
   BOOST_REQUIRE( job.agent.valid() );
   BOOST_CHECK( escrow_of( job_id ).amount == units(90) );
   BOOST_REQUIRE( escrow_of( job_id ).agent.valid() );
   BOOST_CHECK( *escrow_of( job_id ).agent == *job.agent );

   uint32_t total_accepted = 0;
   for( const auto& agent : agents )
      total_accepted += get_agent( agent ).jobs_accepted;
   BOOST_CHECK_EQUAL( total_accepted, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE( persistence_tests )

BOOST_AUTO_TEST_CASE( state_survives_restart )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );
   const auto options = database_fixture::default_options();

   {
      hireledger::app::application app;
      app.initialize( data_dir.path(), options );
      app.startup();
      BOOST_CHECK( app.is_persistent() );

      hireledger::app::marketplace_api api( app );
      hireledger::app::post_job_args job;
      job.title   = "Translate the manual";
      job.payment = "250.5";
      api.post_job( "alice", job );

      hireledger::app::register_agent_args agent;
      agent.name = "Polyglot";
      api.register_agent( "bob", agent );

      app.shutdown();
   }

   hireledger::app::application app;
   app.initialize( data_dir.path(), options );
   app.startup();
   hireledger::app::marketplace_api api( app );

   const auto restored = api.get_database_api().get_job( job_id_type( 0 ) );
   BOOST_REQUIRE( restored.valid() );
   BOOST_CHECK( restored->title == "Translate the manual" );
   BOOST_CHECK( restored->client == "alice" );
   BOOST_CHECK_EQUAL( restored->payment, "250.5" );
   BOOST_CHECK( api.get_database_api().get_agent( "bob" ).valid() );

   // new objects continue the id sequence
   hireledger::app::post_job_args next;
   next.title   = "Proofread the manual";
   next.payment = "20";
   BOOST_CHECK( api.post_job( "carol", next ) == job_id_type( 1 ) );
   BOOST_CHECK( app.chain_database()->get_job( job_id_type( 1 ) ).escrow == escrow_id_type( 1 ) );

   // the administrators always come from the options
   BOOST_CHECK( app.chain_database()->is_administrator( TEST_ADMINISTRATOR ) );
   app.shutdown();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( only_committed_changes_are_flushed )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );

   hireledger::app::application app;
   app.initialize( data_dir.path(), database_fixture::default_options() );
   app.startup();
   hireledger::app::marketplace_api api( app );
   BOOST_CHECK( !app.has_unflushed_changes() );

   api.get_database_api().get_stats();
   BOOST_CHECK( !app.has_unflushed_changes() );

   hireledger::app::post_job_args job;
   job.title   = "Index the archive";
   job.payment = "12";
   api.post_job( "alice", job );
   BOOST_CHECK( app.has_unflushed_changes() );
   app.flush();
   BOOST_CHECK( !app.has_unflushed_changes() );

   // a rejected transaction leaves nothing to write
   HIRELEDGER_CHECK_THROW( api.cancel_job( "bob", job_id_type( 0 ) ), hireledger::protocol::unauthorized_exception );
   BOOST_CHECK( !app.has_unflushed_changes() );

   api.get_database_api().get_job( job_id_type( 0 ) );
   app.flush();
   BOOST_CHECK( !app.has_unflushed_changes() );
   app.shutdown();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
