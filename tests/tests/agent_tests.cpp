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

#include <hireledger/chain/rating_object.hpp>

using namespace hireledger::chain;
using namespace hireledger::chain::test;

BOOST_FIXTURE_TEST_SUITE( agent_tests, database_fixture )

BOOST_AUTO_TEST_CASE( register_agent )
{ try {
   hireledger::app::register_agent_args args;
   args.name           = "Scraper Bot";
   args.description    = "Fast and polite";
   args.skills         = { "python", "scraping" };
   args.portfolio_urls = { "https://example.org/work" };
   args.hourly_rate    = string( "12.5" );

   const agent_id_type id = api.register_agent( "Bob", args );

   const agent_object& bob = get_agent( "bob" );
   BOOST_CHECK( bob.get_id() == id );
   BOOST_CHECK( bob.name == "Scraper Bot" );
   BOOST_CHECK( bob.available );
   BOOST_CHECK( bob.verification == verification_level::unverified );
   BOOST_REQUIRE( bob.hourly_rate.valid() );
   BOOST_CHECK( *bob.hourly_rate == units(12) + 500000 );
   BOOST_CHECK( bob.registered_at == now );
   BOOST_CHECK( bob.has_skill( "PYTHON" ) );
   BOOST_CHECK( !bob.has_skill( "rust" ) );
   BOOST_CHECK_EQUAL( bob.rating(), 0.0 );
   BOOST_CHECK_EQUAL( bob.success_rate(), 0.0 );

   HIRELEDGER_REQUIRE_THROW( api.register_agent( "bob", args ), already_registered_exception );
   HIRELEDGER_REQUIRE_THROW( api.register_agent( " BOB ", args ), already_registered_exception );

   args.hourly_rate = string( "0" );
   HIRELEDGER_REQUIRE_THROW( api.register_agent( "carol", args ), hireledger::protocol::invalid_amount_exception );
   args.hourly_rate.reset();
   args.name = "";
   HIRELEDGER_REQUIRE_THROW( api.register_agent( "carol", args ), hireledger::protocol::invalid_argument_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_agent_profile )
{ try {
   hireledger::app::update_agent_args args;
   args.available = false;
   HIRELEDGER_REQUIRE_THROW( api.update_agent_profile( "bob", args ), not_found_exception );

   register_agent( "bob", { "python" } );
   args.skills = flat_set<string>{ "go", "rust" };
   api.update_agent_profile( "bob", args );

   const agent_object& bob = get_agent( "bob" );
   BOOST_CHECK( !bob.available );
   BOOST_CHECK( bob.has_skill( "rust" ) );
   BOOST_CHECK( !bob.has_skill( "python" ) );
   // fields that were not given are kept
   BOOST_CHECK( bob.name == "bob bot" );
   BOOST_CHECK( !bob.hourly_rate.valid() );

   hireledger::app::update_agent_args rate;
   rate.hourly_rate = string( "30" );
   api.update_agent_profile( "bob", rate );
   BOOST_REQUIRE( get_agent( "bob" ).hourly_rate.valid() );
   BOOST_CHECK( *get_agent( "bob" ).hourly_rate == units(30) );
   BOOST_CHECK( !get_agent( "bob" ).available );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( verify_agent_needs_administrator )
{ try {
   register_agent( "bob" );

   HIRELEDGER_REQUIRE_THROW( api.verify_agent( "alice", "bob", "VERIFIED" ), hireledger::protocol::unauthorized_exception );
   HIRELEDGER_REQUIRE_THROW( api.verify_agent( "admin", "carol", "VERIFIED" ), not_found_exception );
   HIRELEDGER_REQUIRE_THROW( api.verify_agent( "admin", "bob", "GOLD" ), hireledger::protocol::invalid_token_exception );

   api.verify_agent( "admin", " Bob ", "premium" );
   BOOST_CHECK( get_agent( "bob" ).verification == verification_level::premium );

   api.verify_agent( "admin", "bob", "BASIC" );
   BOOST_CHECK( get_agent( "bob" ).verification == verification_level::basic );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rate_completed_job )
{ try {
   const job_id_type job_id = start_job( "alice", "bob" );

   HIRELEDGER_REQUIRE_THROW( api.rate_agent( "alice", { job_id, 5, "" } ), invalid_state_exception );
   api.complete_job( "bob", job_id );

   HIRELEDGER_REQUIRE_THROW( api.rate_agent( "alice", { job_id, 0, "" } ), hireledger::protocol::invalid_argument_exception );
   HIRELEDGER_REQUIRE_THROW( api.rate_agent( "alice", { job_id, 6, "" } ), hireledger::protocol::invalid_argument_exception );
   HIRELEDGER_REQUIRE_THROW( api.rate_agent( "carol", { job_id, 3, "" } ), invalid_state_exception );

   const rating_id_type rating_id = api.rate_agent( "alice", { job_id, 4, "solid work" } );
   const rating_object& rating = db.get( rating_id );
   BOOST_CHECK( rating.rater == "alice" );
   BOOST_CHECK( rating.ratee == "bob" );
   BOOST_CHECK_EQUAL( rating.rating, 4 );
   BOOST_CHECK( rating.review == "solid work" );

   HIRELEDGER_REQUIRE_THROW( api.rate_agent( "alice", { job_id, 5, "changed my mind" } ), duplicate_rating_exception );

   const agent_object& bob = get_agent( "bob" );
   BOOST_CHECK_EQUAL( bob.total_ratings, 1u );
   BOOST_CHECK_EQUAL( bob.total_rating_points, 4u );
   BOOST_CHECK_EQUAL( bob.rating(), 4.0 );

   // the agent rates the client, the client has no profile to update
   const rating_id_type back = api.rate_agent( "bob", { job_id, 5, "clear brief" } );
   BOOST_CHECK( db.get( back ).ratee == "alice" );
   BOOST_CHECK_EQUAL( get_agent( "bob" ).total_ratings, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rating_is_the_mean_of_all_ratings )
{ try {
   const job_id_type first = start_job( "alice", "bob" );
   const job_id_type second = start_job( "carol", "bob" );
   api.complete_job( "bob", first );
   api.complete_job( "bob", second );

   api.rate_agent( "alice", { first, 5, "" } );
   api.rate_agent( "carol", { second, 2, "" } );

   const agent_object& bob = get_agent( "bob" );
   BOOST_CHECK_EQUAL( bob.total_ratings, 2u );
   BOOST_CHECK_EQUAL( bob.rating(), 3.5 );
   BOOST_CHECK_EQUAL( bob.jobs_completed, 2u );
   BOOST_CHECK_EQUAL( bob.jobs_accepted, 2u );
   BOOST_CHECK_EQUAL( bob.success_rate(), 100.0 );

   const job_id_type third = start_job( "alice", "bob" );
   api.open_dispute( "alice", third, "gone" );
   BOOST_CHECK_EQUAL( get_agent( "bob" ).jobs_accepted, 3u );
   BOOST_CHECK_CLOSE( get_agent( "bob" ).success_rate(), 200.0 / 3, 0.0001 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
