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

#include <hireledger/app/database_api.hpp>
#include <hireledger/protocol/config.hpp>

using namespace hireledger::app;
using namespace hireledger::chain;
using namespace hireledger::chain::test;

namespace {

   vector<string> titles( const vector<job_view>& jobs )
   {
      vector<string> result;
      for( const auto& j : jobs )
         result.push_back( j.title );
      return result;
   }

   vector<string> owners( const vector<agent_view>& agents )
   {
      vector<string> result;
      for( const auto& a : agents )
         result.push_back( a.owner );
      return result;
   }

}

struct query_fixture : database_fixture
{
   job_id_type post( const string& client, const string& title, const string& payment,
                     const string& category, const flat_set<string>& tags,
                     fc::optional<uint32_t> deadline_offset = fc::optional<uint32_t>() )
   {
      post_job_args args;
      args.title       = title;
      args.description = "Job " + title;
      args.payment     = payment;
      args.category    = category;
      args.tags        = tags;
      if( deadline_offset.valid() )
         args.deadline = time_point_sec( TEST_START_TIME + *deadline_offset );
      const job_id_type id = api.post_job( client, args );
      advance_time( 60 );
      return id;
   }
};

BOOST_FIXTURE_TEST_SUITE( database_api_tests, query_fixture )

BOOST_AUTO_TEST_CASE( get_job_and_views )
{ try {
   const job_id_type id = post( "alice", "Scraper", "100.25", "data", { "python" } );
   const auto db_api = query();

   const fc::optional<job_view> job = db_api.get_job( id );
   BOOST_REQUIRE( job.valid() );
   BOOST_CHECK( job->title == "Scraper" );
   BOOST_CHECK( job->payment == "100.25" );
   BOOST_CHECK( job->status == "POSTED" );
   BOOST_CHECK( !job->accepted_bid_amount.valid() );
   BOOST_CHECK( job->escrow == get_job( id ).escrow );

   BOOST_CHECK( !db_api.get_job( job_id_type( 77 ) ).valid() );

   const fc::optional<escrow_view> escrow = db_api.get_escrow( id );
   BOOST_REQUIRE( escrow.valid() );
   BOOST_CHECK( escrow->status == "UNFUNDED" );
   BOOST_CHECK( escrow->remaining == "0" );
   BOOST_CHECK( !db_api.get_escrow( job_id_type( 77 ) ).valid() );

   // the variant form is what the node prints
   const fc::variant_object v = fc::variant( *job, HIRELEDGER_MAX_NESTED_OBJECTS ).get_object();
   BOOST_CHECK_EQUAL( v["id"].as_string(), "1.1.0" );
   BOOST_CHECK_EQUAL( v["escrow"].as_string(), "1.2.0" );
   BOOST_CHECK_EQUAL( v["payment"].as_string(), "100.25" );
   BOOST_CHECK_EQUAL( v["status"].as_string(), "POSTED" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( snapshot_is_isolated_from_later_changes )
{ try {
   const job_id_type id = post( "alice", "Scraper", "100", "data", {} );
   const auto before = query();
   api.cancel_job( "alice", id );

   BOOST_CHECK( before.get_job( id )->status == "POSTED" );
   BOOST_CHECK( query().get_job( id )->status == "CANCELLED" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( get_jobs_filters )
{ try {
   const job_id_type a = post( "alice", "Scraper", "100", "data", { "python", "web" } );
   post( "alice", "Logo", "50", "design", { "art" } );
   const job_id_type c = post( "carol", "Crawler", "300", "data", { "Python" } );
   post( "carol", "Banner", "20", "design", {} );
   start_job( "dave", "bob", "80", "80" );
   api.cancel_job( "alice", a );

   const auto db_api = query();
   job_query q;
   BOOST_CHECK_EQUAL( db_api.get_jobs( q ).size(), 5u );

   q.status = string( "posted" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Logo", "Crawler", "Banner" } ) );

   q = job_query();
   q.category = string( "DATA" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Scraper", "Crawler" } ) );

   q = job_query();
   q.tags = { "python" };
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Scraper", "Crawler" } ) );
   q.tags = { "python", "web" };
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Scraper" } ) );

   q = job_query();
   q.client = string( " Carol" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Crawler", "Banner" } ) );

   q = job_query();
   q.agent = string( "bob" );
   const auto assigned = db_api.get_jobs( q );
   BOOST_REQUIRE_EQUAL( assigned.size(), 1u );
   BOOST_CHECK( assigned[0].status == "IN_PROGRESS" );
   BOOST_REQUIRE( assigned[0].agent.valid() );
   BOOST_CHECK( *assigned[0].agent == "bob" );
   BOOST_REQUIRE( assigned[0].accepted_bid_amount.valid() );
   BOOST_CHECK( *assigned[0].accepted_bid_amount == "80" );

   q = job_query();
   q.min_payment = string( "50" );
   q.max_payment = string( "100" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Scraper", "Logo", "Build a scraper" } ) );

   q = job_query();
   q.search = string( "CRAWL" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Crawler" } ) );
   q.search = string( "art" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "Logo" } ) );

   q = job_query();
   q.status = string( "RUNNING" );
   HIRELEDGER_REQUIRE_THROW( db_api.get_jobs( q ), hireledger::protocol::invalid_token_exception );

   BOOST_CHECK( c == job_id_type( 2 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( descending_sort_keeps_ties_in_id_order )
{ try {
   post( "alice", "A", "10", "x", {} );
   post( "alice", "B", "20", "x", {} );
   post( "alice", "C", "10", "x", {} );

   const auto db_api = query();
   job_query q;
   q.sort_by = string( "PAYMENT" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "A", "C", "B" } ) );
   q.sort_dir = string( "DESC" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "B", "A", "C" } ) );

   register_agent( "bob" );
   register_agent( "carol" );
   agent_query aq;
   aq.sort_dir = string( "DESC" );
   BOOST_CHECK( owners( query().get_agents( aq ) ) == vector<string>( { "bob", "carol" } ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( get_jobs_sorting_and_paging )
{ try {
   post( "alice", "A", "30", "x", {}, uint32_t( 3000 ) );
   const job_id_type b = post( "alice", "B", "10", "x", {} );
   const job_id_type c = post( "alice", "C", "20", "x", {}, uint32_t( 1000 ) );
   register_agent( "bob" );
   register_agent( "carol" );
   place_bid( "bob", c, "20" );
   place_bid( "carol", c, "19" );
   place_bid( "bob", b, "10" );

   const auto db_api = query();
   job_query q;
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "A", "B", "C" } ) );

   q.sort_dir = string( "DESC" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "C", "B", "A" } ) );

   q.sort_by = string( "PAYMENT" );
   q.sort_dir = string( "ASC" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "B", "C", "A" } ) );

   // jobs without a deadline come last
   q.sort_by = string( "DEADLINE" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "C", "A", "B" } ) );

   q.sort_by = string( "bid_count" );
   q.sort_dir = string( "desc" );
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "C", "B", "A" } ) );

   q = job_query();
   q.limit = 2;
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "A", "B" } ) );
   q.offset = 2;
   BOOST_CHECK( titles( db_api.get_jobs( q ) ) == vector<string>( { "C" } ) );
   q.offset = 3;
   BOOST_CHECK( db_api.get_jobs( q ).empty() );

   q = job_query();
   q.limit = 101;
   HIRELEDGER_REQUIRE_THROW( db_api.get_jobs( q ), hireledger::protocol::invalid_argument_exception );
   q.limit = 100;
   BOOST_CHECK_EQUAL( db_api.get_jobs( q ).size(), 3u );

   q = job_query();
   q.sort_by = string( "popularity" );
   HIRELEDGER_REQUIRE_THROW( db_api.get_jobs( q ), hireledger::protocol::invalid_token_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( search_category_and_count )
{ try {
   post( "alice", "Scraper", "100", "data", { "python" } );
   const job_id_type logo = post( "alice", "Logo", "50", "design", {} );
   post( "carol", "Crawler", "300", "data", {} );
   api.cancel_job( "alice", logo );

   const auto db_api = query();
   BOOST_CHECK( titles( db_api.search_jobs( "PYTHON" ) ) == vector<string>( { "Scraper" } ) );
   BOOST_CHECK( titles( db_api.search_jobs( "job " ) ) == vector<string>( { "Scraper", "Logo", "Crawler" } ) );
   BOOST_CHECK_EQUAL( db_api.search_jobs( "" ).size(), 3u );
   BOOST_CHECK( db_api.search_jobs( "rust" ).empty() );

   BOOST_CHECK( titles( db_api.get_jobs_by_category( "data" ) ) == vector<string>( { "Scraper", "Crawler" } ) );
   BOOST_CHECK( titles( db_api.get_jobs_by_category( " Data" ) ) == vector<string>( { "Scraper", "Crawler" } ) );
   BOOST_CHECK( db_api.get_jobs_by_category( "dat" ).empty() );

   BOOST_CHECK_EQUAL( db_api.get_jobs_count( fc::optional<string>() ), 3u );
   BOOST_CHECK_EQUAL( db_api.get_jobs_count( string( "POSTED" ) ), 2u );
   BOOST_CHECK_EQUAL( db_api.get_jobs_count( string( "cancelled" ) ), 1u );
   BOOST_CHECK_EQUAL( db_api.get_jobs_count( string( "COMPLETED" ) ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( agent_queries )
{ try {
   register_agent( "bob", { "python", "scraping" } );
   advance_time( 10 );
   register_agent( "carol", { "design" } );
   advance_time( 10 );
   register_agent( "dave", { "Python" } );

   const job_id_type first = start_job( "alice", "bob" );
   api.complete_job( "bob", first );
   api.rate_agent( "alice", { first, 3, "" } );
   const job_id_type second = start_job( "alice", "dave" );
   api.complete_job( "dave", second );
   api.rate_agent( "alice", { second, 5, "" } );
   const job_id_type third = start_job( "erin", "dave" );
   api.complete_job( "dave", third );

   api.verify_agent( "admin", "carol", "BASIC" );
   api.verify_agent( "admin", "dave", "VERIFIED" );
   hireledger::app::update_agent_args busy;
   busy.available = false;
   api.update_agent_profile( "carol", busy );

   const auto db_api = query();
   agent_query q;
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "carol", "bob", "dave" } ) );
   q.sort_dir = string( "DESC" );
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "dave", "bob", "carol" } ) );

   q = agent_query();
   q.sort_by = string( "RATING" );
   q.sort_dir = string( "DESC" );
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "dave", "bob", "carol" } ) );

   q = agent_query();
   q.sort_by = string( "REGISTERED_AT" );
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "bob", "carol", "dave" } ) );

   q = agent_query();
   q.min_jobs_completed = 1;
   q.min_rating = 4.0;
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "dave" } ) );

   q = agent_query();
   q.available = true;
   q.skills = { "PYTHON" };
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "bob", "dave" } ) );

   q = agent_query();
   q.min_verification = string( "BASIC" );
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "carol", "dave" } ) );

   q = agent_query();
   q.limit = 1;
   q.offset = 1;
   BOOST_CHECK( owners( db_api.get_agents( q ) ) == vector<string>( { "bob" } ) );
   q.limit = 1000;
   HIRELEDGER_REQUIRE_THROW( db_api.get_agents( q ), hireledger::protocol::invalid_argument_exception );

   const fc::optional<agent_view> dave = db_api.get_agent( " DAVE" );
   BOOST_REQUIRE( dave.valid() );
   BOOST_CHECK_EQUAL( dave->jobs_completed, 2u );
   BOOST_CHECK_EQUAL( dave->rating, 5.0 );
   BOOST_CHECK_EQUAL( dave->success_rate, 100.0 );
   BOOST_CHECK( dave->verification_level == "VERIFIED" );
   BOOST_CHECK( !db_api.get_agent( "zoe" ).valid() );

   BOOST_CHECK( owners( db_api.get_agents_by_skill( "python" ) ) == vector<string>( { "bob", "dave" } ) );
   BOOST_CHECK( owners( db_api.get_verified_agents( fc::optional<string>() ) ) == vector<string>( { "dave" } ) );
   BOOST_CHECK( owners( db_api.get_verified_agents( string( "BASIC" ) ) ) == vector<string>( { "carol", "dave" } ) );
   BOOST_CHECK_EQUAL( db_api.get_agents_count(), 3u );

   const auto ratings = db_api.get_agent_ratings( "dave" );
   BOOST_REQUIRE_EQUAL( ratings.size(), 1u );
   BOOST_CHECK_EQUAL( ratings[0].rating, 5 );
   BOOST_CHECK( ratings[0].rater == "alice" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( marketplace_stats )
{ try {
   {
      const auto stats = query().get_stats();
      BOOST_CHECK_EQUAL( stats.total_jobs, 0u );
      BOOST_CHECK_EQUAL( stats.avg_bids_per_job, 0.0 );
      BOOST_CHECK( stats.total_payment_volume == "0" );
      BOOST_CHECK( stats.total_escrow_locked == "0" );
   }

   const job_id_type done = start_job( "alice", "bob", "100", "90" );
   api.complete_job( "bob", done );

   const job_id_type busy = start_job( "alice", "carol", "100", "60", milestones( { 50 } ) );
   api.submit_milestone( "carol", busy, 0, "" );
   api.approve_milestone( "alice", busy, 0 );

   const job_id_type argued = start_job( "alice", "bob", "40", "40" );
   api.open_dispute( "bob", argued, "unpaid" );

   const job_id_type funded = post_job( "dave", "70" );
   api.fund_escrow( "dave", funded, "70.5" );

   const job_id_type dropped = post_job( "dave", "10" );
   api.cancel_job( "dave", dropped );

   api.verify_agent( "admin", "bob", "PREMIUM" );

   const auto stats = query().get_stats();
   BOOST_CHECK_EQUAL( stats.total_jobs, 5u );
   BOOST_CHECK_EQUAL( stats.posted_jobs, 1u );
   BOOST_CHECK_EQUAL( stats.in_progress_jobs, 1u );
   BOOST_CHECK_EQUAL( stats.completed_jobs, 1u );
   BOOST_CHECK_EQUAL( stats.disputed_jobs, 1u );
   BOOST_CHECK_EQUAL( stats.cancelled_jobs, 1u );
   BOOST_CHECK_EQUAL( stats.total_agents, 2u );
   BOOST_CHECK_EQUAL( stats.verified_agents, 1u );
   BOOST_CHECK_EQUAL( stats.total_bids, 3u );
   BOOST_CHECK_EQUAL( stats.avg_bids_per_job, 0.6 );
   BOOST_CHECK( stats.total_payment_volume == "90" );
   // 30 left on the milestone job, 40 under dispute, 70.5 deposited up front
   BOOST_CHECK( stats.total_escrow_locked == "140.5" );
   BOOST_CHECK_EQUAL( stats.open_disputes, 1u );

   const auto active = query().get_active_escrows();
   BOOST_REQUIRE_EQUAL( active.size(), 3u );
   BOOST_CHECK( active[0].job == busy );
   BOOST_CHECK( active[0].status == "PARTIALLY_RELEASED" );
   BOOST_CHECK( active[1].job == argued );
   BOOST_CHECK( active[2].job == funded );
   BOOST_CHECK( active[2].remaining == "70.5" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( dispute_queries )
{ try {
   const job_id_type first = start_job( "alice", "bob" );
   const job_id_type second = start_job( "carol", "bob" );
   const dispute_id_type d1 = api.open_dispute( "alice", first, "late" );
   const dispute_id_type d2 = api.open_dispute( "bob", second, "unpaid" );
   api.resolve_dispute( "admin", { d1, "RESOLVED_FOR_AGENT", fc::optional<uint8_t>(), "" } );

   const auto db_api = query();
   dispute_query q;
   BOOST_CHECK_EQUAL( db_api.get_disputes( q ).size(), 2u );

   q.status = string( "OPEN" );
   auto open = db_api.get_disputes( q );
   BOOST_REQUIRE_EQUAL( open.size(), 1u );
   BOOST_CHECK( open[0].id == d2 );

   q = dispute_query();
   q.job = first;
   auto for_job = db_api.get_disputes( q );
   BOOST_REQUIRE_EQUAL( for_job.size(), 1u );
   BOOST_CHECK( for_job[0].status == "RESOLVED_FOR_AGENT" );
   BOOST_REQUIRE( for_job[0].resolved_by.valid() );
   BOOST_CHECK( *for_job[0].resolved_by == "admin" );

   q = dispute_query();
   q.limit = 1;
   BOOST_CHECK_EQUAL( db_api.get_disputes( q ).size(), 1u );
   q.limit = 101;
   HIRELEDGER_REQUIRE_THROW( db_api.get_disputes( q ), hireledger::protocol::invalid_argument_exception );

   BOOST_CHECK( db_api.get_dispute( d2 )->initiator == "bob" );
   BOOST_CHECK( !db_api.get_dispute( dispute_id_type( 9 ) ).valid() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( job_messages )
{ try {
   const job_id_type job_id = start_job( "alice", "bob" );
   api.send_message( "alice", job_id, "bob", "first" );
   advance_time( 1 );
   api.send_message( "bob", job_id, "alice", "second" );

   const auto messages = query().get_job_messages( job_id );
   BOOST_REQUIRE_EQUAL( messages.size(), 2u );
   BOOST_CHECK( messages[0].content == "first" );
   BOOST_CHECK( messages[1].content == "second" );
   BOOST_CHECK( messages[1].sender == "bob" );
   BOOST_CHECK( query().get_job_messages( job_id_type( 5 ) ).empty() );
   BOOST_CHECK_EQUAL( query().get_unread_messages_count( " Alice " ), 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
