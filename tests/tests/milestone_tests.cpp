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

using namespace hireledger::chain;
using namespace hireledger::chain::test;

BOOST_FIXTURE_TEST_SUITE( milestone_tests, database_fixture )

BOOST_AUTO_TEST_CASE( milestones_are_numbered_in_order )
{ try {
   auto specs = milestones( { 30, 70 } );
   specs[1].description = "deliver the rest";
   specs[1].due_date = time_point_sec( TEST_START_TIME + 86400 );
   const job_id_type job_id = post_job( "alice", "100", specs );

   const job_object& job = get_job( job_id );
   BOOST_REQUIRE_EQUAL( job.milestones.size(), 2u );
   BOOST_CHECK_EQUAL( job.milestones[0].milestone_id, 0u );
   BOOST_CHECK_EQUAL( job.milestones[1].milestone_id, 1u );
   BOOST_CHECK_EQUAL( job.milestones[0].payment_percentage, 30 );
   BOOST_CHECK( job.milestones[0].status == milestone_status::pending );
   BOOST_CHECK( job.milestones[1].description == "deliver the rest" );
   BOOST_REQUIRE( job.milestones[1].due_date.valid() );
   BOOST_CHECK( *job.milestones[1].due_date == time_point_sec( TEST_START_TIME + 86400 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( milestone_changes_need_job_in_progress )
{ try {
   const job_id_type job_id = post_job( "alice", "100", milestones( { 100 } ) );
   register_agent( "bob" );
   place_bid( "bob", job_id, "90" );

   // the job has no agent yet
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "bob", job_id, 0, "" ), hireledger::protocol::unauthorized_exception );

   accept_bid( "alice", job_id, "bob", "90" );
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "bob", job_id, 1, "" ), not_found_exception );
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "alice", job_id, 0, "" ), hireledger::protocol::unauthorized_exception );
   HIRELEDGER_REQUIRE_THROW( api.approve_milestone( "alice", job_id, 0 ), invalid_state_exception );
   HIRELEDGER_REQUIRE_THROW( api.request_revision( "alice", job_id, 0, "more" ), invalid_state_exception );

   api.open_dispute( "alice", job_id, "silence" );
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "bob", job_id, 0, "" ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approve_releases_share_of_accepted_bid )
{ try {
   const job_id_type job_id = start_job( "alice", "bob", "100", "90", milestones( { 50, 50 } ) );

   advance_time( 100 );
   api.submit_milestone( " Bob", job_id, 0, "first half done" );
   {
      const milestone_info& m = get_job( job_id ).milestones[0];
      BOOST_CHECK( m.status == milestone_status::submitted );
      BOOST_CHECK( m.submission_notes == "first half done" );
      BOOST_REQUIRE( m.submitted_at.valid() );
      BOOST_CHECK( *m.submitted_at == now );
   }
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "bob", job_id, 0, "again" ), invalid_state_exception );
   HIRELEDGER_REQUIRE_THROW( api.approve_milestone( "bob", job_id, 0 ), hireledger::protocol::unauthorized_exception );

   advance_time( 100 );
   api.approve_milestone( "alice", job_id, 0 );
   {
      const milestone_info& m = get_job( job_id ).milestones[0];
      BOOST_CHECK( m.status == milestone_status::approved );
      BOOST_REQUIRE( m.approved_at.valid() );
      BOOST_CHECK( *m.approved_at == now );
   }

   const escrow_object& escrow = escrow_of( job_id );
   BOOST_CHECK( escrow.released == units(45) );
   BOOST_CHECK( escrow.remaining() == units(45) );
   BOOST_CHECK( escrow.status == escrow_status::partially_released );
   BOOST_CHECK( get_job( job_id ).status == job_status::in_progress );

   HIRELEDGER_REQUIRE_THROW( api.approve_milestone( "alice", job_id, 0 ), invalid_state_exception );
   HIRELEDGER_REQUIRE_THROW( api.submit_milestone( "bob", job_id, 0, "" ), invalid_state_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( revision_cycle )
{ try {
   const job_id_type job_id = start_job( "alice", "bob", "100", "90", milestones( { 100 } ) );

   api.submit_milestone( "bob", job_id, 0, "draft" );
   HIRELEDGER_REQUIRE_THROW( api.request_revision( "bob", job_id, 0, "" ), hireledger::protocol::unauthorized_exception );
   api.request_revision( "alice", job_id, 0, "needs tests" );
   {
      const milestone_info& m = get_job( job_id ).milestones[0];
      BOOST_CHECK( m.status == milestone_status::revision_requested );
      BOOST_CHECK( m.revision_feedback == "needs tests" );
   }
   BOOST_CHECK( escrow_of( job_id ).released == 0 );
   HIRELEDGER_REQUIRE_THROW( api.approve_milestone( "alice", job_id, 0 ), invalid_state_exception );

   api.submit_milestone( "bob", job_id, 0, "with tests" );
   BOOST_CHECK( get_job( job_id ).milestones[0].submission_notes == "with tests" );
   api.approve_milestone( "alice", job_id, 0 );

   BOOST_CHECK( escrow_of( job_id ).released == units(90) );
   BOOST_CHECK( escrow_of( job_id ).status == escrow_status::released );

   api.complete_job( "bob", job_id );
   BOOST_CHECK( get_job( job_id ).status == job_status::completed );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( partial_milestone_plan_leaves_rest_for_completion )
{ try {
   const job_id_type job_id = start_job( "alice", "bob", "100", "80", milestones( { 25 } ) );
   finish_job( "alice", "bob", job_id );

   const escrow_object& escrow = escrow_of( job_id );
   BOOST_CHECK( escrow.released == units(80) );
   BOOST_CHECK( escrow.remaining() == 0 );
   BOOST_CHECK( escrow.status == escrow_status::released );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( approval_after_manual_release_pays_what_is_left )
{ try {
   const job_id_type job_id = start_job( "alice", "bob", "100", "90", milestones( { 60, 40 } ) );
   api.release_escrow( "alice", job_id, "50" );

   api.submit_milestone( "bob", job_id, 0, "part one" );
   api.approve_milestone( "alice", job_id, 0 );
   BOOST_CHECK( get_job( job_id ).milestones[0].status == milestone_status::approved );
   BOOST_CHECK( escrow_of( job_id ).released == units(90) );
   BOOST_CHECK( escrow_of( job_id ).remaining() == 0 );

   // nothing left in escrow, the approval still goes through
   api.submit_milestone( "bob", job_id, 1, "part two" );
   api.approve_milestone( "alice", job_id, 1 );
   BOOST_CHECK( get_job( job_id ).milestones[1].status == milestone_status::approved );

   api.complete_job( "bob", job_id );
   const escrow_object& escrow = escrow_of( job_id );
   BOOST_CHECK( get_job( job_id ).status == job_status::completed );
   BOOST_CHECK( escrow.released == units(90) );
   BOOST_CHECK( escrow.refunded == 0 );
   BOOST_CHECK( escrow.status == escrow_status::released );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
