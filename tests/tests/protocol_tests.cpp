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

#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/tokens.hpp>
#include <hireledger/protocol/transaction.hpp>

using namespace hireledger::protocol;

BOOST_AUTO_TEST_SUITE( protocol_tests )

BOOST_AUTO_TEST_CASE( parse_amounts )
{ try {
   BOOST_CHECK_EQUAL( amount_from_string( "0" ).value, 0 );
   BOOST_CHECK_EQUAL( amount_from_string( "42" ).value, 42 * HIRELEDGER_PAYMENT_PRECISION );
   BOOST_CHECK_EQUAL( amount_from_string( "1.5" ).value, 1500000 );
   BOOST_CHECK_EQUAL( amount_from_string( "0.000001" ).value, 1 );
   BOOST_CHECK_EQUAL( amount_from_string( ".25" ).value, 250000 );
   BOOST_CHECK_EQUAL( amount_from_string( "7." ).value, 7000000 );
   BOOST_CHECK_EQUAL( amount_from_string( "0012.340" ).value, 12340000 );

   for( const string bad : { "", ".", "-1", "+1", "1,000", "1.0000001", "1e5", " 1", "1.2.3", "abc",
                             "1000000000001", "1234567890123456789" } )
      HIRELEDGER_CHECK_THROW( amount_from_string( bad ), invalid_amount_exception );

   BOOST_CHECK_EQUAL( amount_from_string( "1000000000000" ).value, HIRELEDGER_MAX_PAYMENT );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( format_amounts )
{ try {
   BOOST_CHECK_EQUAL( amount_to_string( 0 ), "0" );
   BOOST_CHECK_EQUAL( amount_to_string( 90 * HIRELEDGER_PAYMENT_PRECISION ), "90" );
   BOOST_CHECK_EQUAL( amount_to_string( 1500000 ), "1.5" );
   BOOST_CHECK_EQUAL( amount_to_string( 1 ), "0.000001" );
   BOOST_CHECK_EQUAL( amount_to_string( 140500000 ), "140.5" );
   BOOST_CHECK_EQUAL( amount_to_string( -500000 ), "-0.5" );
   BOOST_CHECK_EQUAL( amount_to_string( amount_from_string( "33.333333" ) ), "33.333333" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( percentages_round_down )
{ try {
   BOOST_CHECK_EQUAL( percent_of( 90 * HIRELEDGER_PAYMENT_PRECISION, 50 ).value, 45 * HIRELEDGER_PAYMENT_PRECISION );
   BOOST_CHECK_EQUAL( percent_of( 3, 50 ).value, 1 );
   BOOST_CHECK_EQUAL( percent_of( 99, 1 ).value, 0 );
   BOOST_CHECK_EQUAL( percent_of( 1234567, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( percent_of( 1234567, 100 ).value, 1234567 );
   // no overflow at the largest payment
   BOOST_CHECK_EQUAL( percent_of( HIRELEDGER_MAX_PAYMENT, 100 ).value, HIRELEDGER_MAX_PAYMENT );
   BOOST_CHECK_EQUAL( percent_of( HIRELEDGER_MAX_PAYMENT, 33 ).value, HIRELEDGER_MAX_PAYMENT / 100 * 33 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( status_tokens )
{ try {
   BOOST_CHECK( from_token<job_status>( "IN_PROGRESS" ) == job_status::in_progress );
   BOOST_CHECK( from_token<job_status>( "in_progress" ) == job_status::in_progress );
   BOOST_CHECK( from_token<job_status>( "InProgress" ) == job_status::in_progress );
   BOOST_CHECK( from_token<milestone_status>( "revision_requested" ) == milestone_status::revision_requested );
   BOOST_CHECK( from_token<escrow_status>( "PARTIALLY_RELEASED" ) == escrow_status::partially_released );
   BOOST_CHECK( from_token<dispute_status>( "resolved_split" ) == dispute_status::resolved_split );
   BOOST_CHECK( from_token<verification_level>( "Premium" ) == verification_level::premium );

   HIRELEDGER_CHECK_THROW( from_token<job_status>( "IN-PROGRESS" ), invalid_token_exception );
   HIRELEDGER_CHECK_THROW( from_token<job_status>( "" ), invalid_token_exception );
   HIRELEDGER_CHECK_THROW( from_token<escrow_status>( "POSTED" ), invalid_token_exception );

   BOOST_CHECK_EQUAL( to_token( job_status::cancelled ), "CANCELLED" );
   BOOST_CHECK_EQUAL( to_token( milestone_status::revision_requested ), "REVISION_REQUESTED" );
   BOOST_CHECK_EQUAL( to_token( escrow_status::unfunded ), "UNFUNDED" );
   BOOST_CHECK_EQUAL( to_token( dispute_status::resolved_for_agent ), "RESOLVED_FOR_AGENT" );
   BOOST_CHECK_EQUAL( to_token( verification_level::basic ), "BASIC" );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( owners_are_canonical )
{ try {
   BOOST_CHECK_EQUAL( normalize_owner( "  Alice " ), "alice" );
   BOOST_CHECK_EQUAL( normalize_owner( "0xAbC123" ), "0xabc123" );
   BOOST_CHECK( is_valid_owner( "alice" ) );
   BOOST_CHECK( !is_valid_owner( "Alice" ) );
   BOOST_CHECK( !is_valid_owner( "al ice" ) );
   BOOST_CHECK( !is_valid_owner( "" ) );
   BOOST_CHECK( !is_valid_owner( string( HIRELEDGER_MAX_OWNER_LENGTH + 1, 'a' ) ) );

   HIRELEDGER_CHECK_THROW( normalize_owner( "   " ), unauthorized_exception );
   HIRELEDGER_CHECK_THROW( normalize_owner( "two words" ), unauthorized_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( job_operation_validation )
{ try {
   job_post_operation op;
   op.client  = "alice";
   op.title   = "Build a scraper";
   op.payment = 100 * HIRELEDGER_PAYMENT_PRECISION;
   op.milestones.resize( 2 );
   op.milestones[0].title = "first";
   op.milestones[0].payment_percentage = 40;
   op.milestones[1].title = "second";
   op.milestones[1].payment_percentage = 60;
   op.validate();

   REQUIRE_OP_VALIDATION_FAILURE( op, client, "Alice", unauthorized_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, title, "", invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, payment, 0, invalid_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, payment, -1, invalid_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( op, payment, HIRELEDGER_MAX_PAYMENT + 1, invalid_amount_exception );

   op.milestones[1].payment_percentage = 61;
   HIRELEDGER_REQUIRE_THROW( op.validate(), invalid_milestones_exception );
   op.milestones[1].payment_percentage = 101;
   HIRELEDGER_REQUIRE_THROW( op.validate(), invalid_milestones_exception );
   // milestones may cover less than the whole payment
   op.milestones[1].payment_percentage = 10;
   op.validate();
   op.milestones[1].title = "";
   HIRELEDGER_REQUIRE_THROW( op.validate(), invalid_argument_exception );

   bid_place_operation bid;
   bid.agent          = "bob";
   bid.amount         = 90 * HIRELEDGER_PAYMENT_PRECISION;
   bid.proposal       = "I can do it";
   bid.estimated_days = 3;
   bid.validate();
   REQUIRE_OP_VALIDATION_FAILURE( bid, amount, 0, invalid_amount_exception );
   REQUIRE_OP_VALIDATION_FAILURE( bid, proposal, "", invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( bid, estimated_days, 0u, invalid_argument_exception );

   bid_accept_operation accept;
   accept.client     = "alice";
   accept.agent      = "bob";
   accept.bid_amount = 90;
   accept.validate();
   REQUIRE_OP_VALIDATION_FAILURE( accept, agent, "", invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( accept, bid_amount, 0, invalid_amount_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( other_operation_validation )
{ try {
   escrow_release_operation release;
   release.client = "alice";
   release.amount = 1;
   release.validate();
   REQUIRE_OP_VALIDATION_FAILURE( release, amount, 0, invalid_amount_exception );

   dispute_resolve_operation resolve;
   resolve.arbiter           = "admin";
   resolve.resolution        = dispute_status::resolved_split;
   resolve.refund_percentage = 100;
   resolve.validate();
   REQUIRE_OP_VALIDATION_FAILURE( resolve, refund_percentage, optional<uint8_t>(), invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( resolve, refund_percentage, 101, invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( resolve, resolution, dispute_status::responded, invalid_argument_exception );
   resolve.resolution = dispute_status::resolved_for_agent;
   resolve.refund_percentage.reset();
   resolve.validate();

   agent_rate_operation rate;
   rate.rater  = "alice";
   rate.rating = 5;
   rate.validate();
   REQUIRE_OP_VALIDATION_FAILURE( rate, rating, 0, invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( rate, rating, 6, invalid_argument_exception );

   agent_register_operation reg;
   reg.owner = "bob";
   reg.name  = "Bob";
   reg.validate();
   REQUIRE_OP_VALIDATION_FAILURE( reg, hourly_rate, share_type( 0 ), invalid_amount_exception );

   message_send_operation msg;
   msg.sender    = "alice";
   msg.recipient = "bob";
   msg.content   = "hello";
   msg.validate();
   REQUIRE_OP_VALIDATION_FAILURE( msg, recipient, "alice", invalid_argument_exception );
   REQUIRE_OP_VALIDATION_FAILURE( msg, content, string( HIRELEDGER_MAX_MESSAGE_LENGTH + 1, 'x' ),
                                  invalid_argument_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( transaction_authority )
{ try {
   bid_place_operation bid;
   bid.agent          = "bob";
   bid.amount         = 1;
   bid.proposal       = "p";
   bid.estimated_days = 1;

   signed_transaction trx;
   trx.operations.push_back( bid );

   trx.signer = "bob";
   trx.validate();
   trx.verify_authority();

   trx.signer = "alice";
   HIRELEDGER_REQUIRE_THROW( trx.verify_authority(), missing_authority_exception );
   // a missing signature is an authorization failure
   trx.signer = "";
   HIRELEDGER_REQUIRE_THROW( trx.verify_authority(), unauthorized_exception );

   trx.clear();
   HIRELEDGER_REQUIRE_THROW( trx.validate(), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( object_ids )
{ try {
   BOOST_CHECK( fc::variant( "1.1.3" ).as<job_id_type>( HIRELEDGER_MAX_NESTED_OBJECTS ) == job_id_type( 3 ) );
   BOOST_CHECK_EQUAL( std::string( object_id_type( escrow_id_type( 12 ) ) ), "1.2.12" );
   BOOST_CHECK( object_id_type( 1, 1, 4 ).next() == object_id_type( 1, 1, 5 ) );

   for( const string bad : { "", "1.1", "1.1.", "1..3", "1.1.3.4", "1.1.-3", "x.1.3", "256.1.3" } )
      HIRELEDGER_CHECK_THROW( fc::variant( bad ).as<object_id_type>( HIRELEDGER_MAX_NESTED_OBJECTS ), fc::exception );
   // an escrow id is not a job id
   HIRELEDGER_CHECK_THROW( fc::variant( "1.2.3" ).as<job_id_type>( HIRELEDGER_MAX_NESTED_OBJECTS ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
