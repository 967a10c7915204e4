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

#include <hireledger/chain/message_object.hpp>
#include <hireledger/protocol/config.hpp>

using namespace hireledger::chain;
using namespace hireledger::chain::test;

BOOST_FIXTURE_TEST_SUITE( message_tests, database_fixture )

BOOST_AUTO_TEST_CASE( participants_can_message )
{ try {
   const job_id_type job_id = post_job( "alice" );
   register_agent( "bob" );
   register_agent( "carol" );

   // bob has no bid yet and takes no part in the job
   HIRELEDGER_REQUIRE_THROW( api.send_message( "bob", job_id, "alice", "hi" ), hireledger::protocol::unauthorized_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id, "bob", "hi" ), hireledger::protocol::invalid_argument_exception );

   place_bid( "bob", job_id, "90" );
   const message_id_type id = api.send_message( "bob", job_id, " Alice", "Questions about the shops" );

   const message_object& msg = db.get( id );
   BOOST_CHECK( msg.job == job_id );
   BOOST_CHECK( msg.sender == "bob" );
   BOOST_CHECK( msg.recipient == "alice" );
   BOOST_CHECK( msg.content == "Questions about the shops" );
   BOOST_CHECK( msg.timestamp == now );
   BOOST_CHECK( !msg.read );

   api.send_message( "alice", job_id, "bob", "Three of them" );

   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id, "alice", "note to self" ),
                             hireledger::protocol::invalid_argument_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id, "bob", "" ),
                             hireledger::protocol::invalid_argument_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id, "   ", "hello" ),
                             hireledger::protocol::invalid_argument_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "carol", job_id, "alice", "can I help" ),
                             hireledger::protocol::unauthorized_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id_type( 3 ), "bob", "hello" ), not_found_exception );
   HIRELEDGER_REQUIRE_THROW( api.send_message( "alice", job_id, "bob", string( HIRELEDGER_MAX_MESSAGE_LENGTH + 1, 'x' ) ),
                             hireledger::protocol::invalid_argument_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( mark_messages_read )
{ try {
   const job_id_type first = start_job( "alice", "bob" );
   const job_id_type second = start_job( "alice", "bob" );

   api.send_message( "bob", first, "alice", "one" );
   api.send_message( "bob", first, "alice", "two" );
   api.send_message( "bob", second, "alice", "three" );
   api.send_message( "alice", first, "bob", "four" );

   auto unread = [this]( const string& user ) {
      return query().get_unread_messages_count( user );
   };
   BOOST_CHECK_EQUAL( unread( "alice" ), 3u );
   BOOST_CHECK_EQUAL( unread( "bob" ), 1u );

   HIRELEDGER_REQUIRE_THROW( api.mark_messages_read( "carol", first ), hireledger::protocol::unauthorized_exception );

   api.mark_messages_read( "alice", first );
   BOOST_CHECK_EQUAL( unread( "alice" ), 1u );
   // messages alice sent are untouched
   BOOST_CHECK_EQUAL( unread( "bob" ), 1u );

   // marking again changes nothing
   api.mark_messages_read( "alice", first );
   BOOST_CHECK_EQUAL( unread( "alice" ), 1u );

   api.mark_messages_read( "alice", second );
   BOOST_CHECK_EQUAL( unread( "alice" ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
