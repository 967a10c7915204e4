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

#include <hireledger/app/config_util.hpp>

#include <fc/filesystem.hpp>

#include <boost/filesystem/fstream.hpp>

using namespace hireledger::chain;
using namespace hireledger::chain::test;
using namespace hireledger::app;

namespace bpo = boost::program_options;

BOOST_AUTO_TEST_SUITE( app_util_tests )

BOOST_AUTO_TEST_CASE( log_levels )
{
   BOOST_CHECK( string_to_level( "info" ) == fc::log_level::info );
   BOOST_CHECK( string_to_level( " DEBUG " ) == fc::log_level::debug );
   BOOST_CHECK( string_to_level( "warn" ) == fc::log_level::warn );
   BOOST_CHECK( string_to_level( "Error" ) == fc::log_level::error );
   BOOST_CHECK( string_to_level( "all" ) == fc::log_level::all );
   HIRELEDGER_CHECK_THROW( string_to_level( "verbose" ), fc::exception );
}

BOOST_AUTO_TEST_CASE( default_config_file_is_written )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );

   application app;
   bpo::options_description cli, cfg;
   app.set_program_options( cli, cfg );

   bpo::variables_map options;
   load_configuration_options( data_dir.path(), cfg, options );
   bpo::notify( options );

   BOOST_CHECK( fc::exists( data_dir.path() / "config.ini" ) );
   BOOST_CHECK_EQUAL( options.at( "api-limit-jobs" ).as<uint32_t>(), 100u );
   BOOST_CHECK_EQUAL( options.at( "api-limit-messages" ).as<uint32_t>(), 500u );
   BOOST_CHECK_EQUAL( options.at( "max-milestones-per-job" ).as<uint16_t>(), HIRELEDGER_DEFAULT_MAX_MILESTONES );
   BOOST_CHECK_EQUAL( options.at( "log-level" ).as<string>(), "info" );
   BOOST_CHECK_EQUAL( options.count( "administrator" ), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( config_file_sets_limits_and_administrators )
{ try {
   fc::temp_directory data_dir( fc::temp_directory_path() );
   {
      boost::filesystem::ofstream out( data_dir.path() / "config.ini" );
      out << "api-limit-jobs = 7\n"
          << "max-milestones-per-job = 2\n"
          << "administrator = Root\n"
          << "administrator = judge\n";
   }

   application app;
   bpo::options_description cli, cfg;
   app.set_program_options( cli, cfg );

   bpo::variables_map options;
   load_configuration_options( data_dir.path(), cfg, options );
   bpo::notify( options );

   app.initialize( fc::path(), options );
   app.startup();
   BOOST_CHECK( !app.is_persistent() );
   BOOST_CHECK_EQUAL( app.get_options().api_limit_jobs, 7u );
   BOOST_CHECK_EQUAL( app.get_options().api_limit_agents, 100u );

   const auto db = app.chain_database();
   BOOST_CHECK( db->is_administrator( "root" ) );
   BOOST_CHECK( db->is_administrator( "judge" ) );
   BOOST_CHECK( !db->is_administrator( "alice" ) );
   BOOST_CHECK_EQUAL( db->get_parameters().max_milestones_per_job, 2u );

   marketplace_api api( app );
   post_job_args job;
   job.title   = "Three steps";
   job.payment = "30";
   job.milestones.resize( 3 );
   for( auto& m : job.milestones )
   {
      m.title = "step";
      m.payment_percentage = 30;
   }
   HIRELEDGER_CHECK_THROW( api.post_job( "alice", job ), hireledger::protocol::invalid_milestones_exception );

   job_query q;
   q.limit = 8;
   HIRELEDGER_CHECK_THROW( api.get_database_api().get_jobs( q ), hireledger::protocol::invalid_argument_exception );
   q.limit = 7;
   BOOST_CHECK( api.get_database_api().get_jobs( q ).empty() );

   post_job_args ops;
   ops.title    = "Rotate keys";
   ops.payment  = "5";
   ops.category = "Ops";
   for( int i = 0; i < 8; ++i )
      api.post_job( "alice", ops );
   BOOST_CHECK_EQUAL( api.get_database_api().get_jobs_by_category( "ops" ).size(), 7u );
   app.shutdown();
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
