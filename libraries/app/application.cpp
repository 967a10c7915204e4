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
#include <hireledger/app/application.hpp>

#include <hireledger/protocol/authority.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>

#include <atomic>

#include "application_impl.hxx"

namespace hireledger { namespace app {

namespace bpo = boost::program_options;

namespace detail {

void application_impl::startup()
{ try {
   FC_ASSERT( !_running, "application is already running" );
   if( _in_memory )
   {
      ilog( "Starting an in-memory marketplace" );
      _chain_db->initialize( _parameters );
   }
   else
      _chain_db->open( _data_dir / "marketplace", _parameters );

   if( _parameters.administrators.empty() )
      wlog( "No administrator configured, disputes can not be resolved and agents can not be verified" );

   publish_snapshot();
   _running = true;
} FC_CAPTURE_AND_RETHROW( (_data_dir)(_in_memory) ) }

void application_impl::shutdown()
{
   std::lock_guard<std::mutex> guard( _write_mutex );
   if( !_running )
      return;
   _chain_db->close( !_in_memory );
   _running = false;
}

void application_impl::flush()
{
   std::lock_guard<std::mutex> guard( _write_mutex );
   if( _in_memory || !_running || !_unflushed )
      return;
   _chain_db->flush();
   _unflushed = false;
}

chain::processed_transaction application_impl::push_transaction( const chain::signed_transaction& trx )
{
   std::lock_guard<std::mutex> guard( _write_mutex );
   FC_ASSERT( _running, "application is not running" );
   auto result = _chain_db->push_transaction( trx );
   _unflushed = true;
   publish_snapshot();
   return result;
}

void application_impl::publish_snapshot()
{
   std::atomic_store( &_snapshot, _chain_db->snapshot() );
}

} // detail

application::application()
   : my( std::make_shared<detail::application_impl>( this ) )
{
}

application::~application()
{
   try
   {
      my->shutdown();
   }
   catch( const fc::exception& e )
   {
      elog( "Error while shutting down the application: ${e}", ("e", e.to_detail_string()) );
   }
}

void application::set_program_options( bpo::options_description& command_line_options,
                                       bpo::options_description& configuration_file_options )const
{
   const auto& defaults = application_options::get_default();
   configuration_file_options.add_options()
         ("administrator", bpo::value<std::vector<string>>()->composing()->multitoken(),
          "Principal allowed to resolve disputes and verify agents (may specify multiple times)")
         ("api-limit-jobs", bpo::value<uint32_t>()->default_value( defaults.api_limit_jobs ),
          "Maximum number of jobs a query may return")
         ("api-limit-agents", bpo::value<uint32_t>()->default_value( defaults.api_limit_agents ),
          "Maximum number of agents a query may return")
         ("api-limit-disputes", bpo::value<uint32_t>()->default_value( defaults.api_limit_disputes ),
          "Maximum number of disputes a query may return")
         ("api-limit-messages", bpo::value<uint32_t>()->default_value( defaults.api_limit_messages ),
          "Maximum number of messages returned for one job")
         ("max-milestones-per-job", bpo::value<uint16_t>()->default_value( HIRELEDGER_DEFAULT_MAX_MILESTONES ),
          "Maximum number of milestones a job may define")
         ("log-level", bpo::value<string>()->default_value( "info" ),
          "Console log level: debug, info, warn or error")
         ;
   command_line_options.add( configuration_file_options );
   command_line_options.add_options()
         ("in-memory", "Keep the marketplace in memory only, nothing is written to the data dir")
         ;
}

void application::initialize( const fc::path& data_dir, const bpo::variables_map& options )
{ try {
   my->_data_dir = data_dir;
   my->_in_memory = data_dir == fc::path() || options.count( "in-memory" ) > 0;

   if( options.count( "api-limit-jobs" ) )
      my->_app_options.api_limit_jobs = options.at( "api-limit-jobs" ).as<uint32_t>();
   if( options.count( "api-limit-agents" ) )
      my->_app_options.api_limit_agents = options.at( "api-limit-agents" ).as<uint32_t>();
   if( options.count( "api-limit-disputes" ) )
      my->_app_options.api_limit_disputes = options.at( "api-limit-disputes" ).as<uint32_t>();
   if( options.count( "api-limit-messages" ) )
      my->_app_options.api_limit_messages = options.at( "api-limit-messages" ).as<uint32_t>();

   if( options.count( "max-milestones-per-job" ) )
      my->_parameters.max_milestones_per_job = options.at( "max-milestones-per-job" ).as<uint16_t>();

   my->_parameters.administrators.clear();
   if( options.count( "administrator" ) )
   {
      for( const auto& admin : options.at( "administrator" ).as<std::vector<string>>() )
      {
         const auto owner = protocol::normalize_owner( admin );
         FC_ASSERT( protocol::is_valid_owner( owner ), "invalid administrator '${a}'", ("a", admin) );
         my->_parameters.administrators.insert( owner );
      }
   }
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

void application::startup()
{
   my->startup();
}

void application::shutdown()
{
   my->shutdown();
}

void application::flush()
{
   my->flush();
}

std::shared_ptr<chain::database> application::chain_database()const
{
   return my->_chain_db;
}

chain::processed_transaction application::push_transaction( const chain::signed_transaction& trx )
{
   return my->push_transaction( trx );
}

std::shared_ptr<const db::object_database> application::snapshot()const
{
   auto result = std::atomic_load( &my->_snapshot );
   FC_ASSERT( result, "application has not been started" );
   return result;
}

const application_options& application::get_options()const
{
   return my->_app_options;
}

bool application::is_persistent()const
{
   return !my->_in_memory;
}

bool application::has_unflushed_changes()const
{
   std::lock_guard<std::mutex> guard( my->_write_mutex );
   return my->_unflushed;
}

} } // hireledger::app
