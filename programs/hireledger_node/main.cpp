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
#include <hireledger/app/api.hpp>
#include <hireledger/app/api_dispatcher.hpp>
#include <hireledger/app/application.hpp>
#include <hireledger/app/config_util.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/algorithm/string/replace.hpp>
#include <boost/filesystem.hpp>
#include <boost/version.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

/// Logs to the console with default color and no format via fc::console_appender
void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print( s );
   my_appender.print( "\n" );
}

/// Reads one request per line from stdin and writes one reply per line to stdout
int main( int argc, char** argv ) {
   auto node = std::make_unique<hireledger::app::application>();
   fc::oexception unhandled_exception;
   try {
      bpo::options_description app_options( "Hireledger Node" );
      bpo::options_description cfg_options( "Hireledger Node" );
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("data-dir,d", bpo::value<boost::filesystem::path>()->default_value( "hireledger_node_data_dir" ),
                    "Directory containing the marketplace database and the configuration file")
            ("version,v", "Display version information");

      bpo::variables_map options;

      try
      {
         bpo::options_description cli;
         bpo::options_description cfg;
         node->set_program_options( cli, cfg );
         app_options.add( cli );
         cfg_options.add( cfg );
         bpo::store( bpo::parse_command_line( argc, argv, app_options ), options );
      }
      catch( const boost::program_options::error& e )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count( "version" ) > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Hireledger node\n";
         ss << "Boost: " << boost::replace_all_copy( std::string( BOOST_LIB_VERSION ), "_", "." );
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      if( options.count( "help" ) > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }

      fc::path data_dir;
      if( options.count( "data-dir" ) > 0 )
      {
         data_dir = options["data-dir"].as<boost::filesystem::path>();
         if( data_dir.is_relative() )
            data_dir = fc::current_path() / data_dir;
      }
      if( options.count( "in-memory" ) == 0 )
         hireledger::app::load_configuration_options( data_dir, cfg_options, options );

      bpo::notify( options );

      hireledger::app::setup_logging( options.at( "log-level" ).as<std::string>() );

      node->initialize( data_dir, options );
      node->startup();

      node->chain_database()->applied_transaction.connect( []( const hireledger::chain::processed_transaction& ptrx ) {
         for( const auto& vop : ptrx.virtual_operations )
            dlog( "Escrow movement ${op}", ("op", vop) );
      });

      hireledger::app::marketplace_api api( *node );
      hireledger::app::api_dispatcher dispatcher( api );

      ilog( "Started hireledger node, reading requests from stdin" );

      std::string line;
      while( std::getline( std::cin, line ) )
      {
         if( line.find_first_not_of( " \t\r" ) == std::string::npos )
            continue;
         const fc::variant_object reply = dispatcher.handle_request( line );
         std::cout << hireledger::app::api_dispatcher::to_json( reply ) << std::endl;
         if( reply.contains( "error" ) )
            wlog( "Request failed: ${e}", ("e", reply["error"]) );

         // queries leave nothing to write, a failed write is retried after the next request
         try {
            node->flush();
         } catch( const fc::exception& e ) {
            elog( "Failed to write the marketplace state: ${e}", ("e", e.to_detail_string()) );
         }
      }

      ilog( "Input closed, exiting" );
      node->shutdown();
      return EXIT_SUCCESS;
   } catch( const fc::exception& e ) {
      unhandled_exception = e;
   }

   if( unhandled_exception )
   {
      elog( "Exiting with error:\n${e}", ("e", unhandled_exception->to_detail_string()) );
      return EXIT_FAILURE;
   }
   return EXIT_SUCCESS;
}
