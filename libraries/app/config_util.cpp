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
#include <hireledger/app/config_util.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/filesystem/fstream.hpp>

namespace hireledger { namespace app {

namespace bpo = boost::program_options;

namespace {

   /// the default of an option as printed by format_parameter(), "arg (=100)" gives "100"
   std::string default_value_text( const bpo::option_description& od )
   {
      const std::string formatted = od.format_parameter();
      const auto start = formatted.find( "(=" );
      if( start == std::string::npos )
         return std::string();
      const auto end = formatted.rfind( ')' );
      if( end == std::string::npos || end < start + 2 )
         return std::string();
      return formatted.substr( start + 2, end - start - 2 );
   }

   void write_default_config_file( const fc::path& config_ini_path, const bpo::options_description& cfg_options )
   {
      ilog( "Writing new config file at ${path}", ("path", config_ini_path) );
      if( !fc::exists( config_ini_path.parent_path() ) )
         fc::create_directories( config_ini_path.parent_path() );

      boost::filesystem::ofstream out_cfg( config_ini_path );
      FC_ASSERT( out_cfg, "unable to write ${path}", ("path", config_ini_path) );
      for( const boost::shared_ptr<bpo::option_description>& od : cfg_options.options() )
      {
         if( !od->description().empty() )
            out_cfg << "# " << od->description() << "\n";
         boost::any store;
         if( !od->semantic()->apply_default( store ) )
            out_cfg << "# " << od->long_name() << " = \n";
         else
            out_cfg << od->long_name() << " = " << default_value_text( *od ) << "\n";
         out_cfg << "\n";
      }
   }

}

void load_configuration_options( const fc::path& data_dir,
                                 const bpo::options_description& cfg_options,
                                 bpo::variables_map& options )
{ try {
   const fc::path config_ini_path = data_dir / "config.ini";
   if( !fc::exists( config_ini_path ) )
      write_default_config_file( config_ini_path, cfg_options );

   bpo::store( bpo::parse_config_file<char>( config_ini_path.preferred_string().c_str(), cfg_options, true ),
               options );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

fc::log_level string_to_level( const std::string& level )
{
   const std::string lower = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( level ) );
   if( lower == "info" )
      return fc::log_level::info;
   if( lower == "debug" )
      return fc::log_level::debug;
   if( lower == "warn" )
      return fc::log_level::warn;
   if( lower == "error" )
      return fc::log_level::error;
   if( lower == "all" )
      return fc::log_level::all;
   FC_THROW( "Log level not allowed. Allowed levels are info, debug, warn, error and all." );
}

void setup_logging( const std::string& level )
{
   fc::logging_config cfg;

   fc::console_appender::config console_appender_config;
   console_appender_config.stream = fc::console_appender::stream::std_error;
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::debug, fc::console_appender::color::green ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::warn, fc::console_appender::color::brown ) );
   console_appender_config.level_colors.emplace_back(
         fc::console_appender::level_color( fc::log_level::error, fc::console_appender::color::red ) );
   cfg.appenders.push_back( fc::appender_config( "default", "console", fc::variant( console_appender_config, 20 ) ) );

   cfg.loggers = { fc::logger_config( "default" ) };
   cfg.loggers.front().level = string_to_level( level );
   cfg.loggers.front().appenders = { "default" };

   fc::configure_logging( cfg );
}

} } // hireledger::app
