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
#include <hireledger/chain/database.hpp>

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/job_object.hpp>

#include <fc/filesystem.hpp>

namespace hireledger { namespace chain {

database::database()
{
   initialize_indexes();
   initialize_evaluators();
   _clock = []() { return time_point_sec( fc::time_point::now() ); };
}

database::~database() = default;

void database::set_clock( std::function<time_point_sec()> clock )
{
   FC_ASSERT( clock, "a clock is required" );
   _clock = std::move( clock );
}

void database::initialize( const marketplace_parameters& params )
{ try {
   FC_ASSERT( !_opened, "database is already open" );
   init_global_properties( params );
   _undo_db.enable();
   _opened = true;
} FC_CAPTURE_AND_RETHROW( (params) ) }

void database::open( const fc::path& data_dir, const marketplace_parameters& params )
{ try {
   FC_ASSERT( !_opened, "database is already open" );
   if( !fc::exists( data_dir ) )
      fc::create_directories( data_dir );

   object_database::open( data_dir );
   init_global_properties( params );

   _undo_db.enable();
   _opened = true;
   ilog( "Opened marketplace database in ${d} with ${j} jobs and ${a} agents",
         ("d", data_dir.generic_string())
         ("j", get_index_type<job_index>().size())
         ("a", get_index_type<agent_index>().size()) );
} FC_CAPTURE_LOG_AND_RETHROW( (data_dir) ) }

void database::close( bool flush )
{
   if( !_opened )
      return;

   FC_ASSERT( _undo_db.active_sessions() == 0, "cannot close the database inside a transaction" );

   if( flush && get_data_dir() != fc::path() )
   {
      ilog( "Flushing marketplace database to ${d}", ("d", get_data_dir().generic_string()) );
      object_database::flush();
   }
   object_database::close();
   _undo_db.disable();
   _opened = false;
}

void database::wipe( const fc::path& data_dir )
{
   ilog( "Wiping marketplace database in ${d}", ("d", data_dir.generic_string()) );
   close( false );
   object_database::wipe( data_dir );
}

void database::init_global_properties( const marketplace_parameters& params )
{
   const auto& idx = get_index_type<global_property_index>();
   if( idx.size() == 0 )
   {
      create<global_property_object>( [&params]( global_property_object& p ) {
         p.parameters = params;
      });
      return;
   }
   modify( get_global_properties(), [&params]( global_property_object& p ) {
      p.parameters = params;
   });
}

} }
