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
#include <hireledger/db/object_database.hpp>

#include <fc/io/raw.hpp>

namespace hireledger { namespace db {

object_database::object_database()
:_undo_db(*this)
{
   _index.resize( _index_size );
}

void object_database::close()
{
}

const object* object_database::find_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).find( id );
}

const object& object_database::get_object( const object_id_type& id )const
{
   return get_index( id.space(), id.type() ).get( id );
}

const index& object_database::get_index( uint8_t space_id, uint8_t type_id )const
{
   FC_ASSERT( _index[space_id].size() > type_id && _index[space_id][type_id] != nullptr,
              "Database index ${space_id}.${type_id} has not been initialized",
              ("space_id",space_id)("type_id",type_id) );
   return *_index[space_id][type_id];
}

index& object_database::get_mutable_index( uint8_t space_id, uint8_t type_id )
{
   FC_ASSERT( _index[space_id].size() > type_id && _index[space_id][type_id] != nullptr,
              "Database index ${space_id}.${type_id} has not been initialized",
              ("space_id",space_id)("type_id",type_id) );
   return *_index[space_id][type_id];
}

const object& object_database::insert( object&& obj )
{
   return get_mutable_index( obj.id.space(), obj.id.type() ).insert( std::move(obj) );
}

void object_database::remove( const object& obj )
{
   save_undo_remove( obj );
   get_mutable_index( obj.id.space(), obj.id.type() ).remove( obj );
}

std::shared_ptr<const object_database> object_database::snapshot()const
{
   auto copy = std::make_shared<object_database>();
   for( size_t space = 0; space < _index.size(); ++space )
   {
      if( _index[space].empty() ) continue;
      copy->_index[space].resize( _index[space].size() );
      for( size_t type = 0; type < _index[space].size(); ++type )
         if( _index[space][type] )
            copy->_index[space][type] = _index[space][type]->clone();
   }
   copy->_data_dir = _data_dir;
   return copy;
}

void object_database::flush()
{ try {
   FC_ASSERT( _data_dir != fc::path(), "object database has no data directory" );
   const auto tmp_dir = _data_dir / "object_database.tmp";
   const auto old_dir = _data_dir / "object_database.old";
   const auto target_dir = _data_dir / "object_database";

   if( fc::exists( tmp_dir ) )
      fc::remove_all( tmp_dir );
   fc::create_directories( tmp_dir / "lock" );

   for( size_t space = 0; space < _index.size(); ++space )
   {
      if( _index[space].empty() ) continue;
      fc::create_directories( tmp_dir / fc::to_string(space) );
      for( size_t type = 0; type < _index[space].size(); ++type )
         if( _index[space][type] )
            _index[space][type]->save( tmp_dir / fc::to_string(space) / fc::to_string(type) );
   }

   fc::remove_all( tmp_dir / "lock" );
   if( fc::exists( target_dir ) )
   {
      if( fc::exists( old_dir ) )
         fc::remove_all( old_dir );
      fc::rename( target_dir, old_dir );
   }
   fc::rename( tmp_dir, target_dir );
   fc::remove_all( old_dir );
} FC_CAPTURE_AND_RETHROW( (_data_dir) ) }

void object_database::wipe( const fc::path& data_dir )
{
   close();
   ilog( "Wiping object database..." );
   fc::remove_all( data_dir / "object_database" );
   ilog( "Done wiping object database." );
}

void object_database::open( const fc::path& data_dir )
{ try {
   _data_dir = data_dir;
   if( fc::exists( _data_dir / "object_database" / "lock" ) )
   {
      wlog( "Ignoring locked object_database" );
      return;
   }

   ilog( "Opening object database from ${d} ...", ("d", data_dir.generic_string()) );
   for( size_t space = 0; space < _index.size(); ++space )
      for( size_t type = 0; type < _index[space].size(); ++type )
         if( _index[space][type] )
            _index[space][type]->open( _data_dir / "object_database" / fc::to_string(space) / fc::to_string(type) );
   ilog( "Done opening object database." );
} FC_CAPTURE_AND_RETHROW( (data_dir) ) }

} } // hireledger::db
