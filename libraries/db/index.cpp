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
#include <hireledger/db/index.hpp>

#include <fc/io/datastream.hpp>
#include <fc/io/fstream.hpp>
#include <fc/io/raw.hpp>

#include <fstream>

namespace hireledger { namespace db {

void index::open( const fc::path& db )
{ try {
   if( !fc::exists( db ) ) return;

   std::string content;
   fc::read_file_contents( db, content );
   fc::datastream<const char*> ds( content.data(), content.size() );

   object_id_type next_id;
   fc::raw::unpack( ds, next_id );
   FC_ASSERT( next_id.space() == object_space_id() && next_id.type() == object_type_id(),
              "Index file ${f} does not belong to this index", ("f", db.generic_string()) );

   std::vector<char> packed;
   while( ds.remaining() > 0 )
   {
      fc::raw::unpack( ds, packed );
      load( packed );
   }
   _next_id = next_id;
} FC_CAPTURE_AND_RETHROW( (db) ) }

void index::save( const fc::path& db )const
{
   std::ofstream out( db.generic_string(), std::ofstream::binary | std::ofstream::out | std::ofstream::trunc );
   FC_ASSERT( out, "Unable to write ${f}", ("f", db.generic_string()) );
   fc::raw::pack( out, _next_id );
   inspect_all_objects( [&out]( const object& o ) {
      auto packed = fc::raw::pack( o.pack() );
      out.write( packed.data(), packed.size() );
   });
}

} } // hireledger::db
