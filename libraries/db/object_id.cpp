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
#include <hireledger/db/object_id.hpp>

#include <fc/variant.hpp>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <vector>

namespace hireledger { namespace db {

object_id_type::operator std::string()const
{
   return fc::to_string( uint64_t(space()) ) + "." + fc::to_string( uint64_t(type()) ) + "." + fc::to_string( instance() );
}

object_id_type object_id_type::from_string( const std::string& s )
{ try {
   std::vector<std::string> parts;
   boost::split( parts, s, boost::is_any_of( "." ) );
   FC_ASSERT( parts.size() == 3, "An object id has the form space.type.instance" );
   for( const auto& p : parts )
      FC_ASSERT( !p.empty() && p.find_first_not_of( "0123456789" ) == std::string::npos,
                 "Object id parts are unsigned numbers" );

   const uint64_t space = fc::to_uint64( parts[0] );
   const uint64_t type  = fc::to_uint64( parts[1] );
   FC_ASSERT( space <= 0xff && type <= 0xff, "Space or type overflow" );
   return object_id_type( uint8_t(space), uint8_t(type), fc::to_uint64( parts[2] ) );
} FC_CAPTURE_AND_RETHROW( (s) ) }

} } // hireledger::db

namespace fc {

void to_variant( const hireledger::db::object_id_type& var, fc::variant& vo, uint32_t max_depth )
{
   vo = std::string( var );
}

void from_variant( const fc::variant& var, hireledger::db::object_id_type& vo, uint32_t max_depth )
{
   vo = hireledger::db::object_id_type::from_string( var.get_string() );
}

} // fc
