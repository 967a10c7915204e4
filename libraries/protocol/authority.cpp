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
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

#include <boost/algorithm/string.hpp>

#include <cctype>

namespace hireledger { namespace protocol {

bool is_valid_owner( const owner_type& owner )
{
   if( owner.empty() || owner.size() > HIRELEDGER_MAX_OWNER_LENGTH )
      return false;
   for( const char c : owner )
   {
      const auto uc = static_cast<unsigned char>(c);
      if( std::isspace( uc ) || std::iscntrl( uc ) || std::isupper( uc ) )
         return false;
   }
   return true;
}

owner_type normalize_owner( const string& owner )
{
   owner_type result = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( owner ) );
   HIRELEDGER_ASSERT( is_valid_owner( result ), unauthorized_exception,
                      "Invalid principal '${o}'", ("o", owner) );
   return result;
}

} } // hireledger::protocol
