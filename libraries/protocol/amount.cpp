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
#include <hireledger/protocol/amount.hpp>
#include <hireledger/protocol/exceptions.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <cctype>

namespace hireledger { namespace protocol {

share_type amount_from_string( const string& amount_string )
{ try {
   HIRELEDGER_ASSERT( !amount_string.empty(), invalid_amount_exception, "Amount is empty", );

   bool decimal_found = false;
   for( const char c : amount_string )
   {
      if( std::isdigit( static_cast<unsigned char>(c) ) )
         continue;
      if( c == '.' && !decimal_found )
      {
         decimal_found = true;
         continue;
      }
      FC_THROW_EXCEPTION( invalid_amount_exception, "Malformed amount ${a}", ("a", amount_string) );
   }

   const auto decimal_pos = amount_string.find( '.' );
   const string lhs = amount_string.substr( 0, decimal_pos );
   const string rhs = decimal_found ? amount_string.substr( decimal_pos + 1 ) : string();
   HIRELEDGER_ASSERT( !lhs.empty() || !rhs.empty(), invalid_amount_exception,
                      "Malformed amount ${a}", ("a", amount_string) );
   HIRELEDGER_ASSERT( rhs.size() <= HIRELEDGER_PAYMENT_PRECISION_DIGITS, invalid_amount_exception,
                      "Amount ${a} has more than ${d} decimal places",
                      ("a", amount_string)("d", HIRELEDGER_PAYMENT_PRECISION_DIGITS) );
   // 19 digits can overflow int64, the maximum check below catches anything shorter
   HIRELEDGER_ASSERT( lhs.size() <= 18, invalid_amount_exception, "Amount ${a} is too large", ("a", amount_string) );

   int64_t units = 0;
   if( !lhs.empty() )
   {
      const int64_t whole = std::stoll( lhs );
      HIRELEDGER_ASSERT( whole <= HIRELEDGER_MAX_PAYMENT / HIRELEDGER_PAYMENT_PRECISION, invalid_amount_exception,
                         "Amount ${a} is too large", ("a", amount_string) );
      units = whole * HIRELEDGER_PAYMENT_PRECISION;
   }
   if( !rhs.empty() )
   {
      string fraction = rhs;
      while( fraction.size() < HIRELEDGER_PAYMENT_PRECISION_DIGITS )
         fraction += '0';
      units += std::stoll( fraction );
   }
   HIRELEDGER_ASSERT( units <= HIRELEDGER_MAX_PAYMENT, invalid_amount_exception,
                      "Amount ${a} is too large", ("a", amount_string) );
   return share_type( units );
} FC_CAPTURE_AND_RETHROW( (amount_string) ) }

string amount_to_string( share_type amount )
{
   const int64_t value = amount.value;
   string result = fc::to_string( value / HIRELEDGER_PAYMENT_PRECISION );
   int64_t decimals = value % HIRELEDGER_PAYMENT_PRECISION;
   if( decimals < 0 )
   {
      decimals = -decimals;
      if( result == "0" )
         result = "-0";
   }
   if( decimals )
   {
      string fraction = fc::to_string( HIRELEDGER_PAYMENT_PRECISION + decimals ).erase( 0, 1 );
      while( !fraction.empty() && fraction.back() == '0' )
         fraction.pop_back();
      result += "." + fraction;
   }
   return result;
}

share_type percent_of( share_type amount, uint16_t percent )
{
   boost::multiprecision::int128_t product = amount.value;
   product *= percent;
   product /= HIRELEDGER_100_PERCENT;
   return share_type( static_cast<int64_t>( product ) );
}

} } // hireledger::protocol
