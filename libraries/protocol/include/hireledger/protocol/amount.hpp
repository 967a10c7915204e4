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
#pragma once
#include <hireledger/protocol/types.hpp>

namespace hireledger { namespace protocol {

   /**
    *  Converts a decimal string such as "123.45" into fixed point units.
    *
    *  At most HIRELEDGER_PAYMENT_PRECISION_DIGITS fractional digits are accepted. Signs,
    *  exponents, grouping separators and empty strings are rejected with invalid_amount_exception.
    *  Zero parses successfully, callers that need a positive amount must check it.
    */
   share_type amount_from_string( const string& amount_string );

   /// Formats fixed point units as a decimal string without trailing fractional zeros
   string amount_to_string( share_type amount );

   /// amount * percent / 100, rounded down
   share_type percent_of( share_type amount, uint16_t percent );

} } // hireledger::protocol
