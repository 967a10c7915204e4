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
#include <hireledger/protocol/escrow.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

void escrow_fund_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
   HIRELEDGER_ASSERT( amount > 0, invalid_amount_exception, "Deposit must be positive", ("amount", amount) );
   HIRELEDGER_ASSERT( amount <= HIRELEDGER_MAX_PAYMENT, invalid_amount_exception,
                      "Deposit exceeds the maximum", ("amount", amount) );
}

void escrow_release_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
   HIRELEDGER_ASSERT( amount > 0, invalid_amount_exception, "Release must be positive", ("amount", amount) );
}

} } // hireledger::protocol
