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
#include <hireledger/protocol/dispute.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

void dispute_open_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( initiator ), unauthorized_exception, "Invalid initiator ${i}", ("i", initiator) );
   validate_text( reason, HIRELEDGER_MAX_TEXT_LENGTH, "reason" );
}

void dispute_respond_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( responder ), unauthorized_exception, "Invalid responder ${r}", ("r", responder) );
   validate_text( response, HIRELEDGER_MAX_TEXT_LENGTH, "response" );
}

void dispute_resolve_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( arbiter ), unauthorized_exception, "Invalid arbiter ${a}", ("a", arbiter) );
   HIRELEDGER_ASSERT( is_resolved( resolution ), invalid_argument_exception,
                      "Resolution must be a resolved state", ("resolution", resolution) );
   if( resolution == dispute_status::resolved_split )
   {
      HIRELEDGER_ASSERT( refund_percentage.valid(), invalid_argument_exception,
                         "A split resolution requires a refund percentage", );
      HIRELEDGER_ASSERT( *refund_percentage <= HIRELEDGER_100_PERCENT, invalid_argument_exception,
                         "Refund percentage ${p} exceeds 100", ("p", *refund_percentage) );
   }
   validate_text( notes, HIRELEDGER_MAX_TEXT_LENGTH, "notes", true );
}

} } // hireledger::protocol
