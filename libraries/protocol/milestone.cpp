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
#include <hireledger/protocol/milestone.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

void milestone_submit_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( agent ), unauthorized_exception, "Invalid agent ${a}", ("a", agent) );
   validate_text( notes, HIRELEDGER_MAX_TEXT_LENGTH, "notes", true );
}

void milestone_approve_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
}

void milestone_revision_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
   validate_text( feedback, HIRELEDGER_MAX_TEXT_LENGTH, "feedback", true );
}

} } // hireledger::protocol
