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
#include <hireledger/protocol/message.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

void message_send_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( sender ), unauthorized_exception, "Invalid sender ${s}", ("s", sender) );
   HIRELEDGER_ASSERT( is_valid_owner( recipient ), invalid_argument_exception, "Invalid recipient ${r}", ("r", recipient) );
   HIRELEDGER_ASSERT( sender != recipient, invalid_argument_exception, "Cannot send a message to yourself", );
   validate_text( content, HIRELEDGER_MAX_MESSAGE_LENGTH, "content" );
}

void messages_mark_read_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( reader ), unauthorized_exception, "Invalid reader ${r}", ("r", reader) );
}

} } // hireledger::protocol
