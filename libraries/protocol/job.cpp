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
#include <hireledger/protocol/job.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

void validate_text( const string& text, size_t max_size, const char* field, bool allow_empty )
{
   HIRELEDGER_ASSERT( allow_empty || !text.empty(), invalid_argument_exception, "${f} must not be empty", ("f", field) );
   HIRELEDGER_ASSERT( text.size() <= max_size, invalid_argument_exception,
                      "${f} exceeds ${max} bytes", ("f", field)("max", max_size) );
}

void job_post_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
   validate_text( title, HIRELEDGER_MAX_TITLE_LENGTH, "title" );
   validate_text( description, HIRELEDGER_MAX_TEXT_LENGTH, "description", true );
   validate_text( category, HIRELEDGER_MAX_TITLE_LENGTH, "category", true );
   HIRELEDGER_ASSERT( payment > 0, invalid_amount_exception, "Payment must be positive", ("payment", payment) );
   HIRELEDGER_ASSERT( payment <= HIRELEDGER_MAX_PAYMENT, invalid_amount_exception,
                      "Payment exceeds the maximum", ("payment", payment) );
   HIRELEDGER_ASSERT( tags.size() <= HIRELEDGER_MAX_TAGS, invalid_argument_exception,
                      "Too many tags", ("tags", tags.size()) );
   for( const auto& tag : tags )
      validate_text( tag, HIRELEDGER_MAX_TITLE_LENGTH, "tag" );

   uint32_t total_percentage = 0;
   for( const auto& m : milestones )
   {
      validate_text( m.title, HIRELEDGER_MAX_TITLE_LENGTH, "milestone title" );
      validate_text( m.description, HIRELEDGER_MAX_TEXT_LENGTH, "milestone description", true );
      HIRELEDGER_ASSERT( m.payment_percentage <= HIRELEDGER_100_PERCENT, invalid_milestones_exception,
                         "Milestone ${t} pays more than 100 percent", ("t", m.title) );
      total_percentage += m.payment_percentage;
   }
   HIRELEDGER_ASSERT( total_percentage <= HIRELEDGER_100_PERCENT, invalid_milestones_exception,
                      "Milestone percentages sum to ${p}", ("p", total_percentage) );
}

void bid_place_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( agent ), unauthorized_exception, "Invalid agent ${a}", ("a", agent) );
   HIRELEDGER_ASSERT( amount > 0, invalid_amount_exception, "Bid amount must be positive", ("amount", amount) );
   HIRELEDGER_ASSERT( amount <= HIRELEDGER_MAX_PAYMENT, invalid_amount_exception,
                      "Bid amount exceeds the maximum", ("amount", amount) );
   validate_text( proposal, HIRELEDGER_MAX_TEXT_LENGTH, "proposal" );
   HIRELEDGER_ASSERT( estimated_days > 0, invalid_argument_exception, "Estimated days must be positive", );
}

void bid_accept_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
   HIRELEDGER_ASSERT( is_valid_owner( agent ), invalid_argument_exception, "Invalid agent ${a}", ("a", agent) );
   HIRELEDGER_ASSERT( bid_amount > 0, invalid_amount_exception, "Bid amount must be positive", ("amount", bid_amount) );
}

void job_complete_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( agent ), unauthorized_exception, "Invalid agent ${a}", ("a", agent) );
}

void job_cancel_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( client ), unauthorized_exception, "Invalid client ${c}", ("c", client) );
}

} } // hireledger::protocol
