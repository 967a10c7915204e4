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
#include <hireledger/protocol/agent.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/exceptions.hpp>

namespace hireledger { namespace protocol {

namespace {

   void validate_skills( const flat_set<string>& skills )
   {
      HIRELEDGER_ASSERT( skills.size() <= HIRELEDGER_MAX_SKILLS, invalid_argument_exception,
                         "Too many skills", ("skills", skills.size()) );
      for( const auto& skill : skills )
         validate_text( skill, HIRELEDGER_MAX_TITLE_LENGTH, "skill" );
   }

   void validate_portfolio( const vector<string>& urls )
   {
      HIRELEDGER_ASSERT( urls.size() <= HIRELEDGER_MAX_PORTFOLIO_URLS, invalid_argument_exception,
                         "Too many portfolio urls", ("urls", urls.size()) );
      for( const auto& url : urls )
         validate_text( url, HIRELEDGER_MAX_TITLE_LENGTH, "portfolio url" );
   }

   void validate_rate( const optional<share_type>& rate )
   {
      if( rate.valid() )
         HIRELEDGER_ASSERT( *rate > 0 && *rate <= HIRELEDGER_MAX_PAYMENT, invalid_amount_exception,
                            "Hourly rate must be positive", ("rate", *rate) );
   }

}

void agent_register_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( owner ), unauthorized_exception, "Invalid owner ${o}", ("o", owner) );
   validate_text( name, HIRELEDGER_MAX_TITLE_LENGTH, "name" );
   validate_text( description, HIRELEDGER_MAX_TEXT_LENGTH, "description", true );
   validate_skills( skills );
   validate_portfolio( portfolio_urls );
   validate_rate( hourly_rate );
}

void agent_update_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( owner ), unauthorized_exception, "Invalid owner ${o}", ("o", owner) );
   if( name.valid() )
      validate_text( *name, HIRELEDGER_MAX_TITLE_LENGTH, "name" );
   if( description.valid() )
      validate_text( *description, HIRELEDGER_MAX_TEXT_LENGTH, "description", true );
   if( skills.valid() )
      validate_skills( *skills );
   if( portfolio_urls.valid() )
      validate_portfolio( *portfolio_urls );
   validate_rate( hourly_rate );
}

void agent_rate_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( rater ), unauthorized_exception, "Invalid rater ${r}", ("r", rater) );
   HIRELEDGER_ASSERT( rating >= HIRELEDGER_MIN_RATING && rating <= HIRELEDGER_MAX_RATING, invalid_argument_exception,
                      "Rating must be between ${min} and ${max}",
                      ("min", HIRELEDGER_MIN_RATING)("max", HIRELEDGER_MAX_RATING)("rating", rating) );
   validate_text( review, HIRELEDGER_MAX_TEXT_LENGTH, "review", true );
}

void agent_verify_operation::validate()const
{
   HIRELEDGER_ASSERT( is_valid_owner( admin ), unauthorized_exception, "Invalid admin ${a}", ("a", admin) );
   HIRELEDGER_ASSERT( is_valid_owner( agent ), invalid_argument_exception, "Invalid agent ${a}", ("a", agent) );
}

} } // hireledger::protocol
