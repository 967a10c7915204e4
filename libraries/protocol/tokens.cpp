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
#include <hireledger/protocol/tokens.hpp>

#include <cctype>

namespace hireledger { namespace protocol {

namespace detail {

   const std::pair<job_status, const char*> job_status_tokens[] = {
      { job_status::posted,      "POSTED" },
      { job_status::in_progress, "IN_PROGRESS" },
      { job_status::completed,   "COMPLETED" },
      { job_status::cancelled,   "CANCELLED" },
      { job_status::disputed,    "DISPUTED" }
   };

   const std::pair<milestone_status, const char*> milestone_status_tokens[] = {
      { milestone_status::pending,            "PENDING" },
      { milestone_status::submitted,          "SUBMITTED" },
      { milestone_status::approved,           "APPROVED" },
      { milestone_status::revision_requested, "REVISION_REQUESTED" }
   };

   const std::pair<escrow_status, const char*> escrow_status_tokens[] = {
      { escrow_status::unfunded,           "UNFUNDED" },
      { escrow_status::locked,             "LOCKED" },
      { escrow_status::released,           "RELEASED" },
      { escrow_status::refunded,           "REFUNDED" },
      { escrow_status::partially_released, "PARTIALLY_RELEASED" }
   };

   const std::pair<dispute_status, const char*> dispute_status_tokens[] = {
      { dispute_status::open,                "OPEN" },
      { dispute_status::responded,           "RESPONDED" },
      { dispute_status::resolved_for_client, "RESOLVED_FOR_CLIENT" },
      { dispute_status::resolved_for_agent,  "RESOLVED_FOR_AGENT" },
      { dispute_status::resolved_split,      "RESOLVED_SPLIT" }
   };

   const std::pair<verification_level, const char*> verification_level_tokens[] = {
      { verification_level::unverified, "UNVERIFIED" },
      { verification_level::basic,      "BASIC" },
      { verification_level::verified,   "VERIFIED" },
      { verification_level::premium,    "PREMIUM" }
   };

} // detail

string normalize_token( const string& token )
{
   string result;
   result.reserve( token.size() );
   for( const char c : token )
   {
      if( c == '_' ) continue;
      result.push_back( static_cast<char>( std::toupper( static_cast<unsigned char>(c) ) ) );
   }
   return result;
}

string to_token( job_status s )         { return detail::token_of( detail::job_status_tokens, s ); }
string to_token( milestone_status s )   { return detail::token_of( detail::milestone_status_tokens, s ); }
string to_token( escrow_status s )      { return detail::token_of( detail::escrow_status_tokens, s ); }
string to_token( dispute_status s )     { return detail::token_of( detail::dispute_status_tokens, s ); }
string to_token( verification_level l ) { return detail::token_of( detail::verification_level_tokens, l ); }

template<>
job_status from_token<job_status>( const string& token )
{
   return detail::lookup_token( detail::job_status_tokens, token, "job status" );
}

template<>
milestone_status from_token<milestone_status>( const string& token )
{
   return detail::lookup_token( detail::milestone_status_tokens, token, "milestone status" );
}

template<>
escrow_status from_token<escrow_status>( const string& token )
{
   return detail::lookup_token( detail::escrow_status_tokens, token, "escrow status" );
}

template<>
dispute_status from_token<dispute_status>( const string& token )
{
   return detail::lookup_token( detail::dispute_status_tokens, token, "dispute status" );
}

template<>
verification_level from_token<verification_level>( const string& token )
{
   return detail::lookup_token( detail::verification_level_tokens, token, "verification level" );
}

} } // hireledger::protocol
