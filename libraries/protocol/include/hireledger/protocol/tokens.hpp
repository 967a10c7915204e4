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
#include <hireledger/protocol/exceptions.hpp>

#include <utility>

namespace hireledger { namespace protocol {

   /**
    *  Enum values cross the API boundary as upper snake case tokens such as IN_PROGRESS.
    *
    *  from_token<Enum>() is the only way a token becomes an enum value. It ignores case and
    *  underscores, so "in_progress", "InProgress" and "IN_PROGRESS" are equivalent, and throws
    *  invalid_token_exception for anything else.
    */
   template<typename Enum>
   Enum from_token( const string& token );

   string to_token( job_status s );
   string to_token( milestone_status s );
   string to_token( escrow_status s );
   string to_token( dispute_status s );
   string to_token( verification_level l );

   template<> job_status         from_token<job_status>( const string& token );
   template<> milestone_status   from_token<milestone_status>( const string& token );
   template<> escrow_status      from_token<escrow_status>( const string& token );
   template<> dispute_status     from_token<dispute_status>( const string& token );
   template<> verification_level from_token<verification_level>( const string& token );

   /// upper cases and drops underscores, used to compare tokens
   string normalize_token( const string& token );

   namespace detail {

      template<typename Enum, size_t N>
      Enum lookup_token( const std::pair<Enum, const char*> (&table)[N], const string& token, const char* type_name )
      {
         const string wanted = normalize_token( token );
         for( const auto& entry : table )
            if( normalize_token( entry.second ) == wanted )
               return entry.first;
         FC_THROW_EXCEPTION( invalid_token_exception, "Unrecognized ${type} token '${t}'",
                             ("type", type_name)("t", token) );
      }

      template<typename Enum, size_t N>
      string token_of( const std::pair<Enum, const char*> (&table)[N], Enum value )
      {
         for( const auto& entry : table )
            if( entry.first == value )
               return entry.second;
         FC_THROW( "Enum value ${v} has no token", ("v", static_cast<int64_t>(value)) );
      }

   } // detail

} } // hireledger::protocol
