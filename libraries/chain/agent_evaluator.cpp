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
#include <hireledger/chain/agent_evaluator.hpp>

#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>

namespace hireledger { namespace chain {

void_result agent_register_evaluator::do_evaluate( const agent_register_operation& o )
{ try {
   HIRELEDGER_ASSERT( db().find_agent( o.owner ) == nullptr, already_registered_exception,
                      "${owner} is already registered as an agent", ("owner", o.owner) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type agent_register_evaluator::do_apply( const agent_register_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   const agent_object& agent = d.create<agent_object>( [&o, now]( agent_object& a ) {
      a.owner          = o.owner;
      a.name           = o.name;
      a.description    = o.description;
      a.skills         = o.skills;
      a.portfolio_urls = o.portfolio_urls;
      a.hourly_rate    = o.hourly_rate;
      a.registered_at  = now;
   });
   dlog( "Agent ${owner} registered as ${id}", ("owner", o.owner)("id", agent.id) );
   return agent.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result agent_update_evaluator::do_evaluate( const agent_update_operation& o )
{ try {
   agent = &db().get_agent( o.owner );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result agent_update_evaluator::do_apply( const agent_update_operation& o )
{ try {
   db().modify( *agent, [&o]( agent_object& a ) {
      if( o.name.valid() )
         a.name = *o.name;
      if( o.description.valid() )
         a.description = *o.description;
      if( o.skills.valid() )
         a.skills = *o.skills;
      if( o.portfolio_urls.valid() )
         a.portfolio_urls = *o.portfolio_urls;
      if( o.hourly_rate.valid() )
         a.hourly_rate = o.hourly_rate;
      if( o.available.valid() )
         a.available = *o.available;
   });
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result agent_verify_evaluator::do_evaluate( const agent_verify_operation& o )
{ try {
   const database& d = db();
   verify_administrator( d, o.admin );
   agent = &d.get_agent( o.agent );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result agent_verify_evaluator::do_apply( const agent_verify_operation& o )
{ try {
   db().modify( *agent, [&o]( agent_object& a ) {
      a.verification = o.level;
   });
   dlog( "Agent ${owner} verified at ${level} by ${admin}", ("owner", o.agent)("level", o.level)("admin", o.admin) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
