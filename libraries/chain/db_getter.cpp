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
#include <hireledger/chain/database.hpp>

#include <hireledger/chain/agent_object.hpp>
#include <hireledger/chain/dispute_object.hpp>
#include <hireledger/chain/escrow_object.hpp>
#include <hireledger/chain/global_property_object.hpp>
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

const marketplace_parameters& database::get_parameters()const
{
   return get_global_properties().parameters;
}

bool database::is_administrator( const owner_type& who )const
{
   const auto& admins = get_parameters().administrators;
   return admins.find( who ) != admins.end();
}

const job_object& database::get_job( job_id_type id )const
{
   const job_object* job = find( id );
   HIRELEDGER_ASSERT( job != nullptr, not_found_exception, "Job ${id} does not exist", ("id", id) );
   return *job;
}

const dispute_object& database::get_dispute( dispute_id_type id )const
{
   const dispute_object* dispute = find( id );
   HIRELEDGER_ASSERT( dispute != nullptr, not_found_exception, "Dispute ${id} does not exist", ("id", id) );
   return *dispute;
}

const escrow_object& database::get_escrow( const job_object& job )const
{
   const escrow_object* escrow = find( job.escrow );
   HIRELEDGER_ASSERT( escrow != nullptr, not_found_exception, "Job ${id} has no escrow record", ("id", job.id) );
   return *escrow;
}

const agent_object* database::find_agent( const owner_type& owner )const
{
   const auto& idx = get_index_type<agent_index>().indices().get<by_owner>();
   auto itr = idx.find( owner );
   if( itr == idx.end() )
      return nullptr;
   return &*itr;
}

const agent_object& database::get_agent( const owner_type& owner )const
{
   const agent_object* agent = find_agent( owner );
   HIRELEDGER_ASSERT( agent != nullptr, not_found_exception, "Agent ${owner} is not registered", ("owner", owner) );
   return *agent;
}

const dispute_object* database::find_unresolved_dispute( job_id_type job )const
{
   const auto& idx = get_index_type<dispute_index>().indices().get<by_job>();
   for( auto itr = idx.lower_bound( boost::make_tuple( job ) ); itr != idx.end() && itr->job == job; ++itr )
      if( !itr->is_resolved() )
         return &*itr;
   return nullptr;
}

} }
