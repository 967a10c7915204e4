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
#include "database_fixture.hpp"

#include <hireledger/protocol/authority.hpp>

namespace hireledger { namespace chain { namespace test {

const char* const TEST_ADMINISTRATOR = "admin";
const uint32_t TEST_START_TIME = 1700000000;

boost::program_options::variables_map database_fixture::default_options()
{
   boost::program_options::variables_map options;
   options.insert( std::make_pair( "administrator", boost::program_options::variable_value(
         std::vector<std::string>{ TEST_ADMINISTRATOR }, false ) ) );
   options.insert( std::make_pair( "max-milestones-per-job",
                                   boost::program_options::variable_value( uint16_t(5), false ) ) );
   return options;
}

database_fixture::database_fixture()
   : app(), db( *app.chain_database() ), api( app ), now( TEST_START_TIME )
{ try {
   db.set_clock( [this]() { return now; } );
   app.initialize( fc::path(), default_options() );
   app.startup();
} FC_LOG_AND_RETHROW() }

database_fixture::~database_fixture()
{
   try
   {
      app.shutdown();
   }
   catch( const fc::exception& e )
   {
      edump( (e.to_detail_string()) );
   }
}

void database_fixture::advance_time( uint32_t seconds )
{
   now += seconds;
}

share_type database_fixture::units( int64_t whole )
{
   return share_type( whole * HIRELEDGER_PAYMENT_PRECISION );
}

processed_transaction database_fixture::push_op( const string& signer, const operation& op )
{
   signed_transaction trx;
   trx.signer = signer;
   trx.operations.push_back( op );
   return app.push_transaction( trx );
}

vector<hireledger::app::milestone_args> database_fixture::milestones( const vector<uint8_t>& percentages )
{
   vector<hireledger::app::milestone_args> result;
   for( size_t i = 0; i < percentages.size(); ++i )
   {
      hireledger::app::milestone_args m;
      m.title = "milestone " + fc::to_string( uint64_t(i) );
      m.payment_percentage = percentages[i];
      result.push_back( m );
   }
   return result;
}

job_id_type database_fixture::post_job( const string& client, const string& payment,
                                        const vector<hireledger::app::milestone_args>& milestones,
                                        const string& category, const flat_set<string>& tags )
{
   hireledger::app::post_job_args args;
   args.title       = "Build a scraper";
   args.description = "Collect prices from three shops";
   args.payment     = payment;
   args.category    = category;
   args.tags        = tags;
   args.milestones  = milestones;
   return api.post_job( client, args );
}

agent_id_type database_fixture::register_agent( const string& owner, const flat_set<string>& skills )
{
   hireledger::app::register_agent_args args;
   args.name   = owner + " bot";
   args.skills = skills;
   return api.register_agent( owner, args );
}

void database_fixture::place_bid( const string& agent, job_id_type job, const string& amount )
{
   hireledger::app::place_bid_args args;
   args.job            = job;
   args.amount         = amount;
   args.proposal       = "I can do it";
   args.estimated_days = 3;
   api.place_bid( agent, args );
}

void database_fixture::accept_bid( const string& client, job_id_type job, const string& agent, const string& amount )
{
   hireledger::app::accept_bid_args args;
   args.job        = job;
   args.agent      = agent;
   args.bid_amount = amount;
   api.accept_bid( client, args );
}

job_id_type database_fixture::start_job( const string& client, const string& agent, const string& payment,
                                         const string& bid_amount,
                                         const vector<hireledger::app::milestone_args>& milestones )
{
   const job_id_type job = post_job( client, payment, milestones );
   if( db.find_agent( agent ) == nullptr )
      register_agent( agent );
   place_bid( agent, job, bid_amount );
   accept_bid( client, job, agent, bid_amount );
   return job;
}

void database_fixture::finish_job( const string& client, const string& agent, job_id_type job )
{
   const auto count = get_job( job ).milestones.size();
   for( milestone_id_type m = 0; m < count; ++m )
   {
      api.submit_milestone( agent, job, m, "done" );
      api.approve_milestone( client, job, m );
   }
   api.complete_job( agent, job );
}

const job_object& database_fixture::get_job( job_id_type job )const
{
   return db.get_job( job );
}

const escrow_object& database_fixture::escrow_of( job_id_type job )const
{
   return db.get_escrow( db.get_job( job ) );
}

const agent_object& database_fixture::get_agent( const string& owner )const
{
   return db.get_agent( owner );
}

} } } // hireledger::chain::test
