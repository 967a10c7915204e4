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
#include <hireledger/app/api.hpp>
#include <hireledger/app/application.hpp>

#include <hireledger/protocol/amount.hpp>
#include <hireledger/protocol/authority.hpp>
#include <hireledger/protocol/tokens.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>

namespace hireledger { namespace app {

namespace {

   /// an owner passed as an argument rather than authenticated, a bad one is the caller's mistake
   owner_type owner_argument( const string& owner, const char* field )
   {
      owner_type result = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( owner ) );
      HIRELEDGER_ASSERT( is_valid_owner( result ), invalid_argument_exception,
                         "Invalid ${field} '${o}'", ("field", field)("o", owner) );
      return result;
   }

   template<typename IdType>
   IdType created_id( const processed_transaction& ptrx )
   {
      FC_ASSERT( ptrx.operation_results.size() == 1
                 && ptrx.operation_results.front().is_type<object_id_type>(),
                 "operation did not create an object" );
      return IdType( ptrx.operation_results.front().get<object_id_type>() );
   }

}

marketplace_api::marketplace_api( application& app )
   : _app( app )
{
}

processed_transaction marketplace_api::push( const string& caller, operation op )
{
   signed_transaction trx;
   trx.signer = normalize_owner( caller );
   trx.operations.emplace_back( std::move( op ) );
   return _app.push_transaction( trx );
}

database_api marketplace_api::get_database_api()const
{
   return database_api( _app.snapshot(), &_app.get_options() );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Jobs                                                             //
//                                                                  //
//////////////////////////////////////////////////////////////////////

job_id_type marketplace_api::post_job( const string& caller, const post_job_args& args )
{
   job_post_operation op;
   op.client      = normalize_owner( caller );
   op.title       = args.title;
   op.description = args.description;
   op.payment     = amount_from_string( args.payment );
   op.category    = args.category;
   op.tags        = args.tags;
   op.deadline    = args.deadline;
   op.milestones.reserve( args.milestones.size() );
   for( const auto& m : args.milestones )
   {
      milestone_spec spec;
      spec.title              = m.title;
      spec.description        = m.description;
      spec.payment_percentage = m.payment_percentage;
      spec.due_date           = m.due_date;
      op.milestones.emplace_back( std::move( spec ) );
   }
   return created_id<job_id_type>( push( caller, op ) );
}

void marketplace_api::place_bid( const string& caller, const place_bid_args& args )
{
   bid_place_operation op;
   op.agent          = normalize_owner( caller );
   op.job            = args.job;
   op.amount         = amount_from_string( args.amount );
   op.proposal       = args.proposal;
   op.estimated_days = args.estimated_days;
   push( caller, op );
}

void marketplace_api::accept_bid( const string& caller, const accept_bid_args& args )
{
   bid_accept_operation op;
   op.client     = normalize_owner( caller );
   op.job        = args.job;
   op.agent      = owner_argument( args.agent, "agent" );
   op.bid_amount = amount_from_string( args.bid_amount );
   push( caller, op );
}

void marketplace_api::complete_job( const string& caller, job_id_type job )
{
   job_complete_operation op;
   op.agent = normalize_owner( caller );
   op.job   = job;
   push( caller, op );
}

void marketplace_api::cancel_job( const string& caller, job_id_type job )
{
   job_cancel_operation op;
   op.client = normalize_owner( caller );
   op.job    = job;
   push( caller, op );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Escrow                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

void marketplace_api::fund_escrow( const string& caller, job_id_type job, const string& amount )
{
   escrow_fund_operation op;
   op.client = normalize_owner( caller );
   op.job    = job;
   op.amount = amount_from_string( amount );
   push( caller, op );
}

void marketplace_api::release_escrow( const string& caller, job_id_type job, const string& amount )
{
   escrow_release_operation op;
   op.client = normalize_owner( caller );
   op.job    = job;
   op.amount = amount_from_string( amount );
   push( caller, op );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Milestones                                                       //
//                                                                  //
//////////////////////////////////////////////////////////////////////

void marketplace_api::submit_milestone( const string& caller, job_id_type job, milestone_id_type milestone,
                                        const string& notes )
{
   milestone_submit_operation op;
   op.agent     = normalize_owner( caller );
   op.job       = job;
   op.milestone = milestone;
   op.notes     = notes;
   push( caller, op );
}

void marketplace_api::approve_milestone( const string& caller, job_id_type job, milestone_id_type milestone )
{
   milestone_approve_operation op;
   op.client    = normalize_owner( caller );
   op.job       = job;
   op.milestone = milestone;
   push( caller, op );
}

void marketplace_api::request_revision( const string& caller, job_id_type job, milestone_id_type milestone,
                                        const string& feedback )
{
   milestone_revision_operation op;
   op.client    = normalize_owner( caller );
   op.job       = job;
   op.milestone = milestone;
   op.feedback  = feedback;
   push( caller, op );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Disputes                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

dispute_id_type marketplace_api::open_dispute( const string& caller, job_id_type job, const string& reason )
{
   dispute_open_operation op;
   op.initiator = normalize_owner( caller );
   op.job       = job;
   op.reason    = reason;
   return created_id<dispute_id_type>( push( caller, op ) );
}

void marketplace_api::respond_to_dispute( const string& caller, dispute_id_type dispute, const string& response )
{
   dispute_respond_operation op;
   op.responder = normalize_owner( caller );
   op.dispute   = dispute;
   op.response  = response;
   push( caller, op );
}

void marketplace_api::resolve_dispute( const string& caller, const resolve_dispute_args& args )
{
   dispute_resolve_operation op;
   op.arbiter           = normalize_owner( caller );
   op.dispute           = args.dispute;
   op.resolution        = from_token<dispute_status>( args.resolution );
   op.refund_percentage = args.refund_percentage;
   op.notes             = args.notes;
   push( caller, op );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Agents                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

agent_id_type marketplace_api::register_agent( const string& caller, const register_agent_args& args )
{
   agent_register_operation op;
   op.owner          = normalize_owner( caller );
   op.name           = args.name;
   op.description    = args.description;
   op.skills         = args.skills;
   op.portfolio_urls = args.portfolio_urls;
   if( args.hourly_rate.valid() )
      op.hourly_rate = amount_from_string( *args.hourly_rate );
   return created_id<agent_id_type>( push( caller, op ) );
}

void marketplace_api::update_agent_profile( const string& caller, const update_agent_args& args )
{
   agent_update_operation op;
   op.owner          = normalize_owner( caller );
   op.name           = args.name;
   op.description    = args.description;
   op.skills         = args.skills;
   op.portfolio_urls = args.portfolio_urls;
   op.available      = args.available;
   if( args.hourly_rate.valid() )
      op.hourly_rate = amount_from_string( *args.hourly_rate );
   push( caller, op );
}

rating_id_type marketplace_api::rate_agent( const string& caller, const rate_agent_args& args )
{
   agent_rate_operation op;
   op.rater  = normalize_owner( caller );
   op.job    = args.job;
   op.rating = args.rating;
   op.review = args.review;
   return created_id<rating_id_type>( push( caller, op ) );
}

void marketplace_api::verify_agent( const string& caller, const string& agent, const string& level )
{
   agent_verify_operation op;
   op.admin = normalize_owner( caller );
   op.agent = owner_argument( agent, "agent" );
   op.level = from_token<verification_level>( level );
   push( caller, op );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Messages                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

message_id_type marketplace_api::send_message( const string& caller, job_id_type job, const string& recipient,
                                               const string& content )
{
   message_send_operation op;
   op.sender    = normalize_owner( caller );
   op.job       = job;
   op.recipient = owner_argument( recipient, "recipient" );
   op.content   = content;
   return created_id<message_id_type>( push( caller, op ) );
}

void marketplace_api::mark_messages_read( const string& caller, job_id_type job )
{
   messages_mark_read_operation op;
   op.reader = normalize_owner( caller );
   op.job    = job;
   push( caller, op );
}

} } // hireledger::app
