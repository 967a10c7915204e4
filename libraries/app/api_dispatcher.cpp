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
#include <hireledger/app/api_dispatcher.hpp>

#include <hireledger/chain/exceptions.hpp>
#include <hireledger/protocol/config.hpp>

#include <fc/io/json.hpp>

namespace hireledger { namespace app {

namespace {

   template<typename T>
   T convert( const fc::variant& v, const char* name )
   {
      try
      {
         return v.as<T>( HIRELEDGER_MAX_NESTED_OBJECTS );
      }
      catch( const fc::exception& e )
      {
         FC_THROW_EXCEPTION( invalid_argument_exception, "Invalid parameter ${name}: ${e}",
                             ("name", name)("e", e.to_string()) );
      }
   }

   template<typename T>
   T required( const fc::variant_object& params, const char* name )
   {
      auto itr = params.find( name );
      HIRELEDGER_ASSERT( itr != params.end() && !itr->value().is_null(), invalid_argument_exception,
                         "Missing parameter ${name}", ("name", name) );
      return convert<T>( itr->value(), name );
   }

   template<typename T>
   optional<T> optional_param( const fc::variant_object& params, const char* name )
   {
      auto itr = params.find( name );
      if( itr == params.end() || itr->value().is_null() )
         return optional<T>();
      return convert<T>( itr->value(), name );
   }

   template<typename T>
   T optional_param( const fc::variant_object& params, const char* name, const T& default_value )
   {
      const auto value = optional_param<T>( params, name );
      return value.valid() ? *value : default_value;
   }

   /// params that are themselves an argument struct
   template<typename T>
   T as_args( const fc::variant_object& params )
   {
      return convert<T>( fc::variant( params ), "params" );
   }

   template<typename T>
   fc::variant to_result( const T& value )
   {
      return fc::variant( value, HIRELEDGER_MAX_NESTED_OBJECTS );
   }

}

api_dispatcher::api_dispatcher( marketplace_api& api )
   : _api( api )
{
   register_mutations();
   register_queries();
}

void api_dispatcher::add_method( const std::string& name, handler h )
{
   FC_ASSERT( _methods.find( name ) == _methods.end(), "Method ${n} is already registered", ("n", name) );
   _methods[name] = std::move( h );
}

void api_dispatcher::register_mutations()
{
   add_method( "postJob", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.post_job( caller, as_args<post_job_args>( p ) ) );
   });
   add_method( "placeBid", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.place_bid( caller, as_args<place_bid_args>( p ) );
      return fc::variant();
   });
   add_method( "acceptBid", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.accept_bid( caller, as_args<accept_bid_args>( p ) );
      return fc::variant();
   });
   add_method( "completeJob", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.complete_job( caller, required<job_id_type>( p, "job" ) );
      return fc::variant();
   });
   add_method( "cancelJob", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.cancel_job( caller, required<job_id_type>( p, "job" ) );
      return fc::variant();
   });

   add_method( "fundEscrow", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.fund_escrow( caller, required<job_id_type>( p, "job" ), required<std::string>( p, "amount" ) );
      return fc::variant();
   });
   add_method( "releaseEscrow", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.release_escrow( caller, required<job_id_type>( p, "job" ), required<std::string>( p, "amount" ) );
      return fc::variant();
   });

   add_method( "submitMilestone", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.submit_milestone( caller, required<job_id_type>( p, "job" ),
                             required<milestone_id_type>( p, "milestone" ),
                             optional_param<std::string>( p, "notes", std::string() ) );
      return fc::variant();
   });
   add_method( "approveMilestone", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.approve_milestone( caller, required<job_id_type>( p, "job" ),
                              required<milestone_id_type>( p, "milestone" ) );
      return fc::variant();
   });
   add_method( "requestRevision", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.request_revision( caller, required<job_id_type>( p, "job" ),
                             required<milestone_id_type>( p, "milestone" ),
                             required<std::string>( p, "feedback" ) );
      return fc::variant();
   });

   add_method( "openDispute", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.open_dispute( caller, required<job_id_type>( p, "job" ),
                                           required<std::string>( p, "reason" ) ) );
   });
   add_method( "respondToDispute", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.respond_to_dispute( caller, required<dispute_id_type>( p, "dispute" ),
                               required<std::string>( p, "response" ) );
      return fc::variant();
   });
   add_method( "resolveDispute", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.resolve_dispute( caller, as_args<resolve_dispute_args>( p ) );
      return fc::variant();
   });

   add_method( "registerAgent", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.register_agent( caller, as_args<register_agent_args>( p ) ) );
   });
   add_method( "updateAgentProfile", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.update_agent_profile( caller, as_args<update_agent_args>( p ) );
      return fc::variant();
   });
   add_method( "rateAgent", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.rate_agent( caller, as_args<rate_agent_args>( p ) ) );
   });
   add_method( "verifyAgent", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.verify_agent( caller, required<std::string>( p, "agent" ), required<std::string>( p, "level" ) );
      return fc::variant();
   });

   add_method( "sendMessage", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.send_message( caller, required<job_id_type>( p, "job" ),
                                           required<std::string>( p, "recipient" ),
                                           required<std::string>( p, "content" ) ) );
   });
   add_method( "markMessagesRead", [this]( const std::string& caller, const fc::variant_object& p ) {
      _api.mark_messages_read( caller, required<job_id_type>( p, "job" ) );
      return fc::variant();
   });
}

void api_dispatcher::register_queries()
{
   add_method( "jobs", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_jobs( as_args<job_query>( p ) ) );
   });
   add_method( "job", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_job( required<job_id_type>( p, "id" ) ) );
   });
   add_method( "searchJobs", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().search_jobs( required<std::string>( p, "query" ) ) );
   });
   add_method( "jobsByCategory", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_jobs_by_category( required<std::string>( p, "category" ) ) );
   });
   add_method( "jobsCount", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_jobs_count( optional_param<std::string>( p, "status" ) ) );
   });

   add_method( "agents", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_agents( as_args<agent_query>( p ) ) );
   });
   add_method( "agent", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_agent( required<std::string>( p, "owner" ) ) );
   });
   add_method( "agentsBySkill", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_agents_by_skill( required<std::string>( p, "skill" ) ) );
   });
   add_method( "verifiedAgents", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_verified_agents( optional_param<std::string>( p, "min_level" ) ) );
   });
   add_method( "agentRatings", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_agent_ratings( required<std::string>( p, "owner" ) ) );
   });
   add_method( "agentsCount", [this]( const std::string&, const fc::variant_object& ) {
      return to_result( _api.get_database_api().get_agents_count() );
   });

   add_method( "stats", [this]( const std::string&, const fc::variant_object& ) {
      return to_result( _api.get_database_api().get_stats() );
   });

   add_method( "disputes", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_disputes( as_args<dispute_query>( p ) ) );
   });
   add_method( "dispute", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_dispute( required<dispute_id_type>( p, "id" ) ) );
   });
   add_method( "escrow", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_escrow( required<job_id_type>( p, "job" ) ) );
   });
   add_method( "activeEscrows", [this]( const std::string&, const fc::variant_object& ) {
      return to_result( _api.get_database_api().get_active_escrows() );
   });

   add_method( "jobMessages", [this]( const std::string&, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_job_messages( required<job_id_type>( p, "job" ) ) );
   });
   // the caller's own count unless another user is named
   add_method( "unreadMessagesCount", [this]( const std::string& caller, const fc::variant_object& p ) {
      return to_result( _api.get_database_api().get_unread_messages_count(
            optional_param<std::string>( p, "user", caller ) ) );
   });
}

fc::variant api_dispatcher::call( const std::string& caller, const std::string& method,
                                  const fc::variant_object& params )const
{
   auto itr = _methods.find( method );
   HIRELEDGER_ASSERT( itr != _methods.end(), invalid_argument_exception,
                      "Unknown method ${m}", ("m", method) );
   return itr->second( caller, params );
}

fc::variant_object api_dispatcher::handle_request( const std::string& request )const
{
   fc::mutable_variant_object reply;
   try
   {
      const fc::variant parsed = fc::json::from_string( request, fc::json::parse_type::legacy_parser,
                                                        HIRELEDGER_MAX_NESTED_OBJECTS );
      HIRELEDGER_ASSERT( parsed.is_object(), invalid_argument_exception, "A request must be a JSON object", ("request", request) );
      const fc::variant_object& obj = parsed.get_object();

      const auto method = required<std::string>( obj, "method" );
      const auto caller = optional_param<std::string>( obj, "caller", std::string() );
      fc::variant_object params;
      auto itr = obj.find( "params" );
      if( itr != obj.end() && !itr->value().is_null() )
      {
         HIRELEDGER_ASSERT( itr->value().is_object(), invalid_argument_exception, "params must be a JSON object", ("method", method) );
         params = itr->value().get_object();
      }

      reply( "result", call( caller, method, params ) );
   }
   catch( const fc::exception& e )
   {
      reply( "error", error_object( e ) );
   }
   catch( const std::exception& e )
   {
      reply( "error", error_object( fc::std_exception_wrapper::from_current_exception( e ) ) );
   }
   return reply;
}

std::string api_dispatcher::to_json( const fc::variant_object& reply )
{
   return fc::json::to_string( fc::variant( reply ), fc::json::output_formatting::stringify_large_ints_and_doubles,
                               HIRELEDGER_MAX_NESTED_OBJECTS );
}

std::string api_dispatcher::error_kind( const fc::exception& e )
{
   switch( e.code() )
   {
      case chain::not_found_exception::code_enum::code_value:           return "NOT_FOUND";
      case chain::bid_not_found_exception::code_enum::code_value:       return "BID_NOT_FOUND";
      case chain::invalid_state_exception::code_enum::code_value:       return "INVALID_STATE";
      case chain::duplicate_bid_exception::code_enum::code_value:       return "DUPLICATE_BID";
      case chain::duplicate_rating_exception::code_enum::code_value:    return "DUPLICATE_RATING";
      case chain::already_registered_exception::code_enum::code_value:  return "ALREADY_REGISTERED";
      case chain::already_funded_exception::code_enum::code_value:      return "ALREADY_FUNDED";
      case chain::already_resolved_exception::code_enum::code_value:    return "ALREADY_RESOLVED";
      case chain::insufficient_escrow_exception::code_enum::code_value: return "INSUFFICIENT_ESCROW";
      case chain::no_agent_exception::code_enum::code_value:            return "NO_AGENT";
      case protocol::invalid_amount_exception::code_enum::code_value:     return "INVALID_AMOUNT";
      case protocol::invalid_milestones_exception::code_enum::code_value: return "INVALID_MILESTONES";
      case protocol::invalid_token_exception::code_enum::code_value:      return "PARSE_ERROR";
      case fc::parse_error_exception::code_enum::code_value:              return "PARSE_ERROR";
      case fc::eof_exception::code_enum::code_value:                      return "PARSE_ERROR";
      case protocol::unauthorized_exception::code_enum::code_value:       return "UNAUTHORIZED";
      case protocol::missing_authority_exception::code_enum::code_value:  return "UNAUTHORIZED";
      case protocol::invalid_argument_exception::code_enum::code_value:   return "INVALID_ARGUMENT";
      default:                                                           return "INTERNAL";
   }
}

fc::variant_object api_dispatcher::error_object( const fc::exception& e )
{
   const auto& log = e.get_log();
   const std::string message = log.empty() ? std::string( e.what() ) : log.front().get_message();
   return fc::mutable_variant_object()
         ( "kind", error_kind( e ) )
         ( "code", e.code() )
         ( "message", message );
}

} } // hireledger::app
