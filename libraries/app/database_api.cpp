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
#include "database_api_impl.hxx"

#include <hireledger/protocol/amount.hpp>
#include <hireledger/protocol/tokens.hpp>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/range/iterator_range.hpp>

#include <algorithm>

namespace hireledger { namespace app {

namespace {

   /// owners in queries are matched in canonical form, invalid input simply matches nothing
   string canonical_owner( const string& owner )
   {
      return boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( owner ) );
   }

   bool matches_search( const job_object& job, const string& text )
   {
      if( boost::algorithm::icontains( job.title, text )
          || boost::algorithm::icontains( job.description, text )
          || boost::algorithm::icontains( job.category, text ) )
         return true;
      for( const auto& tag : job.tags )
         if( boost::algorithm::icontains( tag, text ) )
            return true;
      return false;
   }

   bool has_tag( const job_object& job, const string& tag )
   {
      for( const auto& t : job.tags )
         if( boost::algorithm::iequals( t, tag ) )
            return true;
      return false;
   }

   /// applies the page of a query to results that are already sorted
   template<typename T>
   vector<T> page( vector<T>&& sorted, uint32_t offset, uint32_t limit )
   {
      if( offset >= sorted.size() )
         return vector<T>();
      auto first = sorted.begin() + offset;
      auto last = sorted.size() - offset > limit ? first + limit : sorted.end();
      return vector<T>( std::make_move_iterator( first ), std::make_move_iterator( last ) );
   }

}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( std::shared_ptr<const db::object_database> snapshot, const application_options* app_options )
   : my( std::make_shared<database_api_impl>( std::move(snapshot), app_options ) ) {}

database_api::~database_api() = default;

database_api_impl::database_api_impl( std::shared_ptr<const db::object_database> snapshot,
                                      const application_options* app_options )
:_db( std::move(snapshot) ), _app_options( app_options )
{
   FC_ASSERT( _db, "database_api needs a snapshot of the marketplace state" );
}

uint32_t database_api_impl::page_limit( const optional<uint32_t>& requested, uint32_t configured, const char* name )const
{
   if( !requested.valid() )
      return configured;
   HIRELEDGER_ASSERT( *requested <= configured, invalid_argument_exception,
                      "limit can not be greater than ${configured} for ${name}",
                      ("configured", configured)("name", name) );
   return *requested;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Jobs                                                             //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<job_view> database_api::get_jobs( const job_query& query )const
{
   return my->get_jobs( query );
}

vector<job_view> database_api_impl::get_jobs( const job_query& query )const
{ try {
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const uint32_t limit = page_limit( query.limit, options.api_limit_jobs, "jobs" );

   optional<job_status> status;
   if( query.status.valid() )
      status = from_token<job_status>( *query.status );
   const auto sort_by = query.sort_by.valid() ? from_token<job_sort_field>( *query.sort_by )
                                              : job_sort_field::created_at;
   const auto sort_dir = query.sort_dir.valid() ? from_token<sort_direction>( *query.sort_dir )
                                                : sort_direction::asc;
   optional<share_type> min_payment;
   optional<share_type> max_payment;
   if( query.min_payment.valid() )
      min_payment = amount_from_string( *query.min_payment );
   if( query.max_payment.valid() )
      max_payment = amount_from_string( *query.max_payment );
   optional<string> category;
   if( query.category.valid() )
      category = boost::algorithm::trim_copy( *query.category );
   optional<owner_type> client;
   optional<owner_type> agent;
   if( query.client.valid() )
      client = canonical_owner( *query.client );
   if( query.agent.valid() )
      agent = canonical_owner( *query.agent );

   vector<const job_object*> matches;
   auto consider = [&]( const job_object& job ) {
      if( status.valid() && job.status != *status ) return;
      if( category.valid() && !boost::algorithm::iequals( job.category, *category ) ) return;
      for( const auto& tag : query.tags )
         if( !has_tag( job, tag ) ) return;
      if( query.search.valid() && !matches_search( job, *query.search ) ) return;
      if( client.valid() && job.client != *client ) return;
      if( agent.valid() && !job.is_agent( *agent ) ) return;
      if( min_payment.valid() && job.payment < *min_payment ) return;
      if( max_payment.valid() && job.payment > *max_payment ) return;
      matches.push_back( &job );
   };

   if( status.valid() )
   {
      const auto& idx = indices<job_index>().get<by_status>();
      for( const auto& job : boost::make_iterator_range( idx.equal_range( boost::make_tuple( *status ) ) ) )
         consider( job );
   }
   else if( client.valid() )
   {
      const auto& idx = indices<job_index>().get<by_client>();
      for( const auto& job : boost::make_iterator_range( idx.equal_range( boost::make_tuple( *client ) ) ) )
         consider( job );
   }
   else
   {
      for( const auto& job : indices<job_index>().get<by_id>() )
         consider( job );
   }

   // ties keep id order in both directions
   const auto before = [sort_by]( const job_object* a, const job_object* b ) {
      switch( sort_by )
      {
         case job_sort_field::payment:
            return a->payment < b->payment;
         case job_sort_field::deadline:
            return a->deadline_or_max() < b->deadline_or_max();
         case job_sort_field::bid_count:
            return a->bids.size() < b->bids.size();
         case job_sort_field::created_at:
         default:
            return a->created_at < b->created_at;
      }
   };
   const bool desc = sort_dir == sort_direction::desc;
   std::stable_sort( matches.begin(), matches.end(), [&before, desc]( const job_object* a, const job_object* b ) {
      return desc ? before( b, a ) : before( a, b );
   });

   vector<job_view> result;
   result.reserve( matches.size() );
   for( const job_object* job : matches )
      result.emplace_back( *job );
   return page( std::move(result), query.offset, limit );
} FC_CAPTURE_AND_RETHROW( (query) ) }

optional<job_view> database_api::get_job( job_id_type id )const
{
   return my->get_job( id );
}

optional<job_view> database_api_impl::get_job( job_id_type id )const
{
   const job_object* job = _db->find( id );
   if( job == nullptr )
      return optional<job_view>();
   return job_view( *job );
}

vector<job_view> database_api::search_jobs( const string& text )const
{
   return my->search_jobs( text );
}

vector<job_view> database_api_impl::search_jobs( const string& text )const
{
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const string needle = boost::algorithm::trim_copy( text );

   vector<job_view> result;
   for( const auto& job : indices<job_index>().get<by_id>() )
   {
      if( result.size() >= options.api_limit_jobs )
         break;
      if( needle.empty() || matches_search( job, needle ) )
         result.emplace_back( job );
   }
   return result;
}

vector<job_view> database_api::get_jobs_by_category( const string& category )const
{
   return my->get_jobs_by_category( category );
}

vector<job_view> database_api_impl::get_jobs_by_category( const string& category )const
{
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const auto& idx = indices<job_index>().get<by_category>();
   const string key = boost::algorithm::to_lower_copy( boost::algorithm::trim_copy( category ) );
   vector<job_view> result;
   for( const auto& job : boost::make_iterator_range( idx.equal_range( boost::make_tuple( key ) ) ) )
   {
      if( result.size() >= options.api_limit_jobs )
         break;
      result.emplace_back( job );
   }
   return result;
}

uint64_t database_api::get_jobs_count( const optional<string>& status )const
{
   return my->get_jobs_count( status );
}

uint64_t database_api_impl::get_jobs_count( const optional<string>& status )const
{
   const auto& idx = indices<job_index>();
   if( !status.valid() )
      return idx.size();
   const auto& by_status_idx = idx.get<by_status>();
   const auto range = by_status_idx.equal_range( boost::make_tuple( from_token<job_status>( *status ) ) );
   return static_cast<uint64_t>( std::distance( range.first, range.second ) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Agents                                                           //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<agent_view> database_api::get_agents( const agent_query& query )const
{
   return my->get_agents( query );
}

vector<agent_view> database_api_impl::get_agents( const agent_query& query )const
{ try {
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const uint32_t limit = page_limit( query.limit, options.api_limit_agents, "agents" );

   optional<verification_level> min_verification;
   if( query.min_verification.valid() )
      min_verification = from_token<verification_level>( *query.min_verification );
   const auto sort_by = query.sort_by.valid() ? from_token<agent_sort_field>( *query.sort_by )
                                              : agent_sort_field::jobs_completed;
   const auto sort_dir = query.sort_dir.valid() ? from_token<sort_direction>( *query.sort_dir )
                                                : sort_direction::asc;

   vector<const agent_object*> matches;
   for( const auto& agent : indices<agent_index>().get<by_id>() )
   {
      if( query.min_jobs_completed.valid() && agent.jobs_completed < *query.min_jobs_completed ) continue;
      if( query.min_rating.valid() && agent.rating() < *query.min_rating ) continue;
      if( query.available.valid() && agent.available != *query.available ) continue;
      if( min_verification.valid() && agent.verification < *min_verification ) continue;
      bool has_skills = true;
      for( const auto& skill : query.skills )
         if( !agent.has_skill( skill ) ) { has_skills = false; break; }
      if( !has_skills ) continue;
      matches.push_back( &agent );
   }

   const auto before = [sort_by]( const agent_object* a, const agent_object* b ) {
      switch( sort_by )
      {
         case agent_sort_field::rating:
            return a->rating() < b->rating();
         case agent_sort_field::registered_at:
            return a->registered_at < b->registered_at;
         case agent_sort_field::success_rate:
            return a->success_rate() < b->success_rate();
         case agent_sort_field::jobs_completed:
         default:
            return a->jobs_completed < b->jobs_completed;
      }
   };
   const bool desc = sort_dir == sort_direction::desc;
   std::stable_sort( matches.begin(), matches.end(), [&before, desc]( const agent_object* a, const agent_object* b ) {
      return desc ? before( b, a ) : before( a, b );
   });

   vector<agent_view> result;
   result.reserve( matches.size() );
   for( const agent_object* agent : matches )
      result.emplace_back( *agent );
   return page( std::move(result), query.offset, limit );
} FC_CAPTURE_AND_RETHROW( (query) ) }

optional<agent_view> database_api::get_agent( const string& owner )const
{
   return my->get_agent( owner );
}

optional<agent_view> database_api_impl::get_agent( const string& owner )const
{
   const auto& idx = indices<agent_index>().get<by_owner>();
   auto itr = idx.find( canonical_owner( owner ) );
   if( itr == idx.end() )
      return optional<agent_view>();
   return agent_view( *itr );
}

vector<agent_view> database_api::get_agents_by_skill( const string& skill )const
{
   return my->get_agents_by_skill( skill );
}

vector<agent_view> database_api_impl::get_agents_by_skill( const string& skill )const
{
   const string wanted = boost::algorithm::trim_copy( skill );
   vector<agent_view> result;
   for( const auto& agent : indices<agent_index>().get<by_id>() )
      if( agent.has_skill( wanted ) )
         result.emplace_back( agent );
   return result;
}

vector<agent_view> database_api::get_verified_agents( const optional<string>& min_level )const
{
   return my->get_verified_agents( min_level );
}

vector<agent_view> database_api_impl::get_verified_agents( const optional<string>& min_level )const
{
   const verification_level level = min_level.valid() ? from_token<verification_level>( *min_level )
                                                      : verification_level::verified;
   vector<agent_view> result;
   for( const auto& agent : indices<agent_index>().get<by_id>() )
      if( agent.verification >= level )
         result.emplace_back( agent );
   return result;
}

vector<rating_view> database_api::get_agent_ratings( const string& owner )const
{
   return my->get_agent_ratings( owner );
}

vector<rating_view> database_api_impl::get_agent_ratings( const string& owner )const
{
   const auto& idx = indices<rating_index>().get<by_ratee>();
   vector<rating_view> result;
   for( const auto& r : boost::make_iterator_range( idx.equal_range( boost::make_tuple( canonical_owner( owner ) ) ) ) )
      result.emplace_back( r );
   return result;
}

uint64_t database_api::get_agents_count()const
{
   return my->get_agents_count();
}

uint64_t database_api_impl::get_agents_count()const
{
   return indices<agent_index>().size();
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Stats                                                            //
//                                                                  //
//////////////////////////////////////////////////////////////////////

marketplace_stats database_api::get_stats()const
{
   return my->get_stats();
}

marketplace_stats database_api_impl::get_stats()const
{
   marketplace_stats stats;
   share_type payment_volume;
   for( const auto& job : indices<job_index>().get<by_id>() )
   {
      ++stats.total_jobs;
      stats.total_bids += job.bids.size();
      switch( job.status )
      {
         case job_status::posted:      ++stats.posted_jobs;      break;
         case job_status::in_progress: ++stats.in_progress_jobs; break;
         case job_status::completed:   ++stats.completed_jobs;   break;
         case job_status::cancelled:   ++stats.cancelled_jobs;   break;
         case job_status::disputed:    ++stats.disputed_jobs;    break;
      }
      if( job.status == job_status::completed && job.accepted_bid_amount.valid() )
         payment_volume += *job.accepted_bid_amount;
   }
   stats.total_payment_volume = amount_to_string( payment_volume );
   if( stats.total_jobs > 0 )
      stats.avg_bids_per_job = double( stats.total_bids ) / stats.total_jobs;

   for( const auto& agent : indices<agent_index>().get<by_id>() )
   {
      ++stats.total_agents;
      if( agent.verification >= verification_level::verified )
         ++stats.verified_agents;
   }

   share_type locked;
   for( const auto& escrow : indices<escrow_index>().get<by_id>() )
      if( escrow.is_active() )
         locked += escrow.remaining();
   stats.total_escrow_locked = amount_to_string( locked );

   for( const auto& dispute : indices<dispute_index>().get<by_id>() )
      if( !dispute.is_resolved() )
         ++stats.open_disputes;

   return stats;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Escrow, disputes                                                 //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<dispute_view> database_api::get_disputes( const dispute_query& query )const
{
   return my->get_disputes( query );
}

vector<dispute_view> database_api_impl::get_disputes( const dispute_query& query )const
{ try {
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const uint32_t limit = page_limit( query.limit, options.api_limit_disputes, "disputes" );

   optional<dispute_status> status;
   if( query.status.valid() )
      status = from_token<dispute_status>( *query.status );

   vector<dispute_view> result;
   auto consider = [&]( const dispute_object& d ) {
      if( result.size() >= limit ) return;
      if( status.valid() && d.status != *status ) return;
      result.emplace_back( d );
   };

   if( query.job.valid() )
   {
      const auto& idx = indices<dispute_index>().get<by_job>();
      for( const auto& d : boost::make_iterator_range( idx.equal_range( boost::make_tuple( *query.job ) ) ) )
         consider( d );
   }
   else
   {
      for( const auto& d : indices<dispute_index>().get<by_id>() )
         consider( d );
   }
   return result;
} FC_CAPTURE_AND_RETHROW( (query) ) }

optional<dispute_view> database_api::get_dispute( dispute_id_type id )const
{
   return my->get_dispute( id );
}

optional<dispute_view> database_api_impl::get_dispute( dispute_id_type id )const
{
   const dispute_object* dispute = _db->find( id );
   if( dispute == nullptr )
      return optional<dispute_view>();
   return dispute_view( *dispute );
}

optional<escrow_view> database_api::get_escrow( job_id_type job )const
{
   return my->get_escrow( job );
}

optional<escrow_view> database_api_impl::get_escrow( job_id_type job )const
{
   const auto& idx = indices<escrow_index>().get<by_job>();
   auto itr = idx.find( job );
   if( itr == idx.end() )
      return optional<escrow_view>();
   return escrow_view( *itr );
}

vector<escrow_view> database_api::get_active_escrows()const
{
   return my->get_active_escrows();
}

vector<escrow_view> database_api_impl::get_active_escrows()const
{
   const auto& idx = indices<escrow_index>().get<by_status>();
   vector<escrow_view> result;
   for( const auto status : { escrow_status::locked, escrow_status::partially_released } )
      for( const auto& e : boost::make_iterator_range( idx.equal_range( boost::make_tuple( status ) ) ) )
         result.emplace_back( e );
   std::sort( result.begin(), result.end(), []( const escrow_view& a, const escrow_view& b ) {
      return a.id < b.id;
   });
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Messages                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

vector<message_view> database_api::get_job_messages( job_id_type job )const
{
   return my->get_job_messages( job );
}

vector<message_view> database_api_impl::get_job_messages( job_id_type job )const
{
   const auto& options = _app_options ? *_app_options : application_options::get_default();
   const auto& idx = indices<message_index>().get<by_job>();
   vector<message_view> result;
   for( const auto& m : boost::make_iterator_range( idx.equal_range( boost::make_tuple( job ) ) ) )
   {
      if( result.size() >= options.api_limit_messages )
         break;
      result.emplace_back( m );
   }
   return result;
}

uint64_t database_api::get_unread_messages_count( const string& user )const
{
   return my->get_unread_messages_count( user );
}

uint64_t database_api_impl::get_unread_messages_count( const string& user )const
{
   const auto& idx = indices<message_index>().get<by_recipient>();
   const auto range = idx.equal_range( boost::make_tuple( canonical_owner( user ), false ) );
   return static_cast<uint64_t>( std::distance( range.first, range.second ) );
}

} } // hireledger::app
