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
#include <hireledger/app/api_objects.hpp>
#include <hireledger/protocol/amount.hpp>

namespace hireledger { namespace app {

namespace detail {

   const std::pair<job_sort_field, const char*> job_sort_field_tokens[] = {
      { job_sort_field::created_at, "CREATED_AT" },
      { job_sort_field::payment,    "PAYMENT" },
      { job_sort_field::deadline,   "DEADLINE" },
      { job_sort_field::bid_count,  "BID_COUNT" }
   };

   const std::pair<agent_sort_field, const char*> agent_sort_field_tokens[] = {
      { agent_sort_field::jobs_completed, "JOBS_COMPLETED" },
      { agent_sort_field::rating,         "RATING" },
      { agent_sort_field::registered_at,  "REGISTERED_AT" },
      { agent_sort_field::success_rate,   "SUCCESS_RATE" }
   };

   const std::pair<sort_direction, const char*> sort_direction_tokens[] = {
      { sort_direction::asc,  "ASC" },
      { sort_direction::desc, "DESC" }
   };

} // detail

string to_token( job_sort_field f )   { return protocol::detail::token_of( detail::job_sort_field_tokens, f ); }
string to_token( agent_sort_field f ) { return protocol::detail::token_of( detail::agent_sort_field_tokens, f ); }
string to_token( sort_direction d )   { return protocol::detail::token_of( detail::sort_direction_tokens, d ); }

bid_view::bid_view( const bid_info& b )
: agent( b.agent ),
  bid_id( b.bid_id ),
  amount( amount_to_string( b.amount ) ),
  proposal( b.proposal ),
  estimated_days( b.estimated_days ),
  timestamp( b.timestamp )
{}

milestone_view::milestone_view( const milestone_info& m )
: milestone_id( m.milestone_id ),
  title( m.title ),
  description( m.description ),
  payment_percentage( m.payment_percentage ),
  status( protocol::to_token( m.status ) ),
  due_date( m.due_date ),
  submission_notes( m.submission_notes ),
  revision_feedback( m.revision_feedback ),
  submitted_at( m.submitted_at ),
  approved_at( m.approved_at )
{}

job_view::job_view( const job_object& j )
: id( j.get_id() ),
  client( j.client ),
  title( j.title ),
  description( j.description ),
  payment( amount_to_string( j.payment ) ),
  status( protocol::to_token( j.status ) ),
  agent( j.agent ),
  category( j.category ),
  tags( j.tags ),
  deadline( j.deadline ),
  escrow( j.escrow ),
  created_at( j.created_at ),
  updated_at( j.updated_at ),
  completed_at( j.completed_at )
{
   bids.reserve( j.bids.size() );
   for( const auto& b : j.bids )
      bids.emplace_back( b );
   milestones.reserve( j.milestones.size() );
   for( const auto& m : j.milestones )
      milestones.emplace_back( m );
   if( j.accepted_bid_amount.valid() )
      accepted_bid_amount = amount_to_string( *j.accepted_bid_amount );
}

agent_view::agent_view( const agent_object& a )
: id( a.get_id() ),
  owner( a.owner ),
  name( a.name ),
  description( a.description ),
  skills( a.skills ),
  portfolio_urls( a.portfolio_urls ),
  available( a.available ),
  jobs_completed( a.jobs_completed ),
  jobs_accepted( a.jobs_accepted ),
  total_rating_points( a.total_rating_points ),
  total_ratings( a.total_ratings ),
  rating( a.rating() ),
  success_rate( a.success_rate() ),
  verification_level( protocol::to_token( a.verification ) ),
  registered_at( a.registered_at )
{
   if( a.hourly_rate.valid() )
      hourly_rate = amount_to_string( *a.hourly_rate );
}

escrow_view::escrow_view( const escrow_object& e )
: id( e.get_id() ),
  job( e.job ),
  client( e.client ),
  agent( e.agent ),
  amount( amount_to_string( e.amount ) ),
  deposited( amount_to_string( e.deposited ) ),
  released( amount_to_string( e.released ) ),
  refunded( amount_to_string( e.refunded ) ),
  remaining( amount_to_string( e.remaining() ) ),
  status( protocol::to_token( e.status ) ),
  locked_at( e.locked_at ),
  released_at( e.released_at )
{}

dispute_view::dispute_view( const dispute_object& d )
: id( d.get_id() ),
  job( d.job ),
  initiator( d.initiator ),
  reason( d.reason ),
  status( protocol::to_token( d.status ) ),
  response( d.response ),
  responder( d.responder ),
  created_at( d.created_at ),
  responded_at( d.responded_at ),
  resolved_at( d.resolved_at ),
  resolution_notes( d.resolution_notes ),
  refund_percentage( d.refund_percentage ),
  resolved_by( d.resolved_by )
{}

rating_view::rating_view( const rating_object& r )
: id( r.get_id() ),
  job( r.job ),
  rater( r.rater ),
  ratee( r.ratee ),
  rating( r.rating ),
  review( r.review ),
  timestamp( r.timestamp )
{}

message_view::message_view( const message_object& m )
: id( m.get_id() ),
  job( m.job ),
  sender( m.sender ),
  recipient( m.recipient ),
  content( m.content ),
  timestamp( m.timestamp ),
  read( m.read )
{}

} } // hireledger::app

namespace hireledger { namespace protocol {

template<>
app::job_sort_field from_token<app::job_sort_field>( const string& token )
{
   return detail::lookup_token( app::detail::job_sort_field_tokens, token, "job sort field" );
}

template<>
app::agent_sort_field from_token<app::agent_sort_field>( const string& token )
{
   return detail::lookup_token( app::detail::agent_sort_field_tokens, token, "agent sort field" );
}

template<>
app::sort_direction from_token<app::sort_direction>( const string& token )
{
   return detail::lookup_token( app::detail::sort_direction_tokens, token, "sort direction" );
}

} } // hireledger::protocol
