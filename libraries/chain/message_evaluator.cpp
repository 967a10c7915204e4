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
#include <hireledger/chain/message_evaluator.hpp>

#include <hireledger/chain/authorization.hpp>
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/message_object.hpp>

namespace hireledger { namespace chain {

void_result message_send_evaluator::do_evaluate( const message_send_operation& o )
{ try {
   const job_object& job = db().get_job( o.job );
   HIRELEDGER_ASSERT( is_job_participant( job, o.sender ), unauthorized_exception,
                      "${sender} takes no part in job ${job}", ("sender", o.sender)("job", o.job) );
   HIRELEDGER_ASSERT( is_job_participant( job, o.recipient ), invalid_argument_exception,
                      "${recipient} takes no part in job ${job}", ("recipient", o.recipient)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

object_id_type message_send_evaluator::do_apply( const message_send_operation& o )
{ try {
   database& d = db();
   const auto now = d.head_time();
   const message_object& msg = d.create<message_object>( [&o, now]( message_object& m ) {
      m.job       = o.job;
      m.sender    = o.sender;
      m.recipient = o.recipient;
      m.content   = o.content;
      m.timestamp = now;
   });
   return msg.id;
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result messages_mark_read_evaluator::do_evaluate( const messages_mark_read_operation& o )
{ try {
   const job_object& job = db().get_job( o.job );
   HIRELEDGER_ASSERT( is_job_participant( job, o.reader ), unauthorized_exception,
                      "${reader} takes no part in job ${job}", ("reader", o.reader)("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

void_result messages_mark_read_evaluator::do_apply( const messages_mark_read_operation& o )
{ try {
   database& d = db();
   const auto& idx = d.get_index_type<message_index>().indices().get<by_recipient>();

   // modifying read moves the entry within this index, collect first
   vector<const message_object*> unread;
   for( auto itr = idx.lower_bound( boost::make_tuple( o.reader, false ) );
        itr != idx.end() && itr->recipient == o.reader && !itr->read; ++itr )
      if( itr->job == o.job )
         unread.push_back( &*itr );

   for( const message_object* msg : unread )
      d.modify( *msg, []( message_object& m ) {
         m.read = true;
      });

   dlog( "${reader} read ${n} messages of job ${job}", ("reader", o.reader)("n", unread.size())("job", o.job) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (o) ) }

} } // hireledger::chain
