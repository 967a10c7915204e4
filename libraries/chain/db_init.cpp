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
#include <hireledger/chain/message_object.hpp>
#include <hireledger/chain/rating_object.hpp>

#include <hireledger/chain/agent_evaluator.hpp>
#include <hireledger/chain/dispute_evaluator.hpp>
#include <hireledger/chain/escrow_evaluator.hpp>
#include <hireledger/chain/job_evaluator.hpp>
#include <hireledger/chain/message_evaluator.hpp>
#include <hireledger/chain/milestone_evaluator.hpp>
#include <hireledger/chain/rating_evaluator.hpp>

namespace hireledger { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( 255 );

   register_evaluator<job_post_evaluator>();
   register_evaluator<bid_place_evaluator>();
   register_evaluator<bid_accept_evaluator>();
   register_evaluator<job_complete_evaluator>();
   register_evaluator<job_cancel_evaluator>();
   register_evaluator<escrow_fund_evaluator>();
   register_evaluator<escrow_release_evaluator>();
   register_evaluator<milestone_submit_evaluator>();
   register_evaluator<milestone_approve_evaluator>();
   register_evaluator<milestone_revision_evaluator>();
   register_evaluator<dispute_open_evaluator>();
   register_evaluator<dispute_respond_evaluator>();
   register_evaluator<dispute_resolve_evaluator>();
   register_evaluator<agent_register_evaluator>();
   register_evaluator<agent_update_evaluator>();
   register_evaluator<agent_rate_evaluator>();
   register_evaluator<agent_verify_evaluator>();
   register_evaluator<message_send_evaluator>();
   register_evaluator<messages_mark_read_evaluator>();
}

void database::initialize_indexes()
{
   add_index< job_index >();
   add_index< escrow_index >();
   add_index< agent_index >();
   add_index< dispute_index >();
   add_index< rating_index >();
   add_index< message_index >();

   add_index< global_property_index >();
}

} }
