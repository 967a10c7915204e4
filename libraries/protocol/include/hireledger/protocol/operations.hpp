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
#include <hireledger/protocol/base.hpp>
#include <hireledger/protocol/agent.hpp>
#include <hireledger/protocol/dispute.hpp>
#include <hireledger/protocol/escrow.hpp>
#include <hireledger/protocol/job.hpp>
#include <hireledger/protocol/message.hpp>
#include <hireledger/protocol/milestone.hpp>

namespace hireledger { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ job_post_operation,
            /*  1 */ bid_place_operation,
            /*  2 */ bid_accept_operation,
            /*  3 */ job_complete_operation,
            /*  4 */ job_cancel_operation,
            /*  5 */ escrow_fund_operation,
            /*  6 */ escrow_release_operation,
            /*  7 */ milestone_submit_operation,
            /*  8 */ milestone_approve_operation,
            /*  9 */ milestone_revision_operation,
            /* 10 */ dispute_open_operation,
            /* 11 */ dispute_respond_operation,
            /* 12 */ dispute_resolve_operation,
            /* 13 */ agent_register_operation,
            /* 14 */ agent_update_operation,
            /* 15 */ agent_rate_operation,
            /* 16 */ agent_verify_operation,
            /* 17 */ message_send_operation,
            /* 18 */ messages_mark_read_operation,
            /* 19 */ escrow_locked_operation,      // VIRTUAL
            /* 20 */ escrow_released_operation,    // VIRTUAL
            /* 21 */ escrow_refunded_operation     // VIRTUAL
         > operation;

   /// @} // operations group

   /**
    *  Performs all stateless validation of the operation, throws on failure.
    */
   void operation_validate( const operation& op );

   /**
    *  The principal that must sign a transaction carrying op, empty for virtual operations.
    */
   owner_type operation_get_required_authority( const operation& op );

   bool is_virtual_operation( const operation& op );

} } // hireledger::protocol

FC_REFLECT_TYPENAME( hireledger::protocol::operation )
