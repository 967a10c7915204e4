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

namespace hireledger { namespace protocol {

   /**
    * @brief The client or the assigned agent disputes a job in progress
    * @ingroup operations
    */
   struct dispute_open_operation : public base_operation
   {
      owner_type  initiator;
      job_id_type job;
      string      reason;

      owner_type authority()const { return initiator; }
      void       validate()const;
   };

   /**
    * @brief The other party answers an open dispute
    * @ingroup operations
    */
   struct dispute_respond_operation : public base_operation
   {
      owner_type      responder;
      dispute_id_type dispute;
      string          response;

      owner_type authority()const { return responder; }
      void       validate()const;
   };

   /**
    * @brief An administrator settles a dispute
    * @ingroup operations
    *
    * resolution must be one of the resolved states. refund_percentage is the share of the
    * remaining escrow refunded to the client and is required for resolved_split only.
    */
   struct dispute_resolve_operation : public base_operation
   {
      owner_type        arbiter;
      dispute_id_type   dispute;
      dispute_status    resolution = dispute_status::resolved_split;
      optional<uint8_t> refund_percentage;
      string            notes;

      owner_type authority()const { return arbiter; }
      void       validate()const;
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::dispute_open_operation, (initiator)(job)(reason) )
FC_REFLECT( hireledger::protocol::dispute_respond_operation, (responder)(dispute)(response) )
FC_REFLECT( hireledger::protocol::dispute_resolve_operation, (arbiter)(dispute)(resolution)(refund_percentage)(notes) )
