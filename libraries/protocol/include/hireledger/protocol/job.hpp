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

   /// a milestone as requested when the job is posted
   struct milestone_spec
   {
      string                   title;
      string                   description;
      uint8_t                  payment_percentage = 0;
      optional<time_point_sec> due_date;
   };

   /**
    * @brief Posts a job with a requested budget
    * @ingroup operations
    *
    * Creates the job in the posted state together with its unfunded escrow record.
    */
   struct job_post_operation : public base_operation
   {
      owner_type               client;
      string                   title;
      string                   description;
      share_type               payment;
      string                   category;
      flat_set<string>         tags;
      optional<time_point_sec> deadline;
      vector<milestone_spec>   milestones;

      owner_type authority()const { return client; }
      void       validate()const;
   };

   /**
    * @brief A registered agent offers to do a posted job
    * @ingroup operations
    */
   struct bid_place_operation : public base_operation
   {
      owner_type  agent;
      job_id_type job;
      share_type  amount;
      string      proposal;
      uint32_t    estimated_days = 0;

      owner_type authority()const { return agent; }
      void       validate()const;
   };

   /**
    * @brief The client accepts the bid of one agent
    * @ingroup operations
    *
    * The job moves to in progress and the bid amount is locked in escrow.
    */
   struct bid_accept_operation : public base_operation
   {
      owner_type  client;
      job_id_type job;
      owner_type  agent;
      share_type  bid_amount;

      owner_type authority()const { return client; }
      void       validate()const;
   };

   /**
    * @brief The assigned agent completes the job
    * @ingroup operations
    *
    * Releases whatever remains in escrow to the agent.
    */
   struct job_complete_operation : public base_operation
   {
      owner_type  agent;
      job_id_type job;

      owner_type authority()const { return agent; }
      void       validate()const;
   };

   /**
    * @brief The client withdraws a job that has not been accepted yet
    * @ingroup operations
    */
   struct job_cancel_operation : public base_operation
   {
      owner_type  client;
      job_id_type job;

      owner_type authority()const { return client; }
      void       validate()const;
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::milestone_spec, (title)(description)(payment_percentage)(due_date) )
FC_REFLECT( hireledger::protocol::job_post_operation,
            (client)(title)(description)(payment)(category)(tags)(deadline)(milestones) )
FC_REFLECT( hireledger::protocol::bid_place_operation, (agent)(job)(amount)(proposal)(estimated_days) )
FC_REFLECT( hireledger::protocol::bid_accept_operation, (client)(job)(agent)(bid_amount) )
FC_REFLECT( hireledger::protocol::job_complete_operation, (agent)(job) )
FC_REFLECT( hireledger::protocol::job_cancel_operation, (client)(job) )
