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
    * @brief The assigned agent hands in the work of a milestone
    * @ingroup operations
    */
   struct milestone_submit_operation : public base_operation
   {
      owner_type        agent;
      job_id_type       job;
      milestone_id_type milestone = 0;
      string            notes;

      owner_type authority()const { return agent; }
      void       validate()const;
   };

   /**
    * @brief The client approves a submitted milestone
    * @ingroup operations
    *
    * Pays the milestone share of the accepted bid amount to the agent.
    */
   struct milestone_approve_operation : public base_operation
   {
      owner_type        client;
      job_id_type       job;
      milestone_id_type milestone = 0;

      owner_type authority()const { return client; }
      void       validate()const;
   };

   /**
    * @brief The client sends a submitted milestone back to the agent
    * @ingroup operations
    */
   struct milestone_revision_operation : public base_operation
   {
      owner_type        client;
      job_id_type       job;
      milestone_id_type milestone = 0;
      string            feedback;

      owner_type authority()const { return client; }
      void       validate()const;
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::milestone_submit_operation, (agent)(job)(milestone)(notes) )
FC_REFLECT( hireledger::protocol::milestone_approve_operation, (client)(job)(milestone) )
FC_REFLECT( hireledger::protocol::milestone_revision_operation, (client)(job)(milestone)(feedback) )
