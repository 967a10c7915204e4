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
    * @brief Creates the agent profile of the signing principal
    * @ingroup operations
    *
    * Registration is one-time, a second registration of the same owner fails.
    */
   struct agent_register_operation : public base_operation
   {
      owner_type           owner;
      string               name;
      string               description;
      flat_set<string>     skills;
      vector<string>       portfolio_urls;
      optional<share_type> hourly_rate;

      owner_type authority()const { return owner; }
      void       validate()const;
   };

   /**
    * @brief Updates the profile of the signing agent, unset fields are left untouched
    * @ingroup operations
    */
   struct agent_update_operation : public base_operation
   {
      owner_type                 owner;
      optional<string>           name;
      optional<string>           description;
      optional<flat_set<string>> skills;
      optional<vector<string>>   portfolio_urls;
      optional<share_type>       hourly_rate;
      optional<bool>             available;

      owner_type authority()const { return owner; }
      void       validate()const;
   };

   /**
    * @brief One party of a completed job rates the other
    * @ingroup operations
    */
   struct agent_rate_operation : public base_operation
   {
      owner_type  rater;
      job_id_type job;
      uint8_t     rating = 0;
      string      review;

      owner_type authority()const { return rater; }
      void       validate()const;
   };

   /**
    * @brief An administrator sets the verification level of an agent
    * @ingroup operations
    */
   struct agent_verify_operation : public base_operation
   {
      owner_type         admin;
      owner_type         agent;
      verification_level level = verification_level::unverified;

      owner_type authority()const { return admin; }
      void       validate()const;
   };

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::agent_register_operation,
            (owner)(name)(description)(skills)(portfolio_urls)(hourly_rate) )
FC_REFLECT( hireledger::protocol::agent_update_operation,
            (owner)(name)(description)(skills)(portfolio_urls)(hourly_rate)(available) )
FC_REFLECT( hireledger::protocol::agent_rate_operation, (rater)(job)(rating)(review) )
FC_REFLECT( hireledger::protocol::agent_verify_operation, (admin)(agent)(level) )
