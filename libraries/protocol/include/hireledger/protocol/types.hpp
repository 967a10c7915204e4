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
#include <hireledger/protocol/config.hpp>
#include <hireledger/db/object_id.hpp>

#include <fc/container/flat.hpp>
#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/safe.hpp>
#include <fc/static_variant.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace hireledger { namespace protocol {

   using namespace hireledger::db;

   using std::string;
   using std::vector;
   using fc::flat_set;
   using fc::flat_map;
   using fc::optional;
   using fc::static_variant;
   using fc::time_point_sec;
   using fc::time_point;
   using fc::variant;

   /// fixed point money, HIRELEDGER_PAYMENT_PRECISION units per whole unit
   typedef fc::safe<int64_t> share_type;

   /// the identity of a principal as resolved by the external identity provider
   typedef string owner_type;

   enum reserved_spaces
   {
      relative_protocol_ids = 0,
      protocol_ids          = 1,
      implementation_ids    = 2
   };

   enum object_type
   {
      null_object_type,
      job_object_type,
      escrow_object_type,
      agent_object_type,
      dispute_object_type,
      rating_object_type,
      message_object_type,
      OBJECT_TYPE_COUNT ///< Sentry value which contains the number of different object types
   };

   typedef object_id< protocol_ids, job_object_type >       job_id_type;
   typedef object_id< protocol_ids, escrow_object_type >    escrow_id_type;
   typedef object_id< protocol_ids, agent_object_type >     agent_id_type;
   typedef object_id< protocol_ids, dispute_object_type >   dispute_id_type;
   typedef object_id< protocol_ids, rating_object_type >    rating_id_type;
   typedef object_id< protocol_ids, message_object_type >   message_id_type;

   /// position of a bid in the bid list of its job
   typedef uint32_t bid_id_type;
   /// position of a milestone in the milestone list of its job
   typedef uint32_t milestone_id_type;

   enum class job_status : uint8_t
   {
      posted,
      in_progress,
      completed,
      cancelled,
      disputed
   };

   enum class milestone_status : uint8_t
   {
      pending,
      submitted,
      approved,
      revision_requested
   };

   enum class escrow_status : uint8_t
   {
      unfunded,
      locked,
      released,
      refunded,
      partially_released
   };

   enum class dispute_status : uint8_t
   {
      open,
      responded,
      resolved_for_client,
      resolved_for_agent,
      resolved_split
   };

   enum class verification_level : uint8_t
   {
      unverified,
      basic,
      verified,
      premium
   };

   inline bool is_terminal( job_status s )
   {
      return s == job_status::completed || s == job_status::cancelled;
   }

   inline bool is_resolved( dispute_status s )
   {
      return s != dispute_status::open && s != dispute_status::responded;
   }

} } // hireledger::protocol

FC_REFLECT_ENUM( hireledger::protocol::object_type,
                 (null_object_type)
                 (job_object_type)
                 (escrow_object_type)
                 (agent_object_type)
                 (dispute_object_type)
                 (rating_object_type)
                 (message_object_type)
                 (OBJECT_TYPE_COUNT) )

FC_REFLECT_ENUM( hireledger::protocol::job_status, (posted)(in_progress)(completed)(cancelled)(disputed) )
FC_REFLECT_ENUM( hireledger::protocol::milestone_status, (pending)(submitted)(approved)(revision_requested) )
FC_REFLECT_ENUM( hireledger::protocol::escrow_status, (unfunded)(locked)(released)(refunded)(partially_released) )
FC_REFLECT_ENUM( hireledger::protocol::dispute_status,
                 (open)(responded)(resolved_for_client)(resolved_for_agent)(resolved_split) )
FC_REFLECT_ENUM( hireledger::protocol::verification_level, (unverified)(basic)(verified)(premium) )
