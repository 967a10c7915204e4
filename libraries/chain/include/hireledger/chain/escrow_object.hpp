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

#include <hireledger/chain/types.hpp>
#include <hireledger/db/generic_index.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace hireledger { namespace chain {

   /**
    * @brief funds held for a job
    * @ingroup object
    *
    * deposited is everything the client has put in, released went to the agent and refunded went
    * back to the client. remaining() never becomes negative.
    */
   class escrow_object : public hireledger::db::abstract_object<escrow_object, protocol_ids, escrow_object_type>
   {
      public:
         job_id_type              job;
         owner_type               client;
         optional<owner_type>     agent;
         share_type               amount;
         share_type               deposited;
         share_type               released;
         share_type               refunded;
         escrow_status            status = escrow_status::unfunded;
         optional<time_point_sec> locked_at;
         optional<time_point_sec> released_at;

         share_type remaining()const { return deposited - released - refunded; }

         /// funds are held and may still move
         bool is_active()const
         {
            return status == escrow_status::locked || status == escrow_status::partially_released;
         }
   };

   struct by_job;
   struct by_status;
   using escrow_multi_index_type = multi_index_container<
      escrow_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_job >, member< escrow_object, job_id_type, &escrow_object::job > >,
         ordered_unique< tag< by_status >,
            composite_key< escrow_object,
               member< escrow_object, escrow_status, &escrow_object::status >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using escrow_index = generic_index< escrow_object, escrow_multi_index_type >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::escrow_object )

FC_REFLECT_DERIVED( hireledger::chain::escrow_object, (hireledger::db::object),
                    (job)(client)(agent)(amount)(deposited)(released)(refunded)(status)(locked_at)(released_at) )
