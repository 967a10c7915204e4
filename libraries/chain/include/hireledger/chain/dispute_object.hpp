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
    * @brief a disagreement between the client and the agent of a job
    * @ingroup object
    *
    * A job has at most one unresolved dispute at a time.
    */
   class dispute_object : public hireledger::db::abstract_object<dispute_object, protocol_ids, dispute_object_type>
   {
      public:
         job_id_type              job;
         owner_type               initiator;
         string                   reason;
         dispute_status           status = dispute_status::open;
         optional<string>         response;
         optional<owner_type>     responder;
         time_point_sec           created_at;
         optional<time_point_sec> responded_at;
         optional<time_point_sec> resolved_at;
         string                   resolution_notes;
         optional<uint8_t>        refund_percentage;
         optional<owner_type>     resolved_by;

         bool is_resolved()const { return hireledger::protocol::is_resolved( status ); }
   };

   struct by_job;
   struct by_status;
   using dispute_multi_index_type = multi_index_container<
      dispute_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_job >,
            composite_key< dispute_object,
               member< dispute_object, job_id_type, &dispute_object::job >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag< by_status >,
            composite_key< dispute_object,
               member< dispute_object, dispute_status, &dispute_object::status >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using dispute_index = generic_index< dispute_object, dispute_multi_index_type >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::dispute_object )

FC_REFLECT_DERIVED( hireledger::chain::dispute_object, (hireledger::db::object),
                    (job)(initiator)(reason)(status)(response)(responder)(created_at)(responded_at)
                    (resolved_at)(resolution_notes)(refund_percentage)(resolved_by) )
