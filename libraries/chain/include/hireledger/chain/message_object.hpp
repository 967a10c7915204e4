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
    * @brief one message in the conversation of a job
    * @ingroup object
    */
   class message_object : public hireledger::db::abstract_object<message_object, protocol_ids, message_object_type>
   {
      public:
         job_id_type    job;
         owner_type     sender;
         owner_type     recipient;
         string         content;
         time_point_sec timestamp;
         bool           read = false;
   };

   struct by_job;
   struct by_recipient;
   using message_multi_index_type = multi_index_container<
      message_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >,
         ordered_unique< tag< by_job >,
            composite_key< message_object,
               member< message_object, job_id_type, &message_object::job >,
               member< object, object_id_type, &object::id >
            >
         >,
         ordered_unique< tag< by_recipient >,
            composite_key< message_object,
               member< message_object, owner_type, &message_object::recipient >,
               member< message_object, bool, &message_object::read >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   >;

   using message_index = generic_index< message_object, message_multi_index_type >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::message_object )

FC_REFLECT_DERIVED( hireledger::chain::message_object, (hireledger::db::object),
                    (job)(sender)(recipient)(content)(timestamp)(read) )
