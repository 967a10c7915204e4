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

namespace hireledger { namespace chain {

   /**
    * @brief settings of the marketplace that evaluators consult
    */
   struct marketplace_parameters
   {
      /// principals allowed to resolve disputes and verify agents
      flat_set<owner_type> administrators;
      uint16_t             max_milestones_per_job = HIRELEDGER_DEFAULT_MAX_MILESTONES;
   };

   /**
    * @class global_property_object
    * @brief Maintains global state information
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one instance, created when the database is initialized.
    */
   class global_property_object : public hireledger::db::abstract_object<global_property_object,
                                                                         implementation_ids,
                                                                         impl_global_property_object_type>
   {
      public:
         marketplace_parameters parameters;
         time_point_sec         time;
   };

   using global_property_index = generic_index< global_property_object,
      multi_index_container<
         global_property_object,
         indexed_by<
            ordered_unique< tag< by_id >, member< object, object_id_type, &object::id > >
         >
      >
   >;

} } // hireledger::chain

MAP_OBJECT_ID_TO_TYPE( hireledger::chain::global_property_object )

FC_REFLECT( hireledger::chain::marketplace_parameters, (administrators)(max_milestones_per_job) )
FC_REFLECT_DERIVED( hireledger::chain::global_property_object, (hireledger::db::object), (parameters)(time) )
