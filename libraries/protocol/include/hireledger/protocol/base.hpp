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
#include <hireledger/protocol/types.hpp>

namespace hireledger { namespace protocol {

   /**
    *  @defgroup operations Operations
    *  @brief A set of valid commands for mutating the marketplace state.
    *
    *  An operation can be thought of like a function that will modify the ledger. Each operation
    *  names the single principal that must authorize it through authority(). The transaction that
    *  carries it must be signed by that principal.
    *
    *  Operations validate their stateless invariants in validate(), everything that depends on the
    *  current state is checked by the evaluator of the operation.
    *
    *  Virtual operations are produced by evaluators to record side effects. They are never
    *  accepted in a transaction.
    */

   struct void_result{};

   typedef fc::static_variant<void_result, object_id_type> operation_result;

   struct base_operation
   {
      void validate()const {}
      static constexpr bool is_virtual() { return false; }
   };

   struct base_virtual_operation : public base_operation
   {
      static constexpr bool is_virtual() { return true; }
      owner_type authority()const { return owner_type(); }
   };

   /// validation shared by operations that carry free text
   void validate_text( const string& text, size_t max_size, const char* field, bool allow_empty = false );

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::void_result, )
FC_REFLECT_TYPENAME( hireledger::protocol::operation_result )
