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
#include <hireledger/protocol/operations.hpp>

namespace hireledger { namespace protocol {

   /**
    * @defgroup transactions Transactions
    *
    * A transaction is the unit of atomicity. All of its operations are applied or none of them are.
    *
    * The signer is the principal authenticated by the identity provider for the call that produced
    * the transaction. Every operation must require exactly that principal.
    */
   struct signed_transaction
   {
      owner_type        signer;
      vector<operation> operations;

      void clear() { operations.clear(); }

      /// stateless checks of every operation
      void validate()const;

      /// throws missing_authority_exception when an operation needs a principal other than the signer
      void verify_authority()const;
   };

   /**
    *  @brief captures the result of evaluating the operations contained in the transaction
    *
    *  virtual_operations holds the side effects reported by the evaluators, in application order.
    */
   struct processed_transaction : public signed_transaction
   {
      processed_transaction( const signed_transaction& trx = signed_transaction() )
      : signed_transaction(trx){}

      vector<operation_result> operation_results;
      vector<operation>        virtual_operations;
   };

   /// @} transactions group

} } // hireledger::protocol

FC_REFLECT( hireledger::protocol::signed_transaction, (signer)(operations) )
FC_REFLECT_DERIVED( hireledger::protocol::processed_transaction, (hireledger::protocol::signed_transaction),
                    (operation_results)(virtual_operations) )
