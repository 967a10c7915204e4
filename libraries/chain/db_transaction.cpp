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
#include <hireledger/chain/database.hpp>
#include <hireledger/chain/evaluator.hpp>
#include <hireledger/chain/transaction_evaluation_state.hpp>

namespace hireledger { namespace chain {

processed_transaction database::push_transaction( const signed_transaction& trx )
{ try {
   FC_ASSERT( _opened, "database is not open" );
   trx.validate();
   trx.verify_authority();

   _applied_ops.clear();
   _now = _clock();

   auto session = _undo_db.start_undo_session();

   transaction_evaluation_state eval_state( this );
   eval_state._trx = &trx;

   processed_transaction ptrx( trx );
   ptrx.operation_results.reserve( trx.operations.size() );
   for( const auto& op : trx.operations )
      ptrx.operation_results.emplace_back( apply_operation( eval_state, op ) );

   ptrx.virtual_operations = std::move( _applied_ops );
   _applied_ops.clear();

   session.commit();
   applied_transaction( ptrx );
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   const auto which = op.which();
   FC_ASSERT( which >= 0 && size_t(which) < _operation_evaluators.size() && _operation_evaluators[which],
              "No registered evaluator for this operation", ("which", which) );
   return _operation_evaluators[which]->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op )
{
   _applied_ops.emplace_back( op );
   return static_cast<uint32_t>( _applied_ops.size() - 1 );
}

} }
