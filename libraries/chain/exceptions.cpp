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
#include <hireledger/chain/exceptions.hpp>

namespace hireledger { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "marketplace exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( not_found_exception,           chain_exception, 3010000, "not found" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( invalid_state_exception,       chain_exception, 3020000, "invalid state" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( idempotency_exception,         chain_exception, 3030000, "idempotency violation" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_escrow_exception, chain_exception, 3040000, "insufficient escrow" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_agent_exception,            chain_exception, 3050000, "no agent assigned" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( bid_not_found_exception,       not_found_exception, 3010001, "bid not found" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_bid_exception,       idempotency_exception, 3030001, "duplicate bid" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( duplicate_rating_exception,    idempotency_exception, 3030002, "duplicate rating" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_registered_exception,  idempotency_exception, 3030003, "already registered" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_funded_exception,      idempotency_exception, 3030004, "already funded" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_resolved_exception,    idempotency_exception, 3030005, "already resolved" )

} } // hireledger::chain
