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
#include <hireledger/chain/evaluator.hpp>
#include <hireledger/chain/dispute_object.hpp>
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

   class dispute_open_evaluator : public evaluator<dispute_open_evaluator>
   {
      public:
         typedef dispute_open_operation operation_type;

         void_result    do_evaluate( const dispute_open_operation& o );
         object_id_type do_apply( const dispute_open_operation& o );

         const job_object* job = nullptr;
   };

   class dispute_respond_evaluator : public evaluator<dispute_respond_evaluator>
   {
      public:
         typedef dispute_respond_operation operation_type;

         void_result do_evaluate( const dispute_respond_operation& o );
         void_result do_apply( const dispute_respond_operation& o );

         const dispute_object* dispute = nullptr;
   };

   class dispute_resolve_evaluator : public evaluator<dispute_resolve_evaluator>
   {
      public:
         typedef dispute_resolve_operation operation_type;

         void_result do_evaluate( const dispute_resolve_operation& o );
         void_result do_apply( const dispute_resolve_operation& o );

         const dispute_object* dispute = nullptr;
         const job_object*     job = nullptr;
   };

} } // hireledger::chain
