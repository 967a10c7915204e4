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
#include <hireledger/chain/job_object.hpp>

namespace hireledger { namespace chain {

   class job_post_evaluator : public evaluator<job_post_evaluator>
   {
      public:
         typedef job_post_operation operation_type;

         void_result    do_evaluate( const job_post_operation& o );
         object_id_type do_apply( const job_post_operation& o );
   };

   class bid_place_evaluator : public evaluator<bid_place_evaluator>
   {
      public:
         typedef bid_place_operation operation_type;

         void_result do_evaluate( const bid_place_operation& o );
         void_result do_apply( const bid_place_operation& o );

         const job_object* job = nullptr;
   };

   class bid_accept_evaluator : public evaluator<bid_accept_evaluator>
   {
      public:
         typedef bid_accept_operation operation_type;

         void_result do_evaluate( const bid_accept_operation& o );
         void_result do_apply( const bid_accept_operation& o );

         const job_object* job = nullptr;
   };

   class job_complete_evaluator : public evaluator<job_complete_evaluator>
   {
      public:
         typedef job_complete_operation operation_type;

         void_result do_evaluate( const job_complete_operation& o );
         void_result do_apply( const job_complete_operation& o );

         const job_object* job = nullptr;
   };

   class job_cancel_evaluator : public evaluator<job_cancel_evaluator>
   {
      public:
         typedef job_cancel_operation operation_type;

         void_result do_evaluate( const job_cancel_operation& o );
         void_result do_apply( const job_cancel_operation& o );

         const job_object* job = nullptr;
   };

} } // hireledger::chain
