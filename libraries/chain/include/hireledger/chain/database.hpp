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
#include <hireledger/chain/global_property_object.hpp>
#include <hireledger/chain/transaction_evaluation_state.hpp>

#include <hireledger/db/object_database.hpp>
#include <hireledger/protocol/transaction.hpp>

#include <fc/log/logger.hpp>
#include <fc/signals.hpp>

#include <functional>
#include <map>

namespace hireledger { namespace chain {

   class job_object;
   class escrow_object;
   class agent_object;
   class dispute_object;

   using hireledger::protocol::processed_transaction;

   /**
    *   @class database
    *   @brief tracks the marketplace state in an extensible manner
    *
    *   Every change goes through push_transaction(). The operations of a transaction are applied
    *   inside one undo session, either all of them take effect or none do.
    *
    *   The database is not thread safe, callers serialize access to it.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /**
          * @brief Open a database, creating a new one if necessary
          *
          * Restores the objects saved below data_dir by a previous flush(). When nothing was saved
          * the database starts empty with the given parameters. The administrators of params
          * always replace the stored ones, so config changes take effect on restart.
          */
         void open( const fc::path& data_dir, const marketplace_parameters& params );

         /// starts an empty database that is never written to disk
         void initialize( const marketplace_parameters& params );

         void wipe( const fc::path& data_dir );
         void close( bool flush = true );

         /// the clock that stamps every transaction, defaults to fc::time_point::now()
         void set_clock( std::function<time_point_sec()> clock );

         //////////////////// db_transaction.cpp ////////////////////

         /**
          * Applies every operation of trx or none of them. The result carries the id or void
          * returned for each operation and the virtual operations the evaluators reported.
          */
         processed_transaction push_transaction( const signed_transaction& trx );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /**
          * Records a side effect of the operation being applied, returns its position in the
          * list of the current transaction.
          */
         uint32_t push_applied_operation( const operation& op );
         const vector<operation>& get_applied_operations()const { return _applied_ops; }

         /// time of the transaction being applied
         time_point_sec head_time()const { return _now; }

         /**
          *  This signal is emitted after a transaction has been committed, with the results and
          *  virtual operations of the transaction.
          */
         fc::signal<void(const processed_transaction&)> applied_transaction;

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object& get_global_properties()const;
         const marketplace_parameters& get_parameters()const;
         bool                          is_administrator( const owner_type& who )const;

         const job_object&     get_job( job_id_type id )const;
         const dispute_object& get_dispute( dispute_id_type id )const;
         const escrow_object&  get_escrow( const job_object& job )const;
         const agent_object*   find_agent( const owner_type& owner )const;
         const agent_object&   get_agent( const owner_type& owner )const;

         /// the open or responded dispute of a job, if any
         const dispute_object* find_unresolved_dispute( job_id_type job )const;

         //////////////////// db_escrow.cpp ////////////////////

         /**
          * Moves an unfunded escrow to locked with amount deposited.
          * @throws already_funded_exception unless the escrow is unfunded
          */
         void escrow_lock( const job_object& job, share_type amount );

         /**
          * Binds the escrow of job to the accepted bid. An unfunded escrow locks the bid amount,
          * a pre-funded one must cover it and refunds the excess.
          */
         void escrow_assign( const job_object& job, const owner_type& agent, share_type bid_amount );

         /// pays amount to the assigned agent, returns the amount paid
         share_type escrow_release( const job_object& job, share_type amount );

         /// pays amount back to the client, returns the amount refunded
         share_type escrow_refund( const job_object& job, share_type amount );

         //////////////////// db_init.cpp ////////////////////

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

      private:
         void initialize_evaluators();
         void initialize_indexes();
         void init_global_properties( const marketplace_parameters& params );

         vector< unique_ptr<op_evaluator> >     _operation_evaluators;
         vector<operation>                      _applied_ops;
         time_point_sec                         _now;
         std::function<time_point_sec()>        _clock;
         bool                                   _opened = false;
   };

} }
