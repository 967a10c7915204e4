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

#include <hireledger/app/database_api.hpp>

#include <fc/optional.hpp>

#include <string>
#include <vector>

namespace hireledger { namespace app {
   using namespace hireledger::chain;

   using std::string;
   using std::vector;

   class application;

   /**
    * @brief The marketplace_api class implements every mutation and query of the marketplace
    *
    * Each mutation takes the authenticated caller first. The caller is normalized, the arguments
    * are parsed into an operation and the operation is pushed as a transaction signed by the
    * caller. A mutation either takes effect completely or throws and changes nothing.
    *
    * Queries read the snapshot published after the last committed transaction.
    */
   class marketplace_api
   {
      public:
         explicit marketplace_api( application& app );

         //////////
         // Jobs //
         //////////

         /**
          * @brief Post a job, its escrow record is created unfunded
          * @param caller the client
          * @return the id of the new job
          */
         job_id_type post_job( const string& caller, const post_job_args& args );

         /// @param caller a registered agent
         void place_bid( const string& caller, const place_bid_args& args );

         /**
          * @brief Accept the bid of an agent and lock the bid amount in escrow
          *
          * Exactly one of any number of concurrent calls for the same job succeeds, the others
          * see a job that is no longer posted.
          */
         void accept_bid( const string& caller, const accept_bid_args& args );

         /// @param caller the assigned agent
         void complete_job( const string& caller, job_id_type job );

         /// @param caller the client, only while the job is posted
         void cancel_job( const string& caller, job_id_type job );

         ////////////
         // Escrow //
         ////////////

         void fund_escrow( const string& caller, job_id_type job, const string& amount );
         void release_escrow( const string& caller, job_id_type job, const string& amount );

         ////////////////
         // Milestones //
         ////////////////

         void submit_milestone( const string& caller, job_id_type job, milestone_id_type milestone,
                                const string& notes );
         void approve_milestone( const string& caller, job_id_type job, milestone_id_type milestone );
         void request_revision( const string& caller, job_id_type job, milestone_id_type milestone,
                                const string& feedback );

         //////////////
         // Disputes //
         //////////////

         dispute_id_type open_dispute( const string& caller, job_id_type job, const string& reason );
         void respond_to_dispute( const string& caller, dispute_id_type dispute, const string& response );

         /// @param caller a configured administrator
         void resolve_dispute( const string& caller, const resolve_dispute_args& args );

         ////////////
         // Agents //
         ////////////

         agent_id_type register_agent( const string& caller, const register_agent_args& args );
         void update_agent_profile( const string& caller, const update_agent_args& args );
         rating_id_type rate_agent( const string& caller, const rate_agent_args& args );

         /// @param caller a configured administrator
         void verify_agent( const string& caller, const string& agent, const string& level );

         //////////////
         // Messages //
         //////////////

         message_id_type send_message( const string& caller, job_id_type job, const string& recipient,
                                       const string& content );
         void mark_messages_read( const string& caller, job_id_type job );

         /////////////
         // Queries //
         /////////////

         /// a query interface over the state as of the last committed transaction
         database_api get_database_api()const;

      private:
         processed_transaction push( const string& caller, operation op );

         application& _app;
   };

} } // hireledger::app
