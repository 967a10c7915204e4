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

#include <hireledger/chain/database.hpp>

#include <boost/program_options.hpp>

#include <memory>

namespace hireledger { namespace app {
   namespace detail { class application_impl; }
   using std::string;

   class application_options
   {
      public:
         uint32_t api_limit_jobs = 100;
         uint32_t api_limit_agents = 100;
         uint32_t api_limit_disputes = 100;
         uint32_t api_limit_messages = 500;

         static constexpr application_options get_default()
         {
            constexpr application_options default_options;
            return default_options;
         }
   };

   /**
    * @brief owns the marketplace database and serializes every write to it
    *
    * Transactions are pushed one at a time under a write lock. After each commit a deep copy
    * of the state is published, readers pick up the latest copy without taking the lock.
    */
   class application
   {
      public:
         application();
         ~application();

         void set_program_options( boost::program_options::options_description& command_line_options,
                                   boost::program_options::options_description& configuration_file_options )const;

         /**
          * Reads the limits and marketplace parameters from options. An empty data_dir, or the
          * in-memory option, keeps the state in memory only.
          */
         void initialize( const fc::path& data_dir, const boost::program_options::variables_map& options );

         /// opens the database and publishes the first snapshot
         void startup();

         /// flushes a persistent database and closes it
         void shutdown();

         /// writes the state to the data dir, does nothing for an in-memory database or when
         /// no transaction was committed since the last flush
         void flush();

         std::shared_ptr<chain::database> chain_database()const;

         /// applies trx atomically, only one transaction is applied at a time
         chain::processed_transaction push_transaction( const chain::signed_transaction& trx );

         /// the state as of the last committed transaction
         std::shared_ptr<const db::object_database> snapshot()const;

         const application_options& get_options()const;

         bool is_persistent()const;
         bool has_unflushed_changes()const;

      private:
         std::shared_ptr<detail::application_impl> my;
   };

} } // hireledger::app

FC_REFLECT( hireledger::app::application_options,
            (api_limit_jobs)(api_limit_agents)(api_limit_disputes)(api_limit_messages) )
