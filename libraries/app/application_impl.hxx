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

#include <hireledger/app/application.hpp>

#include <mutex>

namespace hireledger { namespace app { namespace detail {

class application_impl
{
   public:
      explicit application_impl( application* self )
         : _self( self ),
           _chain_db( std::make_shared<chain::database>() )
      {
      }

      void startup();
      void shutdown();
      void flush();

      chain::processed_transaction push_transaction( const chain::signed_transaction& trx );

      void publish_snapshot();

      application* _self;

      fc::path _data_dir;
      bool     _in_memory = false;
      bool     _running = false;
      /// a transaction was committed since the last flush
      bool     _unflushed = false;

      application_options            _app_options;
      chain::marketplace_parameters  _parameters;

      std::shared_ptr<chain::database> _chain_db;

      /// serializes every change to _chain_db
      std::mutex _write_mutex;

      /// read with std::atomic_load, replaced with std::atomic_store
      std::shared_ptr<const db::object_database> _snapshot;
};

} } } // hireledger::app::detail
