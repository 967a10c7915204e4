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

#include <hireledger/app/api.hpp>

#include <fc/variant.hpp>
#include <fc/variant_object.hpp>

#include <functional>
#include <map>
#include <string>

namespace hireledger { namespace app {

   /**
    * @brief Routes JSON requests to the marketplace_api
    *
    * A request is one JSON object:
    *   {"caller": "alice", "method": "postJob", "params": {...}}
    * The reply is {"result": ...} on success or
    *   {"error": {"kind": "NOT_FOUND", "code": 3010000, "message": "..."}}
    * when the call throws. Parameter names are the field names of the argument structs.
    */
   class api_dispatcher
   {
      public:
         explicit api_dispatcher( marketplace_api& api );

         /// handles one request line, errors are reported in the reply rather than thrown
         fc::variant_object handle_request( const std::string& request )const;

         static std::string to_json( const fc::variant_object& reply );

         /// @throws fc::exception when the method is unknown, the params are malformed or the call fails
         fc::variant call( const std::string& caller, const std::string& method, const fc::variant_object& params )const;

         /// the kind reported on the wire for an exception, INTERNAL for anything unexpected
         static std::string error_kind( const fc::exception& e );

         static fc::variant_object error_object( const fc::exception& e );

      private:
         using handler = std::function<fc::variant( const std::string&, const fc::variant_object& )>;

         void add_method( const std::string& name, handler h );
         void register_mutations();
         void register_queries();

         marketplace_api&                 _api;
         std::map<std::string, handler>   _methods;
   };

} } // hireledger::app
