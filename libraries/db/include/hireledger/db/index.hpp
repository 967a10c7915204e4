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
#include <hireledger/db/object.hpp>

#include <fc/filesystem.hpp>

#include <functional>

namespace hireledger { namespace db {

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a sequential manner. The next id of an index is its sequence
    *  generator, it is rolled back by the undo database and saved with the index.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         object_id_type get_next_id()const                 { return _next_id; }
         void           use_next_id()                      { _next_id = _next_id.next(); }
         void           set_next_id( object_id_type id )   { _next_id = id; }

         virtual const object& insert( object&& obj ) = 0;

         /**
          *  Builds a new object and assigns it the next available ID and then
          *  initializes it with constructor.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  @param obj must be a reference to an object in this index
          *  @param m is a functor that will be called with a modifiable copy of obj
          */
         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         virtual const object* find( object_id_type id )const = 0;

         /**
          * Throws if the object is not found, prefer find() when absence is expected.
          */
         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",std::string(id)) );
            return *maybe_found;
         }

         virtual void     inspect_all_objects( std::function<void (const object&)> inspector )const = 0;
         virtual size_t   size()const = 0;

         /// a deep copy of this index, including its next id, used for read snapshots
         virtual std::unique_ptr<index> clone()const = 0;

         /// restores an object written by save()
         virtual void load( const std::vector<char>& data ) = 0;

         void open( const fc::path& db );
         void save( const fc::path& db )const;

      protected:
         object_id_type _next_id;
   };

} } // hireledger::db
