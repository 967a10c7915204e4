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
#include <hireledger/db/object_id.hpp>

#include <fc/io/raw.hpp>
#include <fc/variant.hpp>

#include <memory>
#include <vector>

#define HIRELEDGER_DB_MAX_NESTED_OBJECTS (200)

namespace hireledger { namespace db {

   using std::unique_ptr;
   using std::vector;
   using fc::variant;

   /**
    *  @brief base for all database objects
    *
    *  The object is the level upon which undo operations are performed. Objects are assigned a
    *  unique and sequential id by the index of their type.
    *
    *  All objects must be serializable via FC_REFLECT() and copy-constructable. Objects refer to
    *  each other by id only.
    *
    *  @note Do not use multiple inheritance with object, a static_cast must work between object
    *  and derived types.
    */
   class object
   {
      public:
         object() = default;
         virtual ~object() = default;

         static constexpr uint8_t space_id = 0;
         static constexpr uint8_t type_id  = 0;

         object_id_type id;

         /// implemented for derived classes by inheriting abstract_object<DerivedClass>
         virtual unique_ptr<object> clone()const = 0;
         virtual void               move_from( object& obj ) = 0;
         virtual variant            to_variant()const = 0;
         virtual vector<char>       pack()const = 0;
   };

   /**
    * @class abstract_object
    * @brief Uses CRTP to add polymorphic clone, move and serialization to DerivedClass
    */
   template<typename DerivedClass, uint8_t SpaceID, uint8_t TypeID>
   class abstract_object : public object
   {
      public:
         static constexpr uint8_t space_id = SpaceID;
         static constexpr uint8_t type_id  = TypeID;

         using id_type = object_id<SpaceID, TypeID>;

         id_type get_id()const { return id_type( this->id.instance() ); }

         unique_ptr<object> clone()const override
         {
            return std::make_unique<DerivedClass>( *static_cast<const DerivedClass*>(this) );
         }

         void move_from( object& obj )override
         {
            static_cast<DerivedClass&>(*this) = std::move( static_cast<DerivedClass&>(obj) );
         }
         variant to_variant()const override
         {
            return variant( static_cast<const DerivedClass&>(*this), HIRELEDGER_DB_MAX_NESTED_OBJECTS );
         }
         vector<char> pack()const override { return fc::raw::pack( static_cast<const DerivedClass&>(*this) ); }
   };

} } // hireledger::db

FC_REFLECT( hireledger::db::object, (id) )
