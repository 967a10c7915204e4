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
#include <fc/exception/exception.hpp>
#include <fc/io/varint.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/string.hpp>

#include <functional>
#include <string>

namespace hireledger { namespace db {

   /**
    *  Generic id of a stored object, written "space.type.instance". The space and type select
    *  the index, the instance is handed out sequentially by that index.
    */
   struct object_id_type
   {
      static constexpr uint8_t  instance_bits = 48;
      static constexpr uint64_t max_instance  = ( uint64_t(1) << instance_bits ) - 1;

      object_id_type() = default;
      object_id_type( uint8_t s, uint8_t t, uint64_t i ) { reset( s, t, i ); }

      void reset( uint8_t s, uint8_t t, uint64_t i )
      {
         FC_ASSERT( i <= max_instance, "instance overflow", ("instance",i) );
         number = ( uint64_t(s) << 56 ) | ( uint64_t(t) << instance_bits ) | i;
      }

      uint8_t  space()const    { return uint8_t( number >> 56 ); }
      uint8_t  type()const     { return uint8_t( number >> instance_bits ); }
      uint64_t instance()const { return number & max_instance; }

      /// the id an index assigns after this one
      object_id_type next()const { return object_id_type( space(), type(), instance() + 1 ); }

      friend bool operator == ( const object_id_type& a, const object_id_type& b ) { return a.number == b.number; }
      friend bool operator != ( const object_id_type& a, const object_id_type& b ) { return a.number != b.number; }
      friend bool operator <  ( const object_id_type& a, const object_id_type& b ) { return a.number < b.number; }
      friend bool operator >  ( const object_id_type& a, const object_id_type& b ) { return a.number > b.number; }

      explicit operator std::string()const;

      /// Parses "space.type.instance", throws on any other shape
      static object_id_type from_string( const std::string& s );

      uint64_t number = 0;
   };

   class object;

   /// Object class stored under a typed id, filled in by MAP_OBJECT_ID_TO_TYPE
   template<typename ObjectID>
   struct object_downcast { using type = object; };

   template<typename ObjectID>
   using object_downcast_t = typename object_downcast<ObjectID>::type;

   /**
    *  Id of an object of one known class. Only the instance is stored, the space and type
    *  are part of the C++ type.
    */
   template<uint8_t SpaceID, uint8_t TypeID>
   struct object_id
   {
      static constexpr uint8_t space_id = SpaceID;
      static constexpr uint8_t type_id  = TypeID;

      object_id() = default;
      explicit object_id( uint64_t i ):instance(i)
      {
         FC_ASSERT( i <= object_id_type::max_instance, "instance overflow", ("instance",i) );
      }
      explicit object_id( const object_id_type& id ):instance(id.instance())
      {
         FC_ASSERT( id.space() == SpaceID && id.type() == TypeID, "${id} is not a ${s}.${t} id",
                    ("id",std::string(id))("s",SpaceID)("t",TypeID) );
      }

      explicit operator object_id_type()const { return object_id_type( SpaceID, TypeID, instance.value ); }
      explicit operator std::string()const    { return std::string( object_id_type(*this) ); }

      friend bool operator == ( const object_id& a, const object_id& b ) { return a.instance == b.instance; }
      friend bool operator != ( const object_id& a, const object_id& b ) { return a.instance != b.instance; }
      friend bool operator <  ( const object_id& a, const object_id& b ) { return a.instance.value < b.instance.value; }
      friend bool operator >  ( const object_id& a, const object_id& b ) { return a.instance.value > b.instance.value; }

      fc::unsigned_int instance;
   };

} } // hireledger::db

#define MAP_OBJECT_ID_TO_TYPE(OBJECT) \
   namespace hireledger { namespace db { \
   template<> \
   struct object_downcast<const hireledger::db::object_id<OBJECT::space_id, \
                                                          OBJECT::type_id>&> { using type = OBJECT; }; \
   } }

FC_REFLECT( hireledger::db::object_id_type, (number) )

namespace fc {

// FC_REFLECT_TEMPLATE takes type parameters only
template<uint8_t SpaceID, uint8_t TypeID>
struct get_typename<hireledger::db::object_id<SpaceID,TypeID>>
{
   static const char* name()
   {
      static const std::string n = "hireledger::db::object_id<" + fc::to_string(SpaceID) + ":"
                                                                 + fc::to_string(TypeID) + ">";
      return n.c_str();
   }
};

template<uint8_t SpaceID, uint8_t TypeID>
struct reflector<hireledger::db::object_id<SpaceID,TypeID> >
{
   using type = hireledger::db::object_id<SpaceID,TypeID>;
   using is_defined = std::true_type;
   using native_members = typelist::list<fc::field_reflection<0, type, unsigned_int, &type::instance>>;
   using inherited_members = typelist::list<>;
   using members = native_members;
   using base_classes = typelist::list<>;
   enum member_count_enum {
      local_member_count = 1,
      total_member_count = 1
   };
   template<typename Visitor>
   static inline void visit( const Visitor& visitor )
   {
      visitor.TEMPLATE operator()<unsigned_int,type,&type::instance>( "instance" );
   }
};

namespace member_names {
template<uint8_t S, uint8_t T>
struct member_name<hireledger::db::object_id<S,T>, 0> { static constexpr const char* value = "instance"; };
}

void to_variant( const hireledger::db::object_id_type& var, fc::variant& vo, uint32_t max_depth = 1 );
void from_variant( const fc::variant& var, hireledger::db::object_id_type& vo, uint32_t max_depth = 1 );

template<uint8_t SpaceID, uint8_t TypeID>
void to_variant( const hireledger::db::object_id<SpaceID,TypeID>& var, fc::variant& vo, uint32_t max_depth = 1 )
{
   to_variant( hireledger::db::object_id_type( var ), vo, max_depth );
}

template<uint8_t SpaceID, uint8_t TypeID>
void from_variant( const fc::variant& var, hireledger::db::object_id<SpaceID,TypeID>& vo, uint32_t max_depth = 1 )
{
   hireledger::db::object_id_type generic;
   from_variant( var, generic, max_depth );
   vo = hireledger::db::object_id<SpaceID,TypeID>( generic );
}

} // namespace fc

namespace std {
   template<> struct hash<hireledger::db::object_id_type>
   {
      size_t operator()( const hireledger::db::object_id_type& x )const { return std::hash<uint64_t>()( x.number ); }
   };
}
