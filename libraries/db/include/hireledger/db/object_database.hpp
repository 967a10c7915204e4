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
#include <hireledger/db/index.hpp>
#include <hireledger/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <memory>
#include <vector>

namespace hireledger { namespace db {

   /**
    *   @class object_database
    *   @brief maintains a set of indexed objects that can be modified with rollback support
    *
    *   The state lives in memory. When a data directory is given to open(), flush() writes
    *   every index below it and a later open() restores the objects and id sequences.
    */
   class object_database
   {
      public:
         object_database();
         virtual ~object_database() = default;

         static constexpr uint8_t _index_size = 255;

         void open( const fc::path& data_dir );

         /**
          * Saves the complete state of the object_database to disk, this could take a while
          */
         void flush();
         void wipe( const fc::path& data_dir ); // remove from disk
         void close();

         template<typename T, typename F>
         const T& create( F&& constructor )
         {
            auto& idx = get_mutable_index<T>();
            const object& result = idx.create( [&]( object& o )
            {
               constructor( static_cast<T&>(o) );
            } );
            save_undo_add( result );
            return static_cast<const T&>( result );
         }

         /// These methods are used to retrieve indexes on the object_database. All public index accessors are
         /// const-access only.
         /// @{
         template<typename IndexType>
         const IndexType& get_index_type()const
         {
            static_assert( std::is_base_of<index,IndexType>::value, "Type must be an index type" );
            return static_cast<const IndexType&>( get_index( IndexType::object_type::space_id,
                                                             IndexType::object_type::type_id ) );
         }
         template<typename T>
         const index& get_index()const { return get_index( T::space_id, T::type_id ); }
         const index& get_index( uint8_t space_id, uint8_t type_id )const;
         /// @}

         const object& get_object( const object_id_type& id )const;
         const object* find_object( const object_id_type& id )const;

         /// These methods are mutators of the object_database.
         /// You must use these methods to make changes to the object_database,
         /// in order to maintain proper undo history.
         ///@{
         const object& insert( object&& obj );
         void          remove( const object& obj );

         template<typename T, typename Lambda>
         void modify( const T& obj, const Lambda& m )
         {
            save_undo( obj );
            get_mutable_index( obj.id.space(), obj.id.type() ).modify( obj, [&m]( object& o ){
               m( static_cast<T&>(o) );
            } );
         }
         ///@}

         template<typename T>
         const T& get( const object_id_type& id )const
         {
            const object& obj = get_object( id );
            return static_cast<const T&>( obj );
         }
         template<typename T>
         const T* find( const object_id_type& id )const
         {
            const object* obj = find_object( id );
            return static_cast<const T*>( obj );
         }

         template<uint8_t SpaceID, uint8_t TypeID>
         auto find( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>*
         {
            return find<object_downcast_t<decltype(id)>>( object_id_type(id) );
         }

         template<uint8_t SpaceID, uint8_t TypeID>
         auto get( const object_id<SpaceID,TypeID>& id )const -> const object_downcast_t<decltype(id)>&
         {
            return get<object_downcast_t<decltype(id)>>( object_id_type(id) );
         }

         template<typename IndexType>
         IndexType* add_index()
         {
            using ObjectType = typename IndexType::object_type;
            const auto space_id = ObjectType::space_id;
            const auto type_id = ObjectType::type_id;
            if( _index[space_id].size() <= type_id )
               _index[space_id].resize( _index_size );
            FC_ASSERT( !_index[space_id][type_id], "Index ${s}.${t} already exists", ("s",space_id)("t",type_id) );
            _index[space_id][type_id] = std::make_unique<IndexType>();
            return static_cast<IndexType*>( _index[space_id][type_id].get() );
         }

         /**
          * Deep copy of every index. The copy shares nothing with this database and never
          * tracks undo history, it is safe to read from any thread while this database
          * keeps changing.
          */
         std::shared_ptr<const object_database> snapshot()const;

         fc::path get_data_dir()const { return _data_dir; }

         undo_database _undo_db;

      protected:
         template<typename T>
         index& get_mutable_index() { return get_mutable_index( T::space_id, T::type_id ); }
         index& get_mutable_index( uint8_t space_id, uint8_t type_id );

      private:
         friend class undo_database;
         void save_undo( const object& obj )        { _undo_db.on_modify( obj ); }
         void save_undo_add( const object& obj )    { _undo_db.on_create( obj ); }
         void save_undo_remove( const object& obj ) { _undo_db.on_remove( obj ); }

         fc::path                                                  _data_dir;
         std::vector< std::vector< std::unique_ptr<index> > >      _index;
   };

} } // hireledger::db
