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
#include <witch/db/object.hpp>

#include <functional>

namespace witch { namespace db {

   class object_database;

   /**
    *  @class index
    *  @brief abstract base class for accessing objects indexed in various ways.
    *
    *  All indexes assume that there exists an object ID space that will grow
    *  forever in a seqential manner.  These IDs are used to identify the
    *  index, type, and instance of the object.
    *
    *  Mutations must go through object_database so that they are recorded for undo.
    */
   class index
   {
      public:
         virtual ~index() = default;

         virtual uint8_t object_space_id()const = 0;
         virtual uint8_t object_type_id()const = 0;

         virtual object_id_type get_next_id()const = 0;
         virtual void           use_next_id() = 0;
         virtual void           set_next_id( object_id_type id ) = 0;

         /**
          * Builds a new object and assigns it the next available ID and then
          * initializes it with constructor and lastly inserts it into the index.
          */
         virtual const object& create( const std::function<void(object&)>& constructor ) = 0;

         /**
          *  Used to restore an object that was removed, the id must not be in use.
          */
         virtual const object& insert( object&& obj ) = 0;

         /**
          *  Opens a mutable reference to obj and calls m(obj), the index is
          *  updated afterwards to reflect the new value.
          */
         virtual void modify( const object& obj, const std::function<void(object&)>& m ) = 0;
         virtual void remove( const object& obj ) = 0;

         /**
          *  @return a pointer to the object, or nullptr if it is not in the index
          */
         virtual const object* find( object_id_type id )const = 0;

         const object& get( object_id_type id )const
         {
            auto maybe_found = find( id );
            FC_ASSERT( maybe_found != nullptr, "Unable to find Object", ("id",std::string(id)) );
            return *maybe_found;
         }

         virtual void inspect_all_objects( std::function<void(const object&)> inspector )const = 0;
   };

   /**
    *  @class primary_index
    *  @brief wraps a derived index to keep the id sequence and to report every change to the
    *  object_database so that it can be undone.
    */
   template<typename DerivedIndex>
   class primary_index : public DerivedIndex
   {
      public:
         using object_type = typename DerivedIndex::object_type;

         explicit primary_index( object_database& db )
         :_db(db),_next_id( object_type::space_id, object_type::type_id, 0 ) {}

         uint8_t object_space_id()const override { return object_type::space_id; }
         uint8_t object_type_id()const override  { return object_type::type_id; }

         object_id_type get_next_id()const override           { return _next_id; }
         void           use_next_id() override                { ++_next_id; }
         void           set_next_id( object_id_type id ) override { _next_id = id; }

         const object& create( const std::function<void(object&)>& constructor ) override
         {
            const auto& result = DerivedIndex::create( constructor );
            on_add( result );
            return result;
         }

         const object& insert( object&& obj ) override
         {
            const auto& result = DerivedIndex::insert( std::move(obj) );
            on_add( result );
            return result;
         }

         void modify( const object& obj, const std::function<void(object&)>& m ) override
         {
            on_modify( obj );
            DerivedIndex::modify( obj, m );
         }

         void remove( const object& obj ) override
         {
            on_remove( obj );
            DerivedIndex::remove( obj );
         }

      private:
         // defined in object_database.hpp, which needs the complete index type
         void on_add( const object& obj );
         void on_modify( const object& obj );
         void on_remove( const object& obj );

         object_database& _db;
         object_id_type   _next_id;
   };

} } // witch::db
