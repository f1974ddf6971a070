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

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace witch { namespace db {

   class object_database;

   struct undo_state
   {
      std::unordered_map<object_id_type, std::unique_ptr<object> > old_values;
      std::unordered_map<object_id_type, object_id_type>           old_index_next_ids;
      std::unordered_set<object_id_type>                           new_ids;
      std::unordered_map<object_id_type, std::unique_ptr<object> > removed;
      /** Reverts of changes made outside the object database, run last to first */
      std::vector< std::function<void()> >                         external_reverts;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Every session pushes a new undo_state. Dropping a session without calling
    * merge() or commit() reverts every change recorded since it was started.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ):_db(db){}

         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     elog( "${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               explicit session( undo_database& db, bool apply_undo = true ):_db(db),_apply_undo(apply_undo) {}
               undo_database& _db;
               bool           _apply_undo = true;
         };

         void disable();
         void enable();
         bool enabled()const { return !_disabled; }

         session start_undo_session();

         /** Called just after an object is created or re-inserted */
         void on_create( const object& obj );
         /**
          * Called just before an object is modified. Objects created in the current state are
          * not saved, undoing the state removes them anyway.
          */
         void on_modify( const object& obj );
         /**
          * Called just before an object is removed. If the object was created in the current
          * state it is simply forgotten.
          */
         void on_remove( const object& obj );
         /**
          * Records how to revert a change made outside the object database. The revert runs
          * when the current state is undone and is dropped once the outermost session commits.
          * Nothing is recorded while no session is active.
          */
         void on_external_change( std::function<void()> revert );

         std::size_t size()const { return _stack.size(); }
         std::size_t active_sessions()const { return _active_sessions; }

         const undo_state& head()const;

      private:
         void undo();
         void merge();
         void commit();

         uint32_t                _active_sessions = 0;
         bool                    _disabled = true;
         std::deque<undo_state>  _stack;
         object_database&        _db;
   };

} } // witch::db
