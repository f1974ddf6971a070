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

#include <witch/db/object_database.hpp>
#include <witch/db/undo_database.hpp>

namespace witch { namespace db {

void undo_database::enable()  { _disabled = false; }
void undo_database::disable() { _disabled = true; }

undo_database::session undo_database::start_undo_session()
{
   if( _disabled ) return session( *this, false );

   _stack.emplace_back();
   ++_active_sessions;
   return session( *this );
}

void undo_database::on_create( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   auto index_id = object_id_type( obj.id.space(), obj.id.type(), 0 );
   if( state.old_index_next_ids.find( index_id ) == state.old_index_next_ids.end() )
      state.old_index_next_ids[index_id] = obj.id;
   state.new_ids.insert( obj.id );
}

void undo_database::on_modify( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   auto& state = _stack.back();
   if( state.new_ids.find(obj.id) != state.new_ids.end() )
      return;
   if( state.old_values.find(obj.id) != state.old_values.end() )
      return;
   state.old_values[obj.id] = obj.clone();
}

void undo_database::on_remove( const object& obj )
{
   if( _disabled || _stack.empty() ) return;

   undo_state& state = _stack.back();
   if( state.new_ids.count(obj.id) )
   {
      state.new_ids.erase(obj.id);
      return;
   }
   auto old = state.old_values.find(obj.id);
   if( old != state.old_values.end() )
   {
      state.removed[obj.id] = std::move(old->second);
      state.old_values.erase(old);
      return;
   }
   if( state.removed.count(obj.id) ) return;
   state.removed[obj.id] = obj.clone();
}

void undo_database::on_external_change( std::function<void()> revert )
{
   if( _disabled || _stack.empty() ) return;
   _stack.back().external_reverts.push_back( std::move(revert) );
}

void undo_database::undo()
{ try {
   FC_ASSERT( !_disabled );
   FC_ASSERT( _active_sessions > 0 );
   disable();

   try {
      auto& state = _stack.back();
      for( auto itr = state.external_reverts.rbegin(); itr != state.external_reverts.rend(); ++itr )
         (*itr)();

      for( auto& item : state.old_values )
         _db.modify( _db.get_object( item.second->id ), [&]( object& obj ){ obj.move_from( *item.second ); } );

      for( const auto& id : state.new_ids )
         _db.remove( _db.get_object(id) );

      for( auto& item : state.old_index_next_ids )
         _db.get_mutable_index( item.first.space(), item.first.type() ).set_next_id( item.second );

      for( auto& item : state.removed )
         _db.insert( std::move(*item.second) );

      _stack.pop_back();
   }
   catch( const fc::exception& e )
   {
      elog( "error undoing state ${e}", ("e", e.to_detail_string()) );
      enable();
      throw;
   }

   enable();
   --_active_sessions;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _active_sessions > 0 );
   if( _stack.size() < 2 )
   {
      // outermost session, nothing left to fold the changes into
      _stack.pop_back();
      --_active_sessions;
      return;
   }

   auto& state = _stack.back();
   auto& prev_state = _stack[_stack.size()-2];
   for( auto& obj : state.old_values )
   {
      if( prev_state.new_ids.find(obj.first) != prev_state.new_ids.end() )
         continue;
      if( prev_state.old_values.find(obj.first) == prev_state.old_values.end() )
         prev_state.old_values[obj.first] = std::move(obj.second);
   }
   for( auto id : state.new_ids )
      prev_state.new_ids.insert(id);
   for( auto& item : state.old_index_next_ids )
   {
      if( prev_state.old_index_next_ids.find( item.first ) == prev_state.old_index_next_ids.end() )
         prev_state.old_index_next_ids[item.first] = item.second;
   }
   for( auto& obj : state.removed )
   {
      if( prev_state.new_ids.find(obj.first) != prev_state.new_ids.end() )
      {
         prev_state.new_ids.erase(obj.first);
         continue;
      }
      auto old = prev_state.old_values.find(obj.first);
      if( old != prev_state.old_values.end() )
      {
         prev_state.removed[obj.first] = std::move(old->second);
         prev_state.old_values.erase(old);
         continue;
      }
      prev_state.removed[obj.first] = std::move(obj.second);
   }
   for( auto& revert : state.external_reverts )
      prev_state.external_reverts.push_back( std::move(revert) );
   _stack.pop_back();
   --_active_sessions;
}

void undo_database::commit()
{
   // a nested session hands its changes to the enclosing one, which may still be undone
   merge();
}

const undo_state& undo_database::head()const
{
   FC_ASSERT( !_stack.empty() );
   return _stack.back();
}

} } // witch::db
