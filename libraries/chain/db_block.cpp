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

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

operation_result database::push_operation( const operation& op )
{ try {
   WITCH_ASSERT( !is_virtual_operation( op ), unknown_operation,
                 "Virtual operations are generated by the engine and can not be pushed" );
   operation_validate( op );

   const auto first_new_op = _applied_ops.size();
   auto session = _undo_db.start_undo_session();
   try {
      auto result = apply_operation( op );
      session.commit();
      notify_applied_operations( first_new_op );
      return result;
   }
   catch( const fc::exception& e )
   {
      dlog( "Operation failed, discarding its changes: ${e}", ("e",e.to_string()) );
      _applied_ops.resize( first_new_op );
      throw;
   }
} FC_CAPTURE_AND_RETHROW( (op) ) }

operation_result database::apply_operation( const operation& op )
{ try {
   const auto which = op.which();
   FC_ASSERT( which >= 0 && size_t(which) < _operation_evaluators.size() && _operation_evaluators[which],
              "No registered evaluator for this operation" );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[which];
   auto op_id = push_applied_operation( op, false );
   auto result = eval->evaluate( *this, op, true );
   set_applied_operation_result( op_id, result );
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::push_applied_operation( const operation& op, bool is_virtual )
{
   _applied_ops.emplace_back( op );
   operation_history_object& oh = _applied_ops.back();
   oh.time       = head_block_time();
   oh.sequence   = _cleared_ops + _applied_ops.size() - 1;
   oh.is_virtual = is_virtual;
   return _applied_ops.size() - 1;
}

void database::set_applied_operation_result( uint32_t op_id, const operation_result& result )
{
   FC_ASSERT( op_id < _applied_ops.size(), "Unknown applied operation ${id}", ("id",op_id) );
   _applied_ops[op_id].result = result;
}

const vector<operation_history_object>& database::get_applied_operations()const
{
   return _applied_ops;
}

void database::clear_applied_operations()
{
   FC_ASSERT( _undo_db.active_sessions() == 0, "An operation is being applied" );
   _cleared_ops += _applied_ops.size();
   _applied_ops.clear();
}

void database::notify_applied_operations( size_t first )
{
   for( size_t i = first; i < _applied_ops.size(); ++i )
      applied_operation( _applied_ops[i] );
}

void database::advance_time( time_point_sec new_time )
{
   const auto& props = get_global_properties();
   WITCH_ASSERT( new_time >= props.time, time_moved_backwards,
                 "Can not move time from ${now} back to ${t}", ("now",props.time)("t",new_time) );
   modify( props, [new_time]( global_property_object& p ) {
      p.time = new_time;
   });
}

} }
