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

#include <witch/chain/auction_evaluator.hpp>
#include <witch/chain/auction_line_evaluator.hpp>
#include <witch/chain/auction_line_object.hpp>
#include <witch/chain/auction_object.hpp>
#include <witch/chain/auction_role_object.hpp>
#include <witch/chain/global_property_object.hpp>

namespace witch { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<auction_open_evaluator>();
   register_evaluator<auction_cancel_evaluator>();
   register_evaluator<auction_pay_base_evaluator>();
   register_evaluator<auction_pay_debt_evaluator>();
   register_evaluator<auction_line_update_evaluator>();
   register_evaluator<auction_limit_update_evaluator>();
   register_evaluator<auction_role_update_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();

   add_index< primary_index<global_property_index> >();
   add_index< primary_index<auction_index> >();
   add_index< primary_index<auction_line_index> >();
   add_index< primary_index<auction_limit_index> >();
   add_index< primary_index<auction_role_index> >();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   genesis_state.validate();
   FC_ASSERT( get_index_type<global_property_index>().indices().empty(), "Genesis state was already applied" );

   create<global_property_object>( [&genesis_state]( global_property_object& p ) {
      p.engine_account = genesis_state.engine_account;
      p.time = genesis_state.initial_timestamp;
   });

   for( const auto& role : genesis_state.initial_roles )
   {
      create<auction_role_object>( [&role]( auction_role_object& r ) {
         r.account = role.account;
         r.roles = role.roles;
      });
   }

   for( const auto& line : genesis_state.initial_lines )
   {
      create<auction_line_object>( [&line]( auction_line_object& l ) {
         l.ilk = line.ilk;
         l.base = line.base;
         l.duration = line.duration;
         l.proportion = line.proportion;
         l.initial_offer = line.initial_offer;
      });
   }

   for( const auto& limit : genesis_state.initial_limits )
   {
      create<auction_limit_object>( [&limit]( auction_limit_object& l ) {
         l.ilk = limit.ilk;
         l.base = limit.base;
         l.max = limit.max;
      });
   }

   ilog( "Initialized auction state at ${t}: engine account ${e}, ${r} roles, ${l} lines, ${m} limits",
         ("t",genesis_state.initial_timestamp)("e",genesis_state.engine_account)
         ("r",genesis_state.initial_roles.size())("l",genesis_state.initial_lines.size())
         ("m",genesis_state.initial_limits.size()) );
} FC_CAPTURE_AND_RETHROW() }

} }
