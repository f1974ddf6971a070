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

#include <witch/chain/exceptions.hpp>
#include <witch/chain/genesis_state.hpp>
#include <witch/protocol/operations.hpp>

#include <set>

namespace witch { namespace chain {

void genesis_state_type::validate()const
{ try {
   WITCH_ASSERT( engine_account != WITCH_NULL_ACCOUNT, genesis_exception, "The null account can not hold vaults" );

   std::set<account_id_type> accounts;
   for( const auto& role : initial_roles )
   {
      WITCH_ASSERT( accounts.insert( role.account ).second, genesis_exception,
                    "Duplicate roles for account ${a}", ("a",role.account) );
      auction_role_update_operation op;
      op.account = role.account;
      op.roles = role.roles;
      op.validate();
   }

   std::set<std::pair<asset_id_type,asset_id_type>> markets;
   for( const auto& line : initial_lines )
   {
      WITCH_ASSERT( markets.insert( std::make_pair( line.ilk, line.base ) ).second, genesis_exception,
                    "Duplicate auction line for ${i}/${b}", ("i",line.ilk)("b",line.base) );
      auction_line_update_operation op;
      op.ilk = line.ilk;
      op.base = line.base;
      op.duration = line.duration;
      op.proportion = line.proportion;
      op.initial_offer = line.initial_offer;
      op.validate();
   }

   markets.clear();
   for( const auto& limit : initial_limits )
      WITCH_ASSERT( markets.insert( std::make_pair( limit.ilk, limit.base ) ).second, genesis_exception,
                    "Duplicate auction limit for ${i}/${b}", ("i",limit.ilk)("b",limit.base) );
} FC_CAPTURE_AND_RETHROW() }

} } // witch::chain
