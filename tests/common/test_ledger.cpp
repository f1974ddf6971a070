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

#include "test_ledger.hpp"

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

#include <stdexcept>

namespace witch { namespace chain { namespace test {

void undoable::on_undo( std::function<void()> revert )
{
   if( _db != nullptr )
      _db->on_undo( std::move( revert ) );
}

amount_type test_wallet::balance( account_id_type account, asset_id_type asset )const
{
   auto itr = _balances.find( std::make_pair( account, asset ) );
   return itr != _balances.end() ? itr->second : amount_type();
}

void test_wallet::set_balance( account_id_type account, asset_id_type asset, const amount_type& amount )
{
   const auto old = balance( account, asset );
   _balances[std::make_pair( account, asset )] = amount;
   on_undo( [this,account,asset,old]() { _balances[std::make_pair( account, asset )] = old; } );
}

void test_wallet::credit( account_id_type account, asset_id_type asset, const amount_type& amount )
{
   set_balance( account, asset, balance( account, asset ) + amount );
}

void test_wallet::debit( account_id_type account, asset_id_type asset, const amount_type& amount )
{
   const auto held = balance( account, asset );
   FC_ASSERT( held >= amount, "Insufficient balance", ("account",account)("asset",asset)("held",held)("amount",amount) );
   set_balance( account, asset, held - amount );
}

void test_vault_ledger::add_vault( vault_id_type id, account_id_type owner, asset_id_type ilk, asset_id_type base,
                                   const amount_type& ink, const amount_type& art )
{
   test_vault v;
   v.info.owner = owner;
   v.info.ilk = ilk;
   v.info.base = base;
   v.balances.ink = ink;
   v.balances.art = art;
   _vaults[id] = v;
}

void test_vault_ledger::set_undercollateralized( vault_id_type id, bool unsafe )
{
   mutable_vault( id ).undercollateralized = unsafe;
}

void test_vault_ledger::set_debt_params( asset_id_type base, const amount_type& min_debt, uint8_t decimals )
{
   debt_params params;
   params.min_debt = min_debt;
   params.decimals = decimals;
   _debt_params[base] = params;
}

void test_vault_ledger::set_rate( asset_id_type base, const amount_type& r )
{
   FC_ASSERT( r > 0 );
   _rates[base] = r;
}

const test_vault& test_vault_ledger::vault( vault_id_type id )const
{
   auto itr = _vaults.find( id );
   FC_ASSERT( itr != _vaults.end(), "Unknown vault ${v}", ("v",id) );
   return itr->second;
}

test_vault& test_vault_ledger::mutable_vault( vault_id_type id )
{
   auto itr = _vaults.find( id );
   FC_ASSERT( itr != _vaults.end(), "Unknown vault ${v}", ("v",id) );
   return itr->second;
}

vault_info test_vault_ledger::get_vault( vault_id_type id )const
{
   return vault( id ).info;
}

vault_balances test_vault_ledger::get_balances( vault_id_type id )const
{
   return vault( id ).balances;
}

bool test_vault_ledger::is_undercollateralized( vault_id_type id )const
{
   if( overflow_in_health_check )
      throw std::overflow_error( "overflow in vault health check" );
   return vault( id ).undercollateralized;
}

void test_vault_ledger::give( vault_id_type id, account_id_type receiver )
{
   auto& v = mutable_vault( id );
   const auto old_owner = v.info.owner;
   v.info.owner = receiver;
   on_undo( [this,id,old_owner]() { mutable_vault( id ).info.owner = old_owner; } );
}

vault_balances test_vault_ledger::slurp( vault_id_type id, const amount_type& ink, const amount_type& art )
{
   auto& v = mutable_vault( id );
   FC_ASSERT( ink <= v.balances.ink && art <= v.balances.art, "Vault ${v} can not cover the reduction",
              ("v",id)("ink",ink)("art",art) );
   const auto old_balances = v.balances;
   v.balances.ink -= ink;
   v.balances.art -= art;
   on_undo( [this,id,old_balances]() { mutable_vault( id ).balances = old_balances; } );
   return v.balances;
}

debt_params test_vault_ledger::get_debt_params( asset_id_type base )const
{
   auto itr = _debt_params.find( base );
   return itr != _debt_params.end() ? itr->second : debt_params();
}

amount_type test_vault_ledger::rate( asset_id_type base )const
{
   auto itr = _rates.find( base );
   return itr != _rates.end() ? itr->second : amount_type( WITCH_ONE );
}

amount_type test_vault_ledger::debt_from_base( asset_id_type base, const amount_type& base_amount )const
{ try {
   return static_cast<amount_type>( wide_amount_type( base_amount ) * WITCH_ONE / rate( base ) );
} WITCH_CAPTURE_AND_RETHROW( (base)(base_amount) ) }

amount_type test_vault_ledger::debt_to_base( asset_id_type base, const amount_type& art )const
{ try {
   const wide_amount_type product = wide_amount_type( art ) * rate( base );
   // rounds up, the buyer never pays less than the debt is worth
   return static_cast<amount_type>( ( product + WITCH_ONE - 1 ) / WITCH_ONE );
} WITCH_CAPTURE_AND_RETHROW( (base)(art) ) }

amount_type test_join::receive_from( account_id_type payer, const amount_type& amount )
{
   _wallet.debit( payer, _asset, amount );
   pool += amount;
   on_undo( [this,amount]() { pool -= amount; } );
   return amount > shortfall ? amount - shortfall : amount_type();
}

void test_join::release_to( account_id_type receiver, const amount_type& amount )
{
   FC_ASSERT( pool >= amount, "Join pool of ${a} is too small", ("a",_asset)("pool",pool)("amount",amount) );
   pool -= amount;
   on_undo( [this,amount]() { pool += amount; } );
   _wallet.credit( receiver, _asset, amount );
   FC_ASSERT( !fail_release, "Release of ${a} failed", ("a",_asset) );
}

void test_debt_token::burn( account_id_type payer, const amount_type& amount )
{
   _wallet.debit( payer, _base, amount );
   burned += amount;
   on_undo( [this,amount]() { burned -= amount; } );
}

} } } // witch::chain::test
