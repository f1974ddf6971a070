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

#include <witch/chain/auction_evaluator.hpp>
#include <witch/chain/auction_object.hpp>

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

#include <algorithm>

namespace witch { namespace chain {

namespace {

   /// @return the collateral bought by art_in, after the slippage and dust checks
   amount_type evaluate_purchase( const database& d, const auction_object& auction,
                                  const amount_type& art_in, const amount_type& min_ink_out )
   {
      const auto ink_out = d.calculate_payout( auction, art_in );
      WITCH_ASSERT( ink_out >= min_ink_out, not_enough_bought,
                    "Repaying ${art} debt buys ${ink} collateral, less than the ${min} asked for",
                    ("art",art_in)("ink",ink_out)("min",min_ink_out) );

      const amount_type art_left = auction.art - art_in;
      if( art_left > 0 )
      {
         const auto dust = d.get_dust( auction.base );
         WITCH_ASSERT( art_left >= dust, leaves_dust,
                       "Repaying ${art} debt leaves ${left} under auction, below the minimum of ${dust}",
                       ("art",art_in)("left",art_left)("dust",dust) );
      }
      return ink_out;
   }

}

void_result auction_open_evaluator::do_evaluate( const auction_open_operation& op )
{ try {
   const database& d = db();

   WITCH_ASSERT( d.find_auction( op.vault ) == nullptr, vault_already_auctioned,
                 "Vault ${v} is already under auction", ("v",op.vault) );

   const auto& ledger = d.get_vault_ledger();
   _vault = ledger.get_vault( op.vault );
   const auto balances = ledger.get_balances( op.vault );
   WITCH_ASSERT( ledger.is_undercollateralized( op.vault ), not_undercollateralized,
                 "Vault ${v} is sufficiently collateralized", ("v",op.vault) );

   const auto* line = d.find_auction_line( _vault.ilk, _vault.base );
   WITCH_ASSERT( line != nullptr, auction_line_not_set,
                 "No auction line for ${i}/${b}", ("i",_vault.ilk)("b",_vault.base) );

   const auto dust = d.get_dust( _vault.base );
   _art = static_cast<amount_type>( wide_amount_type( balances.art ) * line->proportion / WITCH_ONE );
   _ink = static_cast<amount_type>( wide_amount_type( balances.ink ) * line->proportion / WITCH_ONE );
   if( balances.art - _art < dust )
   {
      _art = balances.art;
      _ink = balances.ink;
   }

   return void_result();
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

object_id_type auction_open_evaluator::do_apply( const auction_open_operation& op )
{ try {
   return db().open_auction( op.vault, _vault, _art, _ink ).id;
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_cancel_evaluator::do_evaluate( const auction_cancel_operation& op )
{ try {
   const database& d = db();

   _auction = &d.get_auction( op.vault );
   WITCH_ASSERT( !d.get_vault_ledger().is_undercollateralized( op.vault ), still_undercollateralized,
                 "Vault ${v} is still undercollateralized", ("v",op.vault) );

   return void_result();
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_cancel_evaluator::do_apply( const auction_cancel_operation& op )
{ try {
   db().cancel_auction( *_auction );
   return void_result();
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_pay_base_evaluator::do_evaluate( const auction_pay_base_operation& op )
{ try {
   const database& d = db();

   _auction = &d.get_auction( op.vault );
   const auto& ledger = d.get_vault_ledger();
   _art_in = std::min( ledger.debt_from_base( _auction->base, op.max_base_in ), _auction->art );
   _base_in = ledger.debt_to_base( _auction->base, _art_in );
   FC_ASSERT( _base_in <= op.max_base_in, "Repaying ${art} debt costs ${cost}, more than the ${max} offered",
              ("art",_art_in)("cost",_base_in)("max",op.max_base_in) );

   _ink_out = evaluate_purchase( d, *_auction, _art_in, op.min_ink_out );

   d.get_join( _auction->base );
   d.get_join( _auction->ilk );

   return void_result();
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

auction_payment_result auction_pay_base_evaluator::do_apply( const auction_pay_base_operation& op )
{ try {
   database& d = db();

   const auto received = d.get_join( _auction->base ).receive_from( op.account, _base_in );
   FC_ASSERT( received >= _base_in, "Join of ${b} received ${r} instead of ${a}",
              ("b",_auction->base)("r",received)("a",_base_in) );

   return d.settle_auction( *_auction, op.account, op.to, _art_in, _ink_out, _base_in );
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_pay_debt_evaluator::do_evaluate( const auction_pay_debt_operation& op )
{ try {
   const database& d = db();

   _auction = &d.get_auction( op.vault );
   _art_in = std::min( op.max_art_in, _auction->art );

   _ink_out = evaluate_purchase( d, *_auction, _art_in, op.min_ink_out );

   d.get_debt_token( _auction->base );
   d.get_join( _auction->ilk );

   return void_result();
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

auction_payment_result auction_pay_debt_evaluator::do_apply( const auction_pay_debt_operation& op )
{ try {
   database& d = db();

   d.get_debt_token( _auction->base ).burn( op.account, _art_in );

   return d.settle_auction( *_auction, op.account, op.to, _art_in, _ink_out, _art_in );
} WITCH_CAPTURE_AND_RETHROW( (op) ) }

} } // witch::chain
