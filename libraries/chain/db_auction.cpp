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

#include <witch/chain/auction_object.hpp>
#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

const auction_object& database::open_auction( vault_id_type vault, const vault_info& info,
                                              const amount_type& art, const amount_type& ink )
{ try {
   reserve_exposure( info.ilk, info.base, ink );
   get_vault_ledger().give( vault, engine_account() );

   const auto now = head_block_time();
   const auto& auction = create<auction_object>( [&]( auction_object& a ) {
      a.vault = vault;
      a.owner = info.owner;
      a.start = now;
      a.ilk   = info.ilk;
      a.base  = info.base;
      a.art   = art;
      a.ink   = ink;
   });

   ilog( "Auction ${id} opened for vault ${v} at ${t}: ${art} debt, ${ink} collateral",
         ("id",auction.id)("v",vault)("t",now)("art",art)("ink",ink) );
   return auction;
} WITCH_CAPTURE_AND_RETHROW( (vault)(art)(ink) ) }

void database::cancel_auction( const auction_object& auction )
{ try {
   const auto vault = auction.vault;
   const auto owner = auction.owner;

   release_exposure( auction.ilk, auction.base, auction.ink );
   remove( auction );
   get_vault_ledger().give( vault, owner );

   ilog( "Auction for vault ${v} cancelled, returned to ${o}", ("v",vault)("o",owner) );
} WITCH_CAPTURE_AND_RETHROW() }

auction_payment_result database::settle_auction( const auction_object& auction, account_id_type buyer,
                                                 account_id_type receiver, const amount_type& art_in,
                                                 const amount_type& ink_out, const amount_type& paid )
{ try {
   FC_ASSERT( art_in <= auction.art && ink_out <= auction.ink, "Purchase exceeds the auction",
              ("art_in",art_in)("ink_out",ink_out)("auction",auction) );

   const auto vault = auction.vault;
   auto& ledger = get_vault_ledger();

   ledger.slurp( vault, ink_out, art_in );
   get_join( auction.ilk ).release_to( receiver, ink_out );

   if( art_in == auction.art )
   {
      // the collateral left unsold goes back to the owner with the vault
      const auto owner = auction.owner;
      release_exposure( auction.ilk, auction.base, auction.ink );
      remove( auction );
      ledger.give( vault, owner );
      ilog( "Auction for vault ${v} settled, returned to ${o}", ("v",vault)("o",owner) );
   }
   else
   {
      const amount_type art_left = auction.art - art_in;
      const amount_type ink_left = auction.ink - ink_out;
      release_exposure( auction.ilk, auction.base, ink_out );
      modify( auction, [&art_left,&ink_left]( auction_object& a ) {
         a.art = art_left;
         a.ink = ink_left;
      });
      dlog( "Auction for vault ${v} partially settled: ${art} debt and ${ink} collateral left",
            ("v",vault)("art",art_left)("ink",ink_left) );
   }

   push_applied_operation( auction_bought_operation( vault, buyer, ink_out, paid ) );

   auction_payment_result result;
   result.ink_out = ink_out;
   result.paid = paid;
   return result;
} WITCH_CAPTURE_AND_RETHROW( (buyer)(receiver)(art_in)(ink_out)(paid) ) }

} }
