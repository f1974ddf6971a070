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

#include <witch/chain/auction_pricing.hpp>
#include <witch/chain/auction_role_object.hpp>
#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

#include <boost/multiprecision/integer.hpp>

#include <algorithm>

namespace witch { namespace chain {

const global_property_object& database::get_global_properties()const
{
   return get( global_property_id_type() );
}

time_point_sec database::head_block_time()const
{
   return get_global_properties().time;
}

account_id_type database::engine_account()const
{
   return get_global_properties().engine_account;
}

const auction_object* database::find_auction( vault_id_type vault )const
{
   const auto& idx = get_index_type<auction_index>().indices().get<by_vault>();
   auto itr = idx.find( vault );
   return itr != idx.end() ? &*itr : nullptr;
}

const auction_object& database::get_auction( vault_id_type vault )const
{
   const auto* auction = find_auction( vault );
   WITCH_ASSERT( auction != nullptr, vault_not_auctioned, "Vault ${v} is not under auction", ("v",vault) );
   return *auction;
}

const auction_line_object* database::find_auction_line( asset_id_type ilk, asset_id_type base )const
{
   const auto& idx = get_index_type<auction_line_index>().indices().get<by_market>();
   auto itr = idx.find( boost::make_tuple( ilk, base ) );
   return itr != idx.end() ? &*itr : nullptr;
}

const auction_limit_object* database::find_auction_limit( asset_id_type ilk, asset_id_type base )const
{
   const auto& idx = get_index_type<auction_limit_index>().indices().get<by_market>();
   auto itr = idx.find( boost::make_tuple( ilk, base ) );
   return itr != idx.end() ? &*itr : nullptr;
}

bool database::has_role( account_id_type account, auction_role_flags role )const
{
   const auto& idx = get_index_type<auction_role_index>().indices().get<by_account>();
   auto itr = idx.find( account );
   return itr != idx.end() && itr->has_role( role );
}

amount_type database::get_dust( asset_id_type base )const
{ try {
   const auto params = get_vault_ledger().get_debt_params( base );
   FC_ASSERT( params.decimals <= WITCH_MAX_DEBT_DECIMALS, "Debt asset ${b} has too many decimals",
              ("b",base)("decimals",params.decimals) );
   return params.min_debt * boost::multiprecision::pow( amount_type(10), params.decimals );
} WITCH_CAPTURE_AND_RETHROW() }

amount_type database::quote_payout( vault_id_type vault, const amount_type& art_in )const
{
   const auto& auction = get_auction( vault );
   return calculate_payout( auction, std::min( art_in, auction.art ) );
}

amount_type database::calculate_payout( const auction_object& auction, const amount_type& art_in )const
{
   const auto* line = find_auction_line( auction.ilk, auction.base );
   WITCH_ASSERT( line != nullptr, auction_line_not_set,
                 "No auction line for ${i}/${b}", ("i",auction.ilk)("b",auction.base) );

   const uint64_t elapsed = head_block_time().sec_since_epoch() - auction.start.sec_since_epoch();
   const auto fraction = auction_price_fraction( line->initial_offer, elapsed, line->duration );
   return auction_payout( auction.ink, auction.art, art_in, fraction );
}

} }
