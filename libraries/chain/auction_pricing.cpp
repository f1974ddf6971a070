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
#include <witch/chain/exceptions.hpp>

#include <fc/uint128.hpp>

namespace witch { namespace chain {

fraction_type auction_price_fraction( fraction_type initial_offer, uint64_t elapsed, uint32_t duration )
{
   FC_ASSERT( initial_offer <= WITCH_ONE, "Initial offer ${o} exceeds one", ("o",initial_offer) );
   if( elapsed >= duration )
      return WITCH_ONE;

   const fc::uint128_t one = WITCH_ONE;
   const fc::uint128_t progress = fc::uint128_t( elapsed ) * one / duration;
   const fc::uint128_t fraction = fc::uint128_t( initial_offer ) + ( one - initial_offer ) * progress / one;
   return static_cast<fraction_type>( fraction );
}

amount_type auction_payout( const amount_type& ink, const amount_type& art,
                            const amount_type& art_in, fraction_type fraction )
{ try {
   if( art_in == 0 )
      return 0;
   FC_ASSERT( art > 0, "No debt under auction" );
   FC_ASSERT( art_in <= art, "Can not repay more than the debt under auction", ("art_in",art_in)("art",art) );

   const wide_amount_type numerator = wide_amount_type( ink ) * wide_amount_type( art_in ) * fraction;
   const wide_amount_type denominator = wide_amount_type( art ) * WITCH_ONE;
   return static_cast<amount_type>( numerator / denominator );
} WITCH_CAPTURE_AND_RETHROW() }

} } // witch::chain
