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
#include <witch/chain/types.hpp>

namespace witch { namespace chain {

   /**
    *  @return the fraction of WITCH_ONE of the collateral under auction that is offered after
    *  elapsed seconds. Starts at initial_offer and grows linearly to WITCH_ONE, which is
    *  reached when elapsed >= duration. A zero duration offers everything at once.
    */
   fraction_type auction_price_fraction( fraction_type initial_offer, uint64_t elapsed, uint32_t duration );

   /**
    *  Collateral released for repaying art_in of the art debt under auction.
    *
    *  ink * art_in * fraction / ( art * WITCH_ONE ), multiplied out before the single
    *  truncating division.
    */
   amount_type auction_payout( const amount_type& ink, const amount_type& art,
                               const amount_type& art_in, fraction_type fraction );

} } // witch::chain
