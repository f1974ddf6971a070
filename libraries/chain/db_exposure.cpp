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

#include <witch/chain/auction_line_object.hpp>
#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

void database::reserve_exposure( asset_id_type ilk, asset_id_type base, const amount_type& ink )
{ try {
   const auto* limit = find_auction_limit( ilk, base );
   WITCH_ASSERT( limit != nullptr && limit->sum < limit->max, exposure_exceeded,
                 "Collateral under auction for ${i}/${b} is at its limit",
                 ("i",ilk)("b",base)("sum",limit ? limit->sum : amount_type())("max",limit ? limit->max : amount_type()) );

   const amount_type new_sum = limit->sum + ink;
   modify( *limit, [&new_sum]( auction_limit_object& l ) {
      l.sum = new_sum;
   });
   if( limit->sum > limit->max )
      wlog( "Collateral under auction for ${i}/${b} is above its limit: ${s} > ${m}",
            ("i",ilk)("b",base)("s",limit->sum)("m",limit->max) );
} WITCH_CAPTURE_AND_RETHROW( (ilk)(base)(ink) ) }

void database::release_exposure( asset_id_type ilk, asset_id_type base, const amount_type& ink )
{ try {
   const auto* limit = find_auction_limit( ilk, base );
   FC_ASSERT( limit != nullptr, "No exposure recorded for ${i}/${b}", ("i",ilk)("b",base) );
   const amount_type new_sum = limit->sum - ink;
   modify( *limit, [&new_sum]( auction_limit_object& l ) {
      l.sum = new_sum;
   });
} WITCH_CAPTURE_AND_RETHROW( (ilk)(base)(ink) ) }

} }
