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
#include <witch/db/generic_index.hpp>
#include <witch/db/object.hpp>

#include <boost/multi_index/composite_key.hpp>

namespace witch { namespace chain {

   /**
    * @brief Auction parameters of a collateral / debt asset market
    * @ingroup object
    * @ingroup implementation
    */
   class auction_line_object : public witch::db::abstract_object<auction_line_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_auction_line_object_type;

         asset_id_type     ilk;
         asset_id_type     base;
         uint32_t          duration = 0;
         fraction_type     proportion = WITCH_ONE;
         fraction_type     initial_offer = WITCH_ONE;
   };

   /**
    * @brief Caps the collateral of a market that can be under auction at the same time
    * @ingroup object
    * @ingroup implementation
    *
    * sum is the total ink of all open auctions of the market. It may exceed max: the cap
    * is checked before collateral is added, not after.
    */
   class auction_limit_object : public witch::db::abstract_object<auction_limit_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_auction_limit_object_type;

         asset_id_type     ilk;
         asset_id_type     base;
         amount_type       max;
         amount_type       sum;
   };

   struct by_market;

   template<typename Object>
   using market_multi_index_type = multi_index_container<
      Object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_market>,
            composite_key< Object,
               member< Object, asset_id_type, &Object::ilk >,
               member< Object, asset_id_type, &Object::base >
            >
         >
      >
   >;

   typedef generic_index<auction_line_object, market_multi_index_type<auction_line_object>>   auction_line_index;
   typedef generic_index<auction_limit_object, market_multi_index_type<auction_limit_object>> auction_limit_index;

} } // witch::chain

MAP_OBJECT_ID_TO_TYPE( witch::chain::auction_line_object )
MAP_OBJECT_ID_TO_TYPE( witch::chain::auction_limit_object )

FC_REFLECT_DERIVED( witch::chain::auction_line_object, (witch::db::object),
                    (ilk)(base)(duration)(proportion)(initial_offer) )
FC_REFLECT_DERIVED( witch::chain::auction_limit_object, (witch::db::object),
                    (ilk)(base)(max)(sum) )
