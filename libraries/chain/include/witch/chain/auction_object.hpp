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
    * @brief An open auction on the collateral of one vault
    * @ingroup object
    * @ingroup implementation
    *
    * The object exists exactly as long as the vault is under auction. art and ink only
    * shrink, through partial settlements; all other fields are fixed when it is created.
    */
   class auction_object : public witch::db::abstract_object<auction_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_auction_object_type;

         vault_id_type     vault;
         account_id_type   owner;   ///< Owner of the vault before the auction, receives it back
         time_point_sec    start;
         asset_id_type     ilk;     ///< Collateral asset
         asset_id_type     base;    ///< Debt asset
         amount_type       art;     ///< Debt still under auction
         amount_type       ink;     ///< Collateral still under auction
   };

   struct by_vault;
   struct by_market;
   typedef multi_index_container<
      auction_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_vault>, member< auction_object, vault_id_type, &auction_object::vault > >,
         ordered_unique< tag<by_market>,
            composite_key< auction_object,
               member< auction_object, asset_id_type, &auction_object::ilk >,
               member< auction_object, asset_id_type, &auction_object::base >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > auction_multi_index_type;

   typedef generic_index<auction_object, auction_multi_index_type> auction_index;

} } // witch::chain

MAP_OBJECT_ID_TO_TYPE( witch::chain::auction_object )

FC_REFLECT_DERIVED( witch::chain::auction_object, (witch::db::object),
                    (vault)(owner)(start)(ilk)(base)(art)(ink) )
