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
#include <witch/protocol/base.hpp>

namespace witch { namespace protocol {

   /**
    * @brief Set the auction parameters of a collateral / debt asset market
    * @ingroup operations
    *
    * Replaces the whole line. Auctions that are already running are priced with the
    * new parameters from then on.
    *
    * Requires the line_admin role.
    */
   struct auction_line_update_operation : public base_operation
   {
      account_id_type governor;        ///< Must hold the line_admin role
      asset_id_type   ilk;             ///< Collateral asset
      asset_id_type   base;            ///< Debt asset
      uint32_t        duration = 0;    ///< Seconds until all collateral under auction is offered
      fraction_type   proportion = WITCH_ONE;         ///< Share of a vault that one auction covers
      fraction_type   initial_offer = WITCH_ONE;      ///< Share of collateral offered at the start

      void validate()const override;
   };

   /**
    * @brief Set how much collateral of a market may be under auction at once
    * @ingroup operations
    *
    * Only the cap changes; collateral already under auction is kept.
    *
    * Requires the limit_admin role.
    */
   struct auction_limit_update_operation : public base_operation
   {
      account_id_type governor;        ///< Must hold the limit_admin role
      asset_id_type   ilk;
      asset_id_type   base;
      amount_type     max;
   };

} } // witch::protocol

FC_REFLECT( witch::protocol::auction_line_update_operation,
            (governor)(ilk)(base)(duration)(proportion)(initial_offer) )
FC_REFLECT( witch::protocol::auction_limit_update_operation, (governor)(ilk)(base)(max) )
