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
    * @brief Put an undercollateralized vault up for auction
    * @ingroup operations
    *
    * Anyone may open an auction. The engine takes custody of the vault and auctions a
    * proportion of its debt and collateral, or the whole position when the remainder would
    * be dust.
    */
   struct auction_open_operation : public base_operation
   {
      account_id_type account;   ///< Caller, recorded for the history only
      vault_id_type   vault;     ///< Vault to liquidate
   };

   /**
    * @brief Give a vault back to its owner once it is healthy again
    * @ingroup operations
    */
   struct auction_cancel_operation : public base_operation
   {
      account_id_type account;
      vault_id_type   vault;
   };

   /**
    * @brief Repay debt of an auctioned vault with the debt asset in exchange for collateral
    * @ingroup operations
    *
    * The amount of debt repaid is derived from max_base_in, capped at the debt under auction.
    */
   struct auction_pay_base_operation : public base_operation
   {
      account_id_type account;       ///< Buyer, pays the debt asset
      vault_id_type   vault;
      account_id_type to;            ///< Receives the collateral
      amount_type     min_ink_out;   ///< Fails with not_enough_bought below this
      amount_type     max_base_in;   ///< Upper bound of debt asset to pay
   };

   /**
    * @brief Repay debt of an auctioned vault by burning debt tokens in exchange for collateral
    * @ingroup operations
    */
   struct auction_pay_debt_operation : public base_operation
   {
      account_id_type account;       ///< Buyer, its debt tokens are burned
      vault_id_type   vault;
      account_id_type to;            ///< Receives the collateral
      amount_type     min_ink_out;   ///< Fails with not_enough_bought below this
      amount_type     max_art_in;    ///< Upper bound of debt to repay
   };

   /**
    * @brief Generated by the engine when collateral of an auction is bought
    * @ingroup operations
    *
    * @note This is a virtual operation that is created while settling an auction. It is
    * recorded in the history and can not be pushed.
    */
   struct auction_bought_operation : public base_operation
   {
      auction_bought_operation(){}
      auction_bought_operation( vault_id_type v, account_id_type b, const amount_type& i, const amount_type& p )
         :vault(v),buyer(b),ink(i),paid(p) {}

      vault_id_type   vault;
      account_id_type buyer;
      amount_type     ink;    ///< Collateral released
      amount_type     paid;   ///< Debt asset or debt token paid

      void validate()const override { FC_ASSERT( !"virtual operation" ); }
   };

} } // witch::protocol

FC_REFLECT( witch::protocol::auction_open_operation, (account)(vault) )
FC_REFLECT( witch::protocol::auction_cancel_operation, (account)(vault) )
FC_REFLECT( witch::protocol::auction_pay_base_operation, (account)(vault)(to)(min_ink_out)(max_base_in) )
FC_REFLECT( witch::protocol::auction_pay_debt_operation, (account)(vault)(to)(min_ink_out)(max_art_in) )
FC_REFLECT( witch::protocol::auction_bought_operation, (vault)(buyer)(ink)(paid) )
