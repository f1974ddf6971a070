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

   struct vault_info
   {
      account_id_type owner;
      asset_id_type   ilk;    ///< Collateral asset
      asset_id_type   base;   ///< Debt asset
   };

   struct vault_balances
   {
      amount_type     ink;
      amount_type     art;
   };

   /** Minimum debt of a vault is min_debt * 10^decimals */
   struct debt_params
   {
      amount_type     min_debt;
      uint8_t         decimals = 0;
   };

   /**
    *  @brief the ledger that owns the vaults
    *
    *  The engine reads vaults through this interface and asks it to move custody and to
    *  reduce balances. It is implemented by the host; every method reports failure by
    *  throwing an fc::exception.
    *
    *  Implementations of the mutating methods here, in asset_join and in debt_token register
    *  how to revert each change with database::on_undo.
    */
   class vault_ledger
   {
      public:
         virtual ~vault_ledger() = default;

         virtual vault_info     get_vault( vault_id_type vault )const = 0;
         virtual vault_balances get_balances( vault_id_type vault )const = 0;
         virtual bool           is_undercollateralized( vault_id_type vault )const = 0;

         /** Transfer custody of the vault */
         virtual void           give( vault_id_type vault, account_id_type receiver ) = 0;
         /** Reduce the balances of a vault, returns the new balances */
         virtual vault_balances slurp( vault_id_type vault, const amount_type& ink, const amount_type& art ) = 0;

         virtual debt_params    get_debt_params( asset_id_type base )const = 0;
         /** Converts an amount of the debt asset into debt units */
         virtual amount_type    debt_from_base( asset_id_type base, const amount_type& base_amount )const = 0;
         /** Converts debt units into the amount of debt asset that repays them */
         virtual amount_type    debt_to_base( asset_id_type base, const amount_type& art )const = 0;
   };

   /**
    *  @brief custody adapter of one asset
    */
   class asset_join
   {
      public:
         virtual ~asset_join() = default;

         /** Pull amount from payer, returns what was actually received */
         virtual amount_type receive_from( account_id_type payer, const amount_type& amount ) = 0;
         virtual void        release_to( account_id_type receiver, const amount_type& amount ) = 0;
   };

   /**
    *  @brief the token that represents debt units of one debt asset
    */
   class debt_token
   {
      public:
         virtual ~debt_token() = default;

         virtual void burn( account_id_type payer, const amount_type& amount ) = 0;
   };

} } // witch::chain

FC_REFLECT( witch::chain::vault_info, (owner)(ilk)(base) )
FC_REFLECT( witch::chain::vault_balances, (ink)(art) )
FC_REFLECT( witch::chain::debt_params, (min_debt)(decimals) )
