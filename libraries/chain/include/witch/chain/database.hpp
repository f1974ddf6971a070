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
#include <witch/chain/auction_line_object.hpp>
#include <witch/chain/auction_object.hpp>
#include <witch/chain/evaluator.hpp>
#include <witch/chain/genesis_state.hpp>
#include <witch/chain/global_property_object.hpp>
#include <witch/chain/operation_history_object.hpp>
#include <witch/chain/vault_ledger.hpp>

#include <witch/db/object_database.hpp>
#include <witch/db/object.hpp>

#include <fc/signals.hpp>
#include <fc/log/logger.hpp>

#include <map>

namespace witch { namespace chain {
   using witch::db::abstract_object;
   using witch::db::object;

   /**
    *   @class database
    *   @brief tracks the auction state and applies operations to it
    *
    *   Operations are applied one at a time. Each one either succeeds completely or leaves
    *   the state and the history exactly as they were.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         /// @{ @group Collaborators
         void set_vault_ledger( std::shared_ptr<vault_ledger> ledger );
         /** Custody adapter of an asset, used for collateral and for the debt asset */
         void register_join( asset_id_type asset, std::shared_ptr<asset_join> join );
         void register_debt_token( asset_id_type base, std::shared_ptr<debt_token> token );

         vault_ledger& get_vault_ledger()const;
         asset_join&   get_join( asset_id_type asset )const;
         debt_token&   get_debt_token( asset_id_type base )const;

         /**
          *  Collaborators call this for every change they make on behalf of an operation.
          *  If the operation fails, revert is called and the change is rolled back together
          *  with the engine state.
          */
         void          on_undo( std::function<void()> revert );
         /// @}

         //////////////////// db_init.cpp ////////////////////
         void initialize_indexes(); // Mark as public since it is used in tests
         void initialize_evaluators();
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation tag" );
            FC_ASSERT( size_t(op_type) < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

         //////////////////// db_block.cpp ////////////////////

         /**
          *  Validates and applies an operation. On failure every change made by the operation
          *  is undone and the exception propagates.
          */
         operation_result push_operation( const operation& op );

         /** Move the clock forward, auctions get cheaper as time passes */
         void advance_time( time_point_sec new_time );

         /**
          * This method is used to track applied operations during the evaluation of an
          * operation, virtual operations included.
          */
         uint32_t  push_applied_operation( const operation& op, bool is_virtual = true );
         void      set_applied_operation_result( uint32_t op_id, const operation_result& r );
         const vector<operation_history_object>& get_applied_operations()const;
         /**
          *  Drops the recorded history once it has been consumed. Sequence numbers keep counting
          *  from where they were. Can not be called while an operation is being applied.
          */
         void      clear_applied_operations();

         /**
          *  Emitted once for every operation recorded in the history, after the operation
          *  that caused it succeeded.
          */
         fc::signal<void(const operation_history_object&)> applied_operation;

         //////////////////// db_getter.cpp ////////////////////

         const global_property_object& get_global_properties()const;
         time_point_sec                head_block_time()const;
         account_id_type               engine_account()const;

         const auction_object*         find_auction( vault_id_type vault )const;
         /** @throws vault_not_auctioned */
         const auction_object&         get_auction( vault_id_type vault )const;
         const auction_line_object*    find_auction_line( asset_id_type ilk, asset_id_type base )const;
         const auction_limit_object*   find_auction_limit( asset_id_type ilk, asset_id_type base )const;
         bool                          has_role( account_id_type account, auction_role_flags role )const;

         /** Smallest non-zero debt a vault of this debt asset may have */
         amount_type                   get_dust( asset_id_type base )const;

         /**
          *  Collateral the auction of vault currently gives for art_in of its debt. art_in is
          *  capped at the debt under auction.
          */
         amount_type                   quote_payout( vault_id_type vault, const amount_type& art_in )const;
         amount_type                   calculate_payout( const auction_object& auction, const amount_type& art_in )const;

         //////////////////// db_exposure.cpp ////////////////////

         /**
          *  Adds ink to the collateral under auction of the market.
          *
          *  @throws exposure_exceeded if the market is already at or above its limit. A market
          *  below its limit accepts any amount, even one that takes it above the limit.
          */
         void reserve_exposure( asset_id_type ilk, asset_id_type base, const amount_type& ink );
         void release_exposure( asset_id_type ilk, asset_id_type base, const amount_type& ink );

         //////////////////// db_auction.cpp ////////////////////

         const auction_object& open_auction( vault_id_type vault, const vault_info& info,
                                             const amount_type& art, const amount_type& ink );
         void                  cancel_auction( const auction_object& auction );

         /**
          *  Completes a purchase whose payment has been collected: reduces the vault, hands out
          *  the collateral and closes the auction when all of its debt is repaid.
          */
         auction_payment_result settle_auction( const auction_object& auction, account_id_type buyer,
                                                account_id_type receiver, const amount_type& art_in,
                                                const amount_type& ink_out, const amount_type& paid );

      protected:
         void notify_applied_operations( size_t first );

      private:
         operation_result apply_operation( const operation& op );

         vector< unique_ptr<op_evaluator> >                      _operation_evaluators;
         vector< operation_history_object >                      _applied_ops;
         uint64_t                                                _cleared_ops = 0;

         std::shared_ptr<vault_ledger>                           _vault_ledger;
         std::map< asset_id_type, std::shared_ptr<asset_join> >  _joins;
         std::map< asset_id_type, std::shared_ptr<debt_token> >  _debt_tokens;
   };

} }
