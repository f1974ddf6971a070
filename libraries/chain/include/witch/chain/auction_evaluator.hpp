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
#include <witch/chain/evaluator.hpp>
#include <witch/chain/vault_ledger.hpp>

#include <witch/protocol/auction.hpp>

namespace witch { namespace chain {

   class auction_object;

   class auction_open_evaluator : public evaluator<auction_open_evaluator>
   {
      public:
         typedef auction_open_operation operation_type;

         void_result do_evaluate( const auction_open_operation& op );
         object_id_type do_apply( const auction_open_operation& op );

         vault_info     _vault;
         amount_type    _art;
         amount_type    _ink;
   };

   class auction_cancel_evaluator : public evaluator<auction_cancel_evaluator>
   {
      public:
         typedef auction_cancel_operation operation_type;

         void_result do_evaluate( const auction_cancel_operation& op );
         void_result do_apply( const auction_cancel_operation& op );

         const auction_object* _auction = nullptr;
   };

   class auction_pay_base_evaluator : public evaluator<auction_pay_base_evaluator>
   {
      public:
         typedef auction_pay_base_operation operation_type;

         void_result do_evaluate( const auction_pay_base_operation& op );
         auction_payment_result do_apply( const auction_pay_base_operation& op );

         const auction_object* _auction = nullptr;
         amount_type           _art_in;
         amount_type           _base_in;
         amount_type           _ink_out;
   };

   class auction_pay_debt_evaluator : public evaluator<auction_pay_debt_evaluator>
   {
      public:
         typedef auction_pay_debt_operation operation_type;

         void_result do_evaluate( const auction_pay_debt_operation& op );
         auction_payment_result do_apply( const auction_pay_debt_operation& op );

         const auction_object* _auction = nullptr;
         amount_type           _art_in;
         amount_type           _ink_out;
   };

} } // witch::chain
