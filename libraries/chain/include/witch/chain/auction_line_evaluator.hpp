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

#include <witch/protocol/auction_line.hpp>
#include <witch/protocol/auction_role.hpp>

namespace witch { namespace chain {

   class auction_line_object;
   class auction_limit_object;
   class auction_role_object;

   class auction_line_update_evaluator : public evaluator<auction_line_update_evaluator>
   {
      public:
         typedef auction_line_update_operation operation_type;

         void_result do_evaluate( const auction_line_update_operation& op );
         void_result do_apply( const auction_line_update_operation& op );

         const auction_line_object* _line = nullptr;
   };

   class auction_limit_update_evaluator : public evaluator<auction_limit_update_evaluator>
   {
      public:
         typedef auction_limit_update_operation operation_type;

         void_result do_evaluate( const auction_limit_update_operation& op );
         void_result do_apply( const auction_limit_update_operation& op );

         const auction_limit_object* _limit = nullptr;
   };

   class auction_role_update_evaluator : public evaluator<auction_role_update_evaluator>
   {
      public:
         typedef auction_role_update_operation operation_type;

         void_result do_evaluate( const auction_role_update_operation& op );
         void_result do_apply( const auction_role_update_operation& op );

         const auction_role_object* _role = nullptr;
   };

} } // witch::chain
