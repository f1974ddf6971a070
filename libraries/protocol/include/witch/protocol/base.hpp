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

#include <witch/protocol/types.hpp>
#include <witch/protocol/exceptions.hpp>

namespace witch { namespace protocol {

   /**
    * @defgroup operations Operations
    * @ingroup transactions Transactions
    * @brief A set of valid commands for mutating the auction state
    *
    * An operation can be thought of like a function that will modify the state. Every
    * operation carries its own parameters and a stateless validate() method. Checks that
    * need the current state belong to the evaluator of the operation.
    *
    * Operations are either pushed by callers or generated by the engine itself. Generated
    * ("virtual") operations only record what happened and are rejected when pushed.
    */

   /**
    *  @brief result of an operation that needs nothing but success
    */
   struct void_result{};

   /**
    *  @brief what a settlement paid out and what it collected
    */
   struct auction_payment_result
   {
      amount_type ink_out;   ///< Collateral released to the receiver
      amount_type paid;      ///< Debt asset or debt token collected from the buyer
   };

   typedef fc::static_variant<void_result,object_id_type,auction_payment_result> operation_result;

   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const {}
   };

} } // witch::protocol

FC_REFLECT_TYPENAME( witch::protocol::operation_result )
FC_REFLECT( witch::protocol::void_result, )
FC_REFLECT( witch::protocol::auction_payment_result, (ink_out)(paid) )
