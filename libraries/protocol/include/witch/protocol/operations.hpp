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
#include <witch/protocol/auction.hpp>
#include <witch/protocol/auction_line.hpp>
#include <witch/protocol/auction_role.hpp>

namespace witch { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    */
   typedef fc::static_variant<
            /*  0 */ auction_open_operation,
            /*  1 */ auction_cancel_operation,
            /*  2 */ auction_pay_base_operation,
            /*  3 */ auction_pay_debt_operation,
            /*  4 */ auction_bought_operation,         // VIRTUAL
            /*  5 */ auction_line_update_operation,
            /*  6 */ auction_limit_update_operation,
            /*  7 */ auction_role_update_operation
         > operation;

   /// @} // operations group

   void operation_validate( const operation& op );

   /** @return true for operations that only the engine itself generates */
   bool is_virtual_operation( const operation& op );

} } // witch::protocol

FC_REFLECT_TYPENAME( witch::protocol::operation )
