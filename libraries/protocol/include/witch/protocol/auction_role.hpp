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

   enum auction_role_flags
   {
      line_admin  = 0x01, ///< may update auction lines
      limit_admin = 0x02, ///< may update exposure limits
      role_admin  = 0x04  ///< may grant and revoke roles
   };
   const static uint16_t AUCTION_ROLE_MASK = line_admin | limit_admin | role_admin;

   /**
    * @brief Replace the roles held by an account
    * @ingroup operations
    *
    * An empty role set revokes every role of the account.
    *
    * Requires the role_admin role.
    */
   struct auction_role_update_operation : public base_operation
   {
      account_id_type governor;
      account_id_type account;
      uint16_t        roles = 0;   ///< auction_role_flags

      void validate()const override;
   };

} } // witch::protocol

FC_REFLECT_ENUM( witch::protocol::auction_role_flags, (line_admin)(limit_admin)(role_admin) )
FC_REFLECT( witch::protocol::auction_role_update_operation, (governor)(account)(roles) )
