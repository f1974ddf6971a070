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

#include <witch/chain/config.hpp>
#include <witch/chain/types.hpp>

#include <string>
#include <vector>

namespace witch { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_role_type {
      account_id_type account;
      uint16_t roles = 0;
   };
   struct initial_line_type {
      asset_id_type ilk;
      asset_id_type base;
      uint32_t duration = 0;
      fraction_type proportion = WITCH_ONE;
      fraction_type initial_offer = WITCH_ONE;
   };
   struct initial_limit_type {
      asset_id_type ilk;
      asset_id_type base;
      amount_type max;
   };

   time_point_sec                   initial_timestamp;
   account_id_type                  engine_account = WITCH_DEFAULT_ENGINE_ACCOUNT;
   vector<initial_role_type>        initial_roles;
   vector<initial_line_type>        initial_lines;
   vector<initial_limit_type>       initial_limits;

   /**
    * Checks every entry with the rules of the matching operation and rejects duplicates.
    */
   void validate()const;
};

} } // namespace witch::chain

FC_REFLECT(witch::chain::genesis_state_type::initial_role_type, (account)(roles))

FC_REFLECT(witch::chain::genesis_state_type::initial_line_type,
           (ilk)(base)(duration)(proportion)(initial_offer))

FC_REFLECT(witch::chain::genesis_state_type::initial_limit_type, (ilk)(base)(max))

FC_REFLECT(witch::chain::genesis_state_type,
           (initial_timestamp)(engine_account)(initial_roles)(initial_lines)(initial_limits))
