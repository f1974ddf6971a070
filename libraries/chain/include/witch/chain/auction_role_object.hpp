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
#include <witch/protocol/auction_role.hpp>
#include <witch/db/generic_index.hpp>
#include <witch/db/object.hpp>

namespace witch { namespace chain {

   /**
    * @brief Roles held by an account, see auction_role_flags
    * @ingroup object
    * @ingroup implementation
    */
   class auction_role_object : public witch::db::abstract_object<auction_role_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_auction_role_object_type;

         account_id_type   account;
         uint16_t          roles = 0;

         bool has_role( auction_role_flags role )const { return ( roles & role ) != 0; }
   };

   struct by_account;
   typedef multi_index_container<
      auction_role_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_account>, member< auction_role_object, account_id_type, &auction_role_object::account > >
      >
   > auction_role_multi_index_type;

   typedef generic_index<auction_role_object, auction_role_multi_index_type> auction_role_index;

} } // witch::chain

MAP_OBJECT_ID_TO_TYPE( witch::chain::auction_role_object )

FC_REFLECT_DERIVED( witch::chain::auction_role_object, (witch::db::object), (account)(roles) )
