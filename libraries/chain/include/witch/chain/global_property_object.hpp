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
#include <witch/db/generic_index.hpp>
#include <witch/db/object.hpp>

namespace witch { namespace chain {

   /**
    * @class global_property_object
    * @brief Maintains global state information
    * @ingroup object
    * @ingroup implementation
    *
    * There is exactly one instance, created from the genesis state.
    */
   class global_property_object : public witch::db::abstract_object<global_property_object>
   {
      public:
         static const uint8_t space_id = implementation_ids;
         static const uint8_t type_id  = impl_global_property_object_type;

         /** Holds the collateral of every vault under auction */
         account_id_type   engine_account;
         /** Current time, only moves forward */
         time_point_sec    time;
   };

   typedef witch::db::sparse_index<global_property_object> global_property_index;

} } // witch::chain

MAP_OBJECT_ID_TO_TYPE( witch::chain::global_property_object )

FC_REFLECT_DERIVED( witch::chain::global_property_object, (witch::db::object),
                    (engine_account)
                    (time)
                  )
