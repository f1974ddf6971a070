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
#include <witch/protocol/operations.hpp>

namespace witch { namespace chain {

   /**
    * @brief tracks the history of all logical operations on the auction state
    *
    *  Every pushed operation and every virtual operation it implies is recorded once it has
    *  been applied successfully. Records of a failed operation are discarded together with
    *  its state changes.
    *
    *  @note this object is READ ONLY it can never be modified
    */
   class operation_history_object
   {
      public:
         operation_history_object( const operation& o ):op(o){}
         operation_history_object(){}

         operation         op;
         operation_result  result;
         /** time of the database when the operation was applied */
         time_point_sec    time;
         /** position in the history, starting at 0 */
         uint64_t          sequence = 0;
         /** true for operations generated by the engine */
         bool              is_virtual = false;
   };

} } // witch::chain

FC_REFLECT( witch::chain::operation_history_object, (op)(result)(time)(sequence)(is_virtual) )
