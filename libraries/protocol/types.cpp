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

#include <witch/protocol/types.hpp>
#include <witch/protocol/exceptions.hpp>

namespace fc {

   void to_variant( const witch::protocol::amount_type& var, fc::variant& vo, uint32_t max_depth )
   {
      vo = var.str();
   }

   void from_variant( const fc::variant& var, witch::protocol::amount_type& vo, uint32_t max_depth )
   { try {
      if( var.is_uint64() || var.is_int64() )
      {
         FC_ASSERT( !var.is_int64() || var.as_int64() >= 0, "Amount can not be negative" );
         vo = var.as_uint64();
         return;
      }
      const auto s = var.as_string();
      FC_ASSERT( !s.empty() && s.find_first_not_of("0123456789") == std::string::npos,
                 "Amount must be a decimal number" );
      vo = witch::protocol::amount_type( s );
   } FC_CAPTURE_AND_RETHROW( (var) ) }

} // fc
