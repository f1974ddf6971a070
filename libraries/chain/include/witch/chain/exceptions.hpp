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

#include <stdexcept>

#include <fc/exception/exception.hpp>
#include <witch/protocol/exceptions.hpp>
#include <witch/chain/types.hpp>

/**
 * Checked amounts throw std::overflow_error or std::range_error when a result does not fit,
 * turn them into arithmetic_overflow so callers only see fc exceptions.
 */
#define WITCH_RECODE_OVERFLOW                                                      \
   catch( const std::overflow_error& e )                                           \
   {                                                                               \
      FC_THROW_EXCEPTION( witch::chain::arithmetic_overflow, "${what}", ("what", e.what()) ); \
   }                                                                               \
   catch( const std::range_error& e )                                              \
   {                                                                               \
      FC_THROW_EXCEPTION( witch::chain::arithmetic_overflow, "${what}", ("what", e.what()) ); \
   }

/** FC_CAPTURE_AND_RETHROW for code that does checked amount arithmetic */
#define WITCH_CAPTURE_AND_RETHROW( ... )                                          \
   WITCH_RECODE_OVERFLOW                                                           \
   FC_CAPTURE_AND_RETHROW( __VA_ARGS__ )

namespace witch { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( operation_process_exception,   witch::chain::chain_exception, 3030000 )
   FC_DECLARE_DERIVED_EXCEPTION( utility_exception,             witch::chain::chain_exception, 3060000 )
   FC_DECLARE_DERIVED_EXCEPTION( genesis_exception,             witch::chain::chain_exception, 3080000 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_exception,             witch::chain::chain_exception, 3110000 )

   FC_DECLARE_DERIVED_EXCEPTION( missing_required_role,         witch::chain::operation_process_exception, 3030001 )
   FC_DECLARE_DERIVED_EXCEPTION( missing_collaborator,          witch::chain::operation_process_exception, 3030002 )

   FC_DECLARE_DERIVED_EXCEPTION( arithmetic_overflow,           witch::chain::utility_exception, 3060001 )

   FC_DECLARE_DERIVED_EXCEPTION( time_moved_backwards,          witch::chain::chain_exception, 3090001 )

   FC_DECLARE_DERIVED_EXCEPTION( not_undercollateralized,       witch::chain::auction_exception, 3110001 )
   FC_DECLARE_DERIVED_EXCEPTION( vault_already_auctioned,       witch::chain::auction_exception, 3110002 )
   FC_DECLARE_DERIVED_EXCEPTION( vault_not_auctioned,           witch::chain::auction_exception, 3110003 )
   FC_DECLARE_DERIVED_EXCEPTION( exposure_exceeded,             witch::chain::auction_exception, 3110004 )
   FC_DECLARE_DERIVED_EXCEPTION( still_undercollateralized,     witch::chain::auction_exception, 3110005 )
   FC_DECLARE_DERIVED_EXCEPTION( not_enough_bought,             witch::chain::auction_exception, 3110006 )
   FC_DECLARE_DERIVED_EXCEPTION( leaves_dust,                   witch::chain::auction_exception, 3110007 )
   FC_DECLARE_DERIVED_EXCEPTION( auction_line_not_set,          witch::chain::auction_exception, 3110008 )

} } // witch::chain
