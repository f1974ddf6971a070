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

#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "auction engine exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_process_exception,  chain_exception, 3030000, "operation processing exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( utility_exception,            chain_exception, 3060000, "utility method exception" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( genesis_exception,            chain_exception, 3080000, "invalid genesis state" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( auction_exception,            chain_exception, 3110000, "auction exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( missing_required_role,        operation_process_exception, 3030001, "missing required role" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( missing_collaborator,         operation_process_exception, 3030002, "no collaborator registered" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( arithmetic_overflow,          utility_exception, 3060001, "arithmetic overflow" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( time_moved_backwards,         chain_exception, 3090001, "time can only move forward" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( not_undercollateralized,      auction_exception, 3110001, "vault is not undercollateralized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( vault_already_auctioned,      auction_exception, 3110002, "vault is already under auction" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( vault_not_auctioned,          auction_exception, 3110003, "vault is not under auction" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( exposure_exceeded,            auction_exception, 3110004, "collateral under auction exceeds the limit" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( still_undercollateralized,    auction_exception, 3110005, "vault is still undercollateralized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_enough_bought,            auction_exception, 3110006, "collateral bought is below the minimum" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( leaves_dust,                  auction_exception, 3110007, "remaining debt would be dust" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( auction_line_not_set,         auction_exception, 3110008, "no auction line for the market" )

} } // witch::chain
