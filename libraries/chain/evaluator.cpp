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

#include <witch/chain/database.hpp>
#include <witch/chain/evaluator.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

   database& generic_evaluator::db()const
   {
      FC_ASSERT( _db != nullptr, "Evaluator is not attached to a database" );
      return *_db;
   }

   operation_result generic_evaluator::start_evaluate( database& db, const operation& op, bool apply )
   { try {
      _db = &db;
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   } WITCH_CAPTURE_AND_RETHROW() }

   void generic_evaluator::require_role( account_id_type account, auction_role_flags role )const
   {
      WITCH_ASSERT( db().has_role( account, role ), missing_required_role,
                    "Account ${a} does not have the ${r} role",
                    ("a",account)("r",role) );
   }

} }
