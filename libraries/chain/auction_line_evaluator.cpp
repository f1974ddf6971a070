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

#include <witch/chain/auction_line_evaluator.hpp>
#include <witch/chain/auction_line_object.hpp>
#include <witch/chain/auction_role_object.hpp>

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

namespace witch { namespace chain {

void_result auction_line_update_evaluator::do_evaluate( const auction_line_update_operation& op )
{ try {
   require_role( op.governor, line_admin );
   _line = db().find_auction_line( op.ilk, op.base );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_line_update_evaluator::do_apply( const auction_line_update_operation& op )
{ try {
   database& d = db();
   auto update = [&op]( auction_line_object& l ) {
      l.ilk = op.ilk;
      l.base = op.base;
      l.duration = op.duration;
      l.proportion = op.proportion;
      l.initial_offer = op.initial_offer;
   };

   if( _line == nullptr )
      d.create<auction_line_object>( update );
   else
      d.modify( *_line, update );

   dlog( "Auction line ${i}/${b} set by ${g}: duration ${d}, proportion ${p}, initial offer ${o}",
         ("i",op.ilk)("b",op.base)("g",op.governor)
         ("d",op.duration)("p",op.proportion)("o",op.initial_offer) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_limit_update_evaluator::do_evaluate( const auction_limit_update_operation& op )
{ try {
   require_role( op.governor, limit_admin );
   _limit = db().find_auction_limit( op.ilk, op.base );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_limit_update_evaluator::do_apply( const auction_limit_update_operation& op )
{ try {
   database& d = db();

   if( _limit == nullptr )
   {
      d.create<auction_limit_object>( [&op]( auction_limit_object& l ) {
         l.ilk = op.ilk;
         l.base = op.base;
         l.max = op.max;
      });
   }
   else
   {
      if( _limit->sum > op.max )
         wlog( "Exposure of ${i}/${b} is ${s}, above the new limit of ${m}",
               ("i",op.ilk)("b",op.base)("s",_limit->sum)("m",op.max) );
      d.modify( *_limit, [&op]( auction_limit_object& l ) {
         l.max = op.max;
      });
   }

   dlog( "Exposure limit of ${i}/${b} set to ${m} by ${g}", ("i",op.ilk)("b",op.base)("m",op.max)("g",op.governor) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_role_update_evaluator::do_evaluate( const auction_role_update_operation& op )
{ try {
   require_role( op.governor, role_admin );

   const auto& idx = db().get_index_type<auction_role_index>().indices().get<by_account>();
   auto itr = idx.find( op.account );
   if( itr != idx.end() )
      _role = &*itr;

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result auction_role_update_evaluator::do_apply( const auction_role_update_operation& op )
{ try {
   database& d = db();

   if( op.roles == 0 )
   {
      if( _role != nullptr )
         d.remove( *_role );
   }
   else if( _role == nullptr )
   {
      d.create<auction_role_object>( [&op]( auction_role_object& r ) {
         r.account = op.account;
         r.roles = op.roles;
      });
   }
   else
   {
      d.modify( *_role, [&op]( auction_role_object& r ) {
         r.roles = op.roles;
      });
   }

   ilog( "Roles of ${a} set to ${r} by ${g}", ("a",op.account)("r",op.roles)("g",op.governor) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // witch::chain
