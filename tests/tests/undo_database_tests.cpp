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

#include <boost/test/unit_test.hpp>

#include <witch/chain/database.hpp>
#include <witch/chain/exceptions.hpp>

#include <vector>

#include "../common/database_fixture.hpp"

using namespace witch::chain;

BOOST_FIXTURE_TEST_SUITE( undo_database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( undo_create )
{ try {
   const auto next_id = db.get_index_type<auction_role_index>().get_next_id();
   {
      auto session = db._undo_db.start_undo_session();
      db.create<auction_role_object>( [this]( auction_role_object& r ) {
         r.account = alice;
         r.roles = line_admin;
      });
      BOOST_CHECK( db.has_role( alice, line_admin ) );
   }
   BOOST_CHECK( !db.has_role( alice, line_admin ) );
   BOOST_CHECK( db.get_index_type<auction_role_index>().get_next_id() == next_id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( undo_modify_and_remove )
{ try {
   const auto& idx = db.get_index_type<auction_role_index>().indices().get<by_account>();
   const auto role_id = idx.find( governor )->id;
   {
      auto session = db._undo_db.start_undo_session();
      db.modify( *idx.find( governor ), []( auction_role_object& r ) {
         r.roles = line_admin;
      });
      BOOST_CHECK( !db.has_role( governor, role_admin ) );
      db.remove( *idx.find( governor ) );
      BOOST_CHECK( !db.has_role( governor, line_admin ) );
   }
   BOOST_REQUIRE( idx.find( governor ) != idx.end() );
   BOOST_CHECK( idx.find( governor )->id == role_id );
   BOOST_CHECK_EQUAL( idx.find( governor )->roles, AUCTION_ROLE_MASK );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( commit_keeps_changes )
{ try {
   {
      auto session = db._undo_db.start_undo_session();
      db.advance_time( db.head_block_time() + 100 );
      session.commit();
   }
   BOOST_CHECK( db.head_block_time() == fc::time_point_sec( WITCH_TESTING_GENESIS_TIMESTAMP + 100 ) );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( merged_session_is_undone_with_its_parent )
{ try {
   {
      auto outer = db._undo_db.start_undo_session();
      db.reserve_exposure( ilk, base, wad( 1 ) );
      {
         auto inner = db._undo_db.start_undo_session();
         db.reserve_exposure( ilk, base, wad( 2 ) );
         inner.merge();
      }
      BOOST_CHECK_EQUAL( get_limit().sum, wad( 3 ) );
      {
         auto inner = db._undo_db.start_undo_session();
         db.reserve_exposure( ilk, base, wad( 4 ) );
      }
      BOOST_CHECK_EQUAL( get_limit().sum, wad( 3 ) );
   }
   BOOST_CHECK_EQUAL( get_limit().sum, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( external_changes_are_reverted_with_the_session )
{ try {
   std::vector<int> reverted;
   {
      auto outer = db._undo_db.start_undo_session();
      db.on_undo( [&reverted]() { reverted.push_back( 1 ); } );
      {
         auto inner = db._undo_db.start_undo_session();
         db.on_undo( [&reverted]() { reverted.push_back( 2 ); } );
         inner.commit();
      }
      BOOST_CHECK( reverted.empty() );
      {
         auto inner = db._undo_db.start_undo_session();
         db.on_undo( [&reverted]() { reverted.push_back( 3 ); } );
      }
      BOOST_REQUIRE_EQUAL( reverted.size(), 1u );
      BOOST_CHECK_EQUAL( reverted[0], 3 );
   }
   BOOST_REQUIRE_EQUAL( reverted.size(), 3u );
   BOOST_CHECK_EQUAL( reverted[1], 2 );
   BOOST_CHECK_EQUAL( reverted[2], 1 );

   reverted.clear();
   {
      auto session = db._undo_db.start_undo_session();
      db.on_undo( [&reverted]() { reverted.push_back( 4 ); } );
      session.commit();
   }
   // nothing is recorded outside a session
   db.on_undo( [&reverted]() { reverted.push_back( 5 ); } );
   BOOST_CHECK( reverted.empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( failed_operation_is_undone )
{ try {
   create_vault( vault_id_type(1), wad( 100 ), debt( 100000 ) );
   ilk_join->fail_release = true;
   open( vault_id_type(1) );
   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );

   const auto& auction = db.get_auction( vault_id_type(1) );
   const auto auction_id = auction.id;
   wallet.credit( alice, base, debt( 50000 ) );
   WITCH_REQUIRE_THROW( pay_debt( alice, vault_id_type(1), debt( 50000 ) ), fc::exception );

   BOOST_CHECK_EQUAL( db._undo_db.size(), 0u );
   BOOST_REQUIRE( db.find_auction( vault_id_type(1) ) != nullptr );
   BOOST_CHECK( db.find_auction( vault_id_type(1) )->id == auction_id );
   BOOST_CHECK_EQUAL( get_limit().sum, wad( 50 ) );
   BOOST_CHECK_EQUAL( ledger->vault( vault_id_type(1) ).balances.art, debt( 100000 ) );
   BOOST_CHECK_EQUAL( wallet.balance( alice, base ), debt( 50000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
