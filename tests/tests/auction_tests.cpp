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

#include "../common/database_fixture.hpp"

using namespace witch::chain;

BOOST_FIXTURE_TEST_SUITE( auction_tests, database_fixture )

BOOST_AUTO_TEST_CASE( open_auctions_a_proportion_of_the_vault )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );

   const auction_object& auction = open( vault );

   BOOST_CHECK( auction.vault == vault );
   BOOST_CHECK( auction.owner == owner );
   BOOST_CHECK( auction.start == db.head_block_time() );
   BOOST_CHECK( auction.ilk == ilk );
   BOOST_CHECK( auction.base == base );
   BOOST_CHECK_EQUAL( auction.art, debt( 50000 ) );
   BOOST_CHECK_EQUAL( auction.ink, wad( 50 ) );

   BOOST_CHECK( ledger->vault( vault ).info.owner == engine );
   BOOST_CHECK_EQUAL( get_limit().sum, wad( 50 ) );

   const auto& history = db.get_applied_operations();
   BOOST_REQUIRE_EQUAL( history.size(), 1u );
   BOOST_CHECK( history[0].op.is_type<auction_open_operation>() );
   BOOST_CHECK( !history[0].is_virtual );
   BOOST_CHECK( history[0].result.get<object_id_type>() == auction.id );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_takes_the_whole_vault_when_the_rest_would_be_dust )
{ try {
   const vault_id_type vault(1);
   // half of 8000 leaves 4000, below the minimum debt of 5000
   create_vault( vault, wad( 10 ), debt( 8000 ) );

   const auction_object& auction = open( vault );
   BOOST_CHECK_EQUAL( auction.art, debt( 8000 ) );
   BOOST_CHECK_EQUAL( auction.ink, wad( 10 ) );
   BOOST_CHECK_EQUAL( get_limit().sum, wad( 10 ) );

   // exactly the minimum debt left is fine
   const vault_id_type vault2(2);
   create_vault( vault2, wad( 20 ), debt( 10000 ) );
   const auction_object& auction2 = open( vault2 );
   BOOST_CHECK_EQUAL( auction2.art, debt( 5000 ) );
   BOOST_CHECK_EQUAL( auction2.ink, wad( 10 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_with_full_proportion )
{ try {
   set_line( default_duration, WITCH_ONE, default_initial_offer );

   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );
   const auction_object& auction = open( vault );
   BOOST_CHECK_EQUAL( auction.art, debt( 100000 ) );
   BOOST_CHECK_EQUAL( auction.ink, wad( 100 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_requires_an_undercollateralized_vault )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ), false );

   WITCH_REQUIRE_THROW( open( vault ), not_undercollateralized );
   BOOST_CHECK( db.find_auction( vault ) == nullptr );
   BOOST_CHECK( ledger->vault( vault ).info.owner == owner );
   BOOST_CHECK_EQUAL( get_limit().sum, 0 );
   BOOST_CHECK( db.get_applied_operations().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_twice_fails )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );
   open( vault );

   WITCH_REQUIRE_THROW( open( vault ), vault_already_auctioned );
   BOOST_CHECK_EQUAL( get_limit().sum, wad( 50 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_requires_an_auction_line )
{ try {
   const vault_id_type vault(1);
   ledger->add_vault( vault, owner, asset_id_type(3), base, wad( 100 ), debt( 100000 ) );
   ledger->set_undercollateralized( vault, true );

   WITCH_REQUIRE_THROW( open( vault ), auction_line_not_set );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( open_unknown_vault_fails )
{ try {
   WITCH_REQUIRE_THROW( open( vault_id_type(42) ), fc::exception );
   BOOST_CHECK( db.get_applied_operations().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_returns_a_healthy_vault )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );
   open( vault );

   BOOST_TEST_MESSAGE( "Cancelling an unsafe vault fails" );
   WITCH_REQUIRE_THROW( cancel( vault ), still_undercollateralized );
   BOOST_CHECK( db.find_auction( vault ) != nullptr );

   ledger->set_undercollateralized( vault, false );
   cancel( vault, bob );

   BOOST_CHECK( db.find_auction( vault ) == nullptr );
   BOOST_CHECK( ledger->vault( vault ).info.owner == owner );
   BOOST_CHECK_EQUAL( get_limit().sum, 0 );
   BOOST_CHECK_EQUAL( ledger->vault( vault ).balances.ink, wad( 100 ) );
   BOOST_CHECK_EQUAL( ledger->vault( vault ).balances.art, debt( 100000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( cancel_without_auction_fails )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ), false );
   WITCH_REQUIRE_THROW( cancel( vault ), vault_not_auctioned );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( health_check_overflow_is_reported )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );
   create_vault( vault_id_type(2), wad( 100 ), debt( 100000 ) );
   open( vault );

   ledger->overflow_in_health_check = true;
   WITCH_REQUIRE_THROW( cancel( vault ), arithmetic_overflow );
   WITCH_REQUIRE_THROW( open( vault_id_type(2) ), arithmetic_overflow );
   BOOST_CHECK( db.find_auction( vault ) != nullptr );
   BOOST_CHECK( db.find_auction( vault_id_type(2) ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( vault_can_be_auctioned_again_after_cancel )
{ try {
   const vault_id_type vault(1);
   create_vault( vault, wad( 100 ), debt( 100000 ) );
   const auto first_id = open( vault ).id;

   ledger->set_undercollateralized( vault, false );
   cancel( vault );

   generate_seconds( 60 );
   ledger->set_undercollateralized( vault, true );
   const auction_object& auction = open( vault );
   BOOST_CHECK( auction.id != first_id );
   BOOST_CHECK( auction.start == db.head_block_time() );
   BOOST_CHECK_EQUAL( get_limit().sum, wad( 50 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( missing_collaborators_are_reported )
{ try {
   database fresh;
   fresh.init_genesis( genesis_state );

   auction_open_operation op;
   op.account = alice;
   op.vault = vault_id_type(1);
   WITCH_REQUIRE_THROW( fresh.push_operation( op ), missing_collaborator );
   WITCH_REQUIRE_THROW( fresh.get_join( ilk ), missing_collaborator );
   WITCH_REQUIRE_THROW( fresh.get_debt_token( base ), missing_collaborator );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( virtual_operations_can_not_be_pushed )
{ try {
   auction_bought_operation op( vault_id_type(1), alice, wad( 1 ), debt( 1 ) );
   WITCH_REQUIRE_THROW( db.push_operation( op ), unknown_operation );
   BOOST_CHECK( db.get_applied_operations().empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( time_only_moves_forward )
{ try {
   const auto now = db.head_block_time();
   generate_seconds( 10 );
   BOOST_CHECK( db.head_block_time() == now + 10 );
   WITCH_REQUIRE_THROW( db.advance_time( now ), time_moved_backwards );
   db.advance_time( now + 10 );
   BOOST_CHECK( db.head_block_time() == now + 10 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
