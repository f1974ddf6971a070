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

#include <fc/io/json.hpp>

#include "../common/database_fixture.hpp"

using namespace witch::chain;

BOOST_FIXTURE_TEST_SUITE( governance_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_roles_lines_and_limits )
{ try {
   BOOST_CHECK( db.engine_account() == engine );
   BOOST_CHECK( db.head_block_time() == fc::time_point_sec( WITCH_TESTING_GENESIS_TIMESTAMP ) );
   BOOST_CHECK( db.has_role( governor, line_admin ) );
   BOOST_CHECK( db.has_role( governor, limit_admin ) );
   BOOST_CHECK( db.has_role( governor, role_admin ) );
   BOOST_CHECK( !db.has_role( alice, line_admin ) );

   const auto* line = db.find_auction_line( ilk, base );
   BOOST_REQUIRE( line != nullptr );
   BOOST_CHECK_EQUAL( line->duration, default_duration );
   BOOST_CHECK_EQUAL( line->proportion, default_proportion );
   BOOST_CHECK_EQUAL( line->initial_offer, default_initial_offer );
   BOOST_CHECK( db.find_auction_line( base, ilk ) == nullptr );

   BOOST_CHECK_EQUAL( get_limit().max, wad( 1000 ) );
   BOOST_CHECK_EQUAL( get_limit().sum, 0 );

   BOOST_CHECK_EQUAL( db.get_dust( base ), debt( 5000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_from_json )
{ try {
   const auto gs = fc::json::from_string( R"({
      "initial_timestamp": "2021-01-01T00:00:00",
      "engine_account": "1.1.5",
      "initial_roles": [ { "account": "1.1.20", "roles": 3 } ],
      "initial_lines": [ { "ilk": "1.2.7", "base": "1.2.8", "duration": 600,
                           "proportion": 250000000000000000, "initial_offer": 800000000000000000 } ],
      "initial_limits": [ { "ilk": "1.2.7", "base": "1.2.8", "max": "2000000000000000000000" } ]
   })" ).as<genesis_state_type>( WITCH_MAX_NESTING );

   database other;
   other.init_genesis( gs );

   BOOST_CHECK( other.engine_account() == account_id_type(5) );
   BOOST_CHECK( other.head_block_time() == fc::time_point_sec::from_iso_string( "2021-01-01T00:00:00" ) );
   BOOST_CHECK( other.has_role( account_id_type(20), limit_admin ) );
   BOOST_CHECK( !other.has_role( account_id_type(20), role_admin ) );

   const auto* line = other.find_auction_line( asset_id_type(7), asset_id_type(8) );
   BOOST_REQUIRE( line != nullptr );
   BOOST_CHECK_EQUAL( line->duration, 600u );
   BOOST_CHECK_EQUAL( line->proportion, WITCH_ONE / 4 );

   const auto* limit = other.find_auction_limit( asset_id_type(7), asset_id_type(8) );
   BOOST_REQUIRE( limit != nullptr );
   BOOST_CHECK_EQUAL( limit->max, wad( 2000 ) );

   WITCH_REQUIRE_THROW( other.init_genesis( gs ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( invalid_genesis_is_rejected )
{ try {
   {
      genesis_state_type gs = genesis_state;
      gs.engine_account = WITCH_NULL_ACCOUNT;
      WITCH_REQUIRE_THROW( gs.validate(), genesis_exception );
   }
   {
      genesis_state_type gs = genesis_state;
      gs.initial_lines.push_back( gs.initial_lines.front() );
      WITCH_REQUIRE_THROW( gs.validate(), genesis_exception );
   }
   {
      genesis_state_type gs = genesis_state;
      gs.initial_limits.push_back( gs.initial_limits.front() );
      WITCH_REQUIRE_THROW( gs.validate(), genesis_exception );
   }
   {
      genesis_state_type gs = genesis_state;
      gs.initial_roles.push_back( gs.initial_roles.front() );
      WITCH_REQUIRE_THROW( gs.validate(), genesis_exception );
   }
   {
      genesis_state_type gs = genesis_state;
      gs.initial_lines.front().initial_offer = 0;
      WITCH_REQUIRE_THROW( gs.validate(), invalid_parameter );

      database other;
      WITCH_REQUIRE_THROW( other.init_genesis( gs ), invalid_parameter );
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( line_update_requires_line_admin )
{ try {
   WITCH_REQUIRE_THROW( set_line( 60, WITCH_ONE, WITCH_ONE, alice ), missing_required_role );

   set_roles( alice, limit_admin | role_admin );
   WITCH_REQUIRE_THROW( set_line( 60, WITCH_ONE, WITCH_ONE, alice ), missing_required_role );

   set_roles( alice, line_admin );
   set_line( 60, WITCH_ONE, WITCH_ONE / 2, alice );

   const auto* line = db.find_auction_line( ilk, base );
   BOOST_REQUIRE( line != nullptr );
   BOOST_CHECK_EQUAL( line->duration, 60u );
   BOOST_CHECK_EQUAL( line->proportion, WITCH_ONE );
   BOOST_CHECK_EQUAL( line->initial_offer, WITCH_ONE / 2 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( line_update_creates_new_markets )
{ try {
   auction_line_update_operation op;
   op.governor = governor;
   op.ilk = asset_id_type(3);
   op.base = base;
   op.duration = 120;
   op.proportion = WITCH_ONE;
   op.initial_offer = WITCH_ONE;
   db.push_operation( op );

   BOOST_REQUIRE( db.find_auction_line( asset_id_type(3), base ) != nullptr );
   BOOST_CHECK_EQUAL( db.find_auction_line( ilk, base )->duration, default_duration );

   op.initial_offer = 0;
   WITCH_REQUIRE_THROW( db.push_operation( op ), invalid_parameter );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( limit_update_requires_limit_admin )
{ try {
   WITCH_REQUIRE_THROW( set_limit( 1, alice ), missing_required_role );
   set_roles( alice, line_admin );
   WITCH_REQUIRE_THROW( set_limit( 1, alice ), missing_required_role );
   set_roles( alice, limit_admin );
   set_limit( 1, alice );
   BOOST_CHECK_EQUAL( get_limit().max, 1 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( role_updates )
{ try {
   WITCH_REQUIRE_THROW( set_roles( bob, line_admin, alice ), missing_required_role );

   set_roles( alice, role_admin );
   set_roles( bob, line_admin | limit_admin, alice );
   BOOST_CHECK( db.has_role( bob, line_admin ) );
   BOOST_CHECK( db.has_role( bob, limit_admin ) );
   BOOST_CHECK( !db.has_role( bob, role_admin ) );

   BOOST_TEST_MESSAGE( "Replacing the role set" );
   set_roles( bob, limit_admin, alice );
   BOOST_CHECK( !db.has_role( bob, line_admin ) );
   BOOST_CHECK( db.has_role( bob, limit_admin ) );

   BOOST_TEST_MESSAGE( "Revoking every role" );
   set_roles( bob, 0, alice );
   BOOST_CHECK( !db.has_role( bob, limit_admin ) );
   const auto& idx = db.get_index_type<auction_role_index>().indices().get<by_account>();
   BOOST_CHECK( idx.find( bob ) == idx.end() );

   // revoking an account without roles is accepted
   set_roles( bob, 0, alice );

   WITCH_REQUIRE_THROW( set_roles( bob, 0x10, alice ), invalid_parameter );

   BOOST_TEST_MESSAGE( "An admin may revoke its own role" );
   set_roles( alice, 0, alice );
   WITCH_REQUIRE_THROW( set_roles( bob, line_admin, alice ), missing_required_role );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
