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

#include <witch/chain/auction_pricing.hpp>
#include <witch/chain/exceptions.hpp>
#include <witch/protocol/auction_line.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace witch::chain;

namespace {
   const fraction_type start_offer = 714 * ( WITCH_ONE / 1000 );
}

BOOST_AUTO_TEST_SUITE( auction_pricing_tests )

BOOST_AUTO_TEST_CASE( price_fraction_grows_linearly )
{
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 0, 3600 ), start_offer );
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 300, 3600 ), 737833333333333333ull );
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 1800, 3600 ), 857000000000000000ull );
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 3599, 3600 ), 999920555555555555ull );
}

BOOST_AUTO_TEST_CASE( price_fraction_caps_at_one )
{
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 3600, 3600 ), WITCH_ONE );
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 1000000, 3600 ), WITCH_ONE );
   // a zero duration offers everything immediately
   BOOST_CHECK_EQUAL( auction_price_fraction( start_offer, 0, 0 ), WITCH_ONE );
   BOOST_CHECK_EQUAL( auction_price_fraction( WITCH_ONE, 10, 3600 ), WITCH_ONE );
}

BOOST_AUTO_TEST_CASE( payout_of_the_whole_auction )
{
   const amount_type ink = database_fixture::wad( 50 );
   const amount_type art = database_fixture::debt( 50000 );

   BOOST_CHECK_EQUAL( auction_payout( ink, art, art, start_offer ), amount_type( "35700000000000000000" ) );
   BOOST_CHECK_EQUAL( auction_payout( ink, art, art, 737833333333333333ull ), amount_type( "36891666666666666650" ) );
   BOOST_CHECK_EQUAL( auction_payout( ink, art, art, WITCH_ONE ), ink );
}

BOOST_AUTO_TEST_CASE( payout_is_proportional_to_the_debt_repaid )
{
   const amount_type ink = database_fixture::wad( 50 );
   const amount_type art = database_fixture::debt( 50000 );

   BOOST_CHECK_EQUAL( auction_payout( ink, art, art / 2, start_offer ), amount_type( "17850000000000000000" ) );
   BOOST_CHECK_EQUAL( auction_payout( ink, art, 0, start_offer ), 0 );
   // truncates
   BOOST_CHECK_EQUAL( auction_payout( 10, 3, 1, WITCH_ONE ), 3 );
}

BOOST_AUTO_TEST_CASE( payout_rejects_bad_input )
{ try {
   WITCH_REQUIRE_THROW( auction_payout( 100, 10, 11, WITCH_ONE ), fc::exception );
   WITCH_REQUIRE_THROW( auction_payout( 100, 0, 1, WITCH_ONE ), fc::exception );

   const amount_type huge = std::numeric_limits<amount_type>::max();
   WITCH_REQUIRE_THROW( auction_payout( huge, huge, huge, WITCH_ONE ), arithmetic_overflow );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( line_update_validation )
{ try {
   auction_line_update_operation op;
   op.duration = 3600;
   op.proportion = WITCH_ONE / 2;
   op.initial_offer = start_offer;
   op.validate();

   REQUIRE_OP_VALIDATION_SUCCESS( op, initial_offer, WITCH_1_PERCENT );
   REQUIRE_OP_VALIDATION_SUCCESS( op, initial_offer, WITCH_ONE );
   REQUIRE_OP_VALIDATION_SUCCESS( op, proportion, WITCH_ONE );
   REQUIRE_OP_VALIDATION_SUCCESS( op, duration, 0 );

   REQUIRE_OP_VALIDATION_FAILURE_2( op, initial_offer, 0, invalid_parameter );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, initial_offer, WITCH_1_PERCENT - 1, invalid_parameter );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, initial_offer, WITCH_ONE + 1, invalid_parameter );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, proportion, WITCH_1_PERCENT - 1, invalid_parameter );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, proportion, WITCH_ONE + 1, invalid_parameter );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( role_update_validation )
{ try {
   auction_role_update_operation op;
   op.roles = line_admin | limit_admin;
   op.validate();

   REQUIRE_OP_VALIDATION_SUCCESS( op, roles, 0 );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, roles, 0x08, invalid_parameter );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
