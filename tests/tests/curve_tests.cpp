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

#include <launchpad/protocol/curve.hpp>
#include <launchpad/protocol/exceptions.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace launchpad::protocol;

BOOST_AUTO_TEST_SUITE( curve_tests )

BOOST_AUTO_TEST_CASE( isqrt_test )
{
   BOOST_CHECK( bonding_curve::isqrt( 0 ) == 0 );
   BOOST_CHECK( bonding_curve::isqrt( 1 ) == 1 );
   BOOST_CHECK( bonding_curve::isqrt( 3 ) == 1 );
   BOOST_CHECK( bonding_curve::isqrt( 4 ) == 2 );
   BOOST_CHECK( bonding_curve::isqrt( 15 ) == 3 );
   BOOST_CHECK( bonding_curve::isqrt( 16 ) == 4 );
   BOOST_CHECK( bonding_curve::isqrt( 17 ) == 4 );
   BOOST_CHECK( bonding_curve::isqrt( fc::uint128_t( 2560000000000000ull ) ) == 50596442 );

   const fc::uint128_t max64( std::numeric_limits<uint64_t>::max() );
   BOOST_CHECK( bonding_curve::isqrt( max64 * max64 ) == max64 );
   BOOST_CHECK( bonding_curve::isqrt( max64 * max64 - 1 ) == max64 - 1 );
   BOOST_CHECK( bonding_curve::isqrt( std::numeric_limits<fc::uint128_t>::max() ) == max64 );
}

BOOST_AUTO_TEST_CASE( zero_amounts )
{
   bonding_curve curve;
   BOOST_CHECK_EQUAL( curve.quote( 0, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( curve.quote( 0, 123456789 ).value, 0 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 0, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 0, 123456789 ).value, 0 );
}

BOOST_AUTO_TEST_CASE( first_buy_values )
{
   bonding_curve curve;
   // 2 * 10^9 * 10^12 / 781250 = 2.56 * 10^15
   BOOST_CHECK_EQUAL( curve.shares_for_amount( LAUNCHPAD_BASE_PRECISION, 0 ).value, 50596442 );
   BOOST_CHECK_EQUAL( curve.quote( 50596442, 0 ).value, 999999977 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( LAUNCHPAD_BASE_PRECISION, 50596442 ).value, 20957732 );

   // tiny trades round down to nothing on the production curve
   BOOST_CHECK_EQUAL( curve.quote( 100, 0 ).value, 0 );
}

BOOST_AUTO_TEST_CASE( shares_for_amount_is_floor_inverse )
{ try {
   bonding_curve curve;
   const share_type amounts[] = { 1, 999, 1000000, 266666666, LAUNCHPAD_BASE_PRECISION, 133333333333ll };
   const share_type supplies[] = { 0, 1, 50596442, 1000000000ll, 7777777777ll };
   for( const share_type& amount : amounts )
      for( const share_type& supply : supplies )
      {
         const share_type shares = curve.shares_for_amount( amount, supply );
         BOOST_CHECK( curve.quote( shares, supply ) <= amount );
         BOOST_CHECK( curve.quote( shares + 1, supply ) >= amount );
      }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( price_rises_with_supply )
{ try {
   bonding_curve curve;
   share_type supply = 0;
   share_type previous = std::numeric_limits<int64_t>::max();
   for( int i = 0; i < 20; ++i )
   {
      const share_type shares = curve.shares_for_amount( LAUNCHPAD_BASE_PRECISION, supply );
      BOOST_CHECK( shares > 0 );
      BOOST_CHECK( shares <= previous );
      previous = shares;
      supply += shares;
   }

   BOOST_CHECK_EQUAL( curve.quote( 1000000, 0 ).value, 390625 );
   BOOST_CHECK_EQUAL( curve.quote( 1000000, 10000000 ).value, 8203125 );
   BOOST_CHECK( curve.quote( 1000000, 0 ) < curve.quote( 1000000, 10000000 ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( buy_sell_symmetry )
{ try {
   bonding_curve curve;
   const share_type cost = curve.quote( 1000000, 0 );
   BOOST_REQUIRE( cost > 0 );
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( 1000000, 1000000, cost ).value, cost.value );
} FC_LOG_AND_RETHROW() }

/// Buying early and selling after the price rose returns the basis, never the higher price
BOOST_AUTO_TEST_CASE( no_gain_extraction )
{ try {
   // 100 shares round to nothing on the production curve
   bonding_curve curve( 1000000, 1000000 );
   const share_type early_cost = curve.quote( 100, 0 );
   const share_type late_cost = curve.quote( 100, 1000 );
   BOOST_CHECK_EQUAL( early_cost.value, 5000 );
   BOOST_CHECK_EQUAL( late_cost.value, 105000 );
   BOOST_CHECK( late_cost > early_cost );

   const share_type refund = bonding_curve::proportional_refund( 100, 100, early_cost );
   BOOST_CHECK_EQUAL( refund.value, early_cost.value );
   BOOST_CHECK( refund < late_cost );
} FC_LOG_AND_RETHROW() }

/// On a steep curve every unit counts: a round trip can never return more than was paid
BOOST_AUTO_TEST_CASE( steep_curve_no_gain )
{ try {
   bonding_curve curve( 1000000, 1000000 );
   BOOST_CHECK_EQUAL( curve.quote( 100, 0 ).value, 5000 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 5000, 0 ).value, 100 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 5099, 0 ).value, 100 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 5100, 0 ).value, 100 );
   BOOST_CHECK_EQUAL( curve.shares_for_amount( 5101, 0 ).value, 101 );

   for( int64_t amount = 1; amount < 20000; amount += 97 )
   {
      for( int64_t supply : { 0, 10, 1000 } )
      {
         const share_type shares = curve.shares_for_amount( amount, supply );
         BOOST_CHECK( curve.quote( shares, supply ) <= amount );
      }
   }
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( proportional_refund_test )
{ try {
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( 50, 100, 10 * LAUNCHPAD_BASE_PRECISION ).value,
                      5 * LAUNCHPAD_BASE_PRECISION );
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( 100, 100, 12345 ).value, 12345 );
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( 1, 3, 100 ).value, 33 );
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( 0, 3, 100 ).value, 0 );

   // the product of two large values is computed wide
   const int64_t big = std::numeric_limits<int64_t>::max();
   BOOST_CHECK_EQUAL( bonding_curve::proportional_refund( big, big, big ).value, big );

   LAUNCHPAD_REQUIRE_THROW( bonding_curve::proportional_refund( 1, 0, 100 ), invalid_calculation_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( overflow_and_bad_input )
{ try {
   bonding_curve curve;
   const int64_t big = std::numeric_limits<int64_t>::max();
   LAUNCHPAD_REQUIRE_THROW( curve.quote( big, big ), math_overflow_exception );
   LAUNCHPAD_REQUIRE_THROW( curve.quote( -1, 0 ), invalid_calculation_exception );
   LAUNCHPAD_REQUIRE_THROW( curve.shares_for_amount( -1, 0 ), invalid_calculation_exception );
   LAUNCHPAD_REQUIRE_THROW( curve.shares_for_amount( 1, -1 ), invalid_calculation_exception );
   LAUNCHPAD_REQUIRE_THROW( bonding_curve( 0, 1 ), fc::exception );

   // the largest possible amount still fits
   BOOST_CHECK( curve.shares_for_amount( big, 0 ) > 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
