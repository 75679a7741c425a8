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

#include <launchpad/chain/vesting.hpp>

#include "../common/database_fixture.hpp"

#include <limits>

using namespace launchpad::chain;

BOOST_FIXTURE_TEST_SUITE( vesting_tests, database_fixture )

BOOST_AUTO_TEST_CASE( linear_schedule )
{ try {
   const uint32_t duration = LAUNCHPAD_VESTING_DURATION_SECONDS;
   BOOST_CHECK_EQUAL( vested_amount( 1000, 0 ).value, 0 );
   BOOST_CHECK_EQUAL( vested_amount( 1000, 1 ).value, 0 );
   BOOST_CHECK_EQUAL( vested_amount( 1000, duration / 2 ).value, 500 );
   BOOST_CHECK_EQUAL( vested_amount( 1000, duration - 1 ).value, 999 );
   BOOST_CHECK_EQUAL( vested_amount( 1000, duration ).value, 1000 );
   BOOST_CHECK_EQUAL( vested_amount( 1000, duration * 2 ).value, 1000 );
   BOOST_CHECK_EQUAL( vested_amount( 0, duration ).value, 0 );
   BOOST_CHECK_EQUAL( vested_amount( 90, 30, 60 ).value, 45 );

   // large seeds do not overflow
   const int64_t big = std::numeric_limits<int64_t>::max();
   BOOST_CHECK_EQUAL( vested_amount( big, duration ).value, big );

   LAUNCHPAD_REQUIRE_THROW( vested_amount( 1000, 10, 0 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( compute_vesting_test )
{ try {
   const time_point_sec start( 1000000 );
   vesting_state state = compute_vesting( 1000, 0, start, start + 30, 60 );
   BOOST_CHECK_EQUAL( state.total_vested.value, 500 );
   BOOST_CHECK_EQUAL( state.claimable.value, 500 );
   BOOST_CHECK_EQUAL( state.remaining.value, 1000 );

   state = compute_vesting( 1000, 500, start, start + 45, 60 );
   BOOST_CHECK_EQUAL( state.total_vested.value, 750 );
   BOOST_CHECK_EQUAL( state.claimable.value, 250 );
   BOOST_CHECK_EQUAL( state.remaining.value, 500 );

   state = compute_vesting( 1000, 1000, start, start + 600, 60 );
   BOOST_CHECK_EQUAL( state.claimable.value, 0 );
   BOOST_CHECK_EQUAL( state.remaining.value, 0 );

   LAUNCHPAD_REQUIRE_THROW( compute_vesting( 1000, 1001, start, start + 60, 60 ), invalid_calculation_exception );
   LAUNCHPAD_REQUIRE_THROW( compute_vesting( 1000, 0, start, start - 1, 60 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( claim_vesting_after_graduation )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   buy( bob_id, launch, BASE(10) );

   LAUNCHPAD_REQUIRE_THROW( claim_vesting( alice_id, launch ), not_graduated_exception );
   graduate( launch );

   LAUNCHPAD_REQUIRE_THROW( claim_vesting( bob_id, launch ), unauthorized_exception );
   LAUNCHPAD_REQUIRE_THROW( claim_vesting( alice_id, launch ), no_shares_to_claim_exception );

   advance_time( LAUNCHPAD_VESTING_DURATION_SECONDS / 2 );
   BOOST_CHECK_EQUAL( claim_vesting( alice_id, launch ).value, 25171412 );
   const position_object& seed = get_position( launch, alice_id );
   BOOST_CHECK_EQUAL( seed.shares.value, 25171412 );
   BOOST_CHECK_EQUAL( seed.locked_shares.value, 25171412 );
   BOOST_CHECK_EQUAL( seed.vested_claimed.value, 25171412 );
   BOOST_CHECK_EQUAL( get_launch( launch ).claimed_seed_shares.value, 25171412 );
   BOOST_CHECK_EQUAL( get_launch( launch ).unclaimed_seed_shares().value, 25171412 );
   LAUNCHPAD_REQUIRE_THROW( claim_vesting( alice_id, launch ), no_shares_to_claim_exception );

   // tokens wait for the whole seed
   LAUNCHPAD_REQUIRE_THROW( claim_tokens( alice_id, launch ), vesting_not_complete_exception );

   advance_time( LAUNCHPAD_VESTING_DURATION_SECONDS );
   BOOST_CHECK_EQUAL( claim_vesting( alice_id, launch ).value, 25171412 );
   BOOST_CHECK_EQUAL( get_position( launch, alice_id ).locked_shares.value, 0 );
   BOOST_CHECK_EQUAL( get_position( launch, alice_id ).shares.value, 50342824 );
   LAUNCHPAD_REQUIRE_THROW( claim_vesting( alice_id, launch ), no_shares_to_claim_exception );

   const asset tokens = claim_tokens( alice_id, launch );
   BOOST_CHECK_EQUAL( tokens.amount.value, 241209072910024935ll );
   BOOST_CHECK( db.find_position( launch, alice_id ) == nullptr );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( vesting_clock_starts_at_graduation )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   buy( bob_id, launch, BASE(10) );

   // time spent before graduation does not count
   advance_time( LAUNCHPAD_VESTING_DURATION_SECONDS );
   graduate( launch );
   BOOST_CHECK( *get_launch( launch ).vesting_start == db.head_time() );
   LAUNCHPAD_REQUIRE_THROW( claim_vesting( alice_id, launch ), no_shares_to_claim_exception );

   advance_time( 1 );
   // 50342824 / 3628800 rounds down to 13
   BOOST_CHECK_EQUAL( claim_vesting( alice_id, launch ).value, 13 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
