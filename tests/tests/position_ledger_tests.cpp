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

#include <launchpad/chain/position_ledger.hpp>

#include "../common/database_fixture.hpp"

using namespace launchpad::chain;

BOOST_FIXTURE_TEST_SUITE( position_ledger_tests, database_fixture )

BOOST_AUTO_TEST_CASE( create_opens_locked_seed_position )
{ try {
   ACTORS( (alice) );
   fund( alice, BASE(10) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   const launch_object& l = get_launch( launch );
   const position_object& p = get_position( launch, alice_id );

   BOOST_CHECK_EQUAL( p.shares.value, 0 );
   BOOST_CHECK_EQUAL( p.basis.value, 0 );
   BOOST_CHECK_EQUAL( p.locked_shares.value, 50342824 );
   BOOST_CHECK_EQUAL( p.locked_basis.value, 990000000 );
   BOOST_CHECK_EQUAL( p.storage_deposit.value, LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT );
   BOOST_CHECK( p.first_buy_at == db.head_time() );

   BOOST_CHECK_EQUAL( l.total_shares.value, 50342824 );
   BOOST_CHECK_EQUAL( l.seed_shares.value, 50342824 );
   BOOST_CHECK_EQUAL( l.seed_basis.value, 990000000 );
   BOOST_CHECK_EQUAL( l.storage_deposit.value, LAUNCHPAD_DEFAULT_LAUNCH_STORAGE_DEPOSIT );
   BOOST_CHECK( l.is_active() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( buys_accumulate_in_one_position )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );
   fund( carol, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );

   const share_type bob_shares = buy( bob_id, launch, BASE(10) );
   BOOST_CHECK_EQUAL( bob_shares.value, 116625436 );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).basis.value, 9900000000ll );
   // the first buy pays the storage deposit
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value,
                      ( BASE(90) - LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT ).value );

   const share_type more = buy( bob_id, launch, BASE(5) );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).shares.value, ( bob_shares + more ).value );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).basis.value, 9900000000ll + 4950000000ll );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value,
                      ( BASE(85) - LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT ).value );

   buy( carol_id, launch, BASE(3) );
   BOOST_CHECK_EQUAL( db.get_launch_positions( launch ).size(), 3u );
   verify_launch_invariants( db, launch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( sell_refunds_basis_proportionally )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );
   fund( carol, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   const share_type shares = buy( bob_id, launch, BASE(10) );
   // a later buyer raises the curve price, bob still gets only his basis back
   buy( carol_id, launch, BASE(50) );

   const share_type before = get_balance( bob_id );
   const share_type refund = sell( bob_id, launch, shares / 2 );
   BOOST_CHECK_EQUAL( refund.value, 4950000000ll );
   BOOST_CHECK_EQUAL( ( get_balance( bob_id ) - before ).value, 4950000000ll );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).shares.value, ( shares - shares / 2 ).value );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).basis.value, 4950000000ll );

   // selling out leaves an empty position in place
   sell( bob_id, launch, get_position( launch, bob_id ).shares );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).shares.value, 0 );
   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).basis.value, 0 );
   verify_launch_invariants( db, launch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( sell_checks )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   const share_type shares = buy( bob_id, launch, BASE(10) );

   LAUNCHPAD_REQUIRE_THROW( sell( bob_id, launch, shares + 1 ), insufficient_shares_exception );
   LAUNCHPAD_REQUIRE_THROW( sell( carol_id, launch, 1 ), no_position_exception );
   // seed shares stay locked until they vest
   LAUNCHPAD_REQUIRE_THROW( sell( alice_id, launch, 1 ), insufficient_shares_exception );
   LAUNCHPAD_REQUIRE_THROW( sell( bob_id, launch, shares, BASE(10) ), slippage_exceeded_exception );

   BOOST_CHECK_EQUAL( get_position( launch, bob_id ).shares.value, shares.value );
   verify_launch_invariants( db, launch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( ledger_rejects_inconsistent_changes )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   buy( bob_id, launch, BASE(10) );
   const launch_object& l = get_launch( launch );
   const position_object& p = get_position( launch, bob_id );

   position_ledger ledger( db );
   LAUNCHPAD_REQUIRE_THROW( ledger.debit( l, p, p.shares + 1, 0 ), math_overflow_exception );
   LAUNCHPAD_REQUIRE_THROW( ledger.debit( l, p, 0, p.basis + 1 ), math_overflow_exception );
   LAUNCHPAD_REQUIRE_THROW( ledger.debit( l, p, -1, 0 ), math_overflow_exception );
   LAUNCHPAD_REQUIRE_THROW( ledger.unlock_vested( l, p, 1 ), fc::exception );
   LAUNCHPAD_REQUIRE_THROW( ledger.lock_seed( l, p, 1, 1 ), fc::exception );
   LAUNCHPAD_REQUIRE_THROW( ledger.open( l, bob_id, 0 ), fc::exception );

   const position_object& seed = get_position( launch, alice_id );
   LAUNCHPAD_REQUIRE_THROW( ledger.unlock_vested( l, seed, seed.locked_shares + 1 ), math_overflow_exception );

   verify_launch_invariants( db, launch );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( min_shares_out_guards_buys )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   LAUNCHPAD_REQUIRE_THROW( buy( bob_id, launch, BASE(10), 116625437 ), slippage_exceeded_exception );
   BOOST_CHECK( db.find_position( launch, bob_id ) == nullptr );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, BASE(100).value );

   BOOST_CHECK_EQUAL( buy( bob_id, launch, BASE(10), 116625436 ).value, 116625436 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( buy_needs_funds_for_deposit )
{ try {
   ACTORS( (alice)(bob) );
   fund( alice, BASE(10) );
   fund( bob, BASE(1) );

   const launch_id_type launch = create_launch( alice_id, BASE(1) );
   LAUNCHPAD_REQUIRE_THROW( buy( bob_id, launch, BASE(1) ), insufficient_funds_exception );

   buy( bob_id, launch, BASE(1) - LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
