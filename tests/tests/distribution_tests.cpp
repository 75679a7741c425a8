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

#include <launchpad/chain/distribution.hpp>

#include "../common/database_fixture.hpp"

using namespace launchpad::chain;

namespace {

   struct graduated_launch_fixture : database_fixture
   {
      graduated_launch_fixture()
      {
         alice_id = create_account( "alice" ).get_id();
         bob_id = create_account( "bob" ).get_id();
         carol_id = create_account( "carol" ).get_id();
         fund( alice_id, BASE(10) );
         fund( bob_id, BASE(100) );
         fund( carol_id, BASE(100) );

         launch = create_launch( alice_id, BASE(1) );
         bob_shares = buy( bob_id, launch, BASE(10) );
         carol_shares = buy( carol_id, launch, BASE(5) );
         token = graduate( launch );
      }

      account_id_type alice_id;
      account_id_type bob_id;
      account_id_type carol_id;
      launch_id_type  launch;
      asset_id_type   token;
      share_type      bob_shares;
      share_type      carol_shares;
   };

}

BOOST_AUTO_TEST_SUITE( distribution_tests )

BOOST_AUTO_TEST_CASE( split_yield_test )
{ try {
   yield_split split = split_yield( 1000000 );
   BOOST_CHECK_EQUAL( split.caller_reward.value, 10000 );
   BOOST_CHECK_EQUAL( split.creator_reward.value, 600000 );
   BOOST_CHECK_EQUAL( split.protocol_reward.value, 100000 );
   BOOST_CHECK_EQUAL( split.compounded.value, 290000 );

   split = split_yield( 0 );
   BOOST_CHECK_EQUAL( split.compounded.value, 0 );

   // rounding dust is compounded
   split = split_yield( 99 );
   BOOST_CHECK_EQUAL( split.caller_reward.value, 0 );
   BOOST_CHECK_EQUAL( split.creator_reward.value, 59 );
   BOOST_CHECK_EQUAL( split.protocol_reward.value, 9 );
   BOOST_CHECK_EQUAL( split.compounded.value, 31 );

   LAUNCHPAD_REQUIRE_THROW( split_yield( -1 ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( token_entitlement_test )
{ try {
   BOOST_CHECK_EQUAL( token_entitlement( 50, 100 ).value, LAUNCHPAD_TOKENS_FOR_HOLDERS / 2 );
   BOOST_CHECK_EQUAL( token_entitlement( 100, 100 ).value, LAUNCHPAD_TOKENS_FOR_HOLDERS );
   BOOST_CHECK_EQUAL( token_entitlement( 0, 100 ).value, 0 );
   BOOST_CHECK_EQUAL( token_entitlement( 1, 3, 100 ).value, 33 );
   LAUNCHPAD_REQUIRE_THROW( token_entitlement( 1, 0 ), invalid_calculation_exception );
   LAUNCHPAD_REQUIRE_THROW( token_entitlement( 101, 100 ), invalid_calculation_exception );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( claim_tokens_test, graduated_launch_fixture )
{ try {
   BOOST_CHECK_EQUAL( get_launch( launch ).shares_at_graduation.value, 201371298 );

   const asset bob_tokens = claim_tokens( bob_id, launch );
   BOOST_CHECK( bob_tokens.asset_id == token );
   BOOST_CHECK_EQUAL( bob_tokens.amount.value, 463324961037893295ll );
   BOOST_CHECK_EQUAL( get_balance( bob_id, token ).value, 463324961037893295ll );
   BOOST_CHECK( db.find_position( launch, bob_id ) == nullptr );
   LAUNCHPAD_REQUIRE_THROW( claim_tokens( bob_id, launch ), no_position_exception );

   // the storage deposit comes back with the tokens
   BOOST_CHECK_EQUAL( get_balance( carol_id ).value, BASE(95).value - LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT );
   BOOST_CHECK_EQUAL( claim_tokens( carol_id, launch ).amount.value, 136675040948487107ll );
   BOOST_CHECK_EQUAL( get_balance( carol_id ).value, BASE(95).value );

   BOOST_CHECK_EQUAL( get_launch( launch ).token_custody.value,
                      LAUNCHPAD_TOKENS_FOR_HOLDERS - 463324961037893295ll - 136675040948487107ll );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( every_holder_claims, graduated_launch_fixture )
{ try {
   claim_tokens( bob_id, launch );
   claim_tokens( carol_id, launch );
   advance_time( LAUNCHPAD_VESTING_DURATION_SECONDS );
   claim_vesting( alice_id, launch );
   BOOST_CHECK_EQUAL( claim_tokens( alice_id, launch ).amount.value, 199999998013619597ll );

   // the flooring dust stays in custody
   BOOST_CHECK_EQUAL( get_launch( launch ).token_custody.value, 1 );
   BOOST_CHECK( db.get_launch_positions( launch ).empty() );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( sold_out_position_has_nothing_to_claim )
{
   database_fixture f;
   try {
      const account_id_type alice = f.create_account( "alice" ).get_id();
      const account_id_type bob = f.create_account( "bob" ).get_id();
      f.fund( alice, BASE(10) );
      f.fund( bob, BASE(100) );

      const launch_id_type launch = f.create_launch( alice, BASE(1) );
      f.sell( bob, launch, f.buy( bob, launch, BASE(10) ) );
      f.graduate( launch );
      LAUNCHPAD_REQUIRE_THROW( f.claim_tokens( bob, launch ), no_shares_to_claim_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_FIXTURE_TEST_CASE( claim_creator_fees_test, graduated_launch_fixture )
{ try {
   // 30 bps of 10 and 5 base
   BOOST_CHECK_EQUAL( get_launch( launch ).creator_accrued_fees.value, 45000000 );
   LAUNCHPAD_REQUIRE_THROW( claim_creator_fees( bob_id, launch ), not_creator_exception );

   const share_type before = get_balance( alice_id );
   BOOST_CHECK_EQUAL( claim_creator_fees( alice_id, launch ).value, 45000000 );
   BOOST_CHECK_EQUAL( ( get_balance( alice_id ) - before ).value, 45000000 );
   BOOST_CHECK_EQUAL( get_launch( launch ).creator_accrued_fees.value, 0 );
   BOOST_CHECK_EQUAL( get_launch( launch ).base_custody.value, 0 );
   BOOST_CHECK_EQUAL( db.find_creator_stats( alice_id )->total_fees_earned.value, 45000000 );

   LAUNCHPAD_REQUIRE_THROW( claim_creator_fees( alice_id, launch ), no_fees_to_claim_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( creator_fees_wait_for_graduation )
{
   database_fixture f;
   try {
      const account_id_type alice = f.create_account( "alice" ).get_id();
      const account_id_type bob = f.create_account( "bob" ).get_id();
      f.fund( alice, BASE(10) );
      f.fund( bob, BASE(100) );

      const launch_id_type launch = f.create_launch( alice, BASE(1) );
      f.buy( bob, launch, BASE(10) );
      LAUNCHPAD_REQUIRE_THROW( f.claim_creator_fees( alice, launch ), not_graduated_exception );
      LAUNCHPAD_REQUIRE_THROW( f.poke( bob, launch ), not_graduated_exception );
   } FC_LOG_AND_RETHROW()
}

BOOST_FIXTURE_TEST_CASE( poke_test, graduated_launch_fixture )
{ try {
   ACTORS( (dave) );
   const string pool = *get_launch( launch ).pool;
   const vault_object& vault = *db.find_vault( launch );
   const share_type lp_before = vault.lp_balance;
   BOOST_CHECK_EQUAL( lp_before.value, 56284989117881ll );
   const share_type supply_before = db.get_core_asset().current_supply;
   const share_type alice_before = get_balance( alice_id );

   pool_gateway->accrue_yield( pool, 1000000 );
   advance_time( 3600 );
   BOOST_CHECK_EQUAL( poke( dave_id, launch ).value, 1000000 );

   BOOST_CHECK_EQUAL( get_balance( dave_id ).value, 10000 );
   BOOST_CHECK_EQUAL( ( get_balance( alice_id ) - alice_before ).value, 600000 );
   BOOST_CHECK_EQUAL( get_balance( vault_treasury_id ).value, 100000 );
   BOOST_CHECK_EQUAL( ( db.get_core_asset().current_supply - supply_before ).value, 710000 );

   BOOST_CHECK_EQUAL( vault.total_yield.value, 1000000 );
   BOOST_CHECK_EQUAL( vault.total_compounded.value, 290000 );
   BOOST_CHECK_EQUAL( vault.total_caller_rewards.value, 10000 );
   BOOST_CHECK_EQUAL( vault.total_creator_rewards.value, 600000 );
   BOOST_CHECK_EQUAL( vault.total_protocol_rewards.value, 100000 );
   BOOST_CHECK_EQUAL( vault.poke_count, 1u );
   BOOST_CHECK( vault.last_poke_at == db.head_time() );
   // 56284989117881 * 290000 / 15840000000 pool shares minted for the compounded part
   BOOST_CHECK_EQUAL( ( vault.lp_balance - lp_before ).value, 1030470129 );
   BOOST_CHECK_EQUAL( pool_gateway->get_pool( pool ).base_reserve.amount.value, 15840000000ll + 290000 );

   // nothing accrued since
   BOOST_CHECK_EQUAL( poke( dave_id, launch ).value, 0 );
   BOOST_CHECK_EQUAL( vault.poke_count, 2u );
   BOOST_CHECK_EQUAL( get_balance( dave_id ).value, 10000 );
} FC_LOG_AND_RETHROW() }

BOOST_FIXTURE_TEST_CASE( failed_poke_keeps_the_yield, graduated_launch_fixture )
{ try {
   ACTORS( (dave) );
   const string pool = *get_launch( launch ).pool;
   const vault_object& vault = *db.find_vault( launch );
   const share_type lp_before = vault.lp_balance;
   pool_gateway->accrue_yield( pool, 1000000 );

   vault_poke_operation poke_op;
   poke_op.caller = dave_id;
   poke_op.launch = launch;
   launch_claim_creator_fees_operation claim;
   claim.creator = bob_id;
   claim.launch = launch;
   transaction trx;
   trx.operations.push_back( poke_op );
   trx.operations.push_back( claim );
   LAUNCHPAD_REQUIRE_THROW( db.push_transaction( trx ), not_creator_exception );

   const simulated_pool_object& state = pool_gateway->get_pool( pool );
   BOOST_CHECK_EQUAL( state.pending_yield.value, 1000000 );
   BOOST_CHECK_EQUAL( state.base_reserve.amount.value, 15840000000ll );
   BOOST_CHECK_EQUAL( state.lp_supply.value, lp_before.value );
   BOOST_CHECK_EQUAL( vault.poke_count, 0u );
   BOOST_CHECK_EQUAL( get_balance( dave_id ).value, 0 );

   BOOST_CHECK_EQUAL( poke( dave_id, launch ).value, 1000000 );
   BOOST_CHECK_EQUAL( ( vault.lp_balance - lp_before ).value, 1030470129 );
   BOOST_CHECK_EQUAL( state.base_reserve.amount.value, 15840000000ll + 290000 );
   BOOST_CHECK_EQUAL( state.pending_yield.value, 0 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
