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

#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace launchpad::chain;

BOOST_FIXTURE_TEST_SUITE( protocol_config_tests, database_fixture )

BOOST_AUTO_TEST_CASE( initialize_once )
{ try {
   const protocol_config_object& config = db.get_protocol_config();
   BOOST_CHECK( config.authority == authority_id );
   BOOST_CHECK( config.operator_account == operator_id );
   BOOST_CHECK( config.protocol_fee_account == treasury_id );
   BOOST_CHECK( config.vault_protocol_account == vault_treasury_id );
   BOOST_CHECK( !config.paused );

   protocol_initialize_operation op;
   op.authority = authority_id;
   op.operator_account = operator_id;
   op.protocol_fee_account = treasury_id;
   op.vault_protocol_account = vault_treasury_id;
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), already_initialized_exception );

   REQUIRE_OP_VALIDATION_FAILURE_2( op, min_seed_amount, -1, invalid_amount_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( uninitialized_protocol )
{ try {
   database local;
   genesis_state_type genesis;
   genesis.initial_timestamp = fc::time_point_sec( LAUNCHPAD_TESTING_GENESIS_TIMESTAMP );
   genesis.initial_accounts.emplace_back( "root", BASE(100) );
   local.init_genesis( genesis );
   const account_id_type root = local.get_account( "root" ).get_id();

   BOOST_CHECK( local.find_protocol_config() == nullptr );
   LAUNCHPAD_REQUIRE_THROW( local.get_protocol_config(), not_initialized_exception );

   auto push = [&local]( const operation& op ) {
      transaction trx;
      trx.operations.push_back( op );
      return local.push_transaction( trx );
   };

   protocol_update_price_operation price;
   price.updater = root;
   price.price_usd = default_price_usd;
   LAUNCHPAD_REQUIRE_THROW( push( price ), not_initialized_exception );
   LAUNCHPAD_REQUIRE_THROW( push( make_create( root, BASE(1) ) ), not_initialized_exception );

   event_recorder recorder( local );
   protocol_initialize_operation init;
   init.authority = root;
   init.operator_account = root;
   init.protocol_fee_account = root;
   init.vault_protocol_account = root;
   push( init );

   BOOST_REQUIRE_EQUAL( recorder.count<config_initialized_event>(), 1u );
   BOOST_CHECK( recorder.last<config_initialized_event>().authority == root );
   BOOST_CHECK_EQUAL( local.get_protocol_config().price_usd, 0u );

   // no price was ever published
   BOOST_CHECK( !local.try_get_current_price().valid() );
   LAUNCHPAD_REQUIRE_THROW( push( make_create( root, BASE(1) ) ), price_unavailable_exception );

   push( price );
   BOOST_CHECK_EQUAL( local.get_current_price(), default_price_usd );
   push( make_create( root, BASE(1) ) );
   BOOST_CHECK_EQUAL( local.get_protocol_config().total_launches, 1u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_price_test )
{ try {
   ACTORS( (bob) );
   event_recorder recorder( db );
   advance_time( 60 );

   protocol_update_price_operation op;
   op.updater = bob_id;
   op.price_usd = 200;
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), unauthorized_exception );
   REQUIRE_OP_VALIDATION_FAILURE_2( op, price_usd, 0, invalid_price_exception );

   op.updater = operator_id;
   push_op( op );
   BOOST_CHECK_EQUAL( db.get_protocol_config().price_usd, 200u );
   BOOST_CHECK( db.get_protocol_config().price_updated_at == db.head_time() );
   BOOST_REQUIRE_EQUAL( recorder.count<price_updated_event>(), 1u );
   BOOST_CHECK_EQUAL( recorder.last<price_updated_event>().old_price, 150u );
   BOOST_CHECK_EQUAL( recorder.last<price_updated_event>().new_price, 200u );

   // the authority may publish as well
   op.updater = authority_id;
   op.price_usd = 175;
   push_op( op );
   BOOST_CHECK_EQUAL( db.get_current_price(), 175u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( price_staleness )
{ try {
   advance_time( LAUNCHPAD_MAX_PRICE_STALENESS_SECONDS );
   BOOST_CHECK_EQUAL( db.get_current_price(), default_price_usd );

   advance_time( 1 );
   BOOST_CHECK( !db.try_get_current_price().valid() );
   LAUNCHPAD_REQUIRE_THROW( db.get_current_price(), price_stale_exception );

   set_price( default_price_usd );
   BOOST_CHECK_EQUAL( db.get_current_price(), default_price_usd );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( update_config_test )
{ try {
   ACTORS( (bob)(carol) );
   event_recorder recorder( db );

   protocol_update_config_operation op;
   op.authority = authority_id;
   LAUNCHPAD_REQUIRE_THROW( op.validate(), validation_exception );

   op.new_operator = bob_id;
   REQUIRE_OP_VALIDATION_FAILURE_2( op, new_min_seed_amount, share_type(-1), invalid_amount_exception );

   op.authority = operator_id;
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), unauthorized_exception );

   op.authority = authority_id;
   op.new_operator = account_id_type( 9999 );
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), fc::exception );

   op.new_operator = bob_id;
   op.new_protocol_fee_account = carol_id;
   push_op( op );
   const protocol_config_object& config = db.get_protocol_config();
   BOOST_CHECK( config.operator_account == bob_id );
   BOOST_CHECK( config.protocol_fee_account == carol_id );
   BOOST_CHECK( config.authority == authority_id );
   BOOST_REQUIRE_EQUAL( recorder.count<config_updated_event>(), 1u );
   BOOST_CHECK( recorder.last<config_updated_event>().operator_account == bob_id );

   // the former operator lost the price
   LAUNCHPAD_REQUIRE_THROW( set_price( 160 ), unauthorized_exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( rotate_authority )
{ try {
   ACTORS( (bob) );

   protocol_update_config_operation op;
   op.authority = authority_id;
   op.new_authority = bob_id;
   push_op( op );
   BOOST_CHECK( db.get_protocol_config().authority == bob_id );

   protocol_set_paused_operation pause;
   pause.authority = authority_id;
   pause.paused = true;
   LAUNCHPAD_REQUIRE_THROW( push_op( pause ), unauthorized_exception );
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), unauthorized_exception );

   pause.authority = bob_id;
   push_op( pause );
   BOOST_CHECK( db.get_protocol_config().paused );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( set_paused_test )
{ try {
   event_recorder recorder( db );

   protocol_set_paused_operation op;
   op.authority = operator_id;
   op.paused = true;
   LAUNCHPAD_REQUIRE_THROW( push_op( op ), unauthorized_exception );
   BOOST_CHECK( !db.get_protocol_config().paused );

   set_paused( true );
   BOOST_CHECK( db.get_protocol_config().paused );
   BOOST_REQUIRE_EQUAL( recorder.count<pause_toggled_event>(), 1u );
   BOOST_CHECK( recorder.last<pause_toggled_event>().paused );

   set_paused( false );
   BOOST_CHECK( !db.get_protocol_config().paused );
   BOOST_CHECK( !recorder.last<pause_toggled_event>().paused );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
