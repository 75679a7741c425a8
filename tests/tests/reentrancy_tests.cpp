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

namespace {

   /// Pushes one transaction from inside the first debit of a watched account
   struct nested_push
   {
      nested_push( database& db, account_id_type watched, operation op )
         : _db( db ), _watched( watched ), _op( std::move( op ) )
      {
         _connection = db.balance_adjusted.connect( [this]( account_id_type account, const asset& delta ) {
            if( fired || account != _watched || delta.amount >= 0 )
               return;
            fired = true;
            events_before_commit = published;
            transaction trx;
            trx.operations.push_back( _op );
            _db.push_transaction( trx );
            events_after_nested = published;
         });
         _events = db.launch_event_emitted.connect( [this]( const launch_event& ) {
            ++published;
         });
      }

      bool                                 fired = false;
      size_t                               published = 0;
      size_t                               events_before_commit = 0;
      size_t                               events_after_nested = 0;

   private:
      database&                            _db;
      account_id_type                      _watched;
      operation                            _op;
      boost::signals2::scoped_connection   _connection;
      boost::signals2::scoped_connection   _events;
   };

   launch_buy_operation make_buy( account_id_type buyer, launch_id_type launch, share_type amount )
   {
      launch_buy_operation op;
      op.buyer = buyer;
      op.launch = launch;
      op.amount = amount;
      op.min_shares_out = 1;
      return op;
   }

}

BOOST_FIXTURE_TEST_SUITE( reentrancy_tests, database_fixture )

BOOST_AUTO_TEST_CASE( nested_call_into_busy_launch )
{ try {
   ACTORS( (alice)(bob)(carol) );
   fund( alice, BASE(10) );
   fund( bob, BASE(100) );
   fund( carol, BASE(100) );
   const launch_id_type launch = create_launch( alice_id, BASE(1) );

   const share_type total_shares = get_launch( launch ).total_shares;
   const share_type total_base = get_launch( launch ).total_base_amount;
   const share_type bob_balance = get_balance( bob_id );

   {
      nested_push hook( db, bob_id, make_buy( carol_id, launch, BASE(5) ) );
      LAUNCHPAD_REQUIRE_THROW( buy( bob_id, launch, BASE(10) ), operation_in_progress_exception );
      BOOST_CHECK( hook.fired );
      BOOST_CHECK_EQUAL( hook.published, 0u );
   }

   const launch_object& l = get_launch( launch );
   BOOST_CHECK( !l.operation_in_progress );
   BOOST_CHECK_EQUAL( l.total_shares.value, total_shares.value );
   BOOST_CHECK_EQUAL( l.total_base_amount.value, total_base.value );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, bob_balance.value );
   BOOST_CHECK_EQUAL( get_balance( carol_id ).value, BASE(100).value );
   BOOST_CHECK( db.find_position( launch, bob_id ) == nullptr );
   BOOST_CHECK( db.find_position( launch, carol_id ) == nullptr );

   // the launch is usable again
   BOOST_CHECK_EQUAL( buy( bob_id, launch, BASE(10) ).value, 116625436 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( nested_call_into_other_launch )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   fund( alice, BASE(10) );
   fund( dave, BASE(10) );
   fund( bob, BASE(100) );
   fund( carol, BASE(100) );
   const launch_id_type first = create_launch( alice_id, BASE(1), "FIRST" );
   const launch_id_type second = create_launch( dave_id, BASE(1), "SECOND" );

   event_recorder recorder( db );
   nested_push hook( db, bob_id, make_buy( carol_id, second, BASE(5) ) );
   buy( bob_id, first, BASE(10) );

   BOOST_CHECK( hook.fired );
   // the nested transaction publishes with the outer one
   BOOST_CHECK_EQUAL( hook.events_before_commit, 0u );
   BOOST_CHECK_EQUAL( hook.events_after_nested, 0u );
   BOOST_CHECK_EQUAL( recorder.count<shares_purchased_event>(), 2u );

   const shares_purchased_event* first_purchase = nullptr;
   for( const auto& e : recorder.events )
      if( e.which() == launch_event::tag<shares_purchased_event>::value )
      {
         first_purchase = &e.get<shares_purchased_event>();
         break;
      }
   BOOST_REQUIRE( first_purchase != nullptr );
   BOOST_CHECK( first_purchase->buyer == carol_id );
   BOOST_CHECK( recorder.last<shares_purchased_event>().buyer == bob_id );

   BOOST_CHECK_GT( get_position( second, carol_id ).shares.value, 0 );
   BOOST_CHECK_GT( get_position( first, bob_id ).shares.value, 0 );
   BOOST_CHECK( !get_launch( first ).operation_in_progress );
   BOOST_CHECK( !get_launch( second ).operation_in_progress );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( outer_failure_discards_nested_changes )
{ try {
   ACTORS( (alice)(bob)(carol)(dave) );
   fund( alice, BASE(10) );
   fund( dave, BASE(10) );
   fund( bob, BASE(100) );
   fund( carol, BASE(100) );
   const launch_id_type first = create_launch( alice_id, BASE(1), "FIRST" );
   const launch_id_type second = create_launch( dave_id, BASE(1), "SECOND" );
   const share_type second_shares = get_launch( second ).total_shares;

   nested_push hook( db, bob_id, make_buy( carol_id, second, BASE(5) ) );

   // the buy succeeds and triggers the nested one, then the sell fails
   transaction trx;
   trx.operations.push_back( make_buy( bob_id, first, BASE(10) ) );
   launch_sell_operation sell;
   sell.seller = bob_id;
   sell.launch = first;
   sell.shares = BASE(1000000);
   trx.operations.push_back( sell );
   LAUNCHPAD_REQUIRE_THROW( db.push_transaction( trx ), insufficient_shares_exception );

   BOOST_CHECK( hook.fired );
   BOOST_CHECK_EQUAL( hook.published, 0u );
   BOOST_CHECK( db.find_position( second, carol_id ) == nullptr );
   BOOST_CHECK( db.find_position( first, bob_id ) == nullptr );
   BOOST_CHECK_EQUAL( get_launch( second ).total_shares.value, second_shares.value );
   BOOST_CHECK_EQUAL( get_balance( carol_id ).value, BASE(100).value );
   BOOST_CHECK_EQUAL( get_balance( bob_id ).value, BASE(100).value );

   // a later transaction publishes only its own notifications
   buy( carol_id, second, BASE(1) );
   BOOST_CHECK_EQUAL( hook.published, 2u );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_SUITE_END()
