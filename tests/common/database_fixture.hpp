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
#pragma once

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <boost/preprocessor/seq/for_each.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/test/unit_test.hpp>

#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>

#include <iostream>

using namespace launchpad::db;

extern uint32_t LAUNCHPAD_TESTING_GENESIS_TIMESTAMP;

#define LAUNCHPAD_REQUIRE_THROW( expr, exc_type )         \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAUNCHPAD_REQUIRE_THROW begin "       \
         << req_throw_info << std::endl;                  \
   BOOST_REQUIRE_THROW( expr, exc_type );                 \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAUNCHPAD_REQUIRE_THROW end "         \
         << req_throw_info << std::endl;                  \
}

#define LAUNCHPAD_CHECK_THROW( expr, exc_type )           \
{                                                         \
   std::string req_throw_info = fc::json::to_string(      \
      fc::mutable_variant_object()                        \
      ("source_file", __FILE__)                           \
      ("source_lineno", __LINE__)                         \
      ("expr", #expr)                                     \
      ("exc_type", #exc_type)                             \
      );                                                  \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAUNCHPAD_CHECK_THROW begin "         \
         << req_throw_info << std::endl;                  \
   BOOST_CHECK_THROW( expr, exc_type );                   \
   if( fc::enable_record_assert_trip )                    \
      std::cout << "LAUNCHPAD_CHECK_THROW end "           \
         << req_throw_info << std::endl;                  \
}

#define REQUIRE_OP_VALIDATION_SUCCESS( op, field, value ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   op.validate(); \
   op.field = temp; \
}

#define REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, exc_type ) \
{ \
   const auto temp = op.field; \
   op.field = value; \
   LAUNCHPAD_REQUIRE_THROW( op.validate(), exc_type ); \
   op.field = temp; \
}
#define REQUIRE_OP_VALIDATION_FAILURE( op, field, value ) \
   REQUIRE_OP_VALIDATION_FAILURE_2( op, field, value, fc::exception )

#define ACTOR(name) \
   const auto& name = create_account(BOOST_PP_STRINGIZE(name)); \
   launchpad::chain::account_id_type name ## _id = name.get_id(); (void)name ## _id;

#define GET_ACTOR(name) \
   const account_object& name = db.get_account(BOOST_PP_STRINGIZE(name)); \
   launchpad::chain::account_id_type name ## _id = name.get_id(); \
   (void)name ##_id

#define ACTORS_IMPL(r, data, elem) ACTOR(elem)
#define ACTORS(names) BOOST_PP_SEQ_FOR_EACH(ACTORS_IMPL, ~, names)

/// Whole base units
#define BASE(x) ( launchpad::protocol::share_type( int64_t(x) * LAUNCHPAD_BASE_PRECISION ) )

namespace launchpad { namespace chain {

/// Records every notification published by the database
struct event_recorder
{
   explicit event_recorder( database& db )
   {
      connection = db.launch_event_emitted.connect( [this]( const launch_event& e ) {
         events.push_back( e );
      });
   }
   ~event_recorder() { connection.disconnect(); }

   template<typename Event>
   size_t count()const
   {
      size_t n = 0;
      for( const auto& e : events )
         if( e.which() == launch_event::tag<Event>::value )
            ++n;
      return n;
   }

   template<typename Event>
   const Event& last()const
   {
      for( auto itr = events.rbegin(); itr != events.rend(); ++itr )
         if( itr->which() == launch_event::tag<Event>::value )
            return itr->get<Event>();
      FC_THROW( "No such event recorded" );
   }

   vector<launch_event>           events;
   boost::signals2::connection    connection;
};

/**
 * A database with the protocol configured from genesis: an authority, an operator, the two treasuries, a
 * faucet that funds the test actors and a fresh price.
 */
struct database_fixture {
   genesis_state_type genesis_state;
   chain::database db;
   shared_ptr<simulated_pool_gateway> pool_gateway;

   account_id_type authority_id;
   account_id_type operator_id;
   account_id_type treasury_id;
   account_id_type vault_treasury_id;
   account_id_type faucet_id;

   static const uint64_t default_price_usd = 150;

   database_fixture();
   ~database_fixture();

   /**
    * Every unit of an asset is held somewhere: in a balance, in the custody or the storage deposit of a
    * launch or a position, or in a liquidity pool.
    */
   static void verify_asset_supplies( const database& db, const simulated_pool_gateway& gateway );
   /// The launch aggregates equal the sums over its positions
   static void verify_launch_invariants( const database& db, launch_id_type launch );
   void verify_all_launches()const;

   const account_object& create_account( const string& name );
   void fund( const account_object& account, share_type amount );
   void fund( account_id_type account, share_type amount );
   share_type get_balance( account_id_type account, asset_id_type asset_type = asset_id_type() )const;

   void advance_time( uint32_t seconds );
   /// Publishes a price as the operator, which also refreshes its timestamp
   void set_price( uint64_t price_usd );
   /// Advances past the launch duration and republishes the price
   void expire( launch_id_type launch );

   processed_transaction push_op( const operation& op );

   launch_create_operation make_create( account_id_type creator, share_type seed,
                                        const string& symbol = "TEST" )const;
   launch_id_type create_launch( account_id_type creator, share_type seed, const string& symbol = "TEST" );
   share_type buy( account_id_type buyer, launch_id_type launch, share_type amount,
                   share_type min_shares_out = 1 );
   share_type sell( account_id_type seller, launch_id_type launch, share_type shares,
                    share_type min_amount_out = 0 );
   asset_id_type graduate( launch_id_type launch );
   asset_id_type force_graduate( launch_id_type launch );
   void enable_refund( account_id_type caller, launch_id_type launch );
   share_type claim_refund( account_id_type owner, launch_id_type launch );
   share_type push_refund( account_id_type caller, launch_id_type launch, account_id_type recipient );
   void close_launch( account_id_type caller, launch_id_type launch );
   asset claim_tokens( account_id_type owner, launch_id_type launch );
   share_type claim_vesting( account_id_type creator, launch_id_type launch );
   share_type claim_creator_fees( account_id_type creator, launch_id_type launch );
   share_type poke( account_id_type caller, launch_id_type launch );
   void set_paused( bool paused );

   const launch_object& get_launch( launch_id_type launch )const { return launch(db); }
   const position_object& get_position( launch_id_type launch, account_id_type owner )const
   {
      return db.get_position( launch, owner );
   }
};

} } // launchpad::chain
