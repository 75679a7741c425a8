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

#include <launchpad/chain/global_property_object.hpp>
#include <launchpad/chain/account_object.hpp>
#include <launchpad/chain/asset_object.hpp>
#include <launchpad/chain/launch_object.hpp>
#include <launchpad/chain/position_object.hpp>
#include <launchpad/chain/creator_stats_object.hpp>
#include <launchpad/chain/vault_object.hpp>
#include <launchpad/chain/simulated_pool_object.hpp>
#include <launchpad/chain/external.hpp>
#include <launchpad/chain/genesis_state.hpp>
#include <launchpad/chain/evaluator.hpp>

#include <launchpad/protocol/transaction.hpp>

#include <launchpad/db/object_database.hpp>
#include <launchpad/db/object.hpp>
#include <fc/signals.hpp>

#include <fc/log/logger.hpp>

#include <map>

namespace launchpad { namespace chain {
   using launchpad::db::abstract_object;
   using launchpad::db::object;
   class op_evaluator;
   class transaction_evaluation_state;

   /**
    *   @class database
    *   @brief tracks the state of every launch in an extensible manner
    *
    *   The host ledger pushes transactions and advances the clock. Each transaction is applied inside an
    *   undo session, a failing operation rolls back all of its transaction.
    */
   class database : public db::object_database
   {
         //////////////////// db_management.cpp ////////////////////
      public:
         database();
         ~database() override;

         //////////////////// db_genesis.cpp ////////////////////

         /**
          * @brief Creates the indexes, the base asset and everything listed in the genesis state
          *
          * Must be called exactly once, before any transaction is pushed.
          */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         //////////////////// db_block.cpp ////////////////////

         /**
          * Applies a transaction atomically and, once it is committed, publishes its notifications on
          * launch_event_emitted. A transaction pushed from inside another one, by a collaborator callback,
          * is merged into the outer transaction and its notifications wait for the outer commit.
          */
         processed_transaction push_transaction( const transaction& trx );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         /// Moves the clock forward, it never goes back
         void set_head_time( time_point_sec new_time );

         /**
          *  Emitted for every notification of a committed transaction, in order.
          */
         fc::signal<void(const launch_event&)>                       launch_event_emitted;

         /**
          *  Emitted after every balance change, with the account and the signed delta. Subscribers run
          *  inside the operation that moved the funds.
          */
         fc::signal<void(account_id_type, const asset&)>             balance_adjusted;

         //////////////////// db_getter.cpp ////////////////////

         const asset_object&                    get_core_asset()const;
         const dynamic_global_property_object&  get_dynamic_global_properties()const;
         const protocol_config_object&          get_protocol_config()const;
         const protocol_config_object*          find_protocol_config()const;
         time_point_sec                         head_time()const;

         const account_object&                  get_account( const string& name )const;
         const position_object*                 find_position( launch_id_type launch, account_id_type owner )const;
         const position_object&                 get_position( launch_id_type launch, account_id_type owner )const;
         const creator_stats_object*            find_creator_stats( account_id_type creator )const;
         const vault_object*                    find_vault( launch_id_type launch )const;

         /// All live positions of a launch
         vector<const position_object*>         get_launch_positions( launch_id_type launch )const;

         //////////////////// db_balance.cpp ////////////////////

         /**
          * @brief Retrieve a particular account's balance in a given asset
          * @param owner Account whose balance should be retrieved
          * @param asset_id ID of the asset to get balance in
          * @return owner's balance in asset
          */
         asset get_balance(account_id_type owner, asset_id_type asset_id)const;
         /// This is an overloaded method.
         asset get_balance(const account_object& owner, const asset_object& asset_obj)const;

         /**
          * @brief Adjust a particular account's balance in a given asset by a delta
          * @param account ID of account whose balance should be adjusted
          * @param delta Asset ID and amount to adjust balance by
          *
          * A negative delta larger than the balance throws insufficient_funds_exception.
          */
         void adjust_balance(account_id_type account, asset delta);

         //////////////////// db_price.cpp ////////////////////

         /// Installs an external price feed, replacing the cached configuration price
         void set_price_feed( shared_ptr<price_feed> feed ) { _price_feed = std::move( feed ); }
         const shared_ptr<price_feed>& get_price_feed()const { return _price_feed; }

         /**
          * @brief The current USD price of one whole base unit
          *
          * Fails closed: a zero price throws price_unavailable_exception, a price older than the staleness
          * window throws price_stale_exception.
          */
         uint64_t get_current_price()const;

         /// Same checks as get_current_price() without throwing, an unusable price yields nothing
         optional<uint64_t> try_get_current_price()const;

         /// base = usd * 10^9 / price
         static share_type usd_to_base( uint64_t usd, uint64_t price_usd );
         /// usd = base * price / 10^9
         static uint64_t   market_cap_usd( share_type base_amount, uint64_t price_usd );

         //////////////////// db_pool.cpp ////////////////////

         void set_liquidity_pool_gateway( shared_ptr<liquidity_pool_gateway> gateway );
         liquidity_pool_gateway& get_liquidity_pool_gateway()const;

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();
         /// Reset the object graph in-memory
         void initialize_indexes();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            const auto op_type = operation::tag<typename EvaluatorType::operation_type>::value;
            FC_ASSERT( op_type >= 0, "Negative operation type" );
            FC_ASSERT( op_type < _operation_evaluators.size(),
                       "The operation type (${a}) must be smaller than the size of _operation_evaluators (${b})",
                       ("a", op_type)("b", _operation_evaluators.size()) );
            _operation_evaluators[op_type] = std::make_unique<op_evaluator_impl<EvaluatorType>>();
         }

      private:
         processed_transaction _apply_transaction( const transaction& trx );
         optional<uint64_t>    check_price( bool throw_if_unusable )const;
         void                  notify_launch_events( const vector<launch_event>& events );

         vector< unique_ptr<op_evaluator> >  _operation_evaluators;

         shared_ptr<price_feed>              _price_feed;
         shared_ptr<liquidity_pool_gateway>  _pool_gateway;

         /// Notifications of nested transactions, published with the outermost one
         vector<launch_event>                _deferred_events;

         const asset_object*                    _p_core_asset_obj = nullptr;
         const dynamic_global_property_object*  _p_dyn_global_prop_obj = nullptr;
   };

} }
