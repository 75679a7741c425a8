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
#include <launchpad/chain/database.hpp>

#include <launchpad/chain/account_object.hpp>
#include <launchpad/chain/asset_object.hpp>
#include <launchpad/chain/creator_stats_object.hpp>
#include <launchpad/chain/global_property_object.hpp>
#include <launchpad/chain/launch_object.hpp>
#include <launchpad/chain/position_object.hpp>
#include <launchpad/chain/simulated_pool_object.hpp>
#include <launchpad/chain/vault_object.hpp>

#include <launchpad/chain/distribution_evaluator.hpp>
#include <launchpad/chain/launch_evaluator.hpp>
#include <launchpad/chain/protocol_config_evaluator.hpp>

namespace launchpad { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize(255);
   register_evaluator<protocol_initialize_evaluator>();
   register_evaluator<protocol_update_price_evaluator>();
   register_evaluator<protocol_update_config_evaluator>();
   register_evaluator<protocol_set_paused_evaluator>();
   register_evaluator<launch_create_evaluator>();
   register_evaluator<launch_buy_evaluator>();
   register_evaluator<launch_sell_evaluator>();
   register_evaluator<launch_graduate_evaluator>();
   register_evaluator<launch_force_graduate_evaluator>();
   register_evaluator<launch_enable_refund_evaluator>();
   register_evaluator<launch_claim_refund_evaluator>();
   register_evaluator<launch_push_refund_evaluator>();
   register_evaluator<launch_close_evaluator>();
   register_evaluator<launch_claim_tokens_evaluator>();
   register_evaluator<launch_claim_vesting_evaluator>();
   register_evaluator<launch_claim_creator_fees_evaluator>();
   register_evaluator<vault_poke_evaluator>();
}

void database::initialize_indexes()
{
   reset_indexes();
   _undo_db.set_max_size( LAUNCHPAD_MAX_UNDO_HISTORY );

   //Protocol object indexes
   add_index< primary_index<account_index> >();
   add_index< primary_index<asset_index> >();
   add_index< primary_index<launch_index> >();
   add_index< primary_index<position_index> >();
   add_index< primary_index<vault_index> >();

   //Implementation object indexes
   add_index< primary_index<protocol_config_index> >();
   add_index< primary_index<dynamic_global_property_index> >();
   add_index< primary_index<account_balance_index> >();
   add_index< primary_index<creator_stats_index> >();
   add_index< primary_index<simulated_pool_index> >();
}

} }
