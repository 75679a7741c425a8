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

namespace launchpad { namespace chain {

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( _p_core_asset_obj == nullptr, "Genesis state has already been applied" );
   FC_ASSERT( genesis_state.launch_storage_deposit >= 0 && genesis_state.position_storage_deposit >= 0,
              "Storage deposits must not be negative" );

   _undo_db.disable();

   _p_core_asset_obj = &create<asset_object>( []( asset_object& a ) {
      a.symbol = LAUNCHPAD_SYMBOL;
      a.precision = LAUNCHPAD_BASE_PRECISION_DIGITS;
   });
   FC_ASSERT( _p_core_asset_obj->get_id() == asset_id_type() );

   _p_dyn_global_prop_obj = &create<dynamic_global_property_object>( [&genesis_state]( dynamic_global_property_object& p ) {
      p.time = genesis_state.initial_timestamp;
      p.launch_storage_deposit = genesis_state.launch_storage_deposit;
      p.position_storage_deposit = genesis_state.position_storage_deposit;
   });

   FC_ASSERT( create<account_object>( []( account_object& a ) {
      a.name = "null-account";
   }).get_id() == LAUNCHPAD_NULL_ACCOUNT );

   share_type initial_supply;
   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( account.base_balance >= 0, "Initial balance of ${n} is negative", ("n",account.name) );
      const account_object& new_account = create<account_object>( [&account]( account_object& a ) {
         a.name = account.name;
      });
      adjust_balance( new_account.get_id(), asset( account.base_balance ) );
      initial_supply += account.base_balance;
   }
   modify( get_core_asset(), [initial_supply]( asset_object& a ) {
      a.current_supply = initial_supply;
   });

   if( genesis_state.initial_config.valid() )
   {
      const auto& cfg = *genesis_state.initial_config;
      const account_id_type authority = get_account( cfg.authority_name ).get_id();
      const account_id_type operator_account = get_account( cfg.operator_name ).get_id();
      const account_id_type protocol_fee_account = get_account( cfg.protocol_fee_name ).get_id();
      const account_id_type vault_protocol_account = get_account( cfg.vault_protocol_name ).get_id();
      FC_ASSERT( cfg.min_seed_amount >= 0, "Minimum seed must not be negative" );

      create<protocol_config_object>( [&]( protocol_config_object& c ) {
         c.authority = authority;
         c.operator_account = operator_account;
         c.protocol_fee_account = protocol_fee_account;
         c.vault_protocol_account = vault_protocol_account;
         c.min_seed_amount = cfg.min_seed_amount;
         c.price_usd = cfg.price_usd;
         c.price_updated_at = genesis_state.initial_timestamp;
      });
   }

   _undo_db.enable();

   ilog( "Genesis applied: ${n} accounts, time ${t}",
         ("n",genesis_state.initial_accounts.size())("t",genesis_state.initial_timestamp) );
} FC_CAPTURE_AND_RETHROW() }

} }
