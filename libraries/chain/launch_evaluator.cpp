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
#include <launchpad/chain/launch_evaluator.hpp>

#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/chain/position_ledger.hpp>

#include <launchpad/protocol/curve.hpp>

#include <algorithm>

namespace launchpad { namespace chain {

namespace {

   void check_active( const launch_object& launch )
   {
      LAUNCHPAD_ASSERT( !launch.graduated, already_graduated_exception, "Launch ${l} has graduated",
                        ("l",launch.id) );
      LAUNCHPAD_ASSERT( !launch.refund_mode, refund_mode_active_exception, "Launch ${l} is refunding",
                        ("l",launch.id) );
   }

   void check_refunding( const launch_object& launch )
   {
      LAUNCHPAD_ASSERT( launch.refund_mode, refund_mode_not_active_exception, "Launch ${l} is not refunding",
                        ("l",launch.id) );
   }

   void check_not_paused( const protocol_config_object& config )
   {
      LAUNCHPAD_ASSERT( !config.paused, protocol_paused_exception, "The protocol is paused",
                        ("config",config.id) );
   }

   void check_custody( const launch_object& launch, share_type amount )
   {
      LAUNCHPAD_ASSERT( launch.base_custody >= amount, insufficient_funds_exception,
                        "Launch ${l} holds ${c} but has to pay ${a}",
                        ("l",launch.id)("c",launch.base_custody)("a",amount) );
   }

   void check_can_graduate( const launch_object& launch )
   {
      check_not_in_progress( launch );
      check_active( launch );
      FC_ASSERT( launch.total_shares > 0, "Launch ${l} has no shares", ("l",launch.id) );
      FC_ASSERT( launch.base_custody >= launch.total_base_amount, "Launch ${l} custody is short of its basis",
                 ("l",launch.id)("custody",launch.base_custody)("basis",launch.total_base_amount) );
   }

   /**
    * Mints the token, seeds the pool with the basis of the launch and opens the vault and the vesting clock.
    */
   launch_graduated_event graduate_launch( database& d, const launch_object& launch, bool forced )
   { try {
      const time_point_sec now = d.head_time();
      const share_type base_liquidity = launch.total_base_amount;
      const launch_id_type launch_id = launch.get_id();

      const asset_object& token = d.create<asset_object>( [&launch, launch_id]( asset_object& a ) {
         a.symbol = launch.symbol;
         a.precision = LAUNCHPAD_TOKEN_PRECISION_DIGITS;
         a.launch = launch_id;
         a.current_supply = LAUNCHPAD_TOKEN_TOTAL_SUPPLY;
      });

      const pool_creation_result pool = d.get_liquidity_pool_gateway().create_pool(
            launch_id, d.get_core_asset().amount( base_liquidity ), token.amount( LAUNCHPAD_TOKENS_FOR_LP ) );
      FC_ASSERT( pool.lp_shares > 0, "The pool minted no liquidity shares", ("pool",pool.pool) );

      const asset_object& lp_asset = d.create<asset_object>( [&launch, launch_id, &pool]( asset_object& a ) {
         a.symbol = launch.symbol + "-LP";
         a.precision = LAUNCHPAD_TOKEN_PRECISION_DIGITS;
         a.launch = launch_id;
         a.current_supply = pool.lp_shares;
      });

      const vault_object& vault = d.create<vault_object>( [&]( vault_object& v ) {
         v.launch = launch_id;
         v.creator = launch.creator;
         v.pool = pool.pool;
         v.lp_asset = lp_asset.get_id();
         v.lp_balance = pool.lp_shares;
         v.active = true;
         v.last_poke_at = now;
      });

      d.modify( launch, [&]( launch_object& l ) {
         l.graduated = true;
         l.token = token.get_id();
         l.pool = pool.pool;
         l.vault = vault.get_id();
         l.vesting_start = now;
         l.graduated_at = now;
         l.shares_at_graduation = l.total_shares;
         l.base_custody -= base_liquidity;
         l.token_custody = LAUNCHPAD_TOKENS_FOR_HOLDERS;
      });

      const creator_stats_object* stats = d.find_creator_stats( launch.creator );
      FC_ASSERT( stats != nullptr, "Creator ${c} has no statistics", ("c",launch.creator) );
      d.modify( *stats, []( creator_stats_object& s ) {
         ++s.graduation_count;
      });

      launch_graduated_event event;
      event.launch = launch_id;
      event.token = token.get_id();
      event.pool = pool.pool;
      event.vault = vault.get_id();
      event.base_liquidity = base_liquidity;
      event.token_liquidity = LAUNCHPAD_TOKENS_FOR_LP;
      event.lp_shares = pool.lp_shares;
      event.shares_at_graduation = launch.shares_at_graduation;
      event.forced = forced;
      event.timestamp = now;

      ilog( "Launch ${l} graduated${f}: ${b} base into pool ${p}, ${s} shares",
            ("l",launch_id)("f",forced ? " by force" : "")("b",base_liquidity)("p",pool.pool)
            ("s",launch.shares_at_graduation) );
      return event;
   } FC_CAPTURE_AND_RETHROW( (launch.id)(forced) ) }

}

void_result launch_create_evaluator::do_evaluate( const launch_create_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();
   check_not_paused( *_config );
   op.creator(d);

   const uint64_t price = d.get_current_price();
   const share_type min_seed = std::max( _config->min_seed_amount,
                                         database::usd_to_base( LAUNCHPAD_MIN_SEED_USD, price ) );
   const share_type max_seed = database::usd_to_base( LAUNCHPAD_MAX_SEED_USD, price );
   LAUNCHPAD_ASSERT( op.seed_amount >= min_seed, seed_amount_too_low_exception,
                     "Seed of ${s} is below the minimum of ${m}", ("s",op.seed_amount)("m",min_seed) );
   LAUNCHPAD_ASSERT( op.seed_amount <= max_seed, seed_amount_too_high_exception,
                     "Seed of ${s} is above the maximum of ${m}", ("s",op.seed_amount)("m",max_seed) );

   _fee = launch_creation_fee( op.seed_amount );
   _net = op.seed_amount - _fee;
   _seed_shares = bonding_curve().shares_for_amount( _net, 0 );
   FC_ASSERT( _seed_shares > 0, "A seed of ${s} buys no shares", ("s",op.seed_amount) );

   const auto& dgp = d.get_dynamic_global_properties();
   _launch_deposit = dgp.launch_storage_deposit;
   _position_deposit = dgp.position_storage_deposit;

   const share_type required = op.seed_amount + _launch_deposit + _position_deposit;
   const asset balance = d.get_balance( op.creator, asset_id_type() );
   LAUNCHPAD_ASSERT( balance.amount >= required, insufficient_funds_exception,
                     "${c} holds ${b} but creating a launch costs ${r}",
                     ("c",op.creator)("b",balance.amount)("r",required) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type launch_create_evaluator::do_apply( const launch_create_operation& op )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   d.adjust_balance( op.creator, -asset( op.seed_amount + _launch_deposit + _position_deposit ) );
   d.adjust_balance( _config->protocol_fee_account, asset( _fee ) );

   const launch_object& launch = d.create<launch_object>( [&]( launch_object& l ) {
      l.creator = op.creator;
      l.name = op.name;
      l.symbol = op.symbol;
      l.uri = op.uri;
      l.launch_number = _config->total_launches;
      l.seed_shares = _seed_shares;
      l.seed_basis = _net;
      l.created_at = now;
      l.base_custody = _net;
      l.storage_deposit = _launch_deposit;
   });

   position_ledger ledger( d );
   const position_object& position = ledger.open( launch, op.creator, _position_deposit );
   ledger.lock_seed( launch, position, _seed_shares, _net );

   const creator_stats_object* stats = d.find_creator_stats( op.creator );
   if( stats == nullptr )
      stats = &d.create<creator_stats_object>( [&op]( creator_stats_object& s ) {
         s.creator = op.creator;
      });
   d.modify( *stats, []( creator_stats_object& s ) {
      ++s.launch_count;
   });
   d.modify( *_config, []( protocol_config_object& c ) {
      ++c.total_launches;
   });

   launch_created_event event;
   event.launch = launch.get_id();
   event.creator = op.creator;
   event.name = op.name;
   event.symbol = op.symbol;
   event.uri = op.uri;
   event.seed_amount = op.seed_amount;
   event.fee = _fee;
   event.seed_shares = _seed_shares;
   event.launch_number = launch.launch_number;
   event.timestamp = now;
   emit( std::move( event ) );

   ilog( "Launch ${l} ${s} created by ${c} with ${n} base for ${sh} seed shares",
         ("l",launch.id)("s",op.symbol)("c",op.creator)("n",_net)("sh",_seed_shares) );
   return launch.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_buy_evaluator::do_evaluate( const launch_buy_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();
   check_not_paused( *_config );
   op.buyer(d);

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_active( *_launch );

   const creator_stats_object* stats = d.find_creator_stats( _launch->creator );
   _fees = split_buy_fee( op.amount, fee_rates_for( stats != nullptr && stats->is_verified() ) );
   _shares = bonding_curve().shares_for_amount( _fees.net_amount, _launch->total_shares );
   LAUNCHPAD_ASSERT( _shares >= op.min_shares_out, slippage_exceeded_exception,
                     "Buy yields ${s} shares, less than the requested ${m}",
                     ("s",_shares)("m",op.min_shares_out) );

   _position = d.find_position( op.launch, op.buyer );
   if( _position == nullptr )
      _position_deposit = d.get_dynamic_global_properties().position_storage_deposit;

   const share_type required = op.amount + _position_deposit;
   const asset balance = d.get_balance( op.buyer, asset_id_type() );
   LAUNCHPAD_ASSERT( balance.amount >= required, insufficient_funds_exception,
                     "${b} holds ${h} but the buy costs ${r}", ("b",op.buyer)("h",balance.amount)("r",required) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_buy_evaluator::do_apply( const launch_buy_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   const time_point_sec now = d.head_time();

   d.adjust_balance( op.buyer, -asset( op.amount + _position_deposit ) );
   d.adjust_balance( _config->protocol_fee_account, asset( _fees.protocol_fee ) );

   position_ledger ledger( d );
   if( _position == nullptr )
      _position = &ledger.open( *_launch, op.buyer, _position_deposit );
   ledger.credit( *_launch, *_position, _shares, _fees.net_amount );

   const share_type custody_in = _fees.net_amount + _fees.creator_fee;
   d.modify( *_launch, [this, custody_in]( launch_object& l ) {
      l.creator_accrued_fees += _fees.creator_fee;
      l.protocol_accrued_fees += _fees.protocol_fee;
      l.base_custody += custody_in;
   });

   shares_purchased_event purchased;
   purchased.launch = op.launch;
   purchased.buyer = op.buyer;
   purchased.amount = op.amount;
   purchased.shares = _shares;
   purchased.creator_fee = _fees.creator_fee;
   purchased.protocol_fee = _fees.protocol_fee;
   purchased.total_shares = _launch->total_shares;
   purchased.total_base_amount = _launch->total_base_amount;
   purchased.timestamp = now;
   emit( std::move( purchased ) );

   const optional<uint64_t> price = d.try_get_current_price();
   if( price.valid() )
   {
      const uint64_t market_cap = database::market_cap_usd( _launch->total_base_amount, *price );

      market_cap_updated_event cap;
      cap.launch = op.launch;
      cap.total_base_amount = _launch->total_base_amount;
      cap.market_cap_usd = market_cap;
      cap.price_usd = *price;
      emit( std::move( cap ) );

      const uint64_t threshold = uint64_t( LAUNCHPAD_GRADUATION_MARKET_CAP_USD )
                                 * LAUNCHPAD_GRADUATION_NOTIFICATION_BPS / LAUNCHPAD_100_PERCENT;
      if( market_cap >= threshold )
      {
         ready_to_graduate_event ready;
         ready.launch = op.launch;
         ready.market_cap_usd = market_cap;
         ready.threshold_usd = threshold;
         emit( std::move( ready ) );
      }
   }

   guard.release();
   return _shares;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_sell_evaluator::do_evaluate( const launch_sell_operation& op )
{ try {
   const database& d = db();

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_active( *_launch );

   _position = &d.get_position( op.launch, op.seller );
   LAUNCHPAD_ASSERT( op.shares <= _position->shares, insufficient_shares_exception,
                     "${s} holds ${h} sellable shares, cannot sell ${n}",
                     ("s",op.seller)("h",_position->shares)("n",op.shares) );

   _refund = bonding_curve::proportional_refund( op.shares, _position->shares, _position->basis );
   LAUNCHPAD_ASSERT( _refund >= op.min_amount_out, slippage_exceeded_exception,
                     "Sell pays ${p}, less than the requested ${m}", ("p",_refund)("m",op.min_amount_out) );
   check_custody( *_launch, _refund );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_sell_evaluator::do_apply( const launch_sell_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );

   position_ledger( d ).debit( *_launch, *_position, op.shares, _refund );
   d.modify( *_launch, [this]( launch_object& l ) {
      l.base_custody -= _refund;
   });

   d.adjust_balance( op.seller, asset( _refund ) );

   shares_sold_event event;
   event.launch = op.launch;
   event.seller = op.seller;
   event.shares = op.shares;
   event.refund = _refund;
   event.total_shares = _launch->total_shares;
   event.total_base_amount = _launch->total_base_amount;
   event.timestamp = d.head_time();
   emit( std::move( event ) );

   guard.release();
   return _refund;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_graduate_evaluator::do_evaluate( const launch_graduate_operation& op )
{ try {
   const database& d = db();
   const protocol_config_object& config = d.get_protocol_config();
   LAUNCHPAD_ASSERT( config.is_operator( op.caller ), unauthorized_exception,
                     "${c} may not graduate launches", ("c",op.caller) );

   _launch = &op.launch(d);
   check_can_graduate( *_launch );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type launch_graduate_evaluator::do_apply( const launch_graduate_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   launch_graduated_event event = graduate_launch( d, *_launch, false );
   const object_id_type token = event.token;
   emit( std::move( event ) );
   guard.release();
   return token;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_force_graduate_evaluator::do_evaluate( const launch_force_graduate_operation& op )
{ try {
   const database& d = db();
   const protocol_config_object& config = d.get_protocol_config();
   LAUNCHPAD_ASSERT( op.caller == config.authority, unauthorized_exception,
                     "Only the protocol authority may force a graduation", ("c",op.caller) );

   _launch = &op.launch(d);
   check_can_graduate( *_launch );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type launch_force_graduate_evaluator::do_apply( const launch_force_graduate_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   launch_graduated_event event = graduate_launch( d, *_launch, true );
   const object_id_type token = event.token;
   emit( std::move( event ) );
   guard.release();
   return token;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_enable_refund_evaluator::do_evaluate( const launch_enable_refund_operation& op )
{ try {
   const database& d = db();
   op.caller(d);

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   LAUNCHPAD_ASSERT( !_launch->graduated, already_graduated_exception, "Launch ${l} has graduated",
                     ("l",op.launch) );
   LAUNCHPAD_ASSERT( !_launch->refund_mode, refund_mode_already_active_exception,
                     "Launch ${l} is already refunding", ("l",op.launch) );

   const time_point_sec expires = _launch->created_at + LAUNCHPAD_LAUNCH_DURATION_SECONDS;
   LAUNCHPAD_ASSERT( d.head_time() >= expires, launch_not_expired_exception,
                     "Launch ${l} can be refunded from ${e}", ("l",op.launch)("e",expires) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_enable_refund_evaluator::do_apply( const launch_enable_refund_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   const time_point_sec now = d.head_time();

   d.modify( *_launch, [now]( launch_object& l ) {
      l.refund_mode = true;
      l.refund_enabled_at = now;
   });

   refund_enabled_event event;
   event.launch = op.launch;
   event.timestamp = now;
   emit( std::move( event ) );

   ilog( "Launch ${l} entered refund mode, ${b} base held for ${s} shares",
         ("l",op.launch)("b",_launch->total_base_amount)("s",_launch->total_shares) );
   guard.release();
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_claim_refund_evaluator::do_evaluate( const launch_claim_refund_operation& op )
{ try {
   const database& d = db();

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_refunding( *_launch );

   _position = &d.get_position( op.launch, op.owner );
   LAUNCHPAD_ASSERT( !_position->claimed_refund, already_claimed_exception,
                     "${o} already claimed the refund of ${l}", ("o",op.owner)("l",op.launch) );
   check_custody( *_launch, _position->total_basis() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_claim_refund_evaluator::do_apply( const launch_claim_refund_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );

   const drained_position drained = position_ledger( d ).drain( *_launch, *_position );
   d.modify( *_launch, [&drained]( launch_object& l ) {
      l.base_custody -= drained.basis;
   });
   d.adjust_balance( op.owner, asset( drained.basis ) );

   refund_claimed_event event;
   event.launch = op.launch;
   event.owner = op.owner;
   event.shares = drained.shares;
   event.amount = drained.basis;
   emit( std::move( event ) );

   guard.release();
   return drained.basis;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_push_refund_evaluator::do_evaluate( const launch_push_refund_operation& op )
{ try {
   const database& d = db();
   op.caller(d);

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_refunding( *_launch );

   _position = &d.get_position( op.launch, op.recipient );
   LAUNCHPAD_ASSERT( !_position->claimed_refund, already_claimed_exception,
                     "${o} already claimed the refund of ${l}", ("o",op.recipient)("l",op.launch) );
   check_custody( *_launch, _position->total_basis() );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_push_refund_evaluator::do_apply( const launch_push_refund_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   position_ledger ledger( d );

   const drained_position drained = ledger.drain( *_launch, *_position );
   d.modify( *_launch, [&drained]( launch_object& l ) {
      l.base_custody -= drained.basis;
   });
   d.adjust_balance( op.recipient, asset( drained.basis ) );

   const share_type deposit = ledger.close( *_position );
   _position = nullptr;
   d.adjust_balance( op.caller, asset( deposit ) );

   refund_pushed_event event;
   event.launch = op.launch;
   event.owner = op.recipient;
   event.caller = op.caller;
   event.shares = drained.shares;
   event.amount = drained.basis;
   event.storage_deposit = deposit;
   emit( std::move( event ) );

   guard.release();
   return drained.basis;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_close_evaluator::do_evaluate( const launch_close_operation& op )
{ try {
   const database& d = db();
   op.caller(d);

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_refunding( *_launch );
   LAUNCHPAD_ASSERT( _launch->total_shares == 0 && _launch->total_base_amount == 0, launch_not_empty_exception,
                     "Launch ${l} still holds ${s} shares and ${b} base",
                     ("l",op.launch)("s",_launch->total_shares)("b",_launch->total_base_amount) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_close_evaluator::do_apply( const launch_close_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   position_ledger ledger( d );

   for( const position_object* position : d.get_launch_positions( op.launch ) )
   {
      const account_id_type owner = position->owner;
      d.adjust_balance( owner, asset( ledger.close( *position ) ) );
   }

   const account_id_type creator = _launch->creator;
   const share_type leftover = _launch->base_custody;
   const share_type deposit = _launch->storage_deposit;
   FC_ASSERT( _launch->token_custody == 0, "A refunding launch cannot hold tokens" );

   d.remove( *_launch );
   _launch = nullptr;

   d.adjust_balance( creator, asset( leftover ) );
   d.adjust_balance( op.caller, asset( deposit ) );

   launch_closed_event event;
   event.launch = op.launch;
   event.caller = op.caller;
   event.storage_deposit = deposit;
   event.leftover = leftover;
   emit( std::move( event ) );

   ilog( "Launch ${l} closed by ${c}, ${r} base returned to ${cr}",
         ("l",op.launch)("c",op.caller)("r",leftover)("cr",creator) );
   guard.release();
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // launchpad::chain
