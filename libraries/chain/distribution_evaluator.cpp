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
#include <launchpad/chain/distribution_evaluator.hpp>

#include <launchpad/chain/database.hpp>
#include <launchpad/chain/distribution.hpp>
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/chain/position_ledger.hpp>

namespace launchpad { namespace chain {

namespace {

   void check_graduated( const launch_object& launch )
   {
      LAUNCHPAD_ASSERT( launch.graduated, not_graduated_exception, "Launch ${l} has not graduated",
                        ("l",launch.id) );
   }

}

void_result launch_claim_tokens_evaluator::do_evaluate( const launch_claim_tokens_operation& op )
{ try {
   const database& d = db();

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_graduated( *_launch );

   // the position is closed by a successful claim, so a second one finds nothing
   _position = &d.get_position( op.launch, op.owner );
   if( op.owner == _launch->creator )
      LAUNCHPAD_ASSERT( _launch->seed_shares == _position->vested_claimed, vesting_not_complete_exception,
                        "${c} has ${r} seed shares left to vest",
                        ("c",op.owner)("r",_launch->seed_shares - _position->vested_claimed) );

   _amount = token_entitlement( _position->shares, _launch->shares_at_graduation );
   LAUNCHPAD_ASSERT( _amount > 0, no_shares_to_claim_exception, "${o} has no tokens to claim in ${l}",
                     ("o",op.owner)("l",op.launch) );
   FC_ASSERT( _launch->token_custody >= _amount, "Launch ${l} is short of tokens",
              ("l",op.launch)("custody",_launch->token_custody)("amount",_amount) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

asset launch_claim_tokens_evaluator::do_apply( const launch_claim_tokens_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );

   const asset tokens( _amount, *_launch->token );
   const share_type shares = _position->shares;

   d.modify( *_launch, [this]( launch_object& l ) {
      l.token_custody -= _amount;
   });
   d.adjust_balance( op.owner, tokens );

   const share_type deposit = position_ledger( d ).close( *_position );
   _position = nullptr;
   d.adjust_balance( op.owner, asset( deposit ) );

   tokens_claimed_event event;
   event.launch = op.launch;
   event.owner = op.owner;
   event.shares = shares;
   event.amount = _amount;
   emit( std::move( event ) );

   guard.release();
   return tokens;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_claim_vesting_evaluator::do_evaluate( const launch_claim_vesting_operation& op )
{ try {
   const database& d = db();

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   LAUNCHPAD_ASSERT( op.creator == _launch->creator, unauthorized_exception,
                     "Only the creator of ${l} holds vesting shares", ("l",op.launch)("caller",op.creator) );
   check_graduated( *_launch );

   const time_point_sec now = d.head_time();
   LAUNCHPAD_ASSERT( _launch->vesting_start.valid() && *_launch->vesting_start <= now,
                     vesting_not_started_exception, "Vesting of ${l} has not started", ("l",op.launch) );

   _position = &d.get_position( op.launch, op.creator );
   _vesting = compute_vesting( _launch->seed_shares, _position->vested_claimed, *_launch->vesting_start, now );
   LAUNCHPAD_ASSERT( _vesting.remaining > 0, no_shares_to_claim_exception,
                     "Every seed share of ${l} has been claimed", ("l",op.launch) );
   LAUNCHPAD_ASSERT( _vesting.claimable > 0, no_shares_to_claim_exception,
                     "No seed shares of ${l} vested since the last claim", ("l",op.launch) );
   FC_ASSERT( _vesting.claimable <= _position->locked_shares, "Vesting more than is locked",
              ("claimable",_vesting.claimable)("locked",_position->locked_shares) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_claim_vesting_evaluator::do_apply( const launch_claim_vesting_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );

   position_ledger( d ).unlock_vested( *_launch, *_position, _vesting.claimable );

   vesting_claimed_event event;
   event.launch = op.launch;
   event.creator = op.creator;
   event.unlocked = _vesting.claimable;
   event.remaining_locked = _position->locked_shares;
   event.total_claimed = _position->vested_claimed;
   emit( std::move( event ) );

   guard.release();
   return _vesting.claimable;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result launch_claim_creator_fees_evaluator::do_evaluate( const launch_claim_creator_fees_operation& op )
{ try {
   const database& d = db();

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   LAUNCHPAD_ASSERT( op.creator == _launch->creator, not_creator_exception,
                     "${c} is not the creator of ${l}", ("c",op.creator)("l",op.launch) );
   check_graduated( *_launch );
   LAUNCHPAD_ASSERT( _launch->creator_accrued_fees > 0, no_fees_to_claim_exception,
                     "Launch ${l} has no creator fees to claim", ("l",op.launch) );
   LAUNCHPAD_ASSERT( _launch->base_custody >= _launch->creator_accrued_fees, insufficient_funds_exception,
                     "Launch ${l} holds ${c} but owes ${f} in creator fees",
                     ("l",op.launch)("c",_launch->base_custody)("f",_launch->creator_accrued_fees) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type launch_claim_creator_fees_evaluator::do_apply( const launch_claim_creator_fees_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );

   const share_type fees = _launch->creator_accrued_fees;
   d.modify( *_launch, [fees]( launch_object& l ) {
      l.base_custody -= fees;
      l.creator_accrued_fees = 0;
   });
   d.adjust_balance( op.creator, asset( fees ) );

   const creator_stats_object* stats = d.find_creator_stats( op.creator );
   FC_ASSERT( stats != nullptr, "Creator ${c} has no statistics", ("c",op.creator) );
   d.modify( *stats, [fees]( creator_stats_object& s ) {
      s.total_fees_earned += fees;
   });

   creator_fees_claimed_event event;
   event.launch = op.launch;
   event.creator = op.creator;
   event.amount = fees;
   emit( std::move( event ) );

   guard.release();
   return fees;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result vault_poke_evaluator::do_evaluate( const vault_poke_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();
   op.caller(d);

   _launch = &op.launch(d);
   check_not_in_progress( *_launch );
   check_graduated( *_launch );

   _vault = d.find_vault( op.launch );
   FC_ASSERT( _vault != nullptr && _vault->active, "Launch ${l} has no active vault", ("l",op.launch) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

share_type vault_poke_evaluator::do_apply( const vault_poke_operation& op )
{ try {
   database& d = db();
   launch_exclusivity_guard guard( d, *_launch );
   const time_point_sec now = d.head_time();
   liquidity_pool_gateway& gateway = d.get_liquidity_pool_gateway();

   const share_type yield_amount = gateway.collect_yield( _vault->pool );
   FC_ASSERT( yield_amount >= 0, "Pool ${p} reported a negative yield", ("p",_vault->pool) );
   const yield_split split = split_yield( yield_amount );

   share_type minted;
   if( yield_amount > 0 )
   {
      minted = gateway.compound( _vault->pool, split.compounded );

      // the paid out part of the yield enters circulation
      const share_type paid_out = yield_amount - split.compounded;
      d.modify( d.get_core_asset(), [paid_out]( asset_object& a ) {
         a.current_supply += paid_out;
      });
      d.adjust_balance( op.caller, asset( split.caller_reward ) );
      d.adjust_balance( _launch->creator, asset( split.creator_reward ) );
      d.adjust_balance( _config->vault_protocol_account, asset( split.protocol_reward ) );
   }

   d.modify( *_vault, [&split, yield_amount, minted, now]( vault_object& v ) {
      v.lp_balance += minted;
      v.total_yield += yield_amount;
      v.total_caller_rewards += split.caller_reward;
      v.total_creator_rewards += split.creator_reward;
      v.total_protocol_rewards += split.protocol_reward;
      v.total_compounded += split.compounded;
      v.last_poke_at = now;
      ++v.poke_count;
   });
   if( minted > 0 )
   {
      d.modify( _vault->lp_asset(d), [minted]( asset_object& a ) {
         a.current_supply += minted;
      });
   }

   poked_event event;
   event.launch = op.launch;
   event.caller = op.caller;
   event.yield_amount = yield_amount;
   event.caller_reward = split.caller_reward;
   event.creator_reward = split.creator_reward;
   event.protocol_reward = split.protocol_reward;
   event.compounded = split.compounded;
   event.timestamp = now;
   emit( std::move( event ) );

   guard.release();
   return yield_amount;
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // launchpad::chain
