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
#include <launchpad/protocol/base.hpp>

namespace launchpad { namespace protocol {

   /**
    * @defgroup events Notifications
    * @brief Records of successful state changes, published for off-chain consumers
    * @{
    */

   struct config_initialized_event
   {
      account_id_type authority;
      account_id_type operator_account;
      account_id_type protocol_fee_account;
      account_id_type vault_protocol_account;
      share_type      min_seed_amount;
   };

   struct price_updated_event
   {
      uint64_t        old_price = 0;
      uint64_t        new_price = 0;
      time_point_sec  timestamp;
   };

   struct config_updated_event
   {
      account_id_type authority;
      account_id_type operator_account;
      account_id_type protocol_fee_account;
      account_id_type vault_protocol_account;
      share_type      min_seed_amount;
   };

   struct pause_toggled_event
   {
      bool            paused = false;
   };

   struct launch_created_event
   {
      launch_id_type  launch;
      account_id_type creator;
      string          name;
      string          symbol;
      string          uri;
      share_type      seed_amount;      ///< gross
      share_type      fee;
      share_type      seed_shares;
      uint64_t        launch_number = 0;
      time_point_sec  timestamp;
   };

   struct shares_purchased_event
   {
      launch_id_type  launch;
      account_id_type buyer;
      share_type      amount;
      share_type      shares;
      share_type      creator_fee;
      share_type      protocol_fee;
      share_type      total_shares;
      share_type      total_base_amount;
      time_point_sec  timestamp;
   };

   struct shares_sold_event
   {
      launch_id_type  launch;
      account_id_type seller;
      share_type      shares;
      share_type      refund;
      share_type      total_shares;
      share_type      total_base_amount;
      time_point_sec  timestamp;
   };

   struct market_cap_updated_event
   {
      launch_id_type  launch;
      share_type      total_base_amount;
      uint64_t        market_cap_usd = 0;
      uint64_t        price_usd = 0;
   };

   /// Market cap crossed the notification share of the graduation target
   struct ready_to_graduate_event
   {
      launch_id_type  launch;
      uint64_t        market_cap_usd = 0;
      uint64_t        threshold_usd = 0;
   };

   struct launch_graduated_event
   {
      launch_id_type  launch;
      asset_id_type   token;
      string          pool;
      vault_id_type   vault;
      share_type      base_liquidity;
      share_type      token_liquidity;
      share_type      lp_shares;
      share_type      shares_at_graduation;
      bool            forced = false;
      time_point_sec  timestamp;
   };

   struct refund_enabled_event
   {
      launch_id_type  launch;
      time_point_sec  timestamp;
   };

   struct refund_claimed_event
   {
      launch_id_type  launch;
      account_id_type owner;
      share_type      shares;
      share_type      amount;
   };

   struct refund_pushed_event
   {
      launch_id_type  launch;
      account_id_type owner;
      account_id_type caller;
      share_type      shares;
      share_type      amount;
      share_type      storage_deposit;
   };

   struct launch_closed_event
   {
      launch_id_type  launch;
      account_id_type caller;
      share_type      storage_deposit;
      share_type      leftover;          ///< custody returned to the creator
   };

   struct tokens_claimed_event
   {
      launch_id_type  launch;
      account_id_type owner;
      share_type      shares;
      share_type      amount;
   };

   struct vesting_claimed_event
   {
      launch_id_type  launch;
      account_id_type creator;
      share_type      unlocked;
      share_type      remaining_locked;
      share_type      total_claimed;
   };

   struct creator_fees_claimed_event
   {
      launch_id_type  launch;
      account_id_type creator;
      share_type      amount;
   };

   struct poked_event
   {
      launch_id_type  launch;
      account_id_type caller;
      share_type      yield_amount;
      share_type      caller_reward;
      share_type      creator_reward;
      share_type      protocol_reward;
      share_type      compounded;
      time_point_sec  timestamp;
   };

   using launch_event = fc::static_variant<
            config_initialized_event,
            price_updated_event,
            config_updated_event,
            pause_toggled_event,
            launch_created_event,
            shares_purchased_event,
            shares_sold_event,
            market_cap_updated_event,
            ready_to_graduate_event,
            launch_graduated_event,
            refund_enabled_event,
            refund_claimed_event,
            refund_pushed_event,
            launch_closed_event,
            tokens_claimed_event,
            vesting_claimed_event,
            creator_fees_claimed_event,
            poked_event
         >;

   /// @}

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::config_initialized_event,
            (authority)(operator_account)(protocol_fee_account)(vault_protocol_account)(min_seed_amount) )
FC_REFLECT( launchpad::protocol::price_updated_event, (old_price)(new_price)(timestamp) )
FC_REFLECT( launchpad::protocol::config_updated_event,
            (authority)(operator_account)(protocol_fee_account)(vault_protocol_account)(min_seed_amount) )
FC_REFLECT( launchpad::protocol::pause_toggled_event, (paused) )
FC_REFLECT( launchpad::protocol::launch_created_event,
            (launch)(creator)(name)(symbol)(uri)(seed_amount)(fee)(seed_shares)(launch_number)(timestamp) )
FC_REFLECT( launchpad::protocol::shares_purchased_event,
            (launch)(buyer)(amount)(shares)(creator_fee)(protocol_fee)(total_shares)(total_base_amount)(timestamp) )
FC_REFLECT( launchpad::protocol::shares_sold_event,
            (launch)(seller)(shares)(refund)(total_shares)(total_base_amount)(timestamp) )
FC_REFLECT( launchpad::protocol::market_cap_updated_event, (launch)(total_base_amount)(market_cap_usd)(price_usd) )
FC_REFLECT( launchpad::protocol::ready_to_graduate_event, (launch)(market_cap_usd)(threshold_usd) )
FC_REFLECT( launchpad::protocol::launch_graduated_event,
            (launch)(token)(pool)(vault)(base_liquidity)(token_liquidity)(lp_shares)(shares_at_graduation)
            (forced)(timestamp) )
FC_REFLECT( launchpad::protocol::refund_enabled_event, (launch)(timestamp) )
FC_REFLECT( launchpad::protocol::refund_claimed_event, (launch)(owner)(shares)(amount) )
FC_REFLECT( launchpad::protocol::refund_pushed_event, (launch)(owner)(caller)(shares)(amount)(storage_deposit) )
FC_REFLECT( launchpad::protocol::launch_closed_event, (launch)(caller)(storage_deposit)(leftover) )
FC_REFLECT( launchpad::protocol::tokens_claimed_event, (launch)(owner)(shares)(amount) )
FC_REFLECT( launchpad::protocol::vesting_claimed_event, (launch)(creator)(unlocked)(remaining_locked)(total_claimed) )
FC_REFLECT( launchpad::protocol::creator_fees_claimed_event, (launch)(creator)(amount) )
FC_REFLECT( launchpad::protocol::poked_event,
            (launch)(caller)(yield_amount)(caller_reward)(creator_reward)(protocol_reward)(compounded)(timestamp) )

FC_REFLECT_TYPENAME( launchpad::protocol::launch_event )
