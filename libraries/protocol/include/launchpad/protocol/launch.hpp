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

   /// Checks that name, symbol and uri are present and within their length limits
   void validate_launch_metadata( const string& name, const string& symbol, const string& uri );

   /**
    * @brief Create a launch, seeding it with the creator's deposit
    * @ingroup operations
    *
    * The creator's seed shares are locked until they vest after graduation.
    */
   struct launch_create_operation : public base_operation
   {
      account_id_type creator;       ///< The account that creates and seeds the launch
      string          name;          ///< Display name of the token
      string          symbol;        ///< Ticker of the token
      string          uri;           ///< Off-chain metadata location
      share_type      seed_amount;   ///< Gross seed, in base units, the creation fee is deducted from it

      account_id_type signer()const { return creator; }
      void            validate()const override;
   };

   /**
    * @brief Buy shares of an active launch on the bonding curve
    * @ingroup operations
    */
   struct launch_buy_operation : public base_operation
   {
      account_id_type buyer;
      launch_id_type  launch;
      share_type      amount;          ///< Gross amount of base paid, fees included
      share_type      min_shares_out;  ///< Slippage guard

      account_id_type signer()const { return buyer; }
      void            validate()const override;
   };

   /**
    * @brief Sell shares back to an active launch at their basis
    * @ingroup operations
    */
   struct launch_sell_operation : public base_operation
   {
      account_id_type seller;
      launch_id_type  launch;
      share_type      shares;          ///< Number of shares to sell
      share_type      min_amount_out;  ///< Slippage guard

      account_id_type signer()const { return seller; }
      void            validate()const override;
   };

   /**
    * @brief Graduate a launch once the off-chain eligibility gates have passed
    * @ingroup operations
    *
    * Submitted by the protocol operator.
    */
   struct launch_graduate_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;

      account_id_type signer()const { return caller; }
   };

   /**
    * @brief Graduate a launch without any eligibility gate, for recovery
    * @ingroup operations
    *
    * Only the protocol authority may submit it. The effect is identical to @ref launch_graduate_operation.
    */
   struct launch_force_graduate_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;

      account_id_type signer()const { return caller; }
   };

   /**
    * @brief Put an expired launch into refund mode
    * @ingroup operations
    */
   struct launch_enable_refund_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;

      account_id_type signer()const { return caller; }
   };

   /**
    * @brief Claim back the basis of one's own position in a refunding launch
    * @ingroup operations
    */
   struct launch_claim_refund_operation : public base_operation
   {
      account_id_type owner;
      launch_id_type  launch;

      account_id_type signer()const { return owner; }
   };

   /**
    * @brief Pay out another account's refund and close its position
    * @ingroup operations
    *
    * The position's storage deposit goes to the caller.
    */
   struct launch_push_refund_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;
      account_id_type recipient;   ///< Owner of the position being refunded

      account_id_type signer()const { return caller; }
   };

   /**
    * @brief Close a fully drained refunding launch
    * @ingroup operations
    */
   struct launch_close_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;

      account_id_type signer()const { return caller; }
   };

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::launch_create_operation, (creator)(name)(symbol)(uri)(seed_amount) )
FC_REFLECT( launchpad::protocol::launch_buy_operation, (buyer)(launch)(amount)(min_shares_out) )
FC_REFLECT( launchpad::protocol::launch_sell_operation, (seller)(launch)(shares)(min_amount_out) )
FC_REFLECT( launchpad::protocol::launch_graduate_operation, (caller)(launch) )
FC_REFLECT( launchpad::protocol::launch_force_graduate_operation, (caller)(launch) )
FC_REFLECT( launchpad::protocol::launch_enable_refund_operation, (caller)(launch) )
FC_REFLECT( launchpad::protocol::launch_claim_refund_operation, (owner)(launch) )
FC_REFLECT( launchpad::protocol::launch_push_refund_operation, (caller)(launch)(recipient) )
FC_REFLECT( launchpad::protocol::launch_close_operation, (caller)(launch) )
