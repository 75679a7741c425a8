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
    * @brief Claim the pro-rata share of the holder allocation of a graduated launch
    * @ingroup operations
    *
    * The position is closed afterwards. A creator must have claimed all vested seed shares first.
    */
   struct launch_claim_tokens_operation : public base_operation
   {
      account_id_type owner;
      launch_id_type  launch;

      account_id_type signer()const { return owner; }
   };

   /**
    * @brief Unlock the creator's seed shares vested so far
    * @ingroup operations
    */
   struct launch_claim_vesting_operation : public base_operation
   {
      account_id_type creator;
      launch_id_type  launch;

      account_id_type signer()const { return creator; }
   };

   /**
    * @brief Withdraw the creator fees accrued by a graduated launch
    * @ingroup operations
    */
   struct launch_claim_creator_fees_operation : public base_operation
   {
      account_id_type creator;
      launch_id_type  launch;

      account_id_type signer()const { return creator; }
   };

   /**
    * @brief Collect and split the yield of a graduated launch's liquidity vault
    * @ingroup operations
    *
    * Anyone may submit it, the caller receives a small incentive.
    */
   struct vault_poke_operation : public base_operation
   {
      account_id_type caller;
      launch_id_type  launch;

      account_id_type signer()const { return caller; }
   };

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::launch_claim_tokens_operation, (owner)(launch) )
FC_REFLECT( launchpad::protocol::launch_claim_vesting_operation, (creator)(launch) )
FC_REFLECT( launchpad::protocol::launch_claim_creator_fees_operation, (creator)(launch) )
FC_REFLECT( launchpad::protocol::vault_poke_operation, (caller)(launch) )
