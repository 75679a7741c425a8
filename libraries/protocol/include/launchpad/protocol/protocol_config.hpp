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
    * @brief Create the protocol configuration
    * @ingroup operations
    *
    * The submitting account becomes the protocol authority.
    */
   struct protocol_initialize_operation : public base_operation
   {
      account_id_type authority;
      account_id_type operator_account;        ///< May update the price and graduate launches
      account_id_type protocol_fee_account;    ///< Receives the protocol share of every fee
      account_id_type vault_protocol_account;  ///< Receives the protocol share of vault yield
      share_type      min_seed_amount;         ///< Seed floor in base units, applied on top of the USD floor

      account_id_type signer()const { return authority; }
      void            validate()const override;
   };

   /**
    * @brief Publish a new USD price for one whole base unit
    * @ingroup operations
    */
   struct protocol_update_price_operation : public base_operation
   {
      account_id_type updater;
      uint64_t        price_usd = 0;

      account_id_type signer()const { return updater; }
      void            validate()const override;
   };

   /**
    * @brief Rotate protocol identities or the seed floor
    * @ingroup operations
    */
   struct protocol_update_config_operation : public base_operation
   {
      account_id_type            authority;
      optional<account_id_type>  new_authority;
      optional<account_id_type>  new_operator;
      optional<account_id_type>  new_protocol_fee_account;
      optional<account_id_type>  new_vault_protocol_account;
      optional<share_type>       new_min_seed_amount;

      account_id_type signer()const { return authority; }
      void            validate()const override;
   };

   /**
    * @brief Pause or resume launch creation and buying
    * @ingroup operations
    */
   struct protocol_set_paused_operation : public base_operation
   {
      account_id_type authority;
      bool            paused = false;

      account_id_type signer()const { return authority; }
   };

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::protocol_initialize_operation,
            (authority)(operator_account)(protocol_fee_account)(vault_protocol_account)(min_seed_amount) )
FC_REFLECT( launchpad::protocol::protocol_update_price_operation, (updater)(price_usd) )
FC_REFLECT( launchpad::protocol::protocol_update_config_operation,
            (authority)(new_authority)(new_operator)(new_protocol_fee_account)(new_vault_protocol_account)
            (new_min_seed_amount) )
FC_REFLECT( launchpad::protocol::protocol_set_paused_operation, (authority)(paused) )
