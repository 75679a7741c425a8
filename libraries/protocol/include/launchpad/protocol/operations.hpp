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
#include <launchpad/protocol/protocol_config.hpp>
#include <launchpad/protocol/launch.hpp>
#include <launchpad/protocol/distribution.hpp>

namespace launchpad { namespace protocol {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * New operations are appended, the position of an operation is its wire tag.
    */
   using operation = fc::static_variant<
            /*  0 */ protocol_initialize_operation,
            /*  1 */ protocol_update_price_operation,
            /*  2 */ protocol_update_config_operation,
            /*  3 */ protocol_set_paused_operation,
            /*  4 */ launch_create_operation,
            /*  5 */ launch_buy_operation,
            /*  6 */ launch_sell_operation,
            /*  7 */ launch_graduate_operation,
            /*  8 */ launch_force_graduate_operation,
            /*  9 */ launch_enable_refund_operation,
            /* 10 */ launch_claim_refund_operation,
            /* 11 */ launch_push_refund_operation,
            /* 12 */ launch_close_operation,
            /* 13 */ launch_claim_tokens_operation,
            /* 14 */ launch_claim_vesting_operation,
            /* 15 */ launch_claim_creator_fees_operation,
            /* 16 */ vault_poke_operation
         >;

   /// @} // operations group

   /**
    *  Performs the stateless checks of an operation
    */
   void operation_validate( const operation& op );

   /// The account that authorized the operation
   account_id_type operation_signer( const operation& op );

} } // launchpad::protocol

FC_REFLECT_TYPENAME( launchpad::protocol::operation )
