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

#include <launchpad/protocol/types.hpp>

namespace launchpad { namespace protocol {

   /**
    * Fee rates in basis points. The protocol rate is whatever the creator rate leaves of the total.
    */
   struct fee_rates
   {
      bps_type total_bps   = LAUNCHPAD_TOTAL_FEE_BPS;
      bps_type creator_bps = LAUNCHPAD_CREATOR_FEE_UNVERIFIED_BPS;

      bps_type protocol_bps()const { return total_bps - creator_bps; }
   };

   /// A gross amount broken down into fees and the net amount credited to the curve
   struct fee_split
   {
      share_type total_fee;
      share_type creator_fee;
      share_type protocol_fee;
      share_type net_amount;
   };

   /**
    * A verified creator, one with at least one graduated launch, earns the higher creator rate.
    */
   fee_rates fee_rates_for( bool creator_verified );

   /**
    * Splits the gross amount of a buy. Each fee is floored and the protocol fee is computed as
    * total - creator, so that creator_fee + protocol_fee == total_fee always holds.
    */
   fee_split split_buy_fee( share_type gross, const fee_rates& rates );

   /// The launch creation fee, charged in full to the protocol
   share_type launch_creation_fee( share_type seed_amount );

   /// floor( amount * bps / 10000 )
   share_type bps_of( share_type amount, bps_type bps );

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::fee_rates, (total_bps)(creator_bps) )
FC_REFLECT( launchpad::protocol::fee_split, (total_fee)(creator_fee)(protocol_fee)(net_amount) )
