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
#include <launchpad/protocol/fee_policy.hpp>
#include <launchpad/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

namespace launchpad { namespace protocol {

share_type bps_of( share_type amount, bps_type bps )
{
   LAUNCHPAD_ASSERT( amount >= 0, invalid_amount_exception, "Amount must not be negative", ("amount",amount) );
   FC_ASSERT( bps <= LAUNCHPAD_100_PERCENT, "Rate exceeds 100%", ("bps",bps) );
   fc::uint128_t r = fc::uint128_t( amount.value ) * bps / LAUNCHPAD_100_PERCENT;
   return static_cast<int64_t>( r );
}

fee_rates fee_rates_for( bool creator_verified )
{
   fee_rates rates;
   rates.creator_bps = creator_verified ? LAUNCHPAD_CREATOR_FEE_VERIFIED_BPS
                                        : LAUNCHPAD_CREATOR_FEE_UNVERIFIED_BPS;
   return rates;
}

fee_split split_buy_fee( share_type gross, const fee_rates& rates )
{ try {
   FC_ASSERT( rates.creator_bps <= rates.total_bps, "Creator rate exceeds the total fee rate" );

   fee_split result;
   result.total_fee    = bps_of( gross, rates.total_bps );
   result.creator_fee  = bps_of( gross, rates.creator_bps );
   result.protocol_fee = result.total_fee - result.creator_fee;
   result.net_amount   = gross - result.total_fee;
   return result;
} FC_CAPTURE_AND_RETHROW( (gross)(rates) ) }

share_type launch_creation_fee( share_type seed_amount )
{
   return bps_of( seed_amount, LAUNCHPAD_TOTAL_FEE_BPS );
}

} } // launchpad::protocol
