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
#include <launchpad/chain/distribution.hpp>
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/protocol/fee_policy.hpp>

#include <fc/uint128.hpp>

namespace launchpad { namespace chain {

yield_split split_yield( share_type yield_amount )
{ try {
   yield_split result;
   result.caller_reward   = bps_of( yield_amount, LAUNCHPAD_YIELD_CALLER_BPS );
   result.creator_reward  = bps_of( yield_amount, LAUNCHPAD_YIELD_CREATOR_BPS );
   result.protocol_reward = bps_of( yield_amount, LAUNCHPAD_YIELD_PROTOCOL_BPS );
   result.compounded = yield_amount - result.caller_reward - result.creator_reward - result.protocol_reward;
   FC_ASSERT( result.compounded >= 0 );
   return result;
} FC_CAPTURE_AND_RETHROW( (yield_amount) ) }

share_type token_entitlement( share_type shares, share_type shares_at_graduation, share_type allocation )
{ try {
   LAUNCHPAD_ASSERT( shares_at_graduation > 0, invalid_calculation_exception,
                     "No shares existed at graduation", ("shares_at_graduation",shares_at_graduation) );
   FC_ASSERT( shares >= 0 && allocation >= 0 );
   LAUNCHPAD_ASSERT( shares <= shares_at_graduation, invalid_calculation_exception,
                     "Position holds more shares than existed at graduation",
                     ("shares",shares)("shares_at_graduation",shares_at_graduation) );
   const fc::uint128_t amount = fc::uint128_t( shares.value ) * allocation.value / shares_at_graduation.value;
   return static_cast<int64_t>( amount );
} FC_CAPTURE_AND_RETHROW( (shares)(shares_at_graduation)(allocation) ) }

} } // launchpad::chain
