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
#include <launchpad/chain/vesting.hpp>
#include <launchpad/chain/exceptions.hpp>

#include <fc/uint128.hpp>

#include <algorithm>

namespace launchpad { namespace chain {

share_type vested_amount( share_type seed_shares, uint32_t elapsed_seconds, uint32_t duration_seconds )
{
   FC_ASSERT( duration_seconds > 0, "Vesting duration must be positive" );
   FC_ASSERT( seed_shares >= 0 );
   const uint32_t capped = std::min( elapsed_seconds, duration_seconds );
   const fc::uint128_t vested = fc::uint128_t( seed_shares.value ) * capped / duration_seconds;
   return static_cast<int64_t>( vested );
}

vesting_state compute_vesting( share_type seed_shares, share_type already_claimed,
                               time_point_sec start, time_point_sec now, uint32_t duration_seconds )
{ try {
   FC_ASSERT( now >= start, "Vesting has not started" );
   LAUNCHPAD_ASSERT( already_claimed >= 0 && already_claimed <= seed_shares, invalid_calculation_exception,
                     "Claimed more seed shares than exist", ("seed_shares",seed_shares)("claimed",already_claimed) );

   vesting_state result;
   result.total_vested = vested_amount( seed_shares, now.sec_since_epoch() - start.sec_since_epoch(),
                                        duration_seconds );
   result.remaining = seed_shares - already_claimed;
   result.claimable = result.total_vested > already_claimed ? result.total_vested - already_claimed
                                                            : share_type( 0 );
   return result;
} FC_CAPTURE_AND_RETHROW( (seed_shares)(already_claimed)(start)(now) ) }

} } // launchpad::chain
