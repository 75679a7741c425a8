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

#include <launchpad/chain/types.hpp>

namespace launchpad { namespace chain {

   struct vesting_state
   {
      share_type total_vested;   ///< vested since the start, claimed or not
      share_type claimable;      ///< total_vested minus what was already claimed
      share_type remaining;      ///< seed shares not claimed yet
   };

   /**
    * floor( seed_shares * min(elapsed, duration) / duration )
    */
   share_type vested_amount( share_type seed_shares, uint32_t elapsed_seconds,
                             uint32_t duration_seconds = LAUNCHPAD_VESTING_DURATION_SECONDS );

   /**
    * Linear vesting of the creator's seed shares, starting at graduation. @p now must not be before @p start.
    */
   vesting_state compute_vesting( share_type seed_shares, share_type already_claimed,
                                  time_point_sec start, time_point_sec now,
                                  uint32_t duration_seconds = LAUNCHPAD_VESTING_DURATION_SECONDS );

} } // launchpad::chain

FC_REFLECT( launchpad::chain::vesting_state, (total_vested)(claimable)(remaining) )
