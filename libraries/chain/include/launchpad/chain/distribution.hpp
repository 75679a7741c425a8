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

   /**
    * A vault yield divided between the poke caller, the creator, the protocol and the pool. The
    * compounded part is the remainder, so the four always add up to the yield.
    */
   struct yield_split
   {
      share_type caller_reward;
      share_type creator_reward;
      share_type protocol_reward;
      share_type compounded;
   };

   yield_split split_yield( share_type yield_amount );

   /**
    * The holder's share of the token allocation, floor( shares * allocation / shares_at_graduation ).
    * Throws invalid_calculation_exception when the snapshot is not positive.
    */
   share_type token_entitlement( share_type shares, share_type shares_at_graduation,
                                 share_type allocation = LAUNCHPAD_TOKENS_FOR_HOLDERS );

} } // launchpad::chain

FC_REFLECT( launchpad::chain::yield_split, (caller_reward)(creator_reward)(protocol_reward)(compounded) )
