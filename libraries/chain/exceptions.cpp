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
#include <launchpad/chain/exceptions.hpp>

namespace launchpad { namespace chain {

   FC_IMPLEMENT_EXCEPTION( chain_exception, 3000000, "launchpad exception" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( lifecycle_state_exception, chain_exception, 3100000,
                                   "operation not allowed in the current state" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( authorization_exception,   chain_exception, 3200000, "authorization failure" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( economic_exception,        chain_exception, 3300000, "economic check failed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( oracle_exception,          chain_exception, 3400000, "price feed failure" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( protocol_paused_exception,            lifecycle_state_exception, 3100001,
                                   "protocol is paused" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_initialized_exception,        lifecycle_state_exception, 3100002,
                                   "protocol already initialized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_initialized_exception,            lifecycle_state_exception, 3100003,
                                   "protocol not initialized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_graduated_exception,          lifecycle_state_exception, 3100004,
                                   "launch already graduated" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_graduated_exception,              lifecycle_state_exception, 3100005,
                                   "launch not graduated" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( refund_mode_active_exception,         lifecycle_state_exception, 3100006,
                                   "launch is in refund mode" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( refund_mode_already_active_exception, lifecycle_state_exception, 3100007,
                                   "refund mode already active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( refund_mode_not_active_exception,     lifecycle_state_exception, 3100008,
                                   "refund mode not active" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( launch_not_expired_exception,         lifecycle_state_exception, 3100009,
                                   "launch has not expired" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( already_claimed_exception,            lifecycle_state_exception, 3100010,
                                   "already claimed" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( vesting_not_started_exception,        lifecycle_state_exception, 3100011,
                                   "vesting not started" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( vesting_not_complete_exception,       lifecycle_state_exception, 3100012,
                                   "vesting not complete" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_shares_to_claim_exception,         lifecycle_state_exception, 3100013,
                                   "no shares to claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_fees_to_claim_exception,           lifecycle_state_exception, 3100014,
                                   "no fees to claim" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( launch_not_empty_exception,           lifecycle_state_exception, 3100015,
                                   "launch still holds shares or base" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( operation_in_progress_exception,      lifecycle_state_exception, 3100016,
                                   "another operation on this launch is in progress" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( no_position_exception,                lifecycle_state_exception, 3100017,
                                   "account has no position in this launch" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( unauthorized_exception,         authorization_exception, 3200001, "unauthorized" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( not_creator_exception,          authorization_exception, 3200002,
                                   "caller is not the launch creator" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( slippage_exceeded_exception,    economic_exception, 3300001, "slippage exceeded" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_shares_exception,  economic_exception, 3300002, "insufficient shares" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( insufficient_funds_exception,   economic_exception, 3300003, "insufficient funds" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( seed_amount_too_low_exception,  economic_exception, 3300004, "seed amount too low" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( seed_amount_too_high_exception, economic_exception, 3300005, "seed amount too high" )

   FC_IMPLEMENT_DERIVED_EXCEPTION( price_unavailable_exception,    oracle_exception, 3400001, "price unavailable" )
   FC_IMPLEMENT_DERIVED_EXCEPTION( price_stale_exception,          oracle_exception, 3400002, "price is stale" )

} } // launchpad::chain
