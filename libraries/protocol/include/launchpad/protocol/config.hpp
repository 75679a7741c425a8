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

#define LAUNCHPAD_SYMBOL                                 "BASE"
#define LAUNCHPAD_BASE_PRECISION_DIGITS                  9
#define LAUNCHPAD_BASE_PRECISION                         (int64_t(1000000000))

/// Owns nothing and authorizes nothing, it is the default value of every account field
#define LAUNCHPAD_NULL_ACCOUNT                           (launchpad::protocol::account_id_type(0))

#define LAUNCHPAD_MAX_SHARE_SUPPLY                       (int64_t(0x7fffffffffffffff))
#define LAUNCHPAD_100_PERCENT                            10000
#define LAUNCHPAD_1_PERCENT                              (LAUNCHPAD_100_PERCENT/100)

/** @name Metadata limits */
///@{
#define LAUNCHPAD_MAX_NAME_LENGTH                        50
#define LAUNCHPAD_MAX_SYMBOL_LENGTH                      10
#define LAUNCHPAD_MAX_URI_LENGTH                         200
///@}

/** @name USD denominated limits, converted to base units with the current price */
///@{
#define LAUNCHPAD_GRADUATION_MARKET_CAP_USD              42000
#define LAUNCHPAD_MIN_SEED_USD                           40
#define LAUNCHPAD_MAX_SEED_USD                           20000
#define LAUNCHPAD_GRADUATION_NOTIFICATION_BPS            9500
///@}

/** @name Launch token supply, with 9 decimals */
///@{
#define LAUNCHPAD_TOKEN_PRECISION_DIGITS                 9
#define LAUNCHPAD_TOKEN_PRECISION                        (int64_t(1000000000))
#define LAUNCHPAD_TOKENS_FOR_HOLDERS                     (int64_t(800000000) * LAUNCHPAD_TOKEN_PRECISION)
#define LAUNCHPAD_TOKENS_FOR_LP                          (int64_t(200000000) * LAUNCHPAD_TOKEN_PRECISION)
#define LAUNCHPAD_TOKEN_TOTAL_SUPPLY                     (LAUNCHPAD_TOKENS_FOR_HOLDERS + LAUNCHPAD_TOKENS_FOR_LP)
///@}

/** @name Fees, in basis points of the gross amount */
///@{
#define LAUNCHPAD_TOTAL_FEE_BPS                          100
#define LAUNCHPAD_CREATOR_FEE_UNVERIFIED_BPS             30
#define LAUNCHPAD_CREATOR_FEE_VERIFIED_BPS               50
///@}

/** @name Yield split applied by poke, the compounded part is the remainder */
///@{
#define LAUNCHPAD_YIELD_CALLER_BPS                       100
#define LAUNCHPAD_YIELD_CREATOR_BPS                      6000
#define LAUNCHPAD_YIELD_PROTOCOL_BPS                     1000
///@}

#define LAUNCHPAD_VESTING_DURATION_SECONDS               (42*24*60*60)
#define LAUNCHPAD_LAUNCH_DURATION_SECONDS                (7*24*60*60)
#define LAUNCHPAD_MAX_PRICE_STALENESS_SECONDS            300

/// Whale protection, the largest gross amount accepted by a single buy
#define LAUNCHPAD_MAX_BUY_AMOUNT                         (int64_t(1000) * LAUNCHPAD_BASE_PRECISION)

/** @name Graduation gates, enforced by the operator before it submits a graduation */
///@{
#define LAUNCHPAD_GRADUATION_MIN_HOLDERS                 100
#define LAUNCHPAD_GRADUATION_MAX_CONCENTRATION_BPS       1000
///@}

/** @name Bonding curve: cost = slope * (s_new^2 - s^2) / (2 * scale) */
///@{
#define LAUNCHPAD_CURVE_SLOPE                            uint64_t(781250)
#define LAUNCHPAD_CURVE_SCALE                            uint64_t(1000000000000ull)
///@}

/** @name Default storage deposits, paid when the object is created and refunded when it is removed */
///@{
#define LAUNCHPAD_DEFAULT_LAUNCH_STORAGE_DEPOSIT         (int64_t(3000000))
#define LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT       (int64_t(1500000))
///@}

/// Committed transactions kept in the undo history
#define LAUNCHPAD_MAX_UNDO_HISTORY                       1024

/// Nesting limit when converting objects to and from variants
#define LAUNCHPAD_MAX_NESTED_OBJECTS                     (200)
