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

#include <fc/uint128.hpp>

namespace launchpad { namespace protocol {

   /**
    * @brief Quadratic bonding curve pricing launch shares in base units
    *
    * The cost of minting @c d shares on top of an issued supply @c s is
    *
    *    cost = slope * ( (s+d)^2 - s^2 ) / ( 2 * scale )
    *
    * All intermediate values are 128 bit wide and every step is checked, an overflow throws
    * math_overflow_exception instead of wrapping. Results that do not fit a share_type throw as well.
    */
   class bonding_curve
   {
      public:
         bonding_curve() = default;
         bonding_curve( uint64_t slope, uint64_t scale );

         /// Cost in base units of @p shares_out new shares minted on top of @p current_supply
         share_type quote( share_type shares_out, share_type current_supply )const;

         /**
          * Shares obtained for @p base_amount, the floor inverse of quote():
          *
          *    s_new = isqrt( 2 * base_amount * scale / slope + s^2 ),  shares = s_new - s
          */
         share_type shares_for_amount( share_type base_amount, share_type current_supply )const;

         /**
          * Refund owed for selling @p shares_to_sell out of a position holding @p total_shares bought for
          * @p total_basis. The refund is proportional to the basis, never to the current curve price.
          */
         static share_type proportional_refund( share_type shares_to_sell, share_type total_shares,
                                                share_type total_basis );

         /// Floor of the square root
         static fc::uint128_t isqrt( const fc::uint128_t& n );

         uint64_t slope()const { return _slope; }
         uint64_t scale()const { return _scale; }

      private:
         uint64_t _slope = LAUNCHPAD_CURVE_SLOPE;
         uint64_t _scale = LAUNCHPAD_CURVE_SCALE;
   };

} } // launchpad::protocol
