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
#include <launchpad/protocol/curve.hpp>
#include <launchpad/protocol/exceptions.hpp>

#include <limits>

namespace launchpad { namespace protocol {

namespace {

   using fc::uint128_t;

   uint128_t checked_add( const uint128_t& a, const uint128_t& b )
   {
      LAUNCHPAD_ASSERT( a <= std::numeric_limits<uint128_t>::max() - b, math_overflow_exception,
                        "Curve addition overflows", ("step","add") );
      return a + b;
   }

   uint128_t checked_sub( const uint128_t& a, const uint128_t& b )
   {
      LAUNCHPAD_ASSERT( a >= b, math_overflow_exception, "Curve subtraction underflows", ("step","sub") );
      return a - b;
   }

   uint128_t checked_mul( const uint128_t& a, const uint128_t& b )
   {
      if( a == 0 || b == 0 )
         return 0;
      LAUNCHPAD_ASSERT( a <= std::numeric_limits<uint128_t>::max() / b, math_overflow_exception,
                        "Curve multiplication overflows", ("step","mul") );
      return a * b;
   }

   uint128_t checked_div( const uint128_t& a, const uint128_t& b )
   {
      LAUNCHPAD_ASSERT( b != 0, invalid_calculation_exception, "Curve division by zero", ("step","div") );
      return a / b;
   }

   uint128_t to_wide( share_type v )
   {
      LAUNCHPAD_ASSERT( v >= 0, invalid_calculation_exception, "Curve input must not be negative", ("value",v) );
      return uint128_t( v.value );
   }

   share_type to_share( const uint128_t& v )
   {
      LAUNCHPAD_ASSERT( v <= uint128_t( std::numeric_limits<int64_t>::max() ), math_overflow_exception,
                        "Curve result does not fit in a share amount", ("step","narrow") );
      return static_cast<int64_t>( v );
   }

} // anonymous namespace

bonding_curve::bonding_curve( uint64_t slope, uint64_t scale )
   : _slope( slope ), _scale( scale )
{
   FC_ASSERT( slope > 0 && scale > 0, "Curve parameters must be positive", ("slope",slope)("scale",scale) );
}

share_type bonding_curve::quote( share_type shares_out, share_type current_supply )const
{ try {
   if( shares_out == 0 )
      return 0;

   const uint128_t s     = to_wide( current_supply );
   const uint128_t s_new = checked_add( s, to_wide( shares_out ) );
   const uint128_t delta = checked_sub( checked_mul( s_new, s_new ), checked_mul( s, s ) );

   const uint128_t numerator   = checked_mul( uint128_t( _slope ), delta );
   const uint128_t denominator = checked_mul( uint128_t( 2 ), uint128_t( _scale ) );
   return to_share( checked_div( numerator, denominator ) );
} FC_CAPTURE_AND_RETHROW( (shares_out)(current_supply) ) }

share_type bonding_curve::shares_for_amount( share_type base_amount, share_type current_supply )const
{ try {
   if( base_amount == 0 )
      return 0;

   const uint128_t s = to_wide( current_supply );
   const uint128_t scaled = checked_div( checked_mul( checked_mul( uint128_t( 2 ), to_wide( base_amount ) ),
                                                      uint128_t( _scale ) ),
                                         uint128_t( _slope ) );
   const uint128_t s_new = isqrt( checked_add( scaled, checked_mul( s, s ) ) );
   return to_share( checked_sub( s_new, s ) );
} FC_CAPTURE_AND_RETHROW( (base_amount)(current_supply) ) }

share_type bonding_curve::proportional_refund( share_type shares_to_sell, share_type total_shares,
                                               share_type total_basis )
{ try {
   LAUNCHPAD_ASSERT( total_shares > 0, invalid_calculation_exception,
                     "Refund requested from a position without shares", ("total_shares",total_shares) );
   const uint128_t product = checked_mul( to_wide( shares_to_sell ), to_wide( total_basis ) );
   return to_share( checked_div( product, to_wide( total_shares ) ) );
} FC_CAPTURE_AND_RETHROW( (shares_to_sell)(total_shares)(total_basis) ) }

uint128_t bonding_curve::isqrt( const uint128_t& n )
{
   if( n < 2 )
      return n;

   // start from 2^ceil(bits/2), which is never below the root and keeps x + n/x within 65 bits
   uint32_t bits = 0;
   for( uint128_t t = n; t > 0; t >>= 1 )
      ++bits;
   uint128_t x = uint128_t( 1 ) << ( ( bits + 1 ) / 2 );

   while( true )
   {
      const uint128_t y = ( x + n / x ) >> 1;
      if( y >= x )
         return x;
      x = y;
   }
}

} } // launchpad::protocol
