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
#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>

#include <fc/uint128.hpp>

#include <limits>

namespace launchpad { namespace chain {

optional<uint64_t> database::check_price( bool throw_if_unusable )const
{
   price_reading reading;
   if( _price_feed )
      reading = _price_feed->latest();
   else if( const protocol_config_object* config = find_protocol_config() )
   {
      reading.price_usd = config->price_usd;
      reading.published_at = config->price_updated_at;
   }

   if( reading.price_usd == 0 )
   {
      wlog( "Rejected price read: no price published" );
      if( throw_if_unusable )
         FC_THROW_EXCEPTION( price_unavailable_exception, "No USD price is available", ("external_feed",bool(_price_feed)) );
      return optional<uint64_t>();
   }

   const time_point_sec now = head_time();
   if( now > reading.published_at + LAUNCHPAD_MAX_PRICE_STALENESS_SECONDS )
   {
      wlog( "Rejected price read: published at ${p}, now ${n}", ("p",reading.published_at)("n",now) );
      if( throw_if_unusable )
         FC_THROW_EXCEPTION( price_stale_exception, "USD price is older than ${s} seconds",
                             ("s",LAUNCHPAD_MAX_PRICE_STALENESS_SECONDS)("published_at",reading.published_at)("now",now) );
      return optional<uint64_t>();
   }

   return reading.price_usd;
}

uint64_t database::get_current_price()const
{
   return *check_price( true );
}

optional<uint64_t> database::try_get_current_price()const
{
   return check_price( false );
}

share_type database::usd_to_base( uint64_t usd, uint64_t price_usd )
{
   LAUNCHPAD_ASSERT( price_usd > 0, price_unavailable_exception, "No USD price is available", ("usd",usd) );
   const fc::uint128_t base = fc::uint128_t( usd ) * LAUNCHPAD_BASE_PRECISION / price_usd;
   LAUNCHPAD_ASSERT( base <= fc::uint128_t( std::numeric_limits<int64_t>::max() ), math_overflow_exception,
                     "USD amount does not fit in base units", ("usd",usd)("price_usd",price_usd) );
   return static_cast<int64_t>( base );
}

uint64_t database::market_cap_usd( share_type base_amount, uint64_t price_usd )
{
   FC_ASSERT( base_amount >= 0, "Negative base amount" );
   const fc::uint128_t usd = fc::uint128_t( base_amount.value ) * price_usd / LAUNCHPAD_BASE_PRECISION;
   LAUNCHPAD_ASSERT( usd <= fc::uint128_t( std::numeric_limits<uint64_t>::max() ), math_overflow_exception,
                     "Market cap overflows", ("base_amount",base_amount)("price_usd",price_usd) );
   return static_cast<uint64_t>( usd );
}

} }
