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
#include <launchpad/protocol/asset.hpp>

namespace launchpad { namespace chain {

   /**
    * A USD price for one whole base unit and the time it was published
    */
   struct price_reading
   {
      uint64_t        price_usd = 0;
      time_point_sec  published_at;
   };

   /**
    * @brief Source of the USD price of the base currency
    *
    * When a feed is installed on the database it takes precedence over the price cached in the
    * protocol configuration. Staleness is judged by the database against its own clock.
    */
   class price_feed
   {
      public:
         virtual ~price_feed() = default;
         virtual price_reading latest()const = 0;
   };

   /// A feed whose reading is set by hand
   class fixed_price_feed : public price_feed
   {
      public:
         fixed_price_feed() = default;
         fixed_price_feed( uint64_t price_usd, time_point_sec published_at );

         price_reading latest()const override { return _reading; }
         void          publish( uint64_t price_usd, time_point_sec published_at );

      private:
         price_reading _reading;
   };

   struct pool_creation_result
   {
      string      pool;
      share_type  lp_shares;
   };

   /**
    * @brief The external market maker seeded at graduation
    *
    * Graduation hands over the base accumulated by a launch together with the liquidity share of its
    * token. Poke later collects the yield of the position and reinvests part of it.
    */
   class liquidity_pool_gateway
   {
      public:
         virtual ~liquidity_pool_gateway() = default;

         virtual pool_creation_result create_pool( launch_id_type launch, const asset& base, const asset& tokens ) = 0;
         /// Withdraws the yield accrued since the last collection, in base units
         virtual share_type collect_yield( const string& pool ) = 0;
         /// Adds base liquidity back to the pool and returns the pool shares minted for it
         virtual share_type compound( const string& pool, share_type base_amount ) = 0;
   };

   class database;
   class simulated_pool_object;

   /**
    * @brief An in-process constant product pool, the default gateway
    *
    * Creating a pool mints isqrt(base * tokens) shares. Yield is whatever accrue_yield() has added.
    * The pools are simulated_pool_objects of the database, so a failed transaction rolls them back.
    */
   class simulated_pool_gateway : public liquidity_pool_gateway
   {
      public:
         explicit simulated_pool_gateway( database& db ) : _db( db ) {}

         pool_creation_result create_pool( launch_id_type launch, const asset& base, const asset& tokens ) override;
         share_type           collect_yield( const string& pool ) override;
         share_type           compound( const string& pool, share_type base_amount ) override;

         void                         accrue_yield( const string& pool, share_type amount );
         const simulated_pool_object& get_pool( const string& pool )const;
         const simulated_pool_object* find_pool( const string& pool )const;

      private:
         database& _db;
   };

} } // launchpad::chain

FC_REFLECT( launchpad::chain::price_reading, (price_usd)(published_at) )
FC_REFLECT( launchpad::chain::pool_creation_result, (pool)(lp_shares) )
