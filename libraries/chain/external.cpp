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
#include <launchpad/chain/external.hpp>
#include <launchpad/chain/database.hpp>
#include <launchpad/chain/simulated_pool_object.hpp>
#include <launchpad/protocol/curve.hpp>
#include <launchpad/protocol/exceptions.hpp>

#include <fc/uint128.hpp>

namespace launchpad { namespace chain {

fixed_price_feed::fixed_price_feed( uint64_t price_usd, time_point_sec published_at )
{
   publish( price_usd, published_at );
}

void fixed_price_feed::publish( uint64_t price_usd, time_point_sec published_at )
{
   _reading.price_usd = price_usd;
   _reading.published_at = published_at;
}

pool_creation_result simulated_pool_gateway::create_pool( launch_id_type launch, const asset& base,
                                                          const asset& tokens )
{ try {
   FC_ASSERT( base.amount > 0 && tokens.amount > 0, "Pool reserves must be positive" );

   pool_creation_result result;
   result.pool = "pool-" + std::string( object_id_type( launch ) );
   FC_ASSERT( find_pool( result.pool ) == nullptr, "Pool ${p} already exists", ("p",result.pool) );

   const fc::uint128_t product = fc::uint128_t( base.amount.value ) * tokens.amount.value;
   result.lp_shares = static_cast<int64_t>( bonding_curve::isqrt( product ) );

   _db.create<simulated_pool_object>( [&]( simulated_pool_object& p ) {
      p.name          = result.pool;
      p.launch        = launch;
      p.base_reserve  = base;
      p.token_reserve = tokens;
      p.lp_supply     = result.lp_shares;
   });
   return result;
} FC_CAPTURE_AND_RETHROW( (launch)(base)(tokens) ) }

share_type simulated_pool_gateway::collect_yield( const string& pool )
{ try {
   const simulated_pool_object& state = get_pool( pool );
   const share_type collected = state.pending_yield;
   _db.modify( state, []( simulated_pool_object& p ) {
      p.pending_yield = 0;
   });
   return collected;
} FC_CAPTURE_AND_RETHROW( (pool) ) }

share_type simulated_pool_gateway::compound( const string& pool, share_type base_amount )
{ try {
   FC_ASSERT( base_amount >= 0, "Cannot compound a negative amount" );
   const simulated_pool_object& state = get_pool( pool );
   if( base_amount == 0 )
      return 0;

   const fc::uint128_t minted = fc::uint128_t( state.lp_supply.value ) * base_amount.value
                                / state.base_reserve.amount.value;
   LAUNCHPAD_ASSERT( minted <= fc::uint128_t( LAUNCHPAD_MAX_SHARE_SUPPLY ), protocol::math_overflow_exception,
                     "Pool share supply overflows", ("pool",pool)("amount",base_amount) );
   const share_type new_shares = static_cast<int64_t>( minted );
   _db.modify( state, [base_amount, new_shares]( simulated_pool_object& p ) {
      p.base_reserve.amount += base_amount;
      p.lp_supply += new_shares;
   });
   return new_shares;
} FC_CAPTURE_AND_RETHROW( (pool)(base_amount) ) }

void simulated_pool_gateway::accrue_yield( const string& pool, share_type amount )
{ try {
   FC_ASSERT( amount >= 0, "Yield cannot be negative" );
   _db.modify( get_pool( pool ), [amount]( simulated_pool_object& p ) {
      p.pending_yield += amount;
   });
} FC_CAPTURE_AND_RETHROW( (pool)(amount) ) }

const simulated_pool_object* simulated_pool_gateway::find_pool( const string& pool )const
{
   const auto& idx = _db.get_index_type<simulated_pool_index>().indices().get<by_pool_name>();
   auto itr = idx.find( pool );
   return itr == idx.end() ? nullptr : &*itr;
}

const simulated_pool_object& simulated_pool_gateway::get_pool( const string& pool )const
{
   const simulated_pool_object* state = find_pool( pool );
   FC_ASSERT( state != nullptr, "Unknown pool ${p}", ("p",pool) );
   return *state;
}

} } // launchpad::chain
