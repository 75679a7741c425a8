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
#include <launchpad/chain/position_ledger.hpp>
#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>

namespace launchpad { namespace chain {

namespace {

   share_type checked_decrement( share_type value, share_type amount, const char* what )
   {
      LAUNCHPAD_ASSERT( amount >= 0 && value >= amount, math_overflow_exception,
                        "Decrementing ${what} below zero", ("what",what)("value",value)("amount",amount) );
      return value - amount;
   }

}

const position_object& position_ledger::open( const launch_object& launch, account_id_type owner,
                                              share_type storage_deposit )
{ try {
   FC_ASSERT( _db.find_position( launch.get_id(), owner ) == nullptr, "Position already exists" );
   const time_point_sec now = _db.head_time();
   return _db.create<position_object>( [&]( position_object& p ) {
      p.launch = launch.get_id();
      p.owner = owner;
      p.storage_deposit = storage_deposit;
      p.first_buy_at = now;
      p.last_updated_at = now;
   });
} FC_CAPTURE_AND_RETHROW( (launch.id)(owner) ) }

void position_ledger::credit( const launch_object& launch, const position_object& position,
                              share_type shares, share_type basis )
{ try {
   FC_ASSERT( position.launch == launch.get_id(), "Position belongs to another launch" );
   FC_ASSERT( shares >= 0 && basis >= 0 );

   const share_type new_shares = position.shares + shares;
   const share_type new_basis = position.basis + basis;
   const share_type new_total_shares = launch.total_shares + shares;
   const share_type new_total_base = launch.total_base_amount + basis;

   const time_point_sec now = _db.head_time();
   _db.modify( position, [&]( position_object& p ) {
      p.shares = new_shares;
      p.basis = new_basis;
      p.last_updated_at = now;
   });
   _db.modify( launch, [&]( launch_object& l ) {
      l.total_shares = new_total_shares;
      l.total_base_amount = new_total_base;
   });
} FC_CAPTURE_AND_RETHROW( (position.id)(shares)(basis) ) }

void position_ledger::debit( const launch_object& launch, const position_object& position,
                             share_type shares, share_type basis )
{ try {
   FC_ASSERT( position.launch == launch.get_id(), "Position belongs to another launch" );

   const share_type new_shares = checked_decrement( position.shares, shares, "position shares" );
   const share_type new_basis = checked_decrement( position.basis, basis, "position basis" );
   const share_type new_total_shares = checked_decrement( launch.total_shares, shares, "launch shares" );
   const share_type new_total_base = checked_decrement( launch.total_base_amount, basis, "launch base amount" );

   const time_point_sec now = _db.head_time();
   _db.modify( position, [&]( position_object& p ) {
      p.shares = new_shares;
      p.basis = new_basis;
      p.last_updated_at = now;
   });
   _db.modify( launch, [&]( launch_object& l ) {
      l.total_shares = new_total_shares;
      l.total_base_amount = new_total_base;
   });
} FC_CAPTURE_AND_RETHROW( (position.id)(shares)(basis) ) }

void position_ledger::lock_seed( const launch_object& launch, const position_object& position,
                                 share_type shares, share_type basis )
{ try {
   FC_ASSERT( position.launch == launch.get_id() && position.owner == launch.creator,
              "Only the creator's position holds seed shares" );
   FC_ASSERT( shares >= 0 && basis >= 0 );

   const share_type new_locked_shares = position.locked_shares + shares;
   const share_type new_locked_basis = position.locked_basis + basis;
   const share_type new_total_shares = launch.total_shares + shares;
   const share_type new_total_base = launch.total_base_amount + basis;

   _db.modify( position, [&]( position_object& p ) {
      p.locked_shares = new_locked_shares;
      p.locked_basis = new_locked_basis;
   });
   _db.modify( launch, [&]( launch_object& l ) {
      l.total_shares = new_total_shares;
      l.total_base_amount = new_total_base;
   });
} FC_CAPTURE_AND_RETHROW( (position.id)(shares)(basis) ) }

void position_ledger::unlock_vested( const launch_object& launch, const position_object& position, share_type shares )
{ try {
   FC_ASSERT( position.launch == launch.get_id() && position.owner == launch.creator,
              "Only the creator's position holds seed shares" );

   const share_type new_locked = checked_decrement( position.locked_shares, shares, "locked shares" );
   const share_type new_shares = position.shares + shares;
   const share_type new_vested_claimed = position.vested_claimed + shares;
   const share_type new_claimed_seed = launch.claimed_seed_shares + shares;
   FC_ASSERT( new_claimed_seed <= launch.seed_shares, "Unlocking more than the seed" );

   const time_point_sec now = _db.head_time();
   _db.modify( position, [&]( position_object& p ) {
      p.locked_shares = new_locked;
      p.shares = new_shares;
      p.vested_claimed = new_vested_claimed;
      p.last_updated_at = now;
   });
   _db.modify( launch, [&]( launch_object& l ) {
      l.claimed_seed_shares = new_claimed_seed;
   });
} FC_CAPTURE_AND_RETHROW( (position.id)(shares) ) }

drained_position position_ledger::drain( const launch_object& launch, const position_object& position )
{ try {
   FC_ASSERT( position.launch == launch.get_id(), "Position belongs to another launch" );

   drained_position result;
   result.shares = position.total_shares();
   result.basis = position.total_basis();

   const share_type new_total_shares = checked_decrement( launch.total_shares, result.shares, "launch shares" );
   const share_type new_total_base = checked_decrement( launch.total_base_amount, result.basis, "launch base amount" );

   const time_point_sec now = _db.head_time();
   _db.modify( position, [now]( position_object& p ) {
      p.shares = 0;
      p.basis = 0;
      p.locked_shares = 0;
      p.locked_basis = 0;
      p.claimed_refund = true;
      p.last_updated_at = now;
   });
   _db.modify( launch, [&]( launch_object& l ) {
      l.total_shares = new_total_shares;
      l.total_base_amount = new_total_base;
   });
   return result;
} FC_CAPTURE_AND_RETHROW( (position.id) ) }

share_type position_ledger::close( const position_object& position )
{
   const share_type deposit = position.storage_deposit;
   _db.remove( position );
   return deposit;
}

} } // launchpad::chain
