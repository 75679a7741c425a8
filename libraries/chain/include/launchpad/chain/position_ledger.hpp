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

#include <launchpad/chain/launch_object.hpp>
#include <launchpad/chain/position_object.hpp>

namespace launchpad { namespace chain {

   class database;

   /// What a drained position held
   struct drained_position
   {
      share_type shares;   ///< shares + locked_shares
      share_type basis;    ///< basis + locked_basis
   };

   /**
    * @brief Keeps positions and the aggregates of their launch in lockstep
    *
    * Every change to a position's shares or basis goes through here together with the same change to
    * launch_object::total_shares and launch_object::total_base_amount. Overflows and decrements below zero
    * throw math_overflow_exception before anything is written.
    */
   class position_ledger
   {
      public:
         explicit position_ledger( database& db ) : _db( db ) {}

         const position_object& open( const launch_object& launch, account_id_type owner, share_type storage_deposit );

         /// Shares bought for basis
         void credit( const launch_object& launch, const position_object& position,
                      share_type shares, share_type basis );
         /// Shares sold for a refund of basis
         void debit( const launch_object& launch, const position_object& position,
                     share_type shares, share_type basis );
         /// The creator's seed, held in the locked buckets
         void lock_seed( const launch_object& launch, const position_object& position,
                         share_type shares, share_type basis );
         /// Moves vested seed shares from the locked bucket to the free one
         void unlock_vested( const launch_object& launch, const position_object& position, share_type shares );

         /// Empties every bucket of a refunded position and marks it claimed
         drained_position drain( const launch_object& launch, const position_object& position );

         /// Removes the position, returning its storage deposit
         share_type close( const position_object& position );

      private:
         database& _db;
   };

} } // launchpad::chain

FC_REFLECT( launchpad::chain::drained_position, (shares)(basis) )
