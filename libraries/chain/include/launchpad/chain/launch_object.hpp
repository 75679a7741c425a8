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
#include <launchpad/db/generic_index.hpp>

namespace launchpad { namespace chain {
   using namespace launchpad::db;

   enum class launch_status
   {
      active,
      graduated,
      refunding
   };

   /**
    *  @brief A token launch trading on the bonding curve
    *  @ingroup object
    *  @ingroup protocol
    *
    *  A launch starts active. It either graduates or enters refund mode, never both, and neither flag is
    *  ever cleared. A refunding launch is removed once every position has been drained.
    *
    *  The aggregates equal the sums over the live positions of the launch:
    *     total_shares      == sum( shares + locked_shares )
    *     total_base_amount == sum( basis + locked_basis )
    */
   class launch_object : public abstract_object<launch_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = launch_object_type;

         account_id_type            creator;
         string                     name;
         string                     symbol;
         string                     uri;
         uint64_t                   launch_number = 0;

         share_type                 total_shares;
         share_type                 total_base_amount;

         /// Creator seed bookkeeping
         /// @{
         share_type                 seed_shares;
         share_type                 seed_basis;
         share_type                 claimed_seed_shares;
         /// @}

         bool                       graduated = false;
         bool                       refund_mode = false;

         /// Set by graduation
         /// @{
         optional<asset_id_type>    token;
         optional<string>           pool;
         optional<vault_id_type>    vault;
         optional<time_point_sec>   vesting_start;
         share_type                 shares_at_graduation;
         /// @}

         time_point_sec             created_at;
         optional<time_point_sec>   graduated_at;
         optional<time_point_sec>   refund_enabled_at;

         /// Creator fees held in custody until claimed after graduation
         share_type                 creator_accrued_fees;
         /// Protocol fees forwarded to the treasury so far
         share_type                 protocol_accrued_fees;

         /// Base held on behalf of the positions plus the unclaimed creator fees
         share_type                 base_custody;
         /// Launch tokens kept for the holders after graduation
         share_type                 token_custody;
         share_type                 storage_deposit;

         bool                       operation_in_progress = false;

         launch_status status()const
         {
            if( graduated ) return launch_status::graduated;
            if( refund_mode ) return launch_status::refunding;
            return launch_status::active;
         }
         bool is_active()const { return status() == launch_status::active; }

         /// Seed shares that are still locked
         share_type unclaimed_seed_shares()const { return seed_shares - claimed_seed_shares; }
   };

   struct by_creator;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      launch_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_creator>,
            composite_key< launch_object,
               member< launch_object, account_id_type, &launch_object::creator >,
               member< object, object_id_type, &object::id >
            >
         >
      >
   > launch_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<launch_object, launch_multi_index_type> launch_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE( launchpad::chain::launch_object )

FC_REFLECT_ENUM( launchpad::chain::launch_status, (active)(graduated)(refunding) )

FC_REFLECT_DERIVED( launchpad::chain::launch_object, (launchpad::db::object),
                    (creator)
                    (name)
                    (symbol)
                    (uri)
                    (launch_number)
                    (total_shares)
                    (total_base_amount)
                    (seed_shares)
                    (seed_basis)
                    (claimed_seed_shares)
                    (graduated)
                    (refund_mode)
                    (token)
                    (pool)
                    (vault)
                    (vesting_start)
                    (shares_at_graduation)
                    (created_at)
                    (graduated_at)
                    (refund_enabled_at)
                    (creator_accrued_fees)
                    (protocol_accrued_fees)
                    (base_custody)
                    (token_custody)
                    (storage_deposit)
                    (operation_in_progress)
                  )
