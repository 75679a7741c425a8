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

   /**
    *  @brief Holds the liquidity pool shares of a graduated launch and accounts for their yield
    *  @ingroup object
    *  @ingroup protocol
    */
   class vault_object : public abstract_object<vault_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = vault_object_type;

         launch_id_type    launch;
         account_id_type   creator;
         string            pool;
         asset_id_type     lp_asset;
         share_type        lp_balance;
         bool              active = false;

         share_type        total_yield;
         share_type        total_caller_rewards;
         share_type        total_creator_rewards;
         share_type        total_protocol_rewards;
         share_type        total_compounded;

         time_point_sec    last_poke_at;
         uint64_t          poke_count = 0;
   };

   struct by_launch;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      vault_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_launch>, member< vault_object, launch_id_type, &vault_object::launch > >
      >
   > vault_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<vault_object, vault_multi_index_type> vault_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE( launchpad::chain::vault_object )

FC_REFLECT_DERIVED( launchpad::chain::vault_object, (launchpad::db::object),
                    (launch)
                    (creator)
                    (pool)
                    (lp_asset)
                    (lp_balance)
                    (active)
                    (total_yield)
                    (total_caller_rewards)
                    (total_creator_rewards)
                    (total_protocol_rewards)
                    (total_compounded)
                    (last_poke_at)
                    (poke_count)
                  )
