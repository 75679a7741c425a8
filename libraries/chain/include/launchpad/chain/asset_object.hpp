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
#include <launchpad/db/generic_index.hpp>

namespace launchpad { namespace chain {
   using namespace launchpad::db;

   /**
    * @brief An asset held in account balances
    * @ingroup object
    * @ingroup protocol
    *
    * The base currency is 1.3.0. Every graduation creates two more: the launch token, with its fixed
    * supply, and the share asset of the liquidity pool it seeds.
    */
   class asset_object : public abstract_object<asset_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = asset_object_type;

         string                    symbol;
         uint8_t                   precision = 0;
         /// The launch that minted this asset, unset for the base currency
         optional<launch_id_type>  launch;
         share_type                current_supply;

         asset amount(share_type a)const { return asset(a, get_id()); }
   };

   struct by_symbol;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      asset_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_non_unique< tag<by_symbol>, member<asset_object, string, &asset_object::symbol> >
      >
   > asset_object_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<asset_object, asset_object_multi_index_type> asset_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE(launchpad::chain::asset_object)

FC_REFLECT_DERIVED( launchpad::chain::asset_object, (launchpad::db::object),
                    (symbol)(precision)(launch)(current_supply) )
