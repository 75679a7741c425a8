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
#include <launchpad/protocol/asset.hpp>

namespace launchpad { namespace chain {
   using namespace launchpad::db;

   /**
    *  @brief Reserves of a pool held by simulated_pool_gateway
    *  @ingroup object
    *  @ingroup implementation
    *
    *  The pool lives in the object database so that it is rolled back together with the transaction
    *  that seeded or compounded it.
    */
   class simulated_pool_object : public abstract_object<simulated_pool_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_simulated_pool_object_type;

         string          name;
         launch_id_type  launch;
         asset           base_reserve;
         asset           token_reserve;
         share_type      lp_supply;
         /// Accrued by the market and not collected yet
         share_type      pending_yield;
   };

   struct by_pool_name;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      simulated_pool_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_pool_name>, member< simulated_pool_object, string, &simulated_pool_object::name > >
      >
   > simulated_pool_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<simulated_pool_object, simulated_pool_multi_index_type> simulated_pool_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE( launchpad::chain::simulated_pool_object )

FC_REFLECT_DERIVED( launchpad::chain::simulated_pool_object, (launchpad::db::object),
                    (name)(launch)(base_reserve)(token_reserve)(lp_supply)(pending_yield) )
