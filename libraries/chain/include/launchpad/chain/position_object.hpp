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
    *  @brief The shares and basis one account holds in one launch
    *  @ingroup object
    *  @ingroup protocol
    *
    *  Only the creator's position has locked shares, they are the seed shares that have not vested yet.
    *  The seed deposit is tracked as locked_basis so that it can be refunded like any other basis.
    */
   class position_object : public abstract_object<position_object>
   {
      public:
         static constexpr uint8_t space_id = protocol_ids;
         static constexpr uint8_t type_id  = position_object_type;

         launch_id_type    launch;
         account_id_type   owner;

         share_type        shares;
         share_type        basis;
         share_type        locked_shares;
         share_type        locked_basis;
         share_type        vested_claimed;

         /// Set by a refund claim, the position stays until the launch is closed
         bool              claimed_refund = false;

         share_type        storage_deposit;
         time_point_sec    first_buy_at;
         time_point_sec    last_updated_at;

         share_type total_shares()const { return shares + locked_shares; }
         share_type total_basis()const { return basis + locked_basis; }
   };

   struct by_launch_owner;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      position_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_launch_owner>,
            composite_key< position_object,
               member< position_object, launch_id_type, &position_object::launch >,
               member< position_object, account_id_type, &position_object::owner >
            >
         >
      >
   > position_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<position_object, position_multi_index_type> position_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE( launchpad::chain::position_object )

FC_REFLECT_DERIVED( launchpad::chain::position_object, (launchpad::db::object),
                    (launch)
                    (owner)
                    (shares)
                    (basis)
                    (locked_shares)
                    (locked_basis)
                    (vested_claimed)
                    (claimed_refund)
                    (storage_deposit)
                    (first_buy_at)
                    (last_updated_at)
                  )
