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
    * @class protocol_config_object
    * @brief The runtime configuration of the protocol
    * @ingroup object
    * @ingroup implementation
    *
    * There is at most one instance, 2.0.0, created by protocol_initialize_operation or from the genesis
    * state. It is only changed by operations signed by the authority, or the operator for the price.
    */
   class protocol_config_object : public abstract_object<protocol_config_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_protocol_config_object_type;

         account_id_type   authority;
         account_id_type   operator_account;
         account_id_type   protocol_fee_account;
         account_id_type   vault_protocol_account;
         share_type        min_seed_amount;

         uint64_t          price_usd = 0;        ///< USD per whole base unit, 0 until published
         time_point_sec    price_updated_at;

         bool              paused = false;
         uint64_t          total_launches = 0;

         bool is_operator( account_id_type a )const { return a == operator_account || a == authority; }
   };

   /**
    * @class dynamic_global_property_object
    * @brief Maintains global state that changes with time and with the creation of objects
    * @ingroup object
    * @ingroup implementation
    *
    * The host ledger advances the clock, operations read it.
    */
   class dynamic_global_property_object : public abstract_object<dynamic_global_property_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_dynamic_global_property_object_type;

         time_point_sec    time;
         share_type        launch_storage_deposit   = LAUNCHPAD_DEFAULT_LAUNCH_STORAGE_DEPOSIT;
         share_type        position_storage_deposit = LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT;
         uint64_t          applied_transactions = 0;
   };

   typedef multi_index_container<
      protocol_config_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > protocol_config_multi_index_type;
   typedef generic_index<protocol_config_object, protocol_config_multi_index_type> protocol_config_index;

   typedef multi_index_container<
      dynamic_global_property_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >
      >
   > dynamic_global_property_multi_index_type;
   typedef generic_index<dynamic_global_property_object, dynamic_global_property_multi_index_type>
           dynamic_global_property_index;

}}

MAP_OBJECT_ID_TO_TYPE(launchpad::chain::protocol_config_object)
MAP_OBJECT_ID_TO_TYPE(launchpad::chain::dynamic_global_property_object)

FC_REFLECT_DERIVED( launchpad::chain::protocol_config_object, (launchpad::db::object),
                    (authority)
                    (operator_account)
                    (protocol_fee_account)
                    (vault_protocol_account)
                    (min_seed_amount)
                    (price_usd)
                    (price_updated_at)
                    (paused)
                    (total_launches)
                  )

FC_REFLECT_DERIVED( launchpad::chain::dynamic_global_property_object, (launchpad::db::object),
                    (time)
                    (launch_storage_deposit)
                    (position_storage_deposit)
                    (applied_transactions)
                  )
