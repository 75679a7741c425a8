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
    * @class creator_stats_object
    * @ingroup object
    * @ingroup implementation
    *
    * Lifetime statistics of a launch creator, created with the creator's first launch.
    */
   class creator_stats_object : public abstract_object<creator_stats_object>
   {
      public:
         static constexpr uint8_t space_id = implementation_ids;
         static constexpr uint8_t type_id  = impl_creator_stats_object_type;

         account_id_type   creator;
         uint32_t          graduation_count = 0;
         share_type        total_fees_earned;
         uint32_t          launch_count = 0;

         /// Creators with a graduated launch earn the verified fee tier
         bool is_verified()const { return graduation_count > 0; }
   };

   struct by_creator;

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      creator_stats_object,
      indexed_by<
         ordered_unique< tag<by_id>, member< object, object_id_type, &object::id > >,
         ordered_unique< tag<by_creator>,
                         member< creator_stats_object, account_id_type, &creator_stats_object::creator > >
      >
   > creator_stats_multi_index_type;

   /**
    * @ingroup object_index
    */
   typedef generic_index<creator_stats_object, creator_stats_multi_index_type> creator_stats_index;

} } // launchpad::chain

MAP_OBJECT_ID_TO_TYPE( launchpad::chain::creator_stats_object )

FC_REFLECT_DERIVED( launchpad::chain::creator_stats_object, (launchpad::db::object),
                    (creator)(graduation_count)(total_fees_earned)(launch_count) )
