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
#include <launchpad/chain/evaluator.hpp>

#include <launchpad/protocol/protocol_config.hpp>

namespace launchpad { namespace chain {

   class protocol_config_object;

   class protocol_initialize_evaluator : public evaluator<protocol_initialize_evaluator>
   {
      public:
         typedef protocol_initialize_operation operation_type;

         void_result do_evaluate( const protocol_initialize_operation& op );
         object_id_type do_apply( const protocol_initialize_operation& op );
   };

   class protocol_update_price_evaluator : public evaluator<protocol_update_price_evaluator>
   {
      public:
         typedef protocol_update_price_operation operation_type;

         void_result do_evaluate( const protocol_update_price_operation& op );
         void_result do_apply( const protocol_update_price_operation& op );

         const protocol_config_object* _config = nullptr;
   };

   class protocol_update_config_evaluator : public evaluator<protocol_update_config_evaluator>
   {
      public:
         typedef protocol_update_config_operation operation_type;

         void_result do_evaluate( const protocol_update_config_operation& op );
         void_result do_apply( const protocol_update_config_operation& op );

         const protocol_config_object* _config = nullptr;
   };

   class protocol_set_paused_evaluator : public evaluator<protocol_set_paused_evaluator>
   {
      public:
         typedef protocol_set_paused_operation operation_type;

         void_result do_evaluate( const protocol_set_paused_operation& op );
         void_result do_apply( const protocol_set_paused_operation& op );

         const protocol_config_object* _config = nullptr;
   };

} } // launchpad::chain
