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

#include <launchpad/protocol/fee_policy.hpp>
#include <launchpad/protocol/launch.hpp>

namespace launchpad { namespace chain {

   class launch_object;
   class position_object;
   class protocol_config_object;

   class launch_create_evaluator : public evaluator<launch_create_evaluator>
   {
      public:
         typedef launch_create_operation operation_type;

         void_result do_evaluate( const launch_create_operation& op );
         object_id_type do_apply( const launch_create_operation& op );

         const protocol_config_object* _config = nullptr;
         share_type _fee;
         share_type _net;
         share_type _seed_shares;
         share_type _launch_deposit;
         share_type _position_deposit;
   };

   class launch_buy_evaluator : public evaluator<launch_buy_evaluator>
   {
      public:
         typedef launch_buy_operation operation_type;

         void_result do_evaluate( const launch_buy_operation& op );
         share_type do_apply( const launch_buy_operation& op );

         const protocol_config_object* _config = nullptr;
         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
         fee_split _fees;
         share_type _shares;
         share_type _position_deposit;
   };

   class launch_sell_evaluator : public evaluator<launch_sell_evaluator>
   {
      public:
         typedef launch_sell_operation operation_type;

         void_result do_evaluate( const launch_sell_operation& op );
         share_type do_apply( const launch_sell_operation& op );

         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
         share_type _refund;
   };

   /**
    * Both graduation paths share the checks and the state transition, only the required signer differs.
    */
   class launch_graduate_evaluator : public evaluator<launch_graduate_evaluator>
   {
      public:
         typedef launch_graduate_operation operation_type;

         void_result do_evaluate( const launch_graduate_operation& op );
         object_id_type do_apply( const launch_graduate_operation& op );

         const launch_object* _launch = nullptr;
   };

   class launch_force_graduate_evaluator : public evaluator<launch_force_graduate_evaluator>
   {
      public:
         typedef launch_force_graduate_operation operation_type;

         void_result do_evaluate( const launch_force_graduate_operation& op );
         object_id_type do_apply( const launch_force_graduate_operation& op );

         const launch_object* _launch = nullptr;
   };

   class launch_enable_refund_evaluator : public evaluator<launch_enable_refund_evaluator>
   {
      public:
         typedef launch_enable_refund_operation operation_type;

         void_result do_evaluate( const launch_enable_refund_operation& op );
         void_result do_apply( const launch_enable_refund_operation& op );

         const launch_object* _launch = nullptr;
   };

   class launch_claim_refund_evaluator : public evaluator<launch_claim_refund_evaluator>
   {
      public:
         typedef launch_claim_refund_operation operation_type;

         void_result do_evaluate( const launch_claim_refund_operation& op );
         share_type do_apply( const launch_claim_refund_operation& op );

         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
   };

   class launch_push_refund_evaluator : public evaluator<launch_push_refund_evaluator>
   {
      public:
         typedef launch_push_refund_operation operation_type;

         void_result do_evaluate( const launch_push_refund_operation& op );
         share_type do_apply( const launch_push_refund_operation& op );

         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
   };

   class launch_close_evaluator : public evaluator<launch_close_evaluator>
   {
      public:
         typedef launch_close_operation operation_type;

         void_result do_evaluate( const launch_close_operation& op );
         void_result do_apply( const launch_close_operation& op );

         const launch_object* _launch = nullptr;
   };

} } // launchpad::chain
