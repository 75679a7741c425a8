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
#include <launchpad/chain/vesting.hpp>

#include <launchpad/protocol/distribution.hpp>

namespace launchpad { namespace chain {

   class launch_object;
   class position_object;
   class vault_object;
   class protocol_config_object;

   class launch_claim_tokens_evaluator : public evaluator<launch_claim_tokens_evaluator>
   {
      public:
         typedef launch_claim_tokens_operation operation_type;

         void_result do_evaluate( const launch_claim_tokens_operation& op );
         asset do_apply( const launch_claim_tokens_operation& op );

         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
         share_type _amount;
   };

   class launch_claim_vesting_evaluator : public evaluator<launch_claim_vesting_evaluator>
   {
      public:
         typedef launch_claim_vesting_operation operation_type;

         void_result do_evaluate( const launch_claim_vesting_operation& op );
         share_type do_apply( const launch_claim_vesting_operation& op );

         const launch_object* _launch = nullptr;
         const position_object* _position = nullptr;
         vesting_state _vesting;
   };

   class launch_claim_creator_fees_evaluator : public evaluator<launch_claim_creator_fees_evaluator>
   {
      public:
         typedef launch_claim_creator_fees_operation operation_type;

         void_result do_evaluate( const launch_claim_creator_fees_operation& op );
         share_type do_apply( const launch_claim_creator_fees_operation& op );

         const launch_object* _launch = nullptr;
   };

   class vault_poke_evaluator : public evaluator<vault_poke_evaluator>
   {
      public:
         typedef vault_poke_operation operation_type;

         void_result do_evaluate( const vault_poke_operation& op );
         share_type do_apply( const vault_poke_operation& op );

         const protocol_config_object* _config = nullptr;
         const launch_object* _launch = nullptr;
         const vault_object* _vault = nullptr;
   };

} } // launchpad::chain
