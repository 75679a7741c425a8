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
#include <launchpad/chain/protocol_config_evaluator.hpp>

#include <launchpad/chain/database.hpp>
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/chain/global_property_object.hpp>

namespace launchpad { namespace chain {

namespace {

   void check_authority( const protocol_config_object& config, account_id_type signer )
   {
      LAUNCHPAD_ASSERT( signer == config.authority, unauthorized_exception,
                        "${s} is not the protocol authority", ("s",signer)("authority",config.authority) );
   }

   config_updated_event make_config_updated( const protocol_config_object& config )
   {
      config_updated_event event;
      event.authority = config.authority;
      event.operator_account = config.operator_account;
      event.protocol_fee_account = config.protocol_fee_account;
      event.vault_protocol_account = config.vault_protocol_account;
      event.min_seed_amount = config.min_seed_amount;
      return event;
   }

}

void_result protocol_initialize_evaluator::do_evaluate( const protocol_initialize_operation& op )
{ try {
   const database& d = db();

   LAUNCHPAD_ASSERT( d.find_protocol_config() == nullptr, already_initialized_exception,
                     "The protocol is already initialized", ("authority",op.authority) );

   op.authority(d);
   op.operator_account(d);
   op.protocol_fee_account(d);
   op.vault_protocol_account(d);

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

object_id_type protocol_initialize_evaluator::do_apply( const protocol_initialize_operation& op )
{ try {
   database& d = db();

   const auto& config = d.create<protocol_config_object>( [&op]( protocol_config_object& c ) {
      c.authority = op.authority;
      c.operator_account = op.operator_account;
      c.protocol_fee_account = op.protocol_fee_account;
      c.vault_protocol_account = op.vault_protocol_account;
      c.min_seed_amount = op.min_seed_amount;
   });

   config_initialized_event event;
   event.authority = op.authority;
   event.operator_account = op.operator_account;
   event.protocol_fee_account = op.protocol_fee_account;
   event.vault_protocol_account = op.vault_protocol_account;
   event.min_seed_amount = op.min_seed_amount;
   emit( std::move( event ) );

   ilog( "Protocol initialized with authority ${a}", ("a",op.authority) );
   return config.id;
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_update_price_evaluator::do_evaluate( const protocol_update_price_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();

   LAUNCHPAD_ASSERT( _config->is_operator( op.updater ), unauthorized_exception,
                     "${u} may not publish the price", ("u",op.updater) );

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_update_price_evaluator::do_apply( const protocol_update_price_operation& op )
{ try {
   database& d = db();
   const time_point_sec now = d.head_time();

   price_updated_event event;
   event.old_price = _config->price_usd;
   event.new_price = op.price_usd;
   event.timestamp = now;

   d.modify( *_config, [&op, now]( protocol_config_object& c ) {
      c.price_usd = op.price_usd;
      c.price_updated_at = now;
   });

   emit( std::move( event ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_update_config_evaluator::do_evaluate( const protocol_update_config_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();
   check_authority( *_config, op.authority );

   if( op.new_authority.valid() )
      (*op.new_authority)(d);
   if( op.new_operator.valid() )
      (*op.new_operator)(d);
   if( op.new_protocol_fee_account.valid() )
      (*op.new_protocol_fee_account)(d);
   if( op.new_vault_protocol_account.valid() )
      (*op.new_vault_protocol_account)(d);

   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_update_config_evaluator::do_apply( const protocol_update_config_operation& op )
{ try {
   database& d = db();

   d.modify( *_config, [&op]( protocol_config_object& c ) {
      if( op.new_authority.valid() )
         c.authority = *op.new_authority;
      if( op.new_operator.valid() )
         c.operator_account = *op.new_operator;
      if( op.new_protocol_fee_account.valid() )
         c.protocol_fee_account = *op.new_protocol_fee_account;
      if( op.new_vault_protocol_account.valid() )
         c.vault_protocol_account = *op.new_vault_protocol_account;
      if( op.new_min_seed_amount.valid() )
         c.min_seed_amount = *op.new_min_seed_amount;
   });

   emit( make_config_updated( *_config ) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_set_paused_evaluator::do_evaluate( const protocol_set_paused_operation& op )
{ try {
   const database& d = db();
   _config = &d.get_protocol_config();
   check_authority( *_config, op.authority );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

void_result protocol_set_paused_evaluator::do_apply( const protocol_set_paused_operation& op )
{ try {
   db().modify( *_config, [&op]( protocol_config_object& c ) {
      c.paused = op.paused;
   });

   pause_toggled_event event;
   event.paused = op.paused;
   emit( std::move( event ) );

   if( op.paused )
      wlog( "Protocol paused by ${a}", ("a",op.authority) );
   else
      ilog( "Protocol resumed by ${a}", ("a",op.authority) );
   return void_result();
} FC_CAPTURE_AND_RETHROW( (op) ) }

} } // launchpad::chain
