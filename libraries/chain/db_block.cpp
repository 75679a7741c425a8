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
#include <launchpad/chain/database.hpp>
#include <launchpad/chain/evaluator.hpp>
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/chain/transaction_evaluation_state.hpp>

namespace launchpad { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   // a transaction pushed while another one is being applied comes from a collaborator callback
   const bool nested = _undo_db.active_sessions() > 0;

   processed_transaction processed_trx;
   {
      auto session = _undo_db.start_undo_session();
      try
      {
         processed_trx = _apply_transaction( trx );
      }
      catch( const fc::exception& )
      {
         if( !nested )
            _deferred_events.clear();
         throw;
      }

      if( nested )
      {
         session.merge();
         _deferred_events.insert( _deferred_events.end(), processed_trx.events.begin(), processed_trx.events.end() );
         return processed_trx;
      }
      session.commit();
   }

   vector<launch_event> events = std::move( _deferred_events );
   _deferred_events.clear();
   events.insert( events.end(), processed_trx.events.begin(), processed_trx.events.end() );
   notify_launch_events( events );

   return processed_trx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_apply_transaction( const transaction& trx )
{ try {
   FC_ASSERT( _p_core_asset_obj != nullptr, "Genesis state has not been applied" );
   trx.validate();

   transaction_evaluation_state eval_state(this);
   eval_state._trx = &trx;
   eval_state.operation_results.reserve( trx.operations.size() );

   processed_transaction ptrx(trx);
   for( const auto& op : ptrx.operations )
      eval_state.operation_results.emplace_back( apply_operation( eval_state, op ) );

   ptrx.operation_results = std::move( eval_state.operation_results );
   ptrx.events = std::move( eval_state.events );

   modify( get_dynamic_global_properties(), []( dynamic_global_property_object& p ) {
      ++p.applied_transactions;
   });
   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   int i_which = op.which();
   FC_ASSERT( i_which >= 0 && uint64_t( i_which ) < _operation_evaluators.size(),
              "Invalid operation tag ${t}", ("t",i_which) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ i_which ];
   FC_ASSERT( eval, "No registered evaluator for this operation" );
   return eval->evaluate( eval_state, op, true );
} FC_CAPTURE_AND_RETHROW( (op) ) }

void database::set_head_time( time_point_sec new_time )
{ try {
   FC_ASSERT( new_time >= head_time(), "Time cannot go backwards" );
   auto session = _undo_db.start_undo_session();
   modify( get_dynamic_global_properties(), [new_time]( dynamic_global_property_object& p ) {
      p.time = new_time;
   });
   session.commit();
} FC_CAPTURE_AND_RETHROW( (new_time) ) }

void database::notify_launch_events( const vector<launch_event>& events )
{
   for( const auto& event : events )
   {
      LAUNCHPAD_TRY_NOTIFY( launch_event_emitted, event )
   }
}

} }
