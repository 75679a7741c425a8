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
#include <launchpad/chain/launch_object.hpp>
#include <launchpad/chain/transaction_evaluation_state.hpp>

namespace launchpad { namespace chain {
database& generic_evaluator::db()const { return trx_state->db(); }

   operation_result generic_evaluator::start_evaluate( transaction_evaluation_state& eval_state, const operation& op, bool apply )
   { try {
      trx_state   = &eval_state;
      auto result = evaluate( op );

      if( apply ) result = this->apply( op );
      return result;
   } FC_CAPTURE_AND_RETHROW() }

   void generic_evaluator::emit( launch_event&& event )
   {
      trx_state->events.emplace_back( std::move( event ) );
   }

   void check_not_in_progress( const launch_object& launch )
   {
      LAUNCHPAD_ASSERT( !launch.operation_in_progress, operation_in_progress_exception,
                        "Launch ${l} is busy with another operation", ("l",launch.id) );
   }

   launch_exclusivity_guard::launch_exclusivity_guard( database& db, const launch_object& launch )
      : _db( db ), _launch( launch.get_id() )
   {
      check_not_in_progress( launch );
      _db.modify( launch, []( launch_object& l ) {
         l.operation_in_progress = true;
      });
   }

   void launch_exclusivity_guard::release()
   {
      if( _released )
         return;
      _released = true;
      // the launch is gone when the operation closed it
      if( const launch_object* launch = _db.find( _launch ) )
         _db.modify( *launch, []( launch_object& l ) {
            l.operation_in_progress = false;
         });
   }
} }
