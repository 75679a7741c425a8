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
#include <launchpad/chain/exceptions.hpp>
#include <launchpad/chain/transaction_evaluation_state.hpp>
#include <launchpad/protocol/operations.hpp>

namespace launchpad { namespace chain {

   class database;
   class launch_object;

   class generic_evaluator
   {
   public:
      virtual ~generic_evaluator(){}

      virtual int get_type()const = 0;
      virtual operation_result start_evaluate(transaction_evaluation_state& eval_state, const operation& op, bool apply);

      /**
       * @note derived classes should ASSUME that the default validation that is
       * indepenent of chain state should be performed by op.validate() and should
       * not perform these extra checks.
       */
      virtual operation_result evaluate(const operation& op) = 0;
      virtual operation_result apply(const operation& op) = 0;

      database& db()const;

   protected:
      /// Queues a notification, published once the transaction commits
      void emit( launch_event&& event );

      transaction_evaluation_state*    trx_state = nullptr;
   };

   class op_evaluator
   {
   public:
      virtual ~op_evaluator(){}
      virtual operation_result evaluate(transaction_evaluation_state& eval_state, const operation& op, bool apply) = 0;
   };

   template<typename T>
   class op_evaluator_impl : public op_evaluator
   {
   public:
      virtual operation_result evaluate(transaction_evaluation_state& eval_state, const operation& op,
                                        bool apply = true) override
      {
         T eval;
         return eval.start_evaluate(eval_state, op, apply);
      }
   };

   /**
    * Checked share_type arithmetic throws fc::overflow_exception and fc::underflow_exception, they leave the
    * evaluator as math_overflow_exception.
    */
   template<typename DerivedEvaluator>
   class evaluator : public generic_evaluator
   {
   public:
      virtual int get_type()const override { return operation::tag<typename DerivedEvaluator::operation_type>::value; }

      virtual operation_result evaluate(const operation& o) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         try
         {
            return eval->do_evaluate(op);
         }
         LAUNCHPAD_RECODE_EXC( fc::overflow_exception, math_overflow_exception )
         LAUNCHPAD_RECODE_EXC( fc::underflow_exception, math_overflow_exception )
      }

      virtual operation_result apply(const operation& o) final override
      {
         auto* eval = static_cast<DerivedEvaluator*>(this);
         const auto& op = o.get<typename DerivedEvaluator::operation_type>();

         try
         {
            return eval->do_apply(op);
         }
         LAUNCHPAD_RECODE_EXC( fc::overflow_exception, math_overflow_exception )
         LAUNCHPAD_RECODE_EXC( fc::underflow_exception, math_overflow_exception )
      }
   };

   /**
    * Marks a launch as busy while an operation applies to it. An operation re-entering the same launch
    * from a collaborator callback fails with operation_in_progress_exception. release() clears the mark,
    * when the operation fails the undo session discards it with everything else.
    */
   class launch_exclusivity_guard
   {
   public:
      launch_exclusivity_guard( database& db, const launch_object& launch );

      void release();

   private:
      database&       _db;
      launch_id_type  _launch;
      bool            _released = false;
   };

   /// Throws operation_in_progress_exception if the launch is marked busy
   void check_not_in_progress( const launch_object& launch );
} }
