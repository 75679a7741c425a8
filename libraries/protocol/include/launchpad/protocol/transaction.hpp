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
#include <launchpad/protocol/operations.hpp>
#include <launchpad/protocol/events.hpp>

namespace launchpad { namespace protocol {

   /**
    * @brief A group of operations applied atomically
    *
    * Either every operation succeeds or none of their effects persist.
    */
   struct transaction
   {
      vector<operation> operations;

      void validate()const;

      /// The accounts whose authorization the host ledger must check
      flat_set<account_id_type> get_signers()const;
   };

   /**
    * @brief A transaction with the results and notifications of its operations
    */
   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
      vector<launch_event>     events;
   };

} } // launchpad::protocol

FC_REFLECT( launchpad::protocol::transaction, (operations) )
FC_REFLECT_DERIVED( launchpad::protocol::processed_transaction, (launchpad::protocol::transaction),
                    (operation_results)(events) )
