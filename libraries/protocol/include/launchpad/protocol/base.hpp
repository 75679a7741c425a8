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

#include <launchpad/protocol/types.hpp>
#include <launchpad/protocol/asset.hpp>

namespace launchpad { namespace protocol {

   struct void_result{};

   /**
    * What an evaluator hands back: nothing, the id of a created object, an amount paid out, or a share count.
    */
   using operation_result = static_variant<void_result, object_id_type, asset, share_type>;

   /**
    * @defgroup operations Operations
    * @brief A set of valid launchpad state transitions
    *
    * Every operation names the account that authorized it, returned by signer(). Checking that the account
    * actually authorized the transaction belongs to the host ledger. validate() performs the stateless
    * checks, everything that depends on the database is done by the evaluator.
    */
   struct base_operation
   {
      virtual ~base_operation() = default;
      virtual void validate()const {}
   };

} } // launchpad::protocol

FC_REFLECT_EMPTY( launchpad::protocol::void_result )
FC_REFLECT_TYPENAME( launchpad::protocol::operation_result )
