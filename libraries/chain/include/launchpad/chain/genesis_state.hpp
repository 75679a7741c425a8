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

#include <string>
#include <vector>

namespace launchpad { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string(), share_type base_balance = 0)
         : name(name),
           base_balance(base_balance)
      {}
      string name;
      share_type base_balance;
   };
   /// Accounts are referred to by name, they must be listed in initial_accounts
   struct initial_config_type {
      string authority_name;
      string operator_name;
      string protocol_fee_name;
      string vault_protocol_name;
      share_type min_seed_amount;
      uint64_t price_usd = 0;
   };

   time_point_sec                       initial_timestamp;
   vector<initial_account_type>         initial_accounts;
   optional<initial_config_type>        initial_config;
   share_type                           launch_storage_deposit   = LAUNCHPAD_DEFAULT_LAUNCH_STORAGE_DEPOSIT;
   share_type                           position_storage_deposit = LAUNCHPAD_DEFAULT_POSITION_STORAGE_DEPOSIT;
};

} } // launchpad::chain

FC_REFLECT( launchpad::chain::genesis_state_type::initial_account_type, (name)(base_balance) )

FC_REFLECT( launchpad::chain::genesis_state_type::initial_config_type,
            (authority_name)(operator_name)(protocol_fee_name)(vault_protocol_name)(min_seed_amount)(price_usd) )

FC_REFLECT( launchpad::chain::genesis_state_type,
            (initial_timestamp)(initial_accounts)(initial_config)(launch_storage_deposit)(position_storage_deposit) )
