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
#include <launchpad/protocol/protocol_config.hpp>
#include <launchpad/protocol/exceptions.hpp>

namespace launchpad { namespace protocol {

void protocol_initialize_operation::validate()const
{
   LAUNCHPAD_ASSERT( min_seed_amount >= 0, invalid_amount_exception, "Minimum seed must not be negative",
                     ("min_seed_amount",min_seed_amount) );
}

void protocol_update_price_operation::validate()const
{
   LAUNCHPAD_ASSERT( price_usd > 0, invalid_price_exception, "Price must be positive", ("price_usd",price_usd) );
}

void protocol_update_config_operation::validate()const
{
   LAUNCHPAD_ASSERT( new_authority.valid() || new_operator.valid() || new_protocol_fee_account.valid()
                     || new_vault_protocol_account.valid() || new_min_seed_amount.valid(),
                     validation_exception, "Nothing to update", ("authority",authority) );
   if( new_min_seed_amount.valid() )
      LAUNCHPAD_ASSERT( *new_min_seed_amount >= 0, invalid_amount_exception, "Minimum seed must not be negative",
                        ("new_min_seed_amount",*new_min_seed_amount) );
}

} } // launchpad::protocol
