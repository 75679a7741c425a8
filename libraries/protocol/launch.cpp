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
#include <launchpad/protocol/launch.hpp>
#include <launchpad/protocol/exceptions.hpp>

namespace launchpad { namespace protocol {

void validate_launch_metadata( const string& name, const string& symbol, const string& uri )
{
   LAUNCHPAD_ASSERT( !name.empty() && name.size() <= LAUNCHPAD_MAX_NAME_LENGTH, invalid_metadata_exception,
                     "Name must have 1 to ${max} characters", ("max",LAUNCHPAD_MAX_NAME_LENGTH)("name",name) );
   LAUNCHPAD_ASSERT( !symbol.empty() && symbol.size() <= LAUNCHPAD_MAX_SYMBOL_LENGTH, invalid_metadata_exception,
                     "Symbol must have 1 to ${max} characters", ("max",LAUNCHPAD_MAX_SYMBOL_LENGTH)("symbol",symbol) );
   LAUNCHPAD_ASSERT( !uri.empty() && uri.size() <= LAUNCHPAD_MAX_URI_LENGTH, invalid_metadata_exception,
                     "URI must have 1 to ${max} characters", ("max",LAUNCHPAD_MAX_URI_LENGTH)("uri",uri) );
}

void launch_create_operation::validate()const
{
   validate_launch_metadata( name, symbol, uri );
   LAUNCHPAD_ASSERT( seed_amount > 0, invalid_amount_exception, "Seed amount must be positive",
                     ("seed_amount",seed_amount) );
}

void launch_buy_operation::validate()const
{
   LAUNCHPAD_ASSERT( amount > 0, invalid_amount_exception, "Buy amount must be positive", ("amount",amount) );
   LAUNCHPAD_ASSERT( amount <= LAUNCHPAD_MAX_BUY_AMOUNT, invalid_amount_exception,
                     "Buy amount exceeds the per-buy ceiling of ${max}",
                     ("max",LAUNCHPAD_MAX_BUY_AMOUNT)("amount",amount) );
   LAUNCHPAD_ASSERT( min_shares_out > 0, invalid_amount_exception, "Minimum shares out must be positive",
                     ("min_shares_out",min_shares_out) );
}

void launch_sell_operation::validate()const
{
   LAUNCHPAD_ASSERT( shares > 0, invalid_amount_exception, "Shares to sell must be positive", ("shares",shares) );
   LAUNCHPAD_ASSERT( min_amount_out >= 0, invalid_amount_exception, "Minimum amount out must not be negative",
                     ("min_amount_out",min_amount_out) );
}

} } // launchpad::protocol
