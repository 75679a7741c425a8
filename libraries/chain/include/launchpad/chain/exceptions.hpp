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

#include <fc/exception/exception.hpp>
#include <launchpad/protocol/exceptions.hpp>
#include <launchpad/chain/types.hpp>

/**
 * Rethrows an exception of type cause_type as effect_type, keeping its log
 */
#define LAUNCHPAD_RECODE_EXC( cause_type, effect_type ) \
   catch( const cause_type& e ) \
   { throw( effect_type( e.what(), e.get_log() ) ); }

/**
 * Invokes a signal. A failing subscriber is logged and its exception rethrown.
 */
#define LAUNCHPAD_TRY_NOTIFY( signal, ... )                                   \
   try                                                                        \
   {                                                                          \
      signal( __VA_ARGS__ );                                                  \
   }                                                                          \
   catch( const fc::exception& e )                                            \
   {                                                                          \
      elog( "Caught exception in subscriber: ${e}", ("e", e.to_detail_string() ) ); \
      throw;                                                                  \
   }

namespace launchpad { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000 )

   FC_DECLARE_DERIVED_EXCEPTION( lifecycle_state_exception,    chain_exception, 3100000 )
   FC_DECLARE_DERIVED_EXCEPTION( authorization_exception,      chain_exception, 3200000 )
   FC_DECLARE_DERIVED_EXCEPTION( economic_exception,           chain_exception, 3300000 )
   FC_DECLARE_DERIVED_EXCEPTION( oracle_exception,             chain_exception, 3400000 )

   FC_DECLARE_DERIVED_EXCEPTION( protocol_paused_exception,            lifecycle_state_exception, 3100001 )
   FC_DECLARE_DERIVED_EXCEPTION( already_initialized_exception,        lifecycle_state_exception, 3100002 )
   FC_DECLARE_DERIVED_EXCEPTION( not_initialized_exception,            lifecycle_state_exception, 3100003 )
   FC_DECLARE_DERIVED_EXCEPTION( already_graduated_exception,          lifecycle_state_exception, 3100004 )
   FC_DECLARE_DERIVED_EXCEPTION( not_graduated_exception,              lifecycle_state_exception, 3100005 )
   FC_DECLARE_DERIVED_EXCEPTION( refund_mode_active_exception,         lifecycle_state_exception, 3100006 )
   FC_DECLARE_DERIVED_EXCEPTION( refund_mode_already_active_exception, lifecycle_state_exception, 3100007 )
   FC_DECLARE_DERIVED_EXCEPTION( refund_mode_not_active_exception,     lifecycle_state_exception, 3100008 )
   FC_DECLARE_DERIVED_EXCEPTION( launch_not_expired_exception,         lifecycle_state_exception, 3100009 )
   FC_DECLARE_DERIVED_EXCEPTION( already_claimed_exception,            lifecycle_state_exception, 3100010 )
   FC_DECLARE_DERIVED_EXCEPTION( vesting_not_started_exception,        lifecycle_state_exception, 3100011 )
   FC_DECLARE_DERIVED_EXCEPTION( vesting_not_complete_exception,       lifecycle_state_exception, 3100012 )
   FC_DECLARE_DERIVED_EXCEPTION( no_shares_to_claim_exception,         lifecycle_state_exception, 3100013 )
   FC_DECLARE_DERIVED_EXCEPTION( no_fees_to_claim_exception,           lifecycle_state_exception, 3100014 )
   FC_DECLARE_DERIVED_EXCEPTION( launch_not_empty_exception,           lifecycle_state_exception, 3100015 )
   FC_DECLARE_DERIVED_EXCEPTION( operation_in_progress_exception,      lifecycle_state_exception, 3100016 )
   FC_DECLARE_DERIVED_EXCEPTION( no_position_exception,                lifecycle_state_exception, 3100017 )

   FC_DECLARE_DERIVED_EXCEPTION( unauthorized_exception,               authorization_exception, 3200001 )
   FC_DECLARE_DERIVED_EXCEPTION( not_creator_exception,                authorization_exception, 3200002 )

   FC_DECLARE_DERIVED_EXCEPTION( slippage_exceeded_exception,          economic_exception, 3300001 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_shares_exception,        economic_exception, 3300002 )
   FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds_exception,         economic_exception, 3300003 )
   FC_DECLARE_DERIVED_EXCEPTION( seed_amount_too_low_exception,        economic_exception, 3300004 )
   FC_DECLARE_DERIVED_EXCEPTION( seed_amount_too_high_exception,       economic_exception, 3300005 )

   FC_DECLARE_DERIVED_EXCEPTION( price_unavailable_exception,          oracle_exception, 3400001 )
   FC_DECLARE_DERIVED_EXCEPTION( price_stale_exception,                oracle_exception, 3400002 )

} } // launchpad::chain
