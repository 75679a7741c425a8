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
#include <launchpad/chain/exceptions.hpp>

namespace launchpad { namespace chain {

const asset_object& database::get_core_asset() const
{
   return *_p_core_asset_obj;
}

const dynamic_global_property_object& database::get_dynamic_global_properties() const
{
   return *_p_dyn_global_prop_obj;
}

const protocol_config_object* database::find_protocol_config()const
{
   return find( protocol_config_id_type() );
}

const protocol_config_object& database::get_protocol_config()const
{
   const protocol_config_object* config = find_protocol_config();
   LAUNCHPAD_ASSERT( config != nullptr, not_initialized_exception, "The protocol has not been initialized",
                     ("config",protocol_config_id_type()) );
   return *config;
}

time_point_sec database::head_time()const
{
   return get_dynamic_global_properties().time;
}

const account_object& database::get_account( const string& name )const
{
   const auto& accounts_by_name = get_index_type<account_index>().indices().get<by_name>();
   auto itr = accounts_by_name.find( name );
   FC_ASSERT( itr != accounts_by_name.end(), "Unknown account ${n}", ("n",name) );
   return *itr;
}

const position_object* database::find_position( launch_id_type launch, account_id_type owner )const
{
   const auto& positions = get_index_type<position_index>().indices().get<by_launch_owner>();
   auto itr = positions.find( boost::make_tuple( launch, owner ) );
   return itr == positions.end() ? nullptr : &*itr;
}

const position_object& database::get_position( launch_id_type launch, account_id_type owner )const
{
   const position_object* position = find_position( launch, owner );
   LAUNCHPAD_ASSERT( position != nullptr, no_position_exception, "${o} has no position in ${l}",
                     ("o",owner)("l",launch) );
   return *position;
}

const creator_stats_object* database::find_creator_stats( account_id_type creator )const
{
   const auto& stats = get_index_type<creator_stats_index>().indices().get<by_creator>();
   auto itr = stats.find( creator );
   return itr == stats.end() ? nullptr : &*itr;
}

const vault_object* database::find_vault( launch_id_type launch )const
{
   const auto& vaults = get_index_type<vault_index>().indices().get<by_launch>();
   auto itr = vaults.find( launch );
   return itr == vaults.end() ? nullptr : &*itr;
}

vector<const position_object*> database::get_launch_positions( launch_id_type launch )const
{
   vector<const position_object*> result;
   const auto& positions = get_index_type<position_index>().indices().get<by_launch_owner>();
   auto range = positions.equal_range( boost::make_tuple( launch ) );
   for( auto itr = range.first; itr != range.second; ++itr )
      result.push_back( &*itr );
   return result;
}

} }
