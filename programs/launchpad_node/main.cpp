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

#include <fc/io/json.hpp>
#include <fc/log/console_appender.hpp>
#include <fc/log/logger_config.hpp>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <iostream>
#include <sstream>

namespace bpo = boost::program_options;

namespace launchpad { namespace node {

   /**
    * One entry of a replay file: an optional clock advance followed by a transaction.
    */
   struct replay_step
   {
      fc::optional<fc::time_point_sec>       time;
      std::vector<protocol::operation>       operations;
   };

} }

FC_REFLECT( launchpad::node::replay_step, (time)(operations) )

/// Disable default logging
void disable_default_logging()
{
   fc::configure_logging( fc::logging_config() );
}

void my_log( const std::string& s )
{
   static fc::console_appender::config my_console_config;
   static fc::console_appender my_appender( my_console_config );
   my_appender.print(s);
   my_appender.print("\n");
}

int main(int argc, char** argv) {
   using namespace launchpad;
   try {
      bpo::options_description app_options("Launchpad Node");
      app_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json", bpo::value<boost::filesystem::path>(),
                    "File to read the genesis state from, an empty genesis is used when omitted")
            ("transactions", bpo::value<boost::filesystem::path>(),
                    "JSON file with the transactions to replay, a list of {time, operations} steps")
            ("log-events", bpo::bool_switch()->default_value(false),
                    "Log every notification as JSON")
            ("stop-on-error", bpo::bool_switch()->default_value(false),
                    "Stop at the first transaction that fails");

      bpo::variables_map options;
      try
      {
         bpo::store(bpo::parse_command_line(argc, argv, app_options), options);
      }
      catch (const boost::program_options::error& e)
      {
         disable_default_logging();
         std::stringstream ss;
         ss << "Error parsing command line: " << e.what();
         my_log( ss.str() );
         return EXIT_FAILURE;
      }

      if( options.count("help") > 0 )
      {
         disable_default_logging();
         std::stringstream ss;
         ss << app_options << "\n";
         my_log( ss.str() );
         return EXIT_SUCCESS;
      }
      bpo::notify(options);

      chain::genesis_state_type genesis;
      if( options.count("genesis-json") > 0 )
      {
         const auto genesis_file = options.at("genesis-json").as<boost::filesystem::path>();
         ilog( "Loading genesis state from ${f}", ("f",genesis_file.string()) );
         genesis = fc::json::from_file( genesis_file.string() )
                      .as<chain::genesis_state_type>( LAUNCHPAD_MAX_NESTED_OBJECTS );
      }

      chain::database db;
      db.init_genesis( genesis );

      if( options.at("log-events").as<bool>() )
      {
         db.launch_event_emitted.connect( []( const protocol::launch_event& event ) {
            ilog( "${e}", ("e", fc::json::to_string( fc::variant( event, LAUNCHPAD_MAX_NESTED_OBJECTS ) )) );
         });
      }

      if( options.count("transactions") == 0 )
      {
         ilog( "No transactions to replay" );
         return EXIT_SUCCESS;
      }

      const auto trx_file = options.at("transactions").as<boost::filesystem::path>();
      const auto steps = fc::json::from_file( trx_file.string() )
                            .as<std::vector<node::replay_step>>( LAUNCHPAD_MAX_NESTED_OBJECTS );
      const bool stop_on_error = options.at("stop-on-error").as<bool>();

      uint32_t applied = 0;
      uint32_t failed = 0;
      for( size_t i = 0; i < steps.size(); ++i )
      {
         const auto& step = steps[i];
         try
         {
            if( step.time.valid() )
               db.set_head_time( *step.time );
            if( step.operations.empty() )
               continue;

            protocol::transaction trx;
            trx.operations = step.operations;
            const protocol::processed_transaction result = db.push_transaction( trx );
            ++applied;
            ilog( "Step ${i}: ${r}", ("i",i)("r",fc::json::to_string(
                     fc::variant( result.operation_results, LAUNCHPAD_MAX_NESTED_OBJECTS ) )) );
         }
         catch( const fc::exception& e )
         {
            ++failed;
            elog( "Step ${i} failed: ${e}", ("i",i)("e",e.to_detail_string()) );
            if( stop_on_error )
               break;
         }
      }

      ilog( "Replayed ${a} transactions, ${f} failed, head time ${t}",
            ("a",applied)("f",failed)("t",db.head_time()) );
      return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
   }
   catch( const fc::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", e.to_detail_string()) );
      return EXIT_FAILURE;
   }
   catch( const boost::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", boost::diagnostic_information(e)) );
      return EXIT_FAILURE;
   }
   catch( const std::exception& e )
   {
      elog( "Exiting with error:\n${e}", ("e", e.what()) );
      return EXIT_FAILURE;
   }
}
