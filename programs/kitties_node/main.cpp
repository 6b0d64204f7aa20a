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

#include <iostream>
#include <string>
#include <vector>

#include <fc/io/fstream.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>

#include <kitties/app/database_api.hpp>
#include <kitties/chain/database.hpp>
#include <kitties/chain/exceptions.hpp>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

using namespace kitties::app;
using namespace kitties::chain;
using namespace std;
namespace bpo = boost::program_options;

namespace {

/** one line per account: its balance and the kitties it owns, oldest first */
void print_state( const database& db, const database_api& api )
{
   for( account_id_type id = 0; id < db.get_account_count(); ++id )
   {
      const account_object& a = db.get_account( id );
      fc::mutable_variant_object state;
      state( "account", a )
           ( "balance", api.get_account_balance( id ) )
           ( "kitties", api.list_account_kitties( id ) );
      std::cout << fc::json::to_string( state ) << "\n";
   }
}

} // anonymous namespace

int main( int argc, char** argv )
{
   try
   {
      bpo::options_description cli_options("Kitties node");
      cli_options.add_options()
            ("help,h", "Print this help message and exit.")
            ("genesis-json,g", bpo::value<boost::filesystem::path>(), "File to read genesis state from")
            ("transactions-json,t", bpo::value<boost::filesystem::path>(), "File to read an array of transactions from")
            ("transactions-per-block,b", bpo::value<uint32_t>()->default_value(1), "Transactions applied in each generated block")
            ("debug-dump", "Log the full chain state after the last transaction")
            ;

      bpo::variables_map options;
      try
      {
         bpo::store( bpo::parse_command_line(argc, argv, cli_options), options );
      }
      catch (const bpo::error& e)
      {
         std::cerr << "kitties_node:  error parsing command line: " << e.what() << "\n";
         return 1;
      }

      if( options.count("help") )
      {
         std::cout << cli_options << "\n";
         return 1;
      }

      const uint32_t per_block = options["transactions-per-block"].as<uint32_t>();
      if( per_block == 0 )
      {
         std::cerr << "--transactions-per-block must be positive\n";
         return 1;
      }

      genesis_state_type genesis;
      if( options.count("genesis-json") )
      {
         fc::path genesis_json_filename = options["genesis-json"].as<boost::filesystem::path>();
         ilog( "Reading genesis from file ${f}", ("f", genesis_json_filename.preferred_string()) );
         std::string genesis_json;
         fc::read_file_contents( genesis_json_filename, genesis_json );
         genesis = fc::json::from_string( genesis_json ).as< genesis_state_type >();
      }
      else
         wlog( "No genesis file given, starting with no accounts" );

      database db;
      db.init_genesis( genesis );
      database_api api( db );

      vector<transaction> transactions;
      if( options.count("transactions-json") )
      {
         fc::path trx_json_filename = options["transactions-json"].as<boost::filesystem::path>();
         std::string trx_json;
         fc::read_file_contents( trx_json_filename, trx_json );
         transactions = fc::json::from_string( trx_json ).as< vector<transaction> >();
         ilog( "Read ${n} transactions from ${f}", ("n", transactions.size())("f", trx_json_filename.preferred_string()) );
      }

      uint32_t applied = 0;
      uint32_t rejected = 0;
      for( size_t i = 0; i < transactions.size(); ++i )
      {
         if( i % per_block == 0 )
            db.generate_block();

         fc::mutable_variant_object line;
         line( "block", db.head_block_num() )( "index", i );
         try
         {
            line( "result", db.push_transaction( transactions[i] ) );
            ++applied;
         }
         catch( const fc::exception& e )
         {
            line( "error", e.name() )( "code", e.code() )( "message", e.to_string() );
            ++rejected;
         }
         std::cout << fc::json::to_string( line ) << "\n";
      }

      ilog( "Applied ${a} transactions, rejected ${r}, head block ${n}, ${k} kitties",
            ("a", applied)("r", rejected)("n", db.head_block_num())("k", api.get_kitties_count()) );
      if( options.count("debug-dump") )
         db.debug_dump();
      print_state( db, api );
   }
   catch ( const fc::exception& e )
   {
      std::cout << e.to_detail_string() << "\n";
      return 1;
   }
   return 0;
}
