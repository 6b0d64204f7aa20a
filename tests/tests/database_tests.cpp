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

#include <boost/test/unit_test.hpp>

#include <kitties/chain/database.hpp>
#include <kitties/chain/exceptions.hpp>

#include "../common/database_fixture.hpp"

using namespace kitties::chain;

BOOST_FIXTURE_TEST_SUITE( database_tests, database_fixture )

BOOST_AUTO_TEST_CASE( genesis_accounts )
{ try {
   BOOST_CHECK_EQUAL( db->get_account_count(), 4u );
   BOOST_CHECK_EQUAL( db->get_account( alice_id ).name, "alice" );
   BOOST_CHECK_EQUAL( db->get_account( dave_id ).name, "dave" );
   BOOST_REQUIRE( db->find_account_by_name( "carol" ) != nullptr );
   BOOST_CHECK_EQUAL( db->find_account_by_name( "carol" )->id, carol_id );
   BOOST_CHECK( db->find_account_by_name( "erin" ) == nullptr );
   BOOST_CHECK( db->find_account( 4 ) == nullptr );
   KITTIES_REQUIRE_THROW( db->get_account( 4 ), unknown_account );

   BOOST_CHECK( get_balance( alice_id ) == share_type( 10000 ) );
   BOOST_CHECK( get_balance( carol_id ) == share_type( 0 ) );
   BOOST_CHECK( get_balance( dave_id ) == share_type( 500 ) );
   BOOST_CHECK( db->head_block_time() > time_point_sec( KITTIES_TESTING_GENESIS_TIMESTAMP ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_is_checked )
{ try {
   {
      genesis_state_type genesis;
      genesis.initial_accounts.emplace_back( "alice", 1 );
      genesis.initial_accounts.emplace_back( "alice", 2 );
      database d;
      KITTIES_REQUIRE_THROW( d.init_genesis( genesis ), fc::exception );
   }
   {
      genesis_state_type genesis;
      genesis.initial_accounts.emplace_back( "Alice", 1 );
      database d;
      KITTIES_REQUIRE_THROW( d.init_genesis( genesis ), fc::exception );
   }
   {
      genesis_state_type genesis;
      genesis.initial_accounts.emplace_back( "alice", -1 );
      database d;
      KITTIES_REQUIRE_THROW( d.init_genesis( genesis ), fc::exception );
   }
   KITTIES_REQUIRE_THROW( db->init_genesis( genesis_state ), fc::exception );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( genesis_json )
{ try {
   const string json = R"({
      "initial_timestamp": "2015-05-15T00:00:00",
      "initial_random_seed": "1111111111111111111111111111111111111111111111111111111111111111",
      "initial_accounts": [ { "name": "init0", "balance": 100 }, { "name": "init1", "balance": 0 } ]
   })";
   const genesis_state_type genesis = fc::json::from_string( json ).as<genesis_state_type>();

   database d;
   d.init_genesis( genesis );
   BOOST_CHECK_EQUAL( d.get_account_count(), 2u );
   BOOST_CHECK_EQUAL( d.get_account( 1 ).name, "init1" );
   BOOST_CHECK( d.get_balance( 0 ) == share_type( 100 ) );
   BOOST_CHECK( d.head_block_time() == genesis.initial_timestamp );
   BOOST_CHECK( d.get_dynamic_global_properties().random_seed == genesis.initial_random_seed );
   BOOST_CHECK_EQUAL( d.head_block_num(), 0u );
   BOOST_CHECK( genesis.compute_chain_id() == fc::sha256::hash( genesis ) );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( generate_block_rolls_seed_and_counter )
{ try {
   create_kitty( alice_id );
   create_kitty( alice_id );
   const dynamic_global_property_object before = db->get_dynamic_global_properties();
   BOOST_CHECK_EQUAL( before.current_random_index, 2u );

   const uint32_t n = generate_block();
   const dynamic_global_property_object after = db->get_dynamic_global_properties();
   BOOST_CHECK_EQUAL( n, before.head_block_number + 1 );
   BOOST_CHECK_EQUAL( after.head_block_number, n );
   BOOST_CHECK_EQUAL( after.current_random_index, 0u );
   BOOST_CHECK( after.time == before.time + fc::seconds( KITTIES_BLOCK_INTERVAL ) );
   BOOST_CHECK( after.random_seed == fc::sha256::hash( std::make_pair( before.random_seed, n ) ) );

   const fc::sha256 explicit_seed = fc::sha256::hash( string( "explicit" ) );
   db->generate_block( explicit_seed );
   BOOST_CHECK( db->get_dynamic_global_properties().random_seed == explicit_seed );

   generate_blocks( 5 );
   BOOST_CHECK_EQUAL( db->head_block_num(), n + 6 );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( same_chain_same_kitties )
{ try {
   // two nodes replaying the same history draw the same genomes
   database a;
   database b;
   a.init_genesis( genesis_state );
   b.init_genesis( genesis_state );

   transaction t;
   t.origin = bob_id;
   t.operations.push_back( kitty_create_operation() );
   t.operations.push_back( kitty_create_operation() );
   kitty_breed_operation breed;
   breed.kitty_id_1 = 0;
   breed.kitty_id_2 = 1;
   t.operations.push_back( breed );

   a.generate_block();
   b.generate_block();
   a.push_transaction( t );
   b.push_transaction( t );

   for( kitty_index_type id = 0; id < 3; ++id )
      BOOST_CHECK( a.get_kitty( id ).dna == b.get_kitty( id ).dna );
   BOOST_CHECK( a.get_kitty( 0 ).dna != a.get_kitty( 1 ).dna );
   verify_ownership( a );
   verify_ownership( b );
} FC_LOG_AND_RETHROW() }

BOOST_AUTO_TEST_CASE( valid_name_test )
{
   BOOST_CHECK( is_valid_name( "a" ) );
   BOOST_CHECK( is_valid_name( "alice" ) );
   BOOST_CHECK( is_valid_name( "init-0" ) );
   BOOST_CHECK( is_valid_name( "a1b2" ) );

   BOOST_CHECK( !is_valid_name( "" ) );
   BOOST_CHECK( !is_valid_name( "A" ) );
   BOOST_CHECK( !is_valid_name( "0a" ) );
   BOOST_CHECK( !is_valid_name( "-a" ) );
   BOOST_CHECK( !is_valid_name( "a.b" ) );
   BOOST_CHECK( !is_valid_name( "a_b" ) );

   BOOST_CHECK(  is_valid_name( string( KITTIES_MAX_ACCOUNT_NAME_LENGTH, 'a' ) ) );
   BOOST_CHECK( !is_valid_name( string( KITTIES_MAX_ACCOUNT_NAME_LENGTH + 1, 'a' ) ) );
}

BOOST_AUTO_TEST_SUITE_END()
