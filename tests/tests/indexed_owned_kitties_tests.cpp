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

#include <kitties/chain/indexed_owned_kitties.hpp>
#include <kitties/chain/exceptions.hpp>

#include <kitties/db/undo_database.hpp>

using namespace kitties::chain;
using namespace kitties::db;

namespace {

struct indexed_fixture
{
   undo_database                                 udb;
   indexed_owned_kitties<uint64_t, uint32_t>     owned{ udb };
};

}

BOOST_FIXTURE_TEST_SUITE( indexed_owned_kitties_tests, indexed_fixture )

BOOST_AUTO_TEST_CASE( append_fills_dense_slots )
{
   owned.append( 1, 10 );
   owned.append( 1, 11 );
   owned.append( 2, 12 );

   BOOST_CHECK_EQUAL( owned.count( 1 ), 2u );
   BOOST_CHECK_EQUAL( owned.count( 2 ), 1u );
   BOOST_CHECK_EQUAL( owned.count( 3 ), 0u );
   BOOST_CHECK( *owned.at( 1, 0 ) == 10u );
   BOOST_CHECK( *owned.at( 1, 1 ) == 11u );
   BOOST_CHECK( *owned.at( 2, 0 ) == 12u );
   BOOST_CHECK( !owned.at( 1, 2 ).valid() );
   BOOST_CHECK( *owned.slot_of( 11 ) == 1u );
}

BOOST_AUTO_TEST_CASE( remove_moves_last_kitty_into_vacated_slot )
{
   owned.append( 1, 10 );
   owned.append( 1, 11 );
   owned.append( 1, 12 );

   owned.remove( 1, 10 );

   // kitty 12 was not touched by the caller, yet its slot changed
   BOOST_CHECK_EQUAL( owned.count( 1 ), 2u );
   BOOST_CHECK( *owned.at( 1, 0 ) == 12u );
   BOOST_CHECK( *owned.at( 1, 1 ) == 11u );
   BOOST_CHECK( !owned.at( 1, 2 ).valid() );
   BOOST_CHECK( *owned.slot_of( 12 ) == 0u );
   BOOST_CHECK( !owned.slot_of( 10 ).valid() );

   owned.remove( 1, 11 );
   BOOST_CHECK_EQUAL( owned.count( 1 ), 1u );
   BOOST_CHECK( *owned.at( 1, 0 ) == 12u );

   owned.remove( 1, 12 );
   BOOST_CHECK_EQUAL( owned.count( 1 ), 0u );
   BOOST_CHECK( !owned.at( 1, 0 ).valid() );
}

BOOST_AUTO_TEST_CASE( remove_from_empty_account_underflows )
{
   BOOST_CHECK_THROW( owned.remove( 1, 10 ), owned_kitties_count_underflow );

   owned.append( 2, 10 );
   BOOST_CHECK_THROW( owned.remove( 1, 10 ), owned_kitties_count_underflow );
   BOOST_CHECK_EQUAL( owned.count( 2 ), 1u );
}

BOOST_AUTO_TEST_CASE( remove_of_kitty_owned_elsewhere_is_rejected )
{
   owned.append( 1, 10 );
   owned.append( 2, 11 );

   BOOST_CHECK_THROW( owned.remove( 1, 11 ), fc::exception );
   BOOST_CHECK_EQUAL( owned.count( 1 ), 1u );
   BOOST_CHECK_EQUAL( owned.count( 2 ), 1u );
   BOOST_CHECK( *owned.at( 2, 0 ) == 11u );
}

BOOST_AUTO_TEST_CASE( count_overflow_is_rejected )
{
   indexed_owned_kitties<uint64_t, uint8_t> small( udb );
   for( unsigned i = 0; i < 255; ++i )
      small.append( 1, uint8_t( i ) );
   BOOST_CHECK_EQUAL( small.count( 1 ), 255u );

   BOOST_CHECK_THROW( small.append( 1, uint8_t( 255 ) ), owned_kitties_count_overflow );
   BOOST_CHECK_EQUAL( small.count( 1 ), 255u );
   BOOST_CHECK( !small.slot_of( uint8_t( 255 ) ).valid() );
}

BOOST_AUTO_TEST_SUITE_END()
