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

#include <kitties/db/storage_map.hpp>

#include <string>

using namespace kitties::db;

namespace {

struct storage_fixture
{
   undo_database                      udb;
   storage_map<int, std::string>      map{ udb };
   storage_value<int>                 counter{ udb };
};

}

BOOST_FIXTURE_TEST_SUITE( undo_tests, storage_fixture )

BOOST_AUTO_TEST_CASE( map_primitives )
{
   BOOST_CHECK( !map.get( 1 ).valid() );
   BOOST_CHECK( map.find( 1 ) == nullptr );

   map.insert( 1, "one" );
   map.insert( 2, "two" );
   BOOST_CHECK_EQUAL( *map.get( 1 ), "one" );
   BOOST_CHECK( map.contains( 2 ) );
   BOOST_CHECK_EQUAL( map.size(), 2u );

   map.insert( 1, "uno" );
   BOOST_CHECK_EQUAL( *map.find( 1 ), "uno" );

   fc::optional<std::string> taken = map.take( 2 );
   BOOST_REQUIRE( taken.valid() );
   BOOST_CHECK_EQUAL( *taken, "two" );
   BOOST_CHECK( !map.contains( 2 ) );
   BOOST_CHECK( !map.take( 2 ).valid() );

   map.remove( 3 );
   map.remove( 1 );
   BOOST_CHECK( map.empty() );

   BOOST_CHECK_EQUAL( counter.get(), 0 );
   BOOST_CHECK( !counter.exists() );
   counter.put( 5 );
   BOOST_CHECK_EQUAL( counter.get(), 5 );
   counter.kill();
   BOOST_CHECK( !counter.exists() );
}

BOOST_AUTO_TEST_CASE( dropped_session_undoes_every_write )
{
   map.insert( 1, "one" );
   map.insert( 2, "two" );
   counter.put( 1 );
   {
      auto session = udb.start_undo_session();
      BOOST_CHECK_EQUAL( udb.active_sessions(), 1u );
      map.insert( 1, "uno" );
      map.remove( 2 );
      map.insert( 3, "three" );
      map.insert( 3, "tres" );
      counter.put( 2 );
   }
   BOOST_CHECK_EQUAL( udb.active_sessions(), 0u );
   BOOST_CHECK_EQUAL( *map.get( 1 ), "one" );
   BOOST_CHECK_EQUAL( *map.get( 2 ), "two" );
   BOOST_CHECK( !map.contains( 3 ) );
   BOOST_CHECK_EQUAL( counter.get(), 1 );
}

BOOST_AUTO_TEST_CASE( committed_session_keeps_writes )
{
   {
      auto session = udb.start_undo_session();
      map.insert( 1, "one" );
      counter.put( 7 );
      session.commit();
   }
   BOOST_CHECK_EQUAL( *map.get( 1 ), "one" );
   BOOST_CHECK_EQUAL( counter.get(), 7 );
}

BOOST_AUTO_TEST_CASE( nested_sessions_merge_into_parent )
{
   map.insert( 1, "one" );
   {
      auto outer = udb.start_undo_session();
      map.insert( 1, "uno" );
      {
         auto inner = udb.start_undo_session();
         map.insert( 1, "eins" );
         map.insert( 2, "zwei" );
         counter.put( 3 );
         inner.merge();
      }
      BOOST_CHECK_EQUAL( *map.get( 1 ), "eins" );
      BOOST_CHECK( map.contains( 2 ) );
      {
         auto failed = udb.start_undo_session();
         map.remove( 1 );
         counter.put( 4 );
      }
      BOOST_CHECK_EQUAL( *map.get( 1 ), "eins" );
      BOOST_CHECK_EQUAL( counter.get(), 3 );
   }
   // the outer session was dropped, so the merged inner writes go with it
   BOOST_CHECK_EQUAL( *map.get( 1 ), "one" );
   BOOST_CHECK( !map.contains( 2 ) );
   BOOST_CHECK_EQUAL( counter.get(), 0 );
   BOOST_CHECK( !counter.exists() );
}

BOOST_AUTO_TEST_CASE( explicit_undo )
{
   auto session = udb.start_undo_session();
   map.insert( 9, "nine" );
   session.undo();
   BOOST_CHECK( !map.contains( 9 ) );
   BOOST_CHECK_EQUAL( udb.active_sessions(), 0u );
}

BOOST_AUTO_TEST_SUITE_END()
