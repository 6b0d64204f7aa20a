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

#include <kitties/chain/owned_kitties.hpp>
#include <kitties/chain/exceptions.hpp>

#include <kitties/db/undo_database.hpp>

using namespace kitties::chain;
using namespace kitties::db;

namespace {

typedef linked_owned_kitties<uint64_t, uint32_t>   owned_list;
typedef owned_list::item_type                      item;

item make_item( optional<uint32_t> prev, optional<uint32_t> next )
{
   item i;
   i.prev = prev;
   i.next = next;
   return i;
}

optional<item> entry( optional<uint32_t> prev, optional<uint32_t> next )
{
   return make_item( prev, next );
}

const optional<uint32_t> none;

struct owned_kitties_fixture
{
   undo_database udb;
   owned_list    owned{ udb };
};

}

BOOST_FIXTURE_TEST_SUITE( owned_kitties_tests, owned_kitties_fixture )

BOOST_AUTO_TEST_CASE( append_links_in_insertion_order )
{
   owned.append( 0, 1 );

   BOOST_CHECK( owned.get( 0, none ) == entry( 1u, 1u ) );
   BOOST_CHECK( owned.get( 0, 1u ) == entry( none, none ) );

   owned.append( 0, 2 );

   BOOST_CHECK( owned.get( 0, none ) == entry( 2u, 1u ) );
   BOOST_CHECK( owned.get( 0, 1u ) == entry( none, 2u ) );
   BOOST_CHECK( owned.get( 0, 2u ) == entry( 1u, none ) );

   owned.append( 0, 3 );

   BOOST_CHECK( owned.get( 0, none ) == entry( 3u, 1u ) );
   BOOST_CHECK( owned.get( 0, 1u ) == entry( none, 2u ) );
   BOOST_CHECK( owned.get( 0, 2u ) == entry( 1u, 3u ) );
   BOOST_CHECK( owned.get( 0, 3u ) == entry( 2u, none ) );

   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 1, 2, 3 }) );
   BOOST_CHECK( owned.list_reverse( 0 ) == vector<uint32_t>({ 3, 2, 1 }) );
}

BOOST_AUTO_TEST_CASE( remove_splices_neighbours )
{
   owned.append( 0, 1 );
   owned.append( 0, 2 );
   owned.append( 0, 3 );

   owned.remove( 0, 2 );

   BOOST_CHECK( owned.get( 0, none ) == entry( 3u, 1u ) );
   BOOST_CHECK( owned.get( 0, 1u ) == entry( none, 3u ) );
   BOOST_CHECK( !owned.get( 0, 2u ).valid() );
   BOOST_CHECK( owned.get( 0, 3u ) == entry( 1u, none ) );

   owned.remove( 0, 1 );

   BOOST_CHECK( owned.get( 0, none ) == entry( 3u, 3u ) );
   BOOST_CHECK( !owned.get( 0, 1u ).valid() );
   BOOST_CHECK( !owned.get( 0, 2u ).valid() );
   BOOST_CHECK( owned.get( 0, 3u ) == entry( none, none ) );

   owned.remove( 0, 3 );

   // the sentinel stays behind, unlinked
   BOOST_CHECK( owned.get( 0, none ) == entry( none, none ) );
   BOOST_CHECK( !owned.get( 0, 1u ).valid() );
   BOOST_CHECK( !owned.get( 0, 2u ).valid() );
   BOOST_CHECK( !owned.get( 0, 3u ).valid() );
   BOOST_CHECK( owned.list( 0 ).empty() );
}

BOOST_AUTO_TEST_CASE( remove_tail_updates_sentinel_prev )
{
   owned.append( 7, 10 );
   owned.append( 7, 11 );
   owned.append( 7, 12 );

   owned.remove( 7, 12 );

   BOOST_CHECK( owned.read_head( 7 ) == make_item( 11u, 10u ) );
   BOOST_CHECK( owned.read( 7, 11u ) == make_item( 10u, none ) );
   BOOST_CHECK( owned.list( 7 ) == vector<uint32_t>({ 10, 11 }) );

   owned.append( 7, 13 );
   BOOST_CHECK( owned.list( 7 ) == vector<uint32_t>({ 10, 11, 13 }) );
   BOOST_CHECK( owned.list_reverse( 7 ) == vector<uint32_t>({ 13, 11, 10 }) );
}

BOOST_AUTO_TEST_CASE( append_then_remove_restores_sentinel )
{
   BOOST_CHECK( owned.read_head( 5 ) == make_item( none, none ) );

   owned.append( 5, 42 );
   BOOST_CHECK( owned.read_head( 5 ) == make_item( 42u, 42u ) );

   owned.remove( 5, 42 );
   BOOST_CHECK( owned.read_head( 5 ) == make_item( none, none ) );
   BOOST_CHECK( !owned.contains( 5, 42 ) );
}

BOOST_AUTO_TEST_CASE( remove_of_unlinked_kitty_is_a_noop )
{
   owned.append( 0, 1 );
   const size_t entries = owned.links().size();

   owned.remove( 0, 9 );
   owned.remove( 1, 1 );

   BOOST_CHECK_EQUAL( owned.links().size(), entries );
   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 1 }) );
   BOOST_CHECK( !owned.get( 1, none ).valid() );
}

BOOST_AUTO_TEST_CASE( accounts_have_independent_chains )
{
   owned.append( 0, 1 );
   owned.append( 1, 2 );
   owned.append( 0, 3 );
   owned.append( 1, 4 );

   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 1, 3 }) );
   BOOST_CHECK( owned.list( 1 ) == vector<uint32_t>({ 2, 4 }) );

   // moving a kitty between accounts touches neither the other kitties' nodes nor their order
   owned.remove( 0, 1 );
   owned.append( 1, 1 );

   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 3 }) );
   BOOST_CHECK( owned.list( 1 ) == vector<uint32_t>({ 2, 4, 1 }) );
   BOOST_CHECK( owned.read( 0, 3u ) == make_item( none, none ) );
   BOOST_CHECK( owned.read( 1, 4u ) == make_item( 2u, 1u ) );
}

BOOST_AUTO_TEST_CASE( undo_session_restores_links )
{
   owned.append( 0, 1 );
   owned.append( 0, 2 );
   {
      auto session = udb.start_undo_session();
      owned.remove( 0, 1 );
      owned.append( 0, 3 );
      owned.append( 1, 1 );
      BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 2, 3 }) );
   }

   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 1, 2 }) );
   BOOST_CHECK( owned.list_reverse( 0 ) == vector<uint32_t>({ 2, 1 }) );
   BOOST_CHECK( owned.read( 0, 1u ) == make_item( none, 2u ) );
   BOOST_CHECK( !owned.get( 0, 3u ).valid() );
   BOOST_CHECK( !owned.get( 1, none ).valid() );
   BOOST_CHECK( !owned.get( 1, 1u ).valid() );
}

BOOST_AUTO_TEST_CASE( walk_of_broken_chain_fails )
{
   owned.append( 0, 1 );
   // linking the same id twice leaves it pointing back at itself
   owned.append( 0, 1 );

   BOOST_CHECK( owned.read( 0, 1u ) == make_item( 1u, none ) );
   BOOST_CHECK( owned.list( 0 ) == vector<uint32_t>({ 1 }) );
   BOOST_CHECK_THROW( owned.list_reverse( 0 ), fc::assert_exception );
}

BOOST_AUTO_TEST_SUITE_END()
