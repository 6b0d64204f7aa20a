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

#include <kitties/chain/dna.hpp>

using namespace kitties::chain;

BOOST_AUTO_TEST_SUITE( dna_tests )

BOOST_AUTO_TEST_CASE( combine_dna_takes_each_bit_from_selected_parent )
{
   BOOST_CHECK_EQUAL( combine_dna( 0b11110000, 0b11001100, 0b10101010 ), 0b11100100 );

   BOOST_CHECK_EQUAL( combine_dna( 0x5a, 0xa5, 0xff ), 0x5a );
   BOOST_CHECK_EQUAL( combine_dna( 0x5a, 0xa5, 0x00 ), 0xa5 );
   BOOST_CHECK_EQUAL( combine_dna( 0xff, 0x00, 0x0f ), 0x0f );
   BOOST_CHECK_EQUAL( combine_dna( 0x00, 0xff, 0x0f ), 0xf0 );
}

BOOST_AUTO_TEST_CASE( combine_genome_is_bytewise )
{
   kitty_dna_type p1, p2, selector;
   for( uint32_t i = 0; i < KITTIES_DNA_SIZE; ++i )
   {
      p1.data[i] = uint8_t( 0b11110000 );
      p2.data[i] = uint8_t( 0b11001100 );
      selector.data[i] = uint8_t( i % 2 == 0 ? 0b10101010 : 0b01010101 );
   }

   const kitty_dna_type child = combine_genome( p1, p2, selector );
   for( uint32_t i = 0; i < KITTIES_DNA_SIZE; ++i )
   {
      BOOST_CHECK_EQUAL( child.data[i], combine_dna( p1.data[i], p2.data[i], selector.data[i] ) );
      BOOST_CHECK_EQUAL( child.data[i], i % 2 == 0 ? 0b11100100 : 0b11011000 );
   }
}

BOOST_AUTO_TEST_SUITE_END()
