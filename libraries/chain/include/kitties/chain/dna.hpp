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

#include <kitties/chain/protocol/types.hpp>

namespace kitties { namespace chain {

   /**
    * Each bit of the result is taken from dna1 where the matching selector
    * bit is set and from dna2 where it is clear.
    *
    * combine_dna(0b11110000, 0b11001100, 0b10101010) == 0b11100100
    */
   inline uint8_t combine_dna( uint8_t dna1, uint8_t dna2, uint8_t selector )
   {
      return uint8_t( (selector & dna1) | (~selector & dna2) );
   }

   /** applies combine_dna to each byte of two parent genomes */
   kitty_dna_type combine_genome( const kitty_dna_type& parent1,
                                  const kitty_dna_type& parent2,
                                  const kitty_dna_type& selector );

} } // kitties::chain
