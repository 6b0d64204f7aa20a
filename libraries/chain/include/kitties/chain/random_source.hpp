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
    * Everything a random draw depends on.  request_index is bumped on every
    * draw and reset with each block, so draws made by the same account in
    * the same block still differ.
    */
   struct random_context
   {
      fc::sha256       seed;
      account_id_type  sender = 0;
      uint32_t         request_index = 0;
      uint32_t         block_num = 0;
   };

   /**
    * @brief supplies genomes and breeding selectors
    *
    * Implementations must be deterministic in the context: every node
    * replaying the same chain has to draw the same bytes.
    */
   class random_source
   {
      public:
         virtual ~random_source(){}
         virtual kitty_dna_type random_value( const random_context& ctx ) = 0;
   };

   /** the first KITTIES_DNA_SIZE bytes of sha256 over the packed context */
   class hash_random_source : public random_source
   {
      public:
         virtual kitty_dna_type random_value( const random_context& ctx ) override;
   };

} } // kitties::chain

FC_REFLECT( kitties::chain::random_context, (seed)(sender)(request_index)(block_num) )
