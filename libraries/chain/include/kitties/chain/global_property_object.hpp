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
    * @class dynamic_global_property_object
    * @brief Maintains global state that changes from block to block
    */
   class dynamic_global_property_object
   {
      public:
         uint32_t          head_block_number = 0;
         time_point_sec    time;
         /** seed of the head block, input of every random draw made in it */
         fc::sha256        random_seed;
         /** random draws made so far in the head block */
         uint32_t          current_random_index = 0;
   };

}}

FC_REFLECT( kitties::chain::dynamic_global_property_object,
            (head_block_number)
            (time)
            (random_seed)
            (current_random_index)
          )
