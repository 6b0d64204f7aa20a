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
#include <kitties/chain/protocol/base.hpp>
#include <kitties/chain/protocol/kitty.hpp>
#include <kitties/chain/protocol/transfer.hpp>

namespace kitties { namespace chain {

   /**
    * @ingroup operations
    *
    * Defines the set of valid operations as a discriminated union type.
    * New operations are only ever appended; the tag of an operation is part
    * of its serialized form.
    */
   typedef fc::static_variant<
            transfer_operation,                 //0
            kitty_create_operation,             //1
            kitty_breed_operation,              //2
            kitty_transfer_operation,           //3
            kitty_buy_operation,                //4
            kitty_set_price_operation           //5
         > operation;

   void operation_validate( const operation& op );

} } // kitties::chain

FC_REFLECT_TYPENAME( kitties::chain::operation )
FC_REFLECT_TYPENAME( kitties::chain::operation_result )
