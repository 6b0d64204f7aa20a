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

namespace kitties
{
namespace chain
{

// create a kitty with a random genome, owned by the caller
struct kitty_create_operation : public base_operation
{
  void validate() const {}
};

// breed a new kitty for the caller out of two existing, distinct parents
struct kitty_breed_operation : public base_operation
{
  kitty_index_type kitty_id_1 = 0;
  kitty_index_type kitty_id_2 = 0;
  void validate() const {}
};

// hand a kitty owned by the caller to another account
struct kitty_transfer_operation : public base_operation
{
  account_id_type  to = 0;
  kitty_index_type kitty_id = 0;
  void validate() const {}
};

// buy a kitty that is for sale, paying at most max_price
struct kitty_buy_operation : public base_operation
{
  kitty_index_type kitty_id = 0;
  share_type       max_price;
  void validate() const;
};

// put a kitty owned by the caller up for sale; a price of 0 takes it off the market
struct kitty_set_price_operation : public base_operation
{
  kitty_index_type kitty_id = 0;
  share_type       price;
  void validate() const;
};

} // namespace chain
} // namespace kitties

FC_REFLECT(kitties::chain::kitty_create_operation, )
FC_REFLECT(kitties::chain::kitty_breed_operation, (kitty_id_1)(kitty_id_2))
FC_REFLECT(kitties::chain::kitty_transfer_operation, (to)(kitty_id))
FC_REFLECT(kitties::chain::kitty_buy_operation, (kitty_id)(max_price))
FC_REFLECT(kitties::chain::kitty_set_price_operation, (kitty_id)(price))
