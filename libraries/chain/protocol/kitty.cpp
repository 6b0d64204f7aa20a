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

#include <kitties/chain/protocol/kitty.hpp>
#include <kitties/chain/exceptions.hpp>

namespace kitties
{
namespace chain
{

void kitty_buy_operation::validate() const
{
    KITTIES_ASSERT(max_price >= share_type(0), kitty_buy_negative_max_price,
                   "max_price ${p} of kitty ${k} is negative", ("p", max_price)("k", kitty_id));
}

void kitty_set_price_operation::validate() const
{
    KITTIES_ASSERT(price >= share_type(0), kitty_set_price_negative_price,
                   "price ${p} of kitty ${k} is negative", ("p", price)("k", kitty_id));
    FC_ASSERT(price <= share_type(KITTIES_MAX_SHARE_SUPPLY));
}

} // namespace chain
} // namespace kitties
