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

namespace kitties
{
namespace chain
{

struct void_result
{
  void_result(){}
};

/** returned by operations that bring a new kitty into existence */
struct kitty_id_result
{
  kitty_id_result() {}
  kitty_id_result(kitty_index_type id) : result(id) {}
  kitty_index_type result = 0;
};

typedef fc::static_variant<void_result, kitty_id_result> operation_result;

/**
 * @brief base class for all operations
 *
 * The caller of an operation is never part of the operation itself; it is
 * resolved from the enclosing transaction by the identity resolver.
 */
struct base_operation
{
  void validate() const {}
};

} // namespace chain
} // namespace kitties

FC_REFLECT(kitties::chain::void_result, )
FC_REFLECT(kitties::chain::kitty_id_result, (result))
