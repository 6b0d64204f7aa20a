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

/**
 * @class account_object
 * @brief an account able to send transactions, own kitties and hold a balance
 *
 * Accounts are only created from the genesis state.  Balances are kept in a
 * separate map so that transfers do not rewrite the account record.
 */
class account_object
{
 public:
   account_id_type id = 0;
   string name;
};

/**
 * Names are KITTIES_MIN_ACCOUNT_NAME_LENGTH to KITTIES_MAX_ACCOUNT_NAME_LENGTH
 * characters of lower case letters, digits and dashes, starting with a letter.
 */
bool is_valid_name(const string &name);

} // namespace chain
} // namespace kitties

FC_REFLECT(kitties::chain::account_object, (id)(name))
