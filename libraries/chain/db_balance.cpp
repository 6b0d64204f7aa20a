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

#include <kitties/chain/database.hpp>
#include <kitties/chain/exceptions.hpp>

namespace kitties
{
namespace chain
{

share_type database::get_balance(account_id_type owner) const
{
    const share_type *balance = _balances.find(owner);
    if (balance == nullptr)
        return share_type(0);
    return *balance;
}

void database::adjust_balance(account_id_type account, share_type delta)
{
    try
    {
        if (delta == share_type(0))
            return;

        const account_object &a = get_account(account);
        const share_type balance = get_balance(account);
        KITTIES_ASSERT(delta > share_type(0) || balance >= -delta, insufficient_balance,
                       "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                       ("a", a.name)("b", balance)("r", -delta));

        const share_type new_balance = balance + delta;
        if (new_balance == share_type(0))
            _balances.remove(account);
        else
            _balances.insert(account, new_balance);
    }
    FC_CAPTURE_AND_RETHROW((account)(delta))
}

void database::transfer_balance(account_id_type from, account_id_type to, share_type amount)
{
    try
    {
        FC_ASSERT(amount >= share_type(0), "cannot transfer a negative amount");
        KITTIES_ASSERT(find_account(to) != nullptr, unknown_account, "not find account: ${account}", ("account", to));
        const share_type balance = get_balance(from);
        KITTIES_ASSERT(balance >= amount, insufficient_balance,
                       "Insufficient Balance: ${a}'s balance of ${b} is less than required ${r}",
                       ("a", get_account(from).name)("b", balance)("r", amount));
        if (from == to)
            return;

        adjust_balance(from, -amount);
        adjust_balance(to, amount);
    }
    FC_CAPTURE_AND_RETHROW((from)(to)(amount))
}

} // namespace chain
} // namespace kitties
