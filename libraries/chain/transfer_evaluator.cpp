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

#include <kitties/chain/transfer_evaluator.hpp>
#include <kitties/chain/account_object.hpp>
#include <kitties/chain/database.hpp>
#include <kitties/chain/exceptions.hpp>

namespace kitties
{
namespace chain
{
void_result transfer_evaluator::do_evaluate(const transfer_operation &op)
{
  try
  {
    const database &d = db();

    const account_object &from_account = d.get_account(sender());
    const account_object &to_account = d.get_account(op.to);

    const share_type balance = d.get_balance(from_account.id);
    KITTIES_ASSERT(balance >= op.amount, insufficient_balance,
                   "Insufficient Balance: ${balance}, unable to transfer '${total_transfer}' from account '${a}' to '${t}'",
                   ("a", from_account.name)("t", to_account.name)("total_transfer", op.amount)("balance", balance));

    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((op))
}

void_result transfer_evaluator::do_apply(const transfer_operation &o)
{
  try
  {
    db().transfer_balance(sender(), o.to, o.amount);
    return void_result();
  }
  FC_CAPTURE_AND_RETHROW((o))
}

} // namespace chain
} // namespace kitties
