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

#include <kitties/chain/kitty_evaluator.hpp>
#include <kitties/chain/kitty_object.hpp>
#include <kitties/chain/account_object.hpp>
#include <kitties/chain/dna.hpp>

#include <kitties/chain/exceptions.hpp>

#include <fc/log/logger.hpp>

namespace kitties
{
namespace chain
{

void_result kitty_create_evaluator::do_evaluate(const kitty_create_operation &)
{
    const database &d = db();
    new_kitty_id = d.next_kitty_id();
    return void_result();
}

kitty_id_result kitty_create_evaluator::do_apply(const kitty_create_operation &o)
{
    try
    {
        database &d = db();
        const kitty_dna_type dna = d.random_value(sender());
        const kitty_index_type id = d.insert_kitty(sender(), dna);
        FC_ASSERT(id == new_kitty_id);
        return kitty_id_result(id);
    }
    FC_CAPTURE_AND_RETHROW((o))
}

void_result kitty_breed_evaluator::do_evaluate(const kitty_breed_operation &o)
{
    const database &d = db();
    parent_1 = d.find_kitty(o.kitty_id_1);
    parent_2 = d.find_kitty(o.kitty_id_2);
    KITTIES_ASSERT(parent_1 != nullptr, kitty_invalid_parent, "Invalid kitty_id_1 ${id}", ("id", o.kitty_id_1));
    KITTIES_ASSERT(parent_2 != nullptr, kitty_invalid_parent, "Invalid kitty_id_2 ${id}", ("id", o.kitty_id_2));
    KITTIES_ASSERT(o.kitty_id_1 != o.kitty_id_2, kitty_same_parent, "Needs different parent, got ${id} twice", ("id", o.kitty_id_1));
    new_kitty_id = d.next_kitty_id();
    return void_result();
}

kitty_id_result kitty_breed_evaluator::do_apply(const kitty_breed_operation &o)
{
    try
    {
        database &d = db();
        // parents are copied before the registry is written
        const kitty_dna_type dna_1 = parent_1->dna;
        const kitty_dna_type dna_2 = parent_2->dna;
        const kitty_dna_type selector = d.random_value(sender());
        const kitty_index_type id = d.insert_kitty(sender(), combine_genome(dna_1, dna_2, selector));
        FC_ASSERT(id == new_kitty_id);
        return kitty_id_result(id);
    }
    FC_CAPTURE_AND_RETHROW((o))
}

void_result kitty_transfer_evaluator::do_evaluate(const kitty_transfer_operation &o)
{
    const database &d = db();
    const optional<account_id_type> owner = d.owner_of(o.kitty_id);
    KITTIES_ASSERT(owner.valid(), kitty_not_found, "No owner for kitty ${id}", ("id", o.kitty_id));
    KITTIES_ASSERT(*owner == sender(), kitty_unauthorized, "${s} does not own kitty ${id}", ("s", sender())("id", o.kitty_id));
    KITTIES_ASSERT(d.find_account(o.to) != nullptr, unknown_account, "not find account: ${account}", ("account", o.to));
    return void_result();
}

void_result kitty_transfer_evaluator::do_apply(const kitty_transfer_operation &o)
{
    try
    {
        db().move_kitty(sender(), o.to, o.kitty_id);
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((o))
}

void_result kitty_set_price_evaluator::do_evaluate(const operation_type &o)
{
    const database &d = db();
    KITTIES_ASSERT(d.kitty_exists(o.kitty_id), kitty_not_found, "Could not find kitty matching ${id}", ("id", o.kitty_id));
    const optional<account_id_type> owner = d.owner_of(o.kitty_id);
    KITTIES_ASSERT(owner.valid() && *owner == sender(), kitty_unauthorized,
                   "${s} does not own kitty ${id}, so it can't set its price", ("s", sender())("id", o.kitty_id));
    return void_result();
}

void_result kitty_set_price_evaluator::do_apply(const operation_type &o)
{
    try
    {
        db().set_kitty_price(o.kitty_id, o.price);
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((o))
}

void_result kitty_buy_evaluator::do_evaluate(const operation_type &o)
{
    const database &d = db();
    const kitty_object *kitty = d.find_kitty(o.kitty_id);
    KITTIES_ASSERT(kitty != nullptr, kitty_not_found, "This kitty ${id} does not exist", ("id", o.kitty_id));

    const optional<account_id_type> owner = d.owner_of(o.kitty_id);
    KITTIES_ASSERT(owner.valid(), kitty_not_found, "No owner for kitty ${id}", ("id", o.kitty_id));
    KITTIES_ASSERT(*owner != sender(), kitty_self_purchase, "${s} can't buy own kitty ${id}", ("s", sender())("id", o.kitty_id));

    KITTIES_ASSERT(kitty->is_for_sale(), kitty_not_for_sale, "kitty ${id} is not for sale", ("id", o.kitty_id));
    KITTIES_ASSERT(kitty->price <= o.max_price, kitty_price_too_high,
                   "kitty ${id} costs ${p}, more than max price ${m}", ("id", o.kitty_id)("p", kitty->price)("m", o.max_price));

    const share_type balance = d.get_balance(sender());
    KITTIES_ASSERT(balance >= kitty->price, insufficient_balance,
                   "Insufficient Balance: ${b}, unable to pay ${p} for kitty ${id}",
                   ("b", balance)("p", kitty->price)("id", o.kitty_id));

    seller = *owner;
    price = kitty->price;
    return void_result();
}

void_result kitty_buy_evaluator::do_apply(const operation_type &o)
{
    try
    {
        database &d = db();
        d.transfer_balance(sender(), seller, price);
        d.move_kitty(seller, sender(), o.kitty_id);
        d.set_kitty_price(o.kitty_id, 0);
        ilog("kitty ${id} sold by ${from} to ${to} for ${p}", ("id", o.kitty_id)("from", seller)("to", sender())("p", price));
        return void_result();
    }
    FC_CAPTURE_AND_RETHROW((o))
}

} // namespace chain
} // namespace kitties
