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

#include <limits>

namespace kitties { namespace chain {

const kitty_object* database::find_kitty( kitty_index_type id )const
{
   return _kitties.find( id );
}

const kitty_object& database::get_kitty( kitty_index_type id )const
{
   const kitty_object* k = find_kitty( id );
   KITTIES_ASSERT( k != nullptr, kitty_not_found, "Could not find kitty matching ${id}", ("id", id) );
   return *k;
}

bool database::kitty_exists( kitty_index_type id )const
{
   return _kitties.contains( id );
}

optional<account_id_type> database::owner_of( kitty_index_type id )const
{
   return _kitty_owner.get( id );
}

kitty_index_type database::kitties_count()const
{
   return _kitties_count.get();
}

kitty_index_type database::next_kitty_id()const
{
   const kitty_index_type id = kitties_count();
   KITTIES_ASSERT( id != std::numeric_limits<kitty_index_type>::max(), kitty_index_overflow,
                   "Kitties count overflow at ${id}", ("id", id) );
   return id;
}

kitty_index_type database::insert_kitty( account_id_type owner, const kitty_dna_type& dna )
{ try {
   const kitty_index_type id = next_kitty_id();
   KITTIES_ASSERT( !_kitties.contains( id ) && !_kitty_owner.contains( id ), kitty_index_overflow,
                   "Kitty id ${id} has already been issued", ("id", id) );

   kitty_object kitty;
   kitty.dna = dna;
   kitty.price = 0;

   _kitties.insert( id, kitty );
   _kitty_owner.insert( id, owner );
   _kitties_count.put( kitty_index_type( id + 1 ) );
   _owned_kitties.append( owner, id );

   dlog( "kitty ${id} created for ${owner}", ("id", id)("owner", owner) );
   return id;
} FC_CAPTURE_AND_RETHROW( (owner)(dna) ) }

void database::set_kitty_price( kitty_index_type id, share_type price )
{ try {
   kitty_object kitty = get_kitty( id );
   kitty.price = price;
   _kitties.insert( id, kitty );
} FC_CAPTURE_AND_RETHROW( (id)(price) ) }

void database::move_kitty( account_id_type from, account_id_type to, kitty_index_type id )
{ try {
   const optional<account_id_type> owner = owner_of( id );
   KITTIES_ASSERT( owner.valid() && *owner == from, kitty_ownership_mismatch,
                   "kitty ${id} is recorded for ${owner}, not ${from}", ("id", id)("owner", owner)("from", from) );
   KITTIES_ASSERT( _owned_kitties.contains( from, id ), kitty_ownership_mismatch,
                   "kitty ${id} is not linked under ${from}", ("id", id)("from", from) );

   if( from == to )
      return;

   _owned_kitties.remove( from, id );
   _owned_kitties.append( to, id );
   _kitty_owner.insert( id, to );
} FC_CAPTURE_AND_RETHROW( (from)(to)(id) ) }

vector<kitty_index_type> database::get_owned_kitties( account_id_type owner )const
{
   return _owned_kitties.list( owner );
}

kitty_dna_type database::random_value( account_id_type sender )
{
   dynamic_global_property_object dgp = get_dynamic_global_properties();

   random_context ctx;
   ctx.seed = dgp.random_seed;
   ctx.sender = sender;
   ctx.request_index = dgp.current_random_index;
   ctx.block_num = dgp.head_block_number;

   FC_ASSERT( dgp.current_random_index < std::numeric_limits<uint32_t>::max(), "random requests exhausted for this block" );
   dgp.current_random_index++;
   _dynamic_global_props.put( dgp );

   return _random_source->random_value( ctx );
}

} } // kitties::chain
