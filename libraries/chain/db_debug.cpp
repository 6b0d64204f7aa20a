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

namespace kitties { namespace chain {

void database::debug_update_kitties_count( kitty_index_type count )
{
   // ids are never handed out twice, so the counter may not move back over an issued one
   if( !_kitties.empty() )
      KITTIES_ASSERT( _kitties.rbegin()->first < count, kitty_index_overflow,
                      "Kitty ${id} is already issued, can't set kitties count to ${c}",
                      ("id", _kitties.rbegin()->first)("c", count) );
   wlog( "debug update of kitties count from ${old} to ${new}", ("old", kitties_count())("new", count) );
   _kitties_count.put( count );
}

/**
 *  This method dumps the state of the chain in a semi-human readable form for the
 *  purpose of tracking down mismatches between owner records and ownership chains
 */
void database::debug_dump()const
{
   for( const auto& item : _accounts )
   {
      const account_object& a = item.second;
      idump( (a)(get_balance( a.id ))(get_owned_kitties( a.id )) );
   }
   for( const auto& item : _kitty_owner )
      idump( (item.first)(item.second)(*find_kitty( item.first )) );
}

} } // kitties::chain
