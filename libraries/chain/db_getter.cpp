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

dynamic_global_property_object database::get_dynamic_global_properties()const
{
   return _dynamic_global_props.get();
}

uint32_t database::head_block_num()const
{
   return get_dynamic_global_properties().head_block_number;
}

time_point_sec database::head_block_time()const
{
   return get_dynamic_global_properties().time;
}

const account_object* database::find_account( account_id_type id )const
{
   return _accounts.find( id );
}

const account_object& database::get_account( account_id_type id )const
{
   const account_object* a = find_account( id );
   KITTIES_ASSERT( a != nullptr, unknown_account, "not find account: ${account}", ("account", id) );
   return *a;
}

const account_object* database::find_account_by_name( const string& name )const
{
   const account_id_type* id = _accounts_by_name.find( name );
   if( id == nullptr )
      return nullptr;
   return find_account( *id );
}

uint64_t database::get_account_count()const
{
   return _accounts.size();
}

} } // kitties::chain
