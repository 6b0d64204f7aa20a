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

#include <kitties/app/database_api.hpp>

#include <fc/log/logger.hpp>

#include <algorithm>
#include <iterator>

namespace kitties { namespace app {

class database_api_impl : public std::enable_shared_from_this<database_api_impl>
{
   public:
      database_api_impl( kitties::chain::database& db );
      ~database_api_impl();

      optional<kitty_info>         get_kitty( kitty_index_type id )const;
      vector<optional<kitty_info>> get_kitties( const vector<kitty_index_type>& ids )const;
      kitty_index_type             get_kitties_count()const;
      vector<kitty_info>           list_account_kitties( account_id_type account )const;
      vector<kitty_info>           list_kitties_for_sale( account_id_type account )const;

      share_type                   get_account_balance( account_id_type account )const;
      optional<account_object>     get_account_by_name( const string& name )const;

      kitties::chain::database& _db;
};

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Constructors                                                     //
//                                                                  //
//////////////////////////////////////////////////////////////////////

database_api::database_api( kitties::chain::database& db )
   : my( new database_api_impl( db ) ) {}

database_api::~database_api() {}

database_api_impl::database_api_impl( kitties::chain::database& db ):_db(db)
{
   dlog( "creating database api ${x}", ("x",int64_t(this)) );
}

database_api_impl::~database_api_impl()
{
   dlog( "freeing database api ${x}", ("x",int64_t(this)) );
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Kitties                                                          //
//                                                                  //
//////////////////////////////////////////////////////////////////////

optional<kitty_info> database_api::get_kitty( kitty_index_type id )const
{
   return my->get_kitty( id );
}

optional<kitty_info> database_api_impl::get_kitty( kitty_index_type id )const
{
   const kitty_object* kitty = _db.find_kitty( id );
   if( kitty == nullptr )
      return optional<kitty_info>();

   const optional<account_id_type> owner = _db.owner_of( id );
   FC_ASSERT( owner.valid(), "kitty ${id} has no owner", ("id", id) );

   kitty_info info;
   info.id = id;
   info.owner = *owner;
   info.dna = kitty->dna;
   info.price = kitty->price;
   return info;
}

vector<optional<kitty_info>> database_api::get_kitties( const vector<kitty_index_type>& ids )const
{
   return my->get_kitties( ids );
}

vector<optional<kitty_info>> database_api_impl::get_kitties( const vector<kitty_index_type>& ids )const
{
   vector<optional<kitty_info>> result;
   result.reserve( ids.size() );
   std::transform( ids.begin(), ids.end(), std::back_inserter(result),
                   [this]( kitty_index_type id ) -> optional<kitty_info> {
      return get_kitty( id );
   });
   return result;
}

kitty_index_type database_api::get_kitties_count()const
{
   return my->get_kitties_count();
}

kitty_index_type database_api_impl::get_kitties_count()const
{
   return _db.kitties_count();
}

vector<kitty_info> database_api::list_account_kitties( account_id_type account )const
{
   return my->list_account_kitties( account );
}

vector<kitty_info> database_api_impl::list_account_kitties( account_id_type account )const
{
   vector<kitty_info> result;
   for( const kitty_index_type id : _db.get_owned_kitties( account ) )
   {
      optional<kitty_info> info = get_kitty( id );
      FC_ASSERT( info.valid() && info->owner == account,
                 "ownership chain of ${a} lists kitty ${id} it does not own", ("a", account)("id", id) );
      result.push_back( *info );
   }
   return result;
}

vector<kitty_info> database_api::list_kitties_for_sale( account_id_type account )const
{
   return my->list_kitties_for_sale( account );
}

vector<kitty_info> database_api_impl::list_kitties_for_sale( account_id_type account )const
{
   vector<kitty_info> result = list_account_kitties( account );
   result.erase( std::remove_if( result.begin(), result.end(),
                                 []( const kitty_info& k ) { return k.price == share_type(0); } ),
                 result.end() );
   return result;
}

//////////////////////////////////////////////////////////////////////
//                                                                  //
// Accounts                                                         //
//                                                                  //
//////////////////////////////////////////////////////////////////////

share_type database_api::get_account_balance( account_id_type account )const
{
   return my->get_account_balance( account );
}

share_type database_api_impl::get_account_balance( account_id_type account )const
{
   return _db.get_balance( account );
}

optional<account_object> database_api::get_account_by_name( const string& name )const
{
   return my->get_account_by_name( name );
}

optional<account_object> database_api_impl::get_account_by_name( const string& name )const
{
   const account_object* a = _db.find_account_by_name( name );
   if( a == nullptr )
      return optional<account_object>();
   return *a;
}

} } // kitties::app
