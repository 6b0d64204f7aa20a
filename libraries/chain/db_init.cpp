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
#include <kitties/chain/evaluator.hpp>
#include <kitties/chain/exceptions.hpp>
#include <kitties/chain/kitty_evaluator.hpp>
#include <kitties/chain/transfer_evaluator.hpp>

namespace kitties { namespace chain {

void database::initialize_evaluators()
{
   _operation_evaluators.resize( operation::count() );
   register_evaluator<transfer_evaluator>();
   register_evaluator<kitty_create_evaluator>();
   register_evaluator<kitty_breed_evaluator>();
   register_evaluator<kitty_transfer_evaluator>();
   register_evaluator<kitty_buy_evaluator>();
   register_evaluator<kitty_set_price_evaluator>();
}

void database::init_genesis( const genesis_state_type& genesis_state )
{ try {
   FC_ASSERT( _accounts.empty() && !_dynamic_global_props.exists(),
              "genesis can only be applied to an empty database" );
   FC_ASSERT( _undo_db.active_sessions() == 0 );

   for( const auto& account : genesis_state.initial_accounts )
   {
      FC_ASSERT( is_valid_name( account.name ), "account name (${name}) not a legitimate account name", ("name", account.name) );
      FC_ASSERT( !_accounts_by_name.contains( account.name ), "duplicate genesis account ${name}", ("name", account.name) );
      FC_ASSERT( account.balance >= 0 && account.balance <= KITTIES_MAX_SHARE_SUPPLY,
                 "invalid initial balance for ${name}", ("name", account.name)("balance", account.balance) );

      account_object a;
      a.id = _accounts.size();
      a.name = account.name;
      _accounts.insert( a.id, a );
      _accounts_by_name.insert( a.name, a.id );
      if( account.balance != 0 )
         _balances.insert( a.id, account.balance );
   }

   dynamic_global_property_object p;
   p.head_block_number = 0;
   p.time = genesis_state.initial_timestamp;
   p.random_seed = genesis_state.initial_random_seed;
   p.current_random_index = 0;
   _dynamic_global_props.put( p );

   ilog( "initialized genesis with ${n} accounts, chain id ${id}",
         ("n", genesis_state.initial_accounts.size())("id", genesis_state.compute_chain_id()) );
} FC_CAPTURE_AND_RETHROW() }

} } // kitties::chain
