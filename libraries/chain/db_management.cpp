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

namespace kitties { namespace chain {

database::database()
:_identity_resolver( new account_identity_resolver() ),
 _random_source( new hash_random_source() ),
 _kitties(_undo_db),
 _kitty_owner(_undo_db),
 _kitties_count(_undo_db),
 _owned_kitties(_undo_db),
 _accounts(_undo_db),
 _accounts_by_name(_undo_db),
 _balances(_undo_db),
 _dynamic_global_props(_undo_db)
{
   initialize_evaluators();
}

database::~database()
{
}

void database::set_identity_resolver( unique_ptr<identity_resolver> resolver )
{
   FC_ASSERT( resolver, "identity resolver must not be null" );
   _identity_resolver = std::move( resolver );
}

void database::set_random_source( unique_ptr<random_source> source )
{
   FC_ASSERT( source, "random source must not be null" );
   _random_source = std::move( source );
}

} } // kitties::chain
