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

#include <kitties/chain/identity_resolver.hpp>
#include <kitties/chain/database.hpp>
#include <kitties/chain/exceptions.hpp>

namespace kitties { namespace chain {

account_id_type account_identity_resolver::authenticate( const database& db, const transaction& trx )const
{
   KITTIES_ASSERT( trx.origin.valid(), unauthenticated_transaction,
                   "transaction ${id} has no origin", ("id", trx.digest()) );
   KITTIES_ASSERT( db.find_account( *trx.origin ) != nullptr, unauthenticated_transaction,
                   "origin ${a} of transaction ${id} is not a registered account",
                   ("a", *trx.origin)("id", trx.digest()) );
   return *trx.origin;
}

} } // kitties::chain
