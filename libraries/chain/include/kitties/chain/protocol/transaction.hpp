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

#pragma once
#include <kitties/chain/protocol/operations.hpp>

namespace kitties { namespace chain {

   typedef fc::sha256 digest_type;

   /**
    * @defgroup transactions Transactions
    *
    * A transaction groups operations that are applied in order and atomically:
    * if any of them fails, none of their effects remain.
    *
    * @{
    */
   struct transaction
   {
      /**
       * The account the transaction claims to be sent by.  It is turned into
       * an authenticated caller by the database's identity resolver; an
       * absent origin never authenticates.
       */
      optional<account_id_type> origin;
      vector<operation>         operations;

      digest_type digest()const;

      void validate()const;

      void clear() { operations.clear(); }
   };

   struct processed_transaction : public transaction
   {
      processed_transaction( const transaction& trx = transaction() )
         : transaction(trx){}

      vector<operation_result> operation_results;
   };

   /// @} transactions group

} } // kitties::chain

FC_REFLECT( kitties::chain::transaction, (origin)(operations) )
FC_REFLECT_DERIVED( kitties::chain::processed_transaction, (kitties::chain::transaction), (operation_results) )
