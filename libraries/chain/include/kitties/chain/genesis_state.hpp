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

#include <kitties/chain/protocol/types.hpp>

#include <fc/crypto/sha256.hpp>

#include <string>
#include <vector>

namespace kitties { namespace chain {
using std::string;
using std::vector;

struct genesis_state_type {
   struct initial_account_type {
      initial_account_type(const string& name = string(), share_type balance = 0)
         : name(name),
           balance(balance)
      {}
      string name;
      share_type balance;
   };

   time_point_sec                           initial_timestamp = time_point_sec( KITTIES_DEFAULT_GENESIS_TIMESTAMP );
   /// seed of block 0; later seeds are derived from it unless supplied with a block
   fc::sha256                               initial_random_seed = fc::sha256::hash(string(KITTIES_DEFAULT_RANDOM_SEED));
   /// accounts get ids in this order, starting at 0
   vector<initial_account_type>             initial_accounts;

   /**
    * Get the chain_id corresponding to this genesis state.
    *
    * This is the SHA256 serialization of the genesis_state.
    */
   fc::sha256 compute_chain_id() const;
};

} } // namespace kitties::chain

FC_REFLECT(kitties::chain::genesis_state_type::initial_account_type, (name)(balance))

FC_REFLECT(kitties::chain::genesis_state_type,
           (initial_timestamp)(initial_random_seed)(initial_accounts))
