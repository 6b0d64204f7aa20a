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

#include <kitties/chain/database.hpp>

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>

#include <memory>
#include <string>
#include <vector>

namespace kitties { namespace app {

using namespace kitties::chain;
using std::string;
using std::vector;

class database_api_impl;

/** a kitty joined with its current owner */
struct kitty_info
{
   kitty_index_type  id = 0;
   account_id_type   owner = 0;
   kitty_dna_type    dna;
   share_type        price;
};

/**
 * @brief The database_api class implements the RPC API for the chain database.
 *
 * This API exposes accessors on the database which query state tracked by a
 * node. This API is read-only; all modifications to the database must be
 * performed via transactions.
 */
class database_api
{
   public:
      database_api( kitties::chain::database& db );
      ~database_api();

      ////////////
      // Kitties //
      ////////////

      /**
       * @brief Get a kitty together with its owner
       * @return null if no kitty has this id
       */
      optional<kitty_info> get_kitty( kitty_index_type id )const;

      /**
       * @brief Get the kitties corresponding to the provided IDs
       * @return The kitties retrieved, in the order they are mentioned in ids
       *
       * If any of the provided IDs does not map to a kitty, a null is returned in its position.
       */
      vector<optional<kitty_info>> get_kitties( const vector<kitty_index_type>& ids )const;

      /** number of kitties ever created */
      kitty_index_type get_kitties_count()const;

      /** kitties owned by an account, oldest first */
      vector<kitty_info> list_account_kitties( account_id_type account )const;

      /** kitties owned by an account with a non zero price */
      vector<kitty_info> list_kitties_for_sale( account_id_type account )const;

      //////////////
      // Accounts //
      //////////////

      share_type get_account_balance( account_id_type account )const;

      optional<account_object> get_account_by_name( const string& name )const;

   private:
      std::shared_ptr< database_api_impl > my;
};

} } // kitties::app

FC_REFLECT( kitties::app::kitty_info, (id)(owner)(dna)(price) )
