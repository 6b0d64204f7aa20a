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
#include <kitties/chain/evaluator.hpp>
#include <kitties/chain/database.hpp>

namespace kitties { namespace chain {

   class kitty_create_evaluator : public evaluator<kitty_create_evaluator>
   {
      public:
         typedef kitty_create_operation operation_type;

         void_result do_evaluate( const kitty_create_operation& o );
         kitty_id_result do_apply( const kitty_create_operation& o );

      private:
         kitty_index_type new_kitty_id = 0;
   };

   class kitty_breed_evaluator : public evaluator<kitty_breed_evaluator>
   {
      public:
         typedef kitty_breed_operation operation_type;

         void_result do_evaluate( const kitty_breed_operation& o );
         kitty_id_result do_apply( const kitty_breed_operation& o );

      private:
         const kitty_object* parent_1 = nullptr;
         const kitty_object* parent_2 = nullptr;
         kitty_index_type    new_kitty_id = 0;
   };

   class kitty_transfer_evaluator : public evaluator<kitty_transfer_evaluator>
   {
      public:
         typedef kitty_transfer_operation operation_type;

         void_result do_evaluate( const kitty_transfer_operation& o );
         void_result do_apply( const kitty_transfer_operation& o );
   };

   class kitty_set_price_evaluator : public evaluator<kitty_set_price_evaluator>
   {
      public:
         typedef kitty_set_price_operation operation_type;

         void_result do_evaluate( const operation_type& o );
         void_result do_apply( const operation_type& o );
   };

   /**
    * Pays the seller and re-parents the kitty to the buyer.  The payment and
    * the move run in the same operation session, so either both take effect
    * or neither does.
    */
   class kitty_buy_evaluator : public evaluator<kitty_buy_evaluator>
   {
      public:
         typedef kitty_buy_operation operation_type;

         void_result do_evaluate( const operation_type& o );
         void_result do_apply( const operation_type& o );

      private:
         account_id_type seller = 0;
         share_type      price;
   };

} } // kitties::chain
