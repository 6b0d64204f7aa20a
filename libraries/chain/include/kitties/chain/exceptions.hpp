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

#include <fc/exception/exception.hpp>
#include <kitties/chain/protocol/operations.hpp>

#define KITTIES_ASSERT( expr, exc_type, FORMAT, ... )                 \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END


#define KITTIES_DECLARE_OP_BASE_EXCEPTIONS( op_name )                 \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _validate_exception,                                 \
      kitties::chain::operation_validate_exception,                   \
      3040000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation validation exception"                      \
      )                                                               \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _evaluate_exception,                                 \
      kitties::chain::operation_evaluate_exception,                   \
      3050000 + 100 * operation::tag< op_name ## _operation >::value, \
      #op_name "_operation evaluation exception"                      \
      )

#define KITTIES_DECLARE_OP_VALIDATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      kitties::chain::op_name ## _validate_exception,                 \
      3040000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

#define KITTIES_DECLARE_OP_EVALUATE_EXCEPTION( exc_name, op_name, seqnum, msg ) \
   FC_DECLARE_DERIVED_EXCEPTION(                                      \
      op_name ## _ ## exc_name,                                       \
      kitties::chain::op_name ## _evaluate_exception,                 \
      3050000 + 100 * operation::tag< op_name ## _operation >::value  \
         + seqnum,                                                    \
      msg                                                             \
      )

namespace kitties { namespace chain {

   FC_DECLARE_EXCEPTION( chain_exception, 3000000, "blockchain exception" )
   FC_DECLARE_DERIVED_EXCEPTION( database_query_exception,          kitties::chain::chain_exception, 3010000, "database query exception" )
   FC_DECLARE_DERIVED_EXCEPTION( transaction_exception,             kitties::chain::chain_exception, 3030000, "transaction validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_validate_exception,      kitties::chain::chain_exception, 3040000, "operation validation exception" )
   FC_DECLARE_DERIVED_EXCEPTION( operation_evaluate_exception,      kitties::chain::chain_exception, 3050000, "operation evaluation exception" )

   FC_DECLARE_DERIVED_EXCEPTION( unauthenticated_transaction,       kitties::chain::transaction_exception, 3030001, "transaction origin could not be authenticated" )
   FC_DECLARE_DERIVED_EXCEPTION( empty_transaction,                 kitties::chain::transaction_exception, 3030002, "transaction carries no operations" )

   FC_DECLARE_DERIVED_EXCEPTION( unknown_account,                   kitties::chain::database_query_exception, 3010001, "unknown account" )

   // kitty registry, breeding and marketplace failures
   FC_DECLARE_DERIVED_EXCEPTION( kitty_exception,                   kitties::chain::operation_evaluate_exception, 3100000, "kitty exception" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_index_overflow,              kitties::chain::kitty_exception, 3100001, "kitties count overflow" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_not_found,                   kitties::chain::kitty_exception, 3100002, "kitty does not exist" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_unauthorized,                kitties::chain::kitty_exception, 3100003, "sender does not own this kitty" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_same_parent,                 kitties::chain::kitty_exception, 3100004, "needs different parents" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_invalid_parent,              kitties::chain::kitty_exception, 3100005, "invalid parent kitty" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_not_for_sale,                kitties::chain::kitty_exception, 3100006, "kitty is not for sale" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_price_too_high,              kitties::chain::kitty_exception, 3100007, "kitty costs more than max price" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_self_purchase,               kitties::chain::kitty_exception, 3100008, "cannot buy own kitty" )
   FC_DECLARE_DERIVED_EXCEPTION( kitty_ownership_mismatch,          kitties::chain::kitty_exception, 3100009, "kitty owner record and ownership chain disagree" )

   FC_DECLARE_DERIVED_EXCEPTION( owned_kitties_count_overflow,      kitties::chain::kitty_exception, 3100010, "owned kitties count overflow" )
   FC_DECLARE_DERIVED_EXCEPTION( owned_kitties_count_underflow,     kitties::chain::kitty_exception, 3100011, "owned kitties count underflow" )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_balance,              kitties::chain::operation_evaluate_exception, 3110001, "insufficient balance" )

   KITTIES_DECLARE_OP_BASE_EXCEPTIONS( transfer );
   KITTIES_DECLARE_OP_VALIDATE_EXCEPTION( non_positive_amount, transfer, 1, "transfer amount must be positive" )

   KITTIES_DECLARE_OP_BASE_EXCEPTIONS( kitty_buy );
   KITTIES_DECLARE_OP_VALIDATE_EXCEPTION( negative_max_price, kitty_buy, 1, "max price must not be negative" )

   KITTIES_DECLARE_OP_BASE_EXCEPTIONS( kitty_set_price );
   KITTIES_DECLARE_OP_VALIDATE_EXCEPTION( negative_price, kitty_set_price, 1, "price must not be negative" )

} } // kitties::chain
