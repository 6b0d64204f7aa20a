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
#include <kitties/chain/transaction_evaluation_state.hpp>

namespace kitties { namespace chain {

processed_transaction database::push_transaction( const transaction& trx )
{ try {
   // The temporary session is discarded by its destructor if
   // _apply_transaction throws.  If we make it to merge(), the
   // changes become part of the enclosing state.
   auto temp_session = _undo_db.start_undo_session();
   processed_transaction processed_trx;
   try {
      processed_trx = _apply_transaction( trx );
   } catch( const fc::exception& e ) {
      wlog( "transaction ${id} from ${origin} rejected: ${e}",
            ("id", trx.digest())("origin", trx.origin)("e", e.to_string()) );
      throw;
   }
   temp_session.merge();
   return processed_trx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

processed_transaction database::_apply_transaction( const transaction& trx )
{ try {
   trx.validate();

   transaction_evaluation_state eval_state( this );
   eval_state._trx = &trx;
   eval_state.caller = _identity_resolver->authenticate( *this, trx );

   processed_transaction ptrx( trx );
   for( const auto& op : ptrx.operations )
      ptrx.operation_results.emplace_back( apply_operation( eval_state, op ) );

   return ptrx;
} FC_CAPTURE_AND_RETHROW( (trx) ) }

operation_result database::apply_operation( transaction_evaluation_state& eval_state, const operation& op )
{ try {
   const int i_which = op.which();
   FC_ASSERT( i_which >= 0, "Negative operation tag in operation ${op}", ("op", op) );
   const uint64_t u_which = uint64_t( i_which );
   FC_ASSERT( u_which < _operation_evaluators.size(), "No registered evaluator for operation ${op}", ("op", op) );
   unique_ptr<op_evaluator>& eval = _operation_evaluators[ u_which ];
   FC_ASSERT( eval, "No registered evaluator for operation ${op}", ("op", op) );

   auto op_session = _undo_db.start_undo_session();
   operation_result result = eval->evaluate( eval_state, op, true );
   op_session.merge();
   return result;
} FC_CAPTURE_AND_RETHROW( (op) ) }

uint32_t database::generate_block( const optional<fc::sha256>& seed )
{ try {
   FC_ASSERT( _undo_db.active_sessions() == 0, "cannot generate a block inside an undo session" );

   dynamic_global_property_object dgp = get_dynamic_global_properties();
   dgp.head_block_number++;
   dgp.time = dgp.time + fc::seconds( KITTIES_BLOCK_INTERVAL );
   if( seed.valid() )
      dgp.random_seed = *seed;
   else
      dgp.random_seed = fc::sha256::hash( std::make_pair( dgp.random_seed, dgp.head_block_number ) );
   dgp.current_random_index = 0;
   _dynamic_global_props.put( dgp );

   dlog( "generated block ${n} at ${t}", ("n", dgp.head_block_number)("t", dgp.time) );
   return dgp.head_block_number;
} FC_CAPTURE_AND_RETHROW( (seed) ) }

} } // kitties::chain
