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
#include <kitties/chain/account_object.hpp>
#include <kitties/chain/evaluator.hpp>
#include <kitties/chain/genesis_state.hpp>
#include <kitties/chain/global_property_object.hpp>
#include <kitties/chain/identity_resolver.hpp>
#include <kitties/chain/kitty_object.hpp>
#include <kitties/chain/owned_kitties.hpp>
#include <kitties/chain/random_source.hpp>
#include <kitties/chain/protocol/transaction.hpp>

#include <kitties/db/storage_map.hpp>
#include <kitties/db/undo_database.hpp>

#include <fc/log/logger.hpp>

#include <memory>

namespace kitties { namespace chain {

   /**
    *   @class database
    *   @brief tracks the kitties chain state
    *
    *   All state lives in undoable storages registered with one
    *   undo_database.  Every transaction runs inside an undo session, so a
    *   failing operation never leaves any of its writes behind.
    */
   class database
   {
      public:
         typedef linked_owned_kitties<account_id_type,kitty_index_type> owned_kitties_index;

         //////////////////// db_management.cpp ////////////////////

         database();
         ~database();

         /** creates the genesis accounts and balances; must be called once on an empty database */
         void init_genesis( const genesis_state_type& genesis_state = genesis_state_type() );

         void set_identity_resolver( unique_ptr<identity_resolver> resolver );
         void set_random_source( unique_ptr<random_source> source );

         db::undo_database::session start_undo_session() { return _undo_db.start_undo_session(); }

         //////////////////// db_block.cpp ////////////////////

         /**
          * Authenticates the origin, validates and applies every operation.
          * Either all operations take effect or the transaction throws and
          * none of them do.
          */
         processed_transaction push_transaction( const transaction& trx );

         /**
          * Closes the head block and opens the next one.  Without an explicit
          * seed the next seed is the hash of the previous seed and the new
          * block number.
          *
          * @return the new head block number
          */
         uint32_t generate_block( const optional<fc::sha256>& seed = optional<fc::sha256>() );

         operation_result apply_operation( transaction_evaluation_state& eval_state, const operation& op );

         //////////////////// db_getter.cpp ////////////////////

         dynamic_global_property_object get_dynamic_global_properties()const;
         uint32_t                       head_block_num()const;
         time_point_sec                 head_block_time()const;

         const account_object*          find_account( account_id_type id )const;
         /** @throws unknown_account */
         const account_object&          get_account( account_id_type id )const;
         const account_object*          find_account_by_name( const string& name )const;
         uint64_t                       get_account_count()const;

         //////////////////// db_init.cpp ////////////////////

         void initialize_evaluators();

         template<typename EvaluatorType>
         void register_evaluator()
         {
            _operation_evaluators[
               operation::tag<typename EvaluatorType::operation_type>::value].reset( new op_evaluator_impl<EvaluatorType>() );
         }

         //////////////////// db_balance.cpp ////////////////////

         share_type get_balance( account_id_type owner )const;

         /**
          * @brief Adjust a particular account's balance
          * @param account ID of account whose balance should be adjusted
          * @param delta amount to add, negative to subtract
          * @throws insufficient_balance if the balance would go negative
          */
         void adjust_balance( account_id_type account, share_type delta );

         /**
          * Moves amount from one account to another.  The source balance is
          * checked before either balance is written.
          */
         void transfer_balance( account_id_type from, account_id_type to, share_type amount );

         //////////////////// db_kitty.cpp ////////////////////

         const kitty_object*        find_kitty( kitty_index_type id )const;
         /** @throws kitty_not_found */
         const kitty_object&        get_kitty( kitty_index_type id )const;
         bool                       kitty_exists( kitty_index_type id )const;
         optional<account_id_type>  owner_of( kitty_index_type id )const;

         /** number of kitties ever created, which is also the next id to hand out */
         kitty_index_type           kitties_count()const;

         /** @throws kitty_index_overflow once every id has been issued */
         kitty_index_type           next_kitty_id()const;

         /**
          * Stores a new kitty with price 0, records its owner and appends it
          * to the owner's chain.
          *
          * @return the id of the new kitty
          */
         kitty_index_type           insert_kitty( account_id_type owner, const kitty_dna_type& dna );

         /** @throws kitty_not_found */
         void                       set_kitty_price( kitty_index_type id, share_type price );

         /**
          * Re-parents a kitty from one chain to another and rewrites its owner
          * record.  The owner record and the source chain are both checked
          * first; on a mismatch nothing is written.
          *
          * @throws kitty_ownership_mismatch
          */
         void                       move_kitty( account_id_type from, account_id_type to, kitty_index_type id );

         /** ids owned by an account, oldest first */
         vector<kitty_index_type>   get_owned_kitties( account_id_type owner )const;
         const owned_kitties_index& get_owned_kitties_index()const { return _owned_kitties; }

         /**
          * Draws 16 fresh bytes for sender.  Draws in the same block differ
          * because each one bumps the block's request counter.
          */
         kitty_dna_type             random_value( account_id_type sender );

         //////////////////// db_debug.cpp ////////////////////

         /**
          * Overwrites the kitties counter without issuing any kitty.  Only
          * for tests that need to reach the end of the id space.
          */
         void debug_update_kitties_count( kitty_index_type count );

         /** logs every account with its balance and owned kitties */
         void debug_dump()const;

      private:
         processed_transaction _apply_transaction( const transaction& trx );

         /// declared first so it outlives every storage registered with it
         db::undo_database                                      _undo_db;

         vector< unique_ptr<op_evaluator> >                     _operation_evaluators;
         unique_ptr<identity_resolver>                          _identity_resolver;
         unique_ptr<random_source>                              _random_source;

         db::storage_map<kitty_index_type,kitty_object>         _kitties;
         db::storage_map<kitty_index_type,account_id_type>      _kitty_owner;
         db::storage_value<kitty_index_type>                    _kitties_count;
         owned_kitties_index                                    _owned_kitties;

         db::storage_map<account_id_type,account_object>        _accounts;
         db::storage_map<string,account_id_type>                _accounts_by_name;
         db::storage_map<account_id_type,share_type>            _balances;

         db::storage_value<dynamic_global_property_object>      _dynamic_global_props;
   };

} } // kitties::chain
