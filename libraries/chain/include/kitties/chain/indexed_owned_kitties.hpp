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

#include <kitties/db/storage_map.hpp>
#include <kitties/chain/exceptions.hpp>

#include <limits>

namespace kitties { namespace chain {

   /**
    * @class indexed_owned_kitties
    * @brief dense per account slot array of owned kitty ids
    *
    * Each account owns slots 0..count-1.  Removing a kitty moves the kitty in
    * the last slot into the vacated one, so insertion and removal are O(1)
    * but removal changes the slot of an unrelated kitty.  Slot numbers must
    * therefore never be handed out as stable references; the database uses
    * linked_owned_kitties instead.
    */
   template<typename AccountIdType, typename IndexType>
   class indexed_owned_kitties
   {
      public:
         explicit indexed_owned_kitties( db::undo_database& udb )
         :_owned(udb),_count(udb),_slot_of(udb){}

         IndexType count( const AccountIdType& account )const
         {
            const IndexType* c = _count.find( account );
            return c == nullptr ? IndexType() : *c;
         }

         /** the kitty stored in a slot, absent for slots at or beyond count */
         optional<IndexType> at( const AccountIdType& account, const IndexType& slot )const
         {
            return _owned.get( std::make_pair( account, slot ) );
         }

         optional<IndexType> slot_of( const IndexType& kitty_id )const
         {
            return _slot_of.get( kitty_id );
         }

         void append( const AccountIdType& account, const IndexType& kitty_id )
         {
            const IndexType slot = count( account );
            KITTIES_ASSERT( slot < std::numeric_limits<IndexType>::max(), owned_kitties_count_overflow,
                            "account ${a} cannot own more than ${n} kitties", ("a", account)("n", slot) );

            _owned.insert( std::make_pair( account, slot ), kitty_id );
            _slot_of.insert( kitty_id, slot );
            _count.insert( account, IndexType( slot + 1 ) );
         }

         void remove( const AccountIdType& account, const IndexType& kitty_id )
         {
            const IndexType old_count = count( account );
            KITTIES_ASSERT( old_count > IndexType(), owned_kitties_count_underflow,
                            "account ${a} owns no kitties", ("a", account) );
            const IndexType last_slot = IndexType( old_count - 1 );

            optional<IndexType> slot = _slot_of.get( kitty_id );
            FC_ASSERT( slot.valid(), "kitty ${k} has no slot", ("k", kitty_id) );
            FC_ASSERT( at( account, *slot ) == optional<IndexType>( kitty_id ),
                       "kitty ${k} is not owned by ${a}", ("k", kitty_id)("a", account) );

            if( *slot != last_slot )
            {
               const IndexType last_kitty = *_owned.get( std::make_pair( account, last_slot ) );
               _owned.insert( std::make_pair( account, *slot ), last_kitty );
               _slot_of.insert( last_kitty, *slot );
            }

            _owned.remove( std::make_pair( account, last_slot ) );
            _slot_of.remove( kitty_id );
            _count.insert( account, last_slot );
         }

      private:
         db::storage_map<std::pair<AccountIdType,IndexType>,IndexType> _owned;
         db::storage_map<AccountIdType,IndexType>                      _count;
         db::storage_map<IndexType,IndexType>                          _slot_of;
   };

} } // kitties::chain
