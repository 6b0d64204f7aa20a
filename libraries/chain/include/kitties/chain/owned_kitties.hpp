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
#include <kitties/chain/protocol/types.hpp>

namespace kitties { namespace chain {

   /**
    * A node of an account's ownership chain.  The node stored under the
    * account with no kitty is the chain's head: its next is the oldest kitty
    * still owned and its prev the most recently appended one.
    */
   template<typename IndexType>
   struct kitty_linked_item
   {
      optional<IndexType> prev;
      optional<IndexType> next;

      friend bool operator == ( const kitty_linked_item& a, const kitty_linked_item& b )
      {
         return a.prev == b.prev && a.next == b.next;
      }
      friend bool operator != ( const kitty_linked_item& a, const kitty_linked_item& b )
      {
         return !(a == b);
      }
   };

   template<typename AccountIdType, typename IndexType>
   struct owned_kitty_key
   {
      owned_kitty_key(){}
      owned_kitty_key( const AccountIdType& o, const optional<IndexType>& k ):owner(o),kitty(k){}

      AccountIdType        owner;
      optional<IndexType>  kitty;

      /** orders by owner, then the head before every kitty, then by kitty */
      friend bool operator < ( const owned_kitty_key& a, const owned_kitty_key& b )
      {
         if( a.owner != b.owner )
            return a.owner < b.owner;
         if( a.kitty.valid() != b.kitty.valid() )
            return !a.kitty.valid();
         if( !a.kitty.valid() )
            return false;
         return *a.kitty < *b.kitty;
      }
   };

   /**
    * @class linked_owned_kitties
    * @brief per account doubly linked list of owned kitty ids, stored as key-value entries
    *
    * Links live in a storage_map keyed by (account, optional kitty id); the
    * entry without a kitty id is the head.  append and remove touch at most
    * three entries, independent of how many kitties the account owns, and
    * never move any other kitty's node.
    *
    * remove must only be called with a kitty currently linked under the
    * given account.  The database checks this before every move.
    */
   template<typename AccountIdType, typename IndexType>
   class linked_owned_kitties
   {
      public:
         typedef kitty_linked_item<IndexType>                   item_type;
         typedef owned_kitty_key<AccountIdType,IndexType>       key_type;
         typedef db::storage_map<key_type,item_type>            storage_type;

         explicit linked_owned_kitties( db::undo_database& udb ):_links(udb){}

         item_type read_head( const AccountIdType& account )const
         {
            return read( account, optional<IndexType>() );
         }

         /** the stored node, or an unlinked one if the key has no entry */
         item_type read( const AccountIdType& account, const optional<IndexType>& key )const
         {
            const item_type* item = _links.find( key_type( account, key ) );
            if( item == nullptr )
               return item_type();
            return *item;
         }

         /** the raw entry, absent if it was never written or has been removed */
         optional<item_type> get( const AccountIdType& account, const optional<IndexType>& key )const
         {
            return _links.get( key_type( account, key ) );
         }

         bool contains( const AccountIdType& account, const IndexType& kitty_id )const
         {
            return _links.contains( key_type( account, kitty_id ) );
         }

         void append( const AccountIdType& account, const IndexType& kitty_id )
         {
            item_type head = read_head( account );

            item_type item;
            item.prev = head.prev;

            if( head.prev.valid() )
            {
               item_type tail = read( account, head.prev );
               tail.next = kitty_id;
               write( account, head.prev, tail );
            }
            else
               head.next = kitty_id;

            head.prev = kitty_id;
            write_head( account, head );
            write( account, kitty_id, item );
         }

         void remove( const AccountIdType& account, const IndexType& kitty_id )
         {
            optional<item_type> item = _links.take( key_type( account, kitty_id ) );
            if( !item.valid() )
               return;

            // a missing neighbour is the head, so both splices land on it at the ends
            item_type prev = read( account, item->prev );
            prev.next = item->next;
            write( account, item->prev, prev );

            item_type next = read( account, item->next );
            next.prev = item->prev;
            write( account, item->next, next );
         }

         /** kitty ids from the oldest to the most recently appended */
         vector<IndexType> list( const AccountIdType& account )const
         {
            vector<IndexType> result;
            optional<IndexType> cursor = read_head( account ).next;
            while( cursor.valid() )
            {
               FC_ASSERT( result.size() < _links.size(), "ownership chain of ${a} does not terminate", ("a", account) );
               result.push_back( *cursor );
               cursor = read( account, cursor ).next;
            }
            return result;
         }

         /** kitty ids from the most recently appended to the oldest */
         vector<IndexType> list_reverse( const AccountIdType& account )const
         {
            vector<IndexType> result;
            optional<IndexType> cursor = read_head( account ).prev;
            while( cursor.valid() )
            {
               FC_ASSERT( result.size() < _links.size(), "ownership chain of ${a} does not terminate", ("a", account) );
               result.push_back( *cursor );
               cursor = read( account, cursor ).prev;
            }
            return result;
         }

         const storage_type& links()const { return _links; }

      private:
         void write_head( const AccountIdType& account, const item_type& item )
         {
            write( account, optional<IndexType>(), item );
         }

         void write( const AccountIdType& account, const optional<IndexType>& key, const item_type& item )
         {
            _links.insert( key_type( account, key ), item );
         }

         storage_type _links;
   };

} } // kitties::chain

FC_REFLECT_TEMPLATE( (typename IndexType), kitties::chain::kitty_linked_item<IndexType>, (prev)(next) )
