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

#include <kitties/db/undo_database.hpp>

#include <fc/optional.hpp>

#include <deque>
#include <functional>
#include <map>

namespace kitties { namespace db {

   /**
    * @class storage_map
    * @brief an ordered key-value store whose writes can be rolled back
    *
    * get/insert/remove/take are each atomic.  The first write to a key inside
    * an undo session records the key's previous value (or its absence) so the
    * session can restore it.
    */
   template<typename Key, typename Value, typename Compare = std::less<Key>>
   class storage_map : public undoable_storage
   {
      public:
         typedef Key                                  key_type;
         typedef Value                                value_type;
         typedef std::map<Key,Value,Compare>          container_type;
         typedef typename container_type::const_iterator const_iterator;
         typedef typename container_type::const_reverse_iterator const_reverse_iterator;

         explicit storage_map( undo_database& udb )
         :_undo_db(udb)
         {
            _undo_db.register_storage( *this );
         }

         ~storage_map()
         {
            _undo_db.unregister_storage( *this );
         }

         storage_map( const storage_map& ) = delete;
         storage_map& operator = ( const storage_map& ) = delete;

         fc::optional<Value> get( const Key& key )const
         {
            auto itr = _data.find( key );
            if( itr == _data.end() )
               return fc::optional<Value>();
            return itr->second;
         }

         const Value* find( const Key& key )const
         {
            auto itr = _data.find( key );
            if( itr == _data.end() )
               return nullptr;
            return &itr->second;
         }

         bool contains( const Key& key )const
         {
            return _data.find( key ) != _data.end();
         }

         /** insert or overwrite */
         void insert( const Key& key, const Value& value )
         {
            on_modify( key );
            _data[key] = value;
         }

         /** no-op when the key is absent */
         void remove( const Key& key )
         {
            auto itr = _data.find( key );
            if( itr == _data.end() )
               return;
            on_modify( key );
            _data.erase( itr );
         }

         fc::optional<Value> take( const Key& key )
         {
            auto itr = _data.find( key );
            if( itr == _data.end() )
               return fc::optional<Value>();
            on_modify( key );
            fc::optional<Value> result = itr->second;
            _data.erase( itr );
            return result;
         }

         size_t size()const { return _data.size(); }
         bool   empty()const { return _data.empty(); }

         const_iterator begin()const { return _data.begin(); }
         const_iterator end()const   { return _data.end(); }
         const_reverse_iterator rbegin()const { return _data.rbegin(); }
         const_reverse_iterator rend()const   { return _data.rend(); }
         const_iterator lower_bound( const Key& key )const { return _data.lower_bound( key ); }

         virtual void start_undo_state() override
         {
            _undo_stack.emplace_back();
         }

         virtual void undo_state() override
         {
            FC_ASSERT( !_undo_stack.empty() );
            for( const auto& item : _undo_stack.back() )
            {
               if( item.second.valid() )
                  _data[item.first] = *item.second;
               else
                  _data.erase( item.first );
            }
            _undo_stack.pop_back();
         }

         virtual void merge_state() override
         {
            FC_ASSERT( !_undo_stack.empty() );
            if( _undo_stack.size() == 1 )
            {
               _undo_stack.pop_back();
               return;
            }
            auto& state = _undo_stack.back();
            auto& prev_state = _undo_stack[_undo_stack.size() - 2];
            // the parent keeps the older value when both sessions touched a key
            for( auto& item : state )
               prev_state.insert( std::move(item) );
            _undo_stack.pop_back();
         }

      private:
         typedef std::map<Key,fc::optional<Value>,Compare> undo_state_type;

         void on_modify( const Key& key )
         {
            if( _undo_stack.empty() )
               return;
            auto& state = _undo_stack.back();
            if( state.find( key ) != state.end() )
               return;
            state.insert( std::make_pair( key, get( key ) ) );
         }

         undo_database&              _undo_db;
         container_type              _data;
         std::deque<undo_state_type> _undo_stack;
   };

   /**
    * @class storage_value
    * @brief a single undoable value; reads as T() until first written
    */
   template<typename T>
   class storage_value : public undoable_storage
   {
      public:
         explicit storage_value( undo_database& udb )
         :_undo_db(udb)
         {
            _undo_db.register_storage( *this );
         }

         ~storage_value()
         {
            _undo_db.unregister_storage( *this );
         }

         storage_value( const storage_value& ) = delete;
         storage_value& operator = ( const storage_value& ) = delete;

         T get()const
         {
            if( _value.valid() )
               return *_value;
            return T();
         }

         bool exists()const { return _value.valid(); }

         void put( const T& value )
         {
            on_modify();
            _value = value;
         }

         void kill()
         {
            on_modify();
            _value.reset();
         }

         virtual void start_undo_state() override
         {
            _undo_stack.emplace_back();
         }

         virtual void undo_state() override
         {
            FC_ASSERT( !_undo_stack.empty() );
            if( _undo_stack.back().touched )
               _value = _undo_stack.back().old_value;
            _undo_stack.pop_back();
         }

         virtual void merge_state() override
         {
            FC_ASSERT( !_undo_stack.empty() );
            if( _undo_stack.size() > 1 )
            {
               auto& prev_state = _undo_stack[_undo_stack.size() - 2];
               if( !prev_state.touched && _undo_stack.back().touched )
                  prev_state = _undo_stack.back();
            }
            _undo_stack.pop_back();
         }

      private:
         struct undo_state_type
         {
            bool             touched = false;
            fc::optional<T>  old_value;
         };

         void on_modify()
         {
            if( _undo_stack.empty() || _undo_stack.back().touched )
               return;
            _undo_stack.back().touched = true;
            _undo_stack.back().old_value = _value;
         }

         undo_database&               _undo_db;
         fc::optional<T>              _value;
         std::deque<undo_state_type>  _undo_stack;
   };

} } // kitties::db
