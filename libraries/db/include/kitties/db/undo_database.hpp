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
#include <fc/log/logger.hpp>

#include <cstdint>
#include <vector>

namespace kitties { namespace db {

   /**
    * @brief interface every undoable storage registers with the undo_database
    *
    * Each storage keeps one undo state per active session.  The undo_database
    * drives all registered storages in lock step so that a session always
    * spans every map and value of the chain state.
    */
   class undoable_storage
   {
      public:
         virtual ~undoable_storage(){}

         virtual void start_undo_state() = 0;
         /** restore the values recorded in the newest undo state and drop it */
         virtual void undo_state() = 0;
         /** fold the newest undo state into its parent, or drop it if it has none */
         virtual void merge_state() = 0;
   };

   /**
    * @class undo_database
    * @brief tracks nested undo sessions across all registered storages
    *
    * Writes made while no session is active are permanent.
    */
   class undo_database
   {
      public:
         class session
         {
            public:
               session( session&& mv )
               :_db(mv._db),_apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }

               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  FC_CAPTURE_AND_LOG(())
               }

               /** keep the writes of this session, folding them into the enclosing one */
               void commit() { merge(); }
               void undo()   { if( _apply_undo ) _db.undo();  _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge(); _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;
               session( const session& ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db ): _db(db) {}
               undo_database& _db;
               bool _apply_undo = true;
         };

         undo_database(){}
         undo_database( const undo_database& ) = delete;

         session start_undo_session();

         void register_storage( undoable_storage& s );
         void unregister_storage( undoable_storage& s );

         /** number of sessions currently open */
         uint32_t active_sessions()const { return _active_sessions; }

      private:
         void undo();
         void merge();

         std::vector<undoable_storage*> _storages;
         uint32_t                       _active_sessions = 0;
   };

} } // kitties::db
