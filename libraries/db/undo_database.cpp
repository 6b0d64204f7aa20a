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

#include <kitties/db/undo_database.hpp>

#include <algorithm>

namespace kitties { namespace db {

undo_database::session undo_database::start_undo_session()
{
   for( undoable_storage* s : _storages )
      s->start_undo_state();
   ++_active_sessions;
   return session(*this);
}

void undo_database::register_storage( undoable_storage& s )
{
   FC_ASSERT( _active_sessions == 0, "storages must be registered before any undo session starts" );
   _storages.push_back( &s );
}

void undo_database::unregister_storage( undoable_storage& s )
{
   auto itr = std::find( _storages.begin(), _storages.end(), &s );
   if( itr != _storages.end() )
      _storages.erase( itr );
}

void undo_database::undo()
{ try {
   FC_ASSERT( _active_sessions > 0 );
   for( undoable_storage* s : _storages )
      s->undo_state();
   --_active_sessions;
} FC_CAPTURE_AND_RETHROW() }

void undo_database::merge()
{
   FC_ASSERT( _active_sessions > 0 );
   for( undoable_storage* s : _storages )
      s->merge_state();
   --_active_sessions;
}

} } // kitties::db
