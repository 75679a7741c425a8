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
#include <launchpad/db/object.hpp>

#include <fc/exception/exception.hpp>
#include <fc/log/logger.hpp>

#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace launchpad { namespace db {

   using std::unordered_map;
   class object_database;

   struct undo_state
   {
      unordered_map<object_id_type, unique_ptr<object> > old_values;
      unordered_map<object_id_type, object_id_type>      old_index_next_ids;
      std::unordered_set<object_id_type>                 new_ids;
      unordered_map<object_id_type, unique_ptr<object> > removed;
   };

   /**
    * @class undo_database
    * @brief tracks changes to the state and allows changes to be undone
    *
    * Each operation is applied inside a session. A session that goes out of scope without being
    * committed or merged rolls back every create, modify and remove recorded since it started.
    */
   class undo_database
   {
      public:
         explicit undo_database( object_database& db ) : _db(db) {}

         class session
         {
            public:
               session( session&& mv )
               : _db(mv._db), _apply_undo(mv._apply_undo)
               {
                  mv._apply_undo = false;
               }
               ~session()
               {
                  try {
                     if( _apply_undo ) _db.undo();
                  }
                  catch( const fc::exception& e )
                  {
                     // a failed rollback leaves the state unusable
                     elog( "${e}", ("e",e.to_detail_string()) );
                     throw;
                  }
               }
               void commit() { if( _apply_undo ) _db.commit(); _apply_undo = false; }
               void undo()   { if( _apply_undo ) _db.undo();   _apply_undo = false; }
               void merge()  { if( _apply_undo ) _db.merge();  _apply_undo = false; }

               session& operator = ( session&& mv ) = delete;

            private:
               friend class undo_database;
               session( undo_database& db, bool enabled )
               : _db(db), _apply_undo(enabled) {}

               undo_database& _db;
               bool _apply_undo = true;
         };

         void    disable();
         void    enable();

         session start_undo_session();

         /**
          * This should be called just after an object is created
          */
         void on_create( const object& obj );
         /**
          * This should be called just before an object is modified
          *
          * If it's a new object as of this undo state, its pre-modification value is not stored, because
          * prior to this undo state it did not exist.
          */
         void on_modify( const object& obj );
         /**
          * This should be called just before an object is removed.
          *
          * If it's a new object as of this undo state, it is only dropped from the list of newly created
          * objects.
          */
         void on_remove( const object& obj );

         std::size_t size()const { return _stack.size(); }
         void        set_max_size( size_t new_max_size ) { _max_size = new_max_size; }
         size_t      max_size()const { return _max_size; }
         uint32_t    active_sessions()const { return _active_sessions; }

      private:
         void undo();
         void merge();
         void commit();
         void rewind( undo_state& state );

         uint32_t                _active_sessions = 0;
         bool                    _disabled = true;
         std::deque<undo_state>  _stack;
         object_database&        _db;
         size_t                  _max_size = 256;
   };

} } // launchpad::db
