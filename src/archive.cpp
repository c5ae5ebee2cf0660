/**
 * Copyright 2026 Xiao Xuanwen <xxw_pc@163.com>
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "common.h"

#include <errno.h>
#include <time.h>

#include <exception>
#include <memory>

#include <archive.h>
#include <archive_entry.h>



/**
 * 与 git archive 一样, 按 10240 字节的记录输出, 最后一个记录补齐
 */
static constexpr int   RECORD_SIZE = 10240;


struct Walk_state
{
   Tree_archive         *tar;
   struct archive       *writer;
   std::exception_ptr    error;
};



class Archive_entry
   : public boost::noncopyable
{
public:
   Archive_entry( )
      : _entry( archive_entry_new( ) )
   {
      if ( _entry == nullptr )
         receive_fail( io_error, "can't allocate archive entry" );
   }

   ~Archive_entry( )
   {
      archive_entry_free( _entry );
   }

   operator struct archive_entry * ( ) const
   {
      return _entry;
   }

private:
   struct archive_entry  *_entry;
};



Tree_archive::Tree_archive( git_repository *repo, const std::string &revision )
   : _repo( repo )
{
   Git_object  obj;

   if ( git_revparse_single( obj.out( ), repo, revision.c_str( ) ) < 0 )
   {
      auto  e = git_error_last( );
      receive_fail( corrupt_revision, "can't read revision %s: %s", revision.c_str( ), e != nullptr ? e->message : "unknown" );
   }

   Git_object  commit;
   if ( git_object_peel( commit.out( ), obj, GIT_OBJECT_COMMIT ) == 0 )
   {
      _mtime = git_commit_time( reinterpret_cast< const git_commit * >( commit.get( ) ) );
      trace( "archive commit: ", *git_object_id( commit ) );
   }

   else
      _mtime = time( nullptr );

   auto  ret = git_object_peel( reinterpret_cast< git_object ** >( _tree.out( ) ), obj, GIT_OBJECT_TREE );
   git_ensure( ret, corrupt_revision );

   trace( "archive tree : ", tree_id( ) );
}



/**
 * 以 pax 格式把整棵树写入 sink, 只在需要时才输出 pax 扩展头
 */
void Tree_archive::write( const Archive_sink &sink )
{
   std::unique_ptr< struct archive, int (*)( struct archive * ) >  writer( archive_write_new( ), &archive_write_free );
   if ( !writer )
      receive_fail( io_error, "can't initialize libarchive" );

   _sink  = &sink;
   _error = nullptr;

   auto  a = writer.get( );

   check( a, archive_write_set_format_pax_restricted( a ), "can't select tar format" );
   check( a, archive_write_set_bytes_per_block( a, RECORD_SIZE ), "can't set block size" );
   check( a, archive_write_set_bytes_in_last_block( a, RECORD_SIZE ), "can't set block size" );
   check( a, archive_write_open( a, this, nullptr, &Tree_archive::callback_write, nullptr ), "can't open archive" );

   Walk_state  state{ this, a, nullptr };

   auto  ret = git_tree_walk( _tree, GIT_TREEWALK_PRE, &Tree_archive::walk, &state );

   if ( state.error )
      std::rethrow_exception( state.error );

   git_ensure( ret, corrupt_revision );

   check( a, archive_write_close( a ), "can't finish archive" );
}



/**
 * libarchive 的输出回调, 异常不能穿过 libarchive, 先保存下来
 */
ssize_t Tree_archive::callback_write( struct archive *a, void *self, const void *buffer, size_t length )
{
   auto  tar = static_cast< Tree_archive * >( self );

   try
   {
      ( *tar->_sink )( static_cast< const char * >( buffer ), length );
      return length;
   }
   catch ( ... )
   {
      tar->_error = std::current_exception( );
      archive_set_error( a, EIO, "archive consumer failed" );
      return -1;
   }
}



void Tree_archive::check( struct archive *a, int err, const char *what )
{
   if ( err == ARCHIVE_OK )
      return;

   if ( _error )
      std::rethrow_exception( _error );

   if ( err == ARCHIVE_WARN )
   {
      trace( "libarchive   : ", archive_error_string( a ) );
      return;
   }

   auto  msg = archive_error_string( a );
   receive_fail( io_error, "%s: %s", what, msg != nullptr ? msg : "unknown" );
}



/**
 * git_tree_walk 的回调, 异常不能穿过 libgit2, 先保存下来
 */
int Tree_archive::walk( const char *root, const git_tree_entry *entry, void *payload )
{
   auto  state = static_cast< Walk_state * >( payload );

   try
   {
      state->tar->entry( state->writer, root, entry );
      return 0;
   }
   catch ( ... )
   {
      state->error = std::current_exception( );
      return -1;
   }
}



void Tree_archive::entry( struct archive *a, const char *root, const git_tree_entry *entry )
{
   std::string  path = root;
   path += git_tree_entry_name( entry );

   auto  mode = git_tree_entry_filemode( entry );

   Archive_entry  e;
   archive_entry_set_mtime( e, _mtime, 0 );
   archive_entry_set_uname( e, "root" );
   archive_entry_set_gname( e, "root" );

   switch ( mode )
   {
   case GIT_FILEMODE_TREE:
   case GIT_FILEMODE_COMMIT:
      // 子模块输出为空目录
      path += '/';
      archive_entry_set_pathname( e, path.c_str( ) );
      archive_entry_set_filetype( e, AE_IFDIR );
      archive_entry_set_perm( e, 0775 );
      check( a, archive_write_header( a, e ), "can't write directory header" );
      return;

   case GIT_FILEMODE_BLOB:
   case GIT_FILEMODE_BLOB_EXECUTABLE:
   case GIT_FILEMODE_LINK:
      break;

   default:
      receive_fail( corrupt_revision, "unknown file mode %o of %s", unsigned( mode ), path.c_str( ) );
   }

   Git_blob  blob;

   auto  ret = git_blob_lookup( blob.out( ), _repo, git_tree_entry_id( entry ) );
   git_ensure( ret, corrupt_revision );

   auto  content = static_cast< const char * >( git_blob_rawcontent( blob ) );
   auto  size    = static_cast< size_t >( git_blob_rawsize( blob ) );

   archive_entry_set_pathname( e, path.c_str( ) );

   if ( mode == GIT_FILEMODE_LINK )
   {
      std::string  target( content, size );

      archive_entry_set_filetype( e, AE_IFLNK );
      archive_entry_set_perm( e, 0777 );
      archive_entry_set_symlink( e, target.c_str( ) );
      archive_entry_set_size( e, 0 );
      check( a, archive_write_header( a, e ), "can't write symlink header" );
      return;
   }

   archive_entry_set_filetype( e, AE_IFREG );
   archive_entry_set_perm( e, mode == GIT_FILEMODE_BLOB_EXECUTABLE ? 0775 : 0664 );
   archive_entry_set_size( e, size );
   check( a, archive_write_header( a, e ), "can't write file header" );

   while ( size > 0 )
   {
      auto  n = archive_write_data( a, content, size );
      if ( n <= 0 )
         check( a, n < 0 ? int( n ) : ARCHIVE_FATAL, "can't write file data" );

      content += n;
      size    -= n;
   }
}
