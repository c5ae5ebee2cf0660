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

#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <unistd.h>

#include <boost/interprocess/exceptions.hpp>
#include <boost/interprocess/sync/file_lock.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>



/**
 * 共享账户只用来执行一个命令, 关闭其它一切 ssh 功能
 */
static const std::vector< std::string >   restrict_options =
{
   "no-agent-forwarding",
   "no-pty",
   "no-user-rc",
   "no-X11-forwarding",
   "no-port-forwarding",
};



std::string Authorized_key_entry::forced_command( ) const
{
   std::string  cmd;

   for ( auto &[name, value] : environment )
   {
      cmd += name;
      cmd += '=';
      cmd += shell_quote( value );
      cmd += ' ';
   }

   cmd += shell_quote( program.string( ) );
   cmd += " run";

   return cmd;
}



/**
 * command="..." 中 sshd 只认 \" 这一种转义
 */
std::string Authorized_key_entry::to_line( ) const
{
   std::string  line = "command=\"";

   for ( auto c : forced_command( ) )
   {
      if ( c == '"' )
         line += '\\';

      line += c;
   }

   line += '"';

   for ( auto &opt : options )
   {
      line += ',';
      line += opt;
   }

   line += ' ';
   line += key.algorithm;
   line += ' ';
   line += key.body;

   if ( !comment.empty( ) )
   {
      line += ' ';
      line += comment;
   }

   return line;
}



Authorized_key_entry make_entry( const Account &account, const Identity &id, const Public_key &key, const std::filesystem::path &program )
{
   if ( !valid_username( id.username ) )
      receive_fail( no_username, "invalid username '%s'", id.username.c_str( ) );

   for ( auto c : account.name + program.string( ) )
   {
      if ( ( c == '\n' ) || ( c == '\r' ) || ( c == 0 ) )
         receive_fail( io_error, "account name or program path can't be written to authorized_keys" );
   }

   Authorized_key_entry  entry;

   entry.environment.emplace_back( "GITUSER",             account.name   );
   entry.environment.emplace_back( "RECEIVE_USER",        id.username    );
   entry.environment.emplace_back( "RECEIVE_FINGERPRINT", id.fingerprint );

   entry.program = program;
   entry.options = restrict_options;
   entry.key     = key;
   entry.comment = id.username;

   return entry;
}



std::filesystem::path authorized_keys_path( const Account &account )
{
   return account.home / ".ssh" / "authorized_keys";
}



static std::filesystem::path lock_path( const Account &account )
{
   return account.home / ".ssh" / "authorized_keys.lock";
}



static void touch( const std::filesystem::path &path, mode_t mode )
{
   auto  fd = ::open( path.c_str( ), O_WRONLY | O_CREAT | O_CLOEXEC, mode );
   if ( fd < 0 )
      receive_fail( io_error, "can't create %s: %s", path.c_str( ), strerror( errno ) );

   ::close( fd );
}



/**
 * 创建 ~/.ssh (0700) 与 authorized_keys (0600)
 */
void ensure_authorized_keys( const Account &account )
{
   auto  dir = account.home / ".ssh";

   std::error_code  ec;
   std::filesystem::create_directories( dir, ec );
   if ( ec )
      receive_fail( io_error, "can't create %s: %s", dir.c_str( ), ec.message( ).c_str( ) );

   std::filesystem::permissions( dir, std::filesystem::perms::owner_all, ec );
   if ( ec )
      receive_fail( io_error, "can't chmod %s: %s", dir.c_str( ), ec.message( ).c_str( ) );

   auto  path = authorized_keys_path( account );
   touch( path, 0600 );
   touch( lock_path( account ), 0600 );

   chown_to_account( account, dir );
   chown_to_account( account, path );
   chown_to_account( account, lock_path( account ) );
}



/**
 * 判断 authorized_keys 中的一行是否绑定了指定的 key
 * 按空白切分, 但双引号内的内容 (选项中的 command="...") 不切分
 */
bool line_binds_key( std::string_view line, std::string_view body )
{
   if ( line.empty( ) || ( line[0] == '#' ) )
      return false;

   std::string  token;
   bool         quoted = false;

   for ( size_t i = 0; i <= line.size( ); ++i )
   {
      if ( i == line.size( ) || ( !quoted && isspace( static_cast< unsigned char >( line[i] ) ) ) )
      {
         if ( token == body )
            return true;

         token.clear( );
         continue;
      }

      auto  c = line[i];

      if ( quoted && ( c == '\\' ) && ( ( i + 1 ) < line.size( ) ) && ( line[i+1] == '"' ) )
      {
         token += '"';
         ++i;
         continue;
      }

      if ( c == '"' )
         quoted = !quoted;

      token += c;
   }

   return false;
}



/**
 * 写入或更新一个 key 的 authorized_keys 行
 *
 * 同一个 key body 只保留一行: 已有的行原地替换, 多余的删除
 * 多个 upload-key 同时运行时, 通过 authorized_keys.lock 上的文件锁串行化
 */
void authorize( const Account &account, const Identity &id, const Public_key &key, const std::filesystem::path &program )
{
   auto  entry = make_entry( account, id, key, program );
   auto  line  = entry.to_line( );

   ensure_authorized_keys( account );

   auto  path = authorized_keys_path( account );

   try
   {
      boost::interprocess::file_lock                                   lock( lock_path( account ).c_str( ) );
      boost::interprocess::scoped_lock< boost::interprocess::file_lock > guard( lock );

      std::string  content;
      bool         placed = false;

      auto  fp = fopen( path.c_str( ), "re" );
      if ( fp == nullptr )
         receive_fail( io_error, "can't open %s: %s", path.c_str( ), strerror( errno ) );

      std::string  old;
      while ( get_line( fp, old ) )
      {
         if ( line_binds_key( old, key.body ) )
         {
            if ( !placed )
            {
               trace( "replace key  : ", id.username );
               content += line;
               content += '\n';
               placed = true;
            }

            continue;
         }

         content += old;
         content += '\n';
      }

      auto  err = ferror( fp );
      fclose( fp );

      if ( err != 0 )
         receive_fail( io_error, "can't read %s", path.c_str( ) );

      if ( !placed )
      {
         trace( "append key   : ", id.username );
         content += line;
         content += '\n';
      }

      write_file_atomic( path, content, 0600 );
      chown_to_account( account, path );
   }
   catch ( const boost::interprocess::interprocess_exception &e )
   {
      receive_fail( io_error, "can't lock %s: %s", lock_path( account ).c_str( ), e.what( ) );
   }
}
