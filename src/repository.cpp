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
#include <stdlib.h>
#include <unistd.h>



/**
 * 规范化仓库名
 *
 * 去掉末尾的 .git, 拒绝绝对路径, 空的路径分量, 以及任何以 '.' 开头的分量
 * (这同时挡住了 . .. 与 .ssh 这类账户家目录下的隐藏目录)
 */
std::string normalize_repo_name( std::string_view requested )
{
   std::string  name( requested );

   if ( name.ends_with( ".git" ) )
      name.resize( name.size( ) - 4 );

   if ( name.empty( ) )
      receive_fail( bad_command, "empty repository name" );

   if ( name[0] == '/' )
      receive_fail( path_traversal, "absolute repository path '%s' is not allowed", name.c_str( ) );

   std::vector< std::string >  parts;
   boost::split( parts, name, boost::is_any_of( "/" ) );

   for ( auto &part : parts )
   {
      if ( part.empty( ) || ( part[0] == '.' ) )
         receive_fail( path_traversal, "invalid repository path '%s'", name.c_str( ) );

      for ( auto c : part )
      {
         auto  u = static_cast< unsigned char >( c );

         if ( ( u < 0x20 ) || ( u == 0x7f ) || ( c == '\\' ) )
            receive_fail( path_traversal, "invalid character in repository path '%s'", name.c_str( ) );
      }
   }

   return name;
}



static bool is_bare_repository( const std::filesystem::path &path )
{
   Git_repository  repo;

   if ( git_repository_open_bare( repo.out( ), path.c_str( ) ) < 0 )
      return false;

   return git_repository_is_bare( repo ) == 1;
}



/**
 * 在同目录的临时目录中初始化裸仓库, 再 rename 到目标位置
 * 两个会话同时首次推送同一个仓库时, rename 失败的一方丢弃自己的临时仓库
 */
static void create_bare_repository( const std::filesystem::path &path )
{
   std::error_code  ec;

   auto  parent = path.parent_path( );
   std::filesystem::create_directories( parent, ec );
   if ( ec )
      receive_fail( io_error, "can't create %s: %s", parent.c_str( ), ec.message( ).c_str( ) );

   std::string  tmp = ( parent / ( "." + path.filename( ).string( ) + ".XXXXXX" ) ).string( );
   if ( mkdtemp( tmp.data( ) ) == nullptr )
      receive_fail( io_error, "can't create %s: %s", tmp.c_str( ), strerror( errno ) );

   trace( "init bare    : ", tmp );

   {
      git_repository_init_options  opts = GIT_REPOSITORY_INIT_OPTIONS_INIT;
      opts.flags = GIT_REPOSITORY_INIT_BARE | GIT_REPOSITORY_INIT_NO_REINIT;

      Git_repository  repo;

      if ( git_repository_init_ext( repo.out( ), tmp.c_str( ), &opts ) < 0 )
      {
         auto  e = git_error_last( );
         std::string  msg = e != nullptr ? e->message : "unknown";

         std::filesystem::remove_all( tmp, ec );
         receive_fail( io_error, "can't initialize repository: %s", msg.c_str( ) );
      }
   }

   if ( ::rename( tmp.c_str( ), path.c_str( ) ) == 0 )
   {
      trace( "created      : ", path );
      return;
   }

   auto  err = errno;
   std::filesystem::remove_all( tmp, ec );

   if ( ( err != EEXIST ) && ( err != ENOTEMPTY ) )
      receive_fail( io_error, "can't create %s: %s", path.c_str( ), strerror( err ) );

   trace( "lost race    : ", path );

   if ( !is_bare_repository( path ) )
      receive_fail( io_error, "%s exists but is not a bare repository", path.c_str( ) );
}



Repository resolve_repository( const Account &account, std::string_view requested, bool create )
{
   Repository  repo;

   repo.name = normalize_repo_name( requested );
   repo.path = account.home / ( repo.name + ".git" );

   trace( "repository   : ", repo.name, " -> ", repo.path );

   if ( !create )
      return repo;

   std::error_code  ec;
   if ( std::filesystem::exists( repo.path, ec ) )
   {
      if ( !is_bare_repository( repo.path ) )
         receive_fail( io_error, "%s exists but is not a bare repository", repo.path.c_str( ) );

      return repo;
   }

   create_bare_repository( repo.path );

   return repo;
}



std::string hook_script( const std::filesystem::path &program )
{
   std::string  script = "#!/bin/sh\n";

   script += "exec ";
   script += shell_quote( program.string( ) );
   script += " hook\n";

   return script;
}



/**
 * 每次推送都无条件重写 pre-receive, 程序升级后 hook 也随之更新
 */
void install_hook( const Repository &repo, const std::filesystem::path &program )
{
   auto  dir = repo.path / "hooks";

   std::error_code  ec;
   std::filesystem::create_directories( dir, ec );
   if ( ec )
      receive_fail( io_error, "can't create %s: %s", dir.c_str( ), ec.message( ).c_str( ) );

   write_file_atomic( dir / "pre-receive", hook_script( program ), 0755 );

   trace( "hook         : ", dir / "pre-receive" );
}
