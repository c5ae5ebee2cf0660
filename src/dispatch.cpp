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
#include <unistd.h>



static constexpr std::pair< std::string_view, Git_service >  service_table[] =
{
   { "git-receive-pack",   Git_service::receive_pack   },
   { "git-upload-archive", Git_service::upload_archive },
   { "git-upload-pack",    Git_service::upload_pack    },
};



const char * service_name( Git_service service )
{
   switch ( service )
   {
   case Git_service::receive_pack:     return "receive-pack";
   case Git_service::upload_pack:      return "upload-pack";
   case Git_service::upload_archive:   return "upload-archive";
   }

   return "";
}



/**
 * 按 git 的 sq_quote 规则去引号
 * 'a'\''b' -> a'b,  'a'\!'b' -> a!b
 */
static bool sq_dequote( std::string &out, std::string_view src )
{
   out.clear( );

   if ( src.empty( ) || ( src[0] != '\'' ) )
      return false;

   size_t  i = 1;

   while ( true )
   {
      while ( ( i < src.size( ) ) && ( src[i] != '\'' ) )
         out += src[i++];

      if ( i == src.size( ) )
         return false;

      ++i;

      if ( i == src.size( ) )
         return true;

      if ( ( src[i] == '\\' ) && ( ( i + 2 ) < src.size( ) )
         && ( ( src[i+1] == '\'' ) || ( src[i+1] == '!' ) ) && ( src[i+2] == '\'' ) )
      {
         out += src[i+1];
         i += 3;
         continue;
      }

      return false;
   }
}



/**
 * 解析 SSH_ORIGINAL_COMMAND, 例如 git-receive-pack 'demo.git'
 */
Ssh_command parse_ssh_command( std::string_view text )
{
   auto  sp = text.find( ' ' );
   auto  verb = text.substr( 0, sp );

   auto  itr = std::find_if( std::begin( service_table ), std::end( service_table ),
      [&]( auto &item )
      {
         return item.first == verb;
      } );

   if ( itr == std::end( service_table ) )
      receive_fail( bad_command, "arbitrary ssh prohibited: '%.*s'", int( verb.size( ) ), verb.data( ) );

   if ( sp == std::string_view::npos )
      receive_fail( bad_command, "missing repository argument" );

   auto  arg = text.substr( sp + 1 );
   while ( !arg.empty( ) && ( arg.front( ) == ' ' ) )
      arg.remove_prefix( 1 );

   while ( !arg.empty( ) && ( arg.back( ) == ' ' ) )
      arg.remove_suffix( 1 );

   if ( arg.empty( ) )
      receive_fail( bad_command, "missing repository argument" );

   Ssh_command  cmd;
   cmd.service = itr->second;

   if ( !sq_dequote( cmd.repo, arg ) )
      receive_fail( bad_command, "malformed repository argument: %.*s", int( arg.size( ) ), arg.data( ) );

   trace( "service      : ", service_name( cmd.service ) );
   trace( "repo arg     : ", cmd.repo );

   return cmd;
}



static std::string require_env( const char *name )
{
   auto  value = my_getenv( name );
   if ( ( value == nullptr ) || ( *value == 0 ) )
      receive_fail( bad_command, "missing %s, this key was not installed by git-receive", name );

   return value;
}



Push_context Push_context::from_env( bool need_repo )
{
   Push_context  ctx;

   ctx.user        = require_env( "RECEIVE_USER" );
   ctx.fingerprint = require_env( "RECEIVE_FINGERPRINT" );

   if ( need_repo )
      ctx.repo = require_env( "RECEIVE_REPO" );

   if ( !valid_username( ctx.user ) )
      receive_fail( no_username, "invalid username '%s'", ctx.user.c_str( ) );

   return ctx;
}



void Push_context::export_env( ) const
{
   if ( ( ::setenv( "RECEIVE_USER",        user.c_str( ),        1 ) != 0 )
     || ( ::setenv( "RECEIVE_FINGERPRINT", fingerprint.c_str( ), 1 ) != 0 )
     || ( ::setenv( "RECEIVE_REPO",        repo.c_str( ),        1 ) != 0 ) )
      receive_fail( io_error, "can't set environment: %s", strerror( errno ) );
}



/**
 * 推送时创建仓库并安装 hook, 拉取时只校验路径
 * ssh://host/demo 形式的 URL 发来的路径是 '/demo', 去掉开头的一个 '/'
 */
Session prepare_session( const Account &account, std::string_view original_command, const std::filesystem::path &program )
{
   Session  session;

   session.command = parse_ssh_command( original_command );

   auto  receive = session.command.service == Git_service::receive_pack;

   std::string_view  requested = session.command.repo;
   if ( requested.starts_with( '/' ) )
      requested.remove_prefix( 1 );

   session.repository = resolve_repository( account, requested, receive );

   if ( receive )
      install_hook( session.repository, program );

   return session;
}



/**
 * 用 git 服务端程序替换当前进程, 标准输入输出原样交给它
 */
[[noreturn]] void exec_git_server( const Account &account, const Session &session )
{
   const char  *git = my_getenv( "RECEIVE_GIT" );
   if ( ( git == nullptr ) || ( *git == 0 ) )
      git = "git";

   if ( ::chdir( account.home.c_str( ) ) != 0 )
      receive_fail( io_error, "can't enter %s: %s", account.home.c_str( ), strerror( errno ) );

   std::string  path = session.repository.path.string( );

   trace( "exec         : ", git, " ", service_name( session.command.service ), " ", path );

   const char  *argv[] =
   {
      git,
      service_name( session.command.service ),
      path.c_str( ),
      nullptr,
   };

   fflush( stdout );
   fflush( stderr );

   ::execvp( git, const_cast< char * const * >( argv ) );

   receive_fail( io_error, "can't execute %s: %s", git, strerror( errno ) );
}
