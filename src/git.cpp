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
#include <pwd.h>
#include <unistd.h>



/**
 * 获取共享账户
 * 账户名依次取参数, 环境变量 GITUSER, 默认 git
 * 家目录依次取环境变量 RECEIVE_HOME, passwd 中的记录, /home/<name>
 */
Account current_account( const char *name )
{
   if ( ( name == nullptr ) || ( *name == 0 ) )
      name = my_getenv( "GITUSER" );

   if ( ( name == nullptr ) || ( *name == 0 ) )
      name = "git";

   Account  account;
   account.name = name;

   auto  pw   = getpwnam( name );
   auto  home = my_getenv( "RECEIVE_HOME" );

   if ( ( home != nullptr ) && ( *home != 0 ) )
      account.home = home;

   else if ( ( pw != nullptr ) && ( pw->pw_dir != nullptr ) && ( pw->pw_dir[0] != 0 ) )
      account.home = pw->pw_dir;

   else
   {
      account.home = "/home";
      account.home /= account.name;
   }

   trace( "account      : ", account.name, " ", account.home );

   return account;
}



std::filesystem::path self_program( )
{
   std::error_code  ec;

   auto  path = std::filesystem::read_symlink( "/proc/self/exe", ec );
   if ( ec )
      receive_fail( io_error, "can't locate program: %s", ec.message( ).c_str( ) );

   return path;
}



std::filesystem::path receiver_path( const Account &account )
{
   return account.home / "receiver";
}



/**
 * 用单引号包裹, 内部的单引号写成 '\''
 */
std::string shell_quote( std::string_view str )
{
   std::string  out = "'";

   for ( auto c : str )
   {
      if ( c == '\'' )
         out += "'\\''";
      else
         out += c;
   }

   out += '\'';
   return out;
}



static Deliver parse_deliver( const char *value )
{
   std::string_view  v( value );

   if ( v == "each" )
      return Deliver::each;

   if ( v == "first" )
      return Deliver::first;

   if ( v == "last" )
      return Deliver::last;

   receive_err( "unknown gitreceive.deliver '%s', using 'each'", value );
   return Deliver::each;
}



Repo_config load_repo_config( git_repository *repo )
{
   Repo_config  conf;
   Git_config   cfg;

   auto  ret = git_repository_config_snapshot( cfg.out( ), repo );
   git_ensure( ret, io_error );

   const char  *str;

   if ( git_config_get_string( &str, cfg, "gitreceive.deliver" ) == 0 )
      conf.deliver = parse_deliver( str );

   if ( git_config_get_string( &str, cfg, "gitreceive.branch" ) == 0 )
      conf.branch = str;

   if ( git_config_get_string( &str, cfg, "gitreceive.receiver" ) == 0 )
      conf.receiver = str;

   int  flag;
   if ( git_config_get_bool( &flag, cfg, "gitreceive.rejectOnFailure" ) == 0 )
      conf.reject_on_failure = !!flag;

   trace( "deliver      : ", static_cast< unsigned >( conf.deliver ) );
   trace( "branch       : ", conf.branch );
   trace( "receiver     : ", conf.receiver );
   trace( "reject       : ", conf.reject_on_failure ? "yes" : "no" );

   return conf;
}



/**
 * 以 root 运行时 (init, upload-key 通常通过 sudo 调用), 把文件交给共享账户
 */
void chown_to_account( const Account &account, const std::filesystem::path &path )
{
   if ( geteuid( ) != 0 )
      return;

   auto  pw = getpwnam( account.name.c_str( ) );
   if ( pw == nullptr )
      return;

   if ( ::chown( path.c_str( ), pw->pw_uid, pw->pw_gid ) != 0 )
      receive_fail( io_error, "can't chown %s: %s", path.c_str( ), strerror( errno ) );
}
