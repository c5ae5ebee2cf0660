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

#include <errno.h>
#include <pwd.h>
#include <unistd.h>

#include "common.h"

#if BOOST_VERSION >= 108600
#include <boost/process/v1/search_path.hpp>
namespace bp = boost::process::v1;
#else
#include <boost/process/search_path.hpp>
namespace bp = boost::process;
#endif



static const char  receiver_skeleton[] =
R"(#!/bin/bash
# Called once per push with:
#   $1 repository  $2 revision  $3 username  $4 key fingerprint
# and a tar archive of the pushed tree on standard input.
# Everything written to standard output is shown to the pusher.
#URL=http://requestb.in/rlh4znrl
#echo "----> Posting to $URL ..."
#curl \
#  -X 'POST' \
#  -F "repository=$1" \
#  -F "revision=$2" \
#  -F "username=$3" \
#  -F "fingerprint=$4" \
#  -F contents=@- \
#  --silent $URL
)";



[[noreturn]] static void usage( )
{
   printf( "usage: %s <command> [<args>...]\n\n", grv_name );
   printf( "command:\n" );
   printf( "   init [--user=<name>]    create the shared account and its receiver script\n" );
   printf( "   upload-key [<name>]     authorize the public keys read from stdin\n" );

   _Exit( 2 );
}



/**
 * git-receive init [--user=<name>]
 */
static int do_init( unsigned argc, char **argv )
{
   const char  *user = nullptr;

   for ( unsigned i = 1; i < argc; ++i )
   {
      std::string_view  arg( argv[i] );

      if ( arg.starts_with( "--user=" ) )
         user = argv[i] + 7;

      else
      {
         receive_err( "unknown option '%s'", argv[i] );
         usage( );
      }
   }

   auto  account = current_account( user );

   if ( getpwnam( account.name.c_str( ) ) == nullptr )
   {
      if ( geteuid( ) != 0 )
      {
         receive_err( "account '%s' does not exist, run init as root to create it", account.name.c_str( ) );
         return EXIT_FAILURE;
      }

      auto  useradd = bp::search_path( "useradd" );
      if ( useradd.empty( ) )
      {
         receive_err( "useradd not found, create account '%s' by hand", account.name.c_str( ) );
         return EXIT_FAILURE;
      }

      std::list< std::string >  args = { useradd.string( ), "-m", "-d", account.home.string( ), account.name };

      auto  ret = system( args );
      if ( ret != 0 )
      {
         receive_err( "useradd failed with status %d", ret );
         return EXIT_FAILURE;
      }

      account = current_account( user );
   }

   ensure_authorized_keys( account );

   auto  path = receiver_path( account );

   std::error_code  ec;
   if ( !std::filesystem::exists( path, ec ) )
   {
      write_file_atomic( path, receiver_skeleton, 0755 );
      chown_to_account( account, path );
   }

   printf( "Created receiver script in %s for user '%s'.\n", account.home.c_str( ), account.name.c_str( ) );

   return EXIT_SUCCESS;
}



/**
 * git-receive upload-key [<name>] < id_rsa.pub
 * 每个 key 的 md5 指纹输出到 stdout
 */
static int do_upload_key( unsigned argc, char **argv )
{
   const char  *name = argc > 1 ? argv[1] : nullptr;

   auto  account = current_account( );
   auto  program = self_program( );

   std::string  line;
   unsigned     count = 0;

   while ( get_line( stdin, line ) )
   {
      auto  pos = line.find_first_not_of( " \t\r" );
      if ( ( pos == std::string::npos ) || ( line[pos] == '#' ) )
         continue;

      auto  key = parse_public_key( line );

      Identity  id;
      id.fingerprint = fingerprint( key );
      id.username    = resolve_username( key, name );

      authorize( account, id, key, program );

      fprintf( stderr, "Authorized %s key of '%s' (%s)\n", key.algorithm.c_str( ), id.username.c_str( ), fingerprint_sha256( key ).c_str( ) );
      printf( "%s\n", id.fingerprint.c_str( ) );

      ++count;
   }

   if ( count == 0 )
      receive_fail( malformed_key, "no public key on standard input" );

   return EXIT_SUCCESS;
}



/**
 * authorized_keys 中的 forced command
 * sshd 把客户端原本要执行的命令放在 SSH_ORIGINAL_COMMAND 中
 */
static int do_run( unsigned argc, char **argv )
{
   auto  original = my_getenv( "SSH_ORIGINAL_COMMAND" );
   if ( original == nullptr )
      receive_fail( bad_command, "arbitrary ssh prohibited" );

   auto  ctx     = Push_context::from_env( false );
   auto  account = current_account( );
   auto  session = prepare_session( account, original, self_program( ) );

   ctx.repo = session.repository.name;
   ctx.export_env( );

   if ( ::setenv( "GITUSER", account.name.c_str( ), 1 ) != 0 )
      receive_fail( io_error, "can't set environment: %s", strerror( errno ) );

   exec_git_server( account, session );
}



/**
 * 作为 pre-receive hook 被 git receive-pack 调用
 * 仓库从 GIT_DIR 等环境变量打开, 这样能看到隔离区中刚推送的对象
 */
static int do_hook( unsigned argc, char **argv )
{
   auto  ctx     = Push_context::from_env( true );
   auto  account = current_account( );

   Git_repository  repo;

   auto  ret = git_repository_open_ext( repo.out( ), nullptr, GIT_REPOSITORY_OPEN_FROM_ENV, nullptr );
   git_ensure( ret, io_error );

   return hook_bridge( repo, stdin, STDERR_FILENO, ctx, account );
}



using user_command_callback = int (*)( unsigned, char ** );



static constexpr std::pair< std::string_view, user_command_callback >  user_command_table[] =
{
   { "hook",        &do_hook       },
   { "init",        &do_init       },
   { "run",         &do_run        },
   { "upload-key",  &do_upload_key },
};



static user_command_callback get_user_command_callback( const char *command )
{
   auto  itr = std::lower_bound( std::begin( user_command_table ), std::end( user_command_table ), command,
      []( auto &item, const char * cmd )
      {
         return item.first < cmd;
      } );

   if ( itr == std::end( user_command_table ) )
      return nullptr;

   if ( itr->first != command )
      return nullptr;

   return itr->second;
}



int user_command( unsigned argc, char **argv )
{
   if ( argc > 0 )
   {
      auto  cb = get_user_command_callback( argv[0] );
      if ( cb != nullptr )
         return cb( argc, argv );

      receive_err( "unknown command '%s'", argv[0] );
   }

   usage( );
}
