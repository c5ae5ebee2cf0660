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

#include "test_util.h"

#include <sys/wait.h>



/**
 * 测试结束时恢复 RECEIVE_* 环境变量
 */
class Env_guard
   : public boost::noncopyable
{
public:
   Env_guard( )
   {
      for ( auto name : names )
      {
         auto  value = getenv( name );
         _saved.emplace_back( value != nullptr, value != nullptr ? value : "" );
         unsetenv( name );
      }
   }

   ~Env_guard( )
   {
      for ( size_t i = 0; i < std::size( names ); ++i )
      {
         if ( _saved[i].first )
            setenv( names[i], _saved[i].second.c_str( ), 1 );
         else
            unsetenv( names[i] );
      }
   }

private:
   static constexpr const char  *names[] = { "RECEIVE_USER", "RECEIVE_FINGERPRINT", "RECEIVE_REPO", "RECEIVE_GIT" };

   std::vector< std::pair< bool, std::string > >   _saved;
};



/* ----------------------------------------------------------------------------
 * parse_ssh_command
 * --------------------------------------------------------------------------*/

TEST( parseSshCommand, recognizesGitServices )
{
   auto  push = parse_ssh_command( "git-receive-pack 'demo.git'" );
   ASSERT_EQ( push.service, Git_service::receive_pack );
   ASSERT_EQ( push.repo, "demo.git" );

   auto  fetch = parse_ssh_command( "git-upload-pack 'team/demo'" );
   ASSERT_EQ( fetch.service, Git_service::upload_pack );
   ASSERT_EQ( fetch.repo, "team/demo" );

   auto  archive = parse_ssh_command( "git-upload-archive 'demo'" );
   ASSERT_EQ( archive.service, Git_service::upload_archive );
   ASSERT_STREQ( service_name( archive.service ), "upload-archive" );
}

TEST( parseSshCommand, unquotesLikeGit )
{
   ASSERT_EQ( parse_ssh_command( "git-receive-pack 'it'\\''s.git'" ).repo, "it's.git" );
   ASSERT_EQ( parse_ssh_command( "git-receive-pack 'wow'\\!'.git'" ).repo, "wow!.git" );
   ASSERT_EQ( parse_ssh_command( "git-receive-pack 'with space.git'" ).repo, "with space.git" );
}

TEST( parseSshCommand, rejectsOtherCommands )
{
   for ( auto text : { "ls -la", "bash", "", "git-receive-packx 'demo'", "scp -t /tmp" } )
      ASSERT_EQ( fault_of( [&] { parse_ssh_command( text ); } ), Fault::bad_command ) << text;
}

TEST( parseSshCommand, rejectsMissingOrMalformedArgument )
{
   for ( auto text : { "git-receive-pack", "git-receive-pack   ", "git-receive-pack 'demo.git",
                       "git-receive-pack 'demo.git' extra", "git-receive-pack 'a'\\x'b'" } )
      ASSERT_EQ( fault_of( [&] { parse_ssh_command( text ); } ), Fault::bad_command ) << text;
}

/* ----------------------------------------------------------------------------
 * prepare_session
 * --------------------------------------------------------------------------*/

TEST( prepareSession, pushCreatesRepositoryAndHook )
{
   Temp_dir  dir;
   auto      account = test_account( dir );

   auto  session = prepare_session( account, "git-receive-pack 'demo.git'", "/usr/bin/git-receive" );

   ASSERT_EQ( session.command.service, Git_service::receive_pack );
   ASSERT_EQ( session.repository.name, "demo" );
   ASSERT_EQ( session.repository.path, account.home / "demo.git" );

   auto  hook = session.repository.path / "hooks" / "pre-receive";
   ASSERT_EQ( read_file( hook ), hook_script( "/usr/bin/git-receive" ) );
   ASSERT_EQ( file_mode( hook ), 0755u );
}

TEST( prepareSession, fetchDoesNotCreateRepository )
{
   Temp_dir  dir;
   auto      account = test_account( dir );

   auto  session = prepare_session( account, "git-upload-pack 'demo.git'", "/usr/bin/git-receive" );

   ASSERT_EQ( session.command.service, Git_service::upload_pack );
   ASSERT_EQ( session.repository.path, account.home / "demo.git" );
   ASSERT_FALSE( std::filesystem::exists( session.repository.path ) );
}

TEST( prepareSession, acceptsSshUrlPath )
{
   Temp_dir  dir;
   auto      account = test_account( dir );

   auto  session = prepare_session( account, "git-receive-pack '/demo.git'", "/usr/bin/git-receive" );

   ASSERT_EQ( session.repository.name, "demo" );
   ASSERT_EQ( session.repository.path, account.home / "demo.git" );
   ASSERT_TRUE( std::filesystem::exists( session.repository.path / "hooks" / "pre-receive" ) );

   ASSERT_EQ( fault_of( [&] { prepare_session( account, "git-receive-pack '//etc/passwd'", "/usr/bin/git-receive" ); } ),
              Fault::path_traversal );
   ASSERT_EQ( fault_of( [&] { prepare_session( account, "git-receive-pack '/../escape'", "/usr/bin/git-receive" ); } ),
              Fault::path_traversal );
}

TEST( prepareSession, traversalIsRejectedBeforeAnyWrite )
{
   Temp_dir  dir;
   auto      account = test_account( dir );

   ASSERT_EQ( fault_of( [&] { prepare_session( account, "git-receive-pack '../escape.git'", "/usr/bin/git-receive" ); } ),
              Fault::path_traversal );
   ASSERT_TRUE( std::filesystem::is_empty( account.home ) );
}

/* ----------------------------------------------------------------------------
 * Push_context
 * --------------------------------------------------------------------------*/

TEST( pushContext, travelsThroughEnvironment )
{
   Env_guard  guard;

   Push_context  ctx;
   ctx.repo        = "demo";
   ctx.user        = "alice";
   ctx.fingerprint = ALICE_MD5;
   ctx.export_env( );

   auto  back = Push_context::from_env( true );

   ASSERT_EQ( back.repo, "demo" );
   ASSERT_EQ( back.user, "alice" );
   ASSERT_EQ( back.fingerprint, ALICE_MD5 );
}

TEST( pushContext, missingIdentityIsRejected )
{
   Env_guard  guard;

   ASSERT_EQ( fault_of( [] { Push_context::from_env( false ); } ), Fault::bad_command );

   setenv( "RECEIVE_USER", "alice", 1 );
   setenv( "RECEIVE_FINGERPRINT", ALICE_MD5, 1 );

   ASSERT_EQ( Push_context::from_env( false ).repo, "" );
   ASSERT_EQ( fault_of( [] { Push_context::from_env( true ); } ), Fault::bad_command );

   setenv( "RECEIVE_USER", "alice;reboot", 1 );
   ASSERT_EQ( fault_of( [] { Push_context::from_env( false ); } ), Fault::no_username );
}

/* ----------------------------------------------------------------------------
 * exec_git_server
 * --------------------------------------------------------------------------*/

TEST( execGitServer, replacesProcessWithGitService )
{
   Env_guard  guard;
   Temp_dir   dir;
   auto       account = test_account( dir );

   auto  fake_git = dir.path( ) / "fake-git";
   auto  output   = dir.path( ) / "args.txt";

   write_script( fake_git, "pwd -P > '" + output.string( ) + "'\nprintf '%s\\n' \"$@\" >> '" + output.string( ) + "'\n" );

   auto  session = prepare_session( account, "git-receive-pack 'demo.git'", "/usr/bin/git-receive" );

   auto  pid = fork( );
   ASSERT_GE( pid, 0 );

   if ( pid == 0 )
   {
      setenv( "RECEIVE_GIT", fake_git.c_str( ), 1 );

      try
      {
         exec_git_server( account, session );
      }
      catch ( const std::exception & )
      {
      }

      _exit( 1 );
   }

   int  status = 0;
   ASSERT_EQ( waitpid( pid, &status, 0 ), pid );
   ASSERT_TRUE( WIFEXITED( status ) );
   ASSERT_EQ( WEXITSTATUS( status ), 0 );

   auto  home = std::filesystem::canonical( account.home ).string( );
   ASSERT_EQ( read_file( output ), home + "\nreceive-pack\n" + session.repository.path.string( ) + "\n" );
}
