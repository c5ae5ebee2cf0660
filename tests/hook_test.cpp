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



static const std::string  ZERO_ID( 40, '0' );



/* ----------------------------------------------------------------------------
 * read_ref_updates / select_deliveries
 * --------------------------------------------------------------------------*/

TEST( readRefUpdates, parsesPreReceiveInput )
{
   Input_file  in( "1111111111111111111111111111111111111111 2222222222222222222222222222222222222222 refs/heads/master\n"
                   "\n"
                   "garbage\n"
                   "3333333333333333333333333333333333333333 0000000000000000000000000000000000000000 refs/heads/old" );

   auto  updates = read_ref_updates( in );

   ASSERT_EQ( updates.size( ), 2u );
   ASSERT_EQ( updates[0].old_id, std::string( 40, '1' ) );
   ASSERT_EQ( updates[0].new_id, std::string( 40, '2' ) );
   ASSERT_EQ( updates[0].ref_name, "refs/heads/master" );
   ASSERT_FALSE( updates[0].is_delete( ) );
   ASSERT_EQ( updates[1].ref_name, "refs/heads/old" );
   ASSERT_TRUE( updates[1].is_delete( ) );
}

TEST( selectDeliveries, followsDeliverPolicy )
{
   std::vector< Ref_update >  updates =
   {
      { ZERO_ID, std::string( 40, 'a' ), "refs/heads/master"  },
      { ZERO_ID, std::string( 40, 'b' ), "refs/heads/feature" },
      { std::string( 40, 'c' ), ZERO_ID, "refs/heads/gone"    },
      { ZERO_ID, std::string( 40, 'd' ), "refs/tags/v1"       },
   };

   Repo_config  conf;

   auto  each = select_deliveries( updates, conf );
   ASSERT_EQ( each.size( ), 3u );
   ASSERT_EQ( each[0].ref_name, "refs/heads/master" );
   ASSERT_EQ( each[2].ref_name, "refs/tags/v1" );

   conf.deliver = Deliver::first;
   auto  first = select_deliveries( updates, conf );
   ASSERT_EQ( first.size( ), 1u );
   ASSERT_EQ( first[0].ref_name, "refs/heads/master" );

   conf.deliver = Deliver::last;
   auto  last = select_deliveries( updates, conf );
   ASSERT_EQ( last.size( ), 1u );
   ASSERT_EQ( last[0].ref_name, "refs/tags/v1" );
}

TEST( selectDeliveries, restrictsToConfiguredBranch )
{
   std::vector< Ref_update >  updates =
   {
      { ZERO_ID, std::string( 40, 'a' ), "refs/heads/master"  },
      { ZERO_ID, std::string( 40, 'b' ), "refs/heads/feature" },
   };

   Repo_config  conf;
   conf.branch = "feature";

   auto  out = select_deliveries( updates, conf );
   ASSERT_EQ( out.size( ), 1u );
   ASSERT_EQ( out[0].new_id, std::string( 40, 'b' ) );

   conf.branch = "refs/heads/master";
   out = select_deliveries( updates, conf );
   ASSERT_EQ( out.size( ), 1u );
   ASSERT_EQ( out[0].new_id, std::string( 40, 'a' ) );

   conf.branch = "release";
   ASSERT_TRUE( select_deliveries( updates, conf ).empty( ) );
}

TEST( selectDeliveries, neverDeliversDeletion )
{
   Repo_config  conf;

   ASSERT_TRUE( select_deliveries( { { std::string( 40, 'c' ), ZERO_ID, "refs/heads/gone" } }, conf ).empty( ) );
}

/* ----------------------------------------------------------------------------
 * hook_bridge
 * --------------------------------------------------------------------------*/

class Hook_bridge_test
   : public ::testing::Test
{
protected:
   void SetUp( ) override
   {
      _account = test_account( _dir );
      _repo    = resolve_repository( _account, "demo", true );

      ASSERT_EQ( git_repository_open_bare( _git.out( ), _repo.path.c_str( ) ), 0 );

      _ctx.repo        = "demo";
      _ctx.user        = "alice";
      _ctx.fingerprint = ALICE_MD5;
   }

   void set_config( const char *name, const char *value )
   {
      Git_config  cfg;
      ASSERT_EQ( git_repository_config( cfg.out( ), _git ), 0 );
      ASSERT_EQ( git_config_set_string( cfg, name, value ), 0 );
   }

   void set_receiver( const std::string &body )
   {
      write_script( receiver_path( _account ), body );
   }

   int push( const std::string &input, const Relay_file &relay )
   {
      Input_file  in( input );
      return hook_bridge( _git, in, relay.fd( ), _ctx, _account );
   }

   std::filesystem::path home( const char *name ) const
   {
      return _account.home / name;
   }

   Temp_dir         _dir;
   Account          _account;
   Repository       _repo;
   Git_repository   _git;
   Push_context     _ctx;
};



TEST_F( Hook_bridge_test, deliversArgumentsAndArchive )
{
   auto  commit = commit_files( _git, { { "app.py", "print( 'hi' )\n" } } );

   set_receiver( "printf '%s\\n' \"$@\" > \"$HOME_DIR/args\"\n"
                 "cat > \"$HOME_DIR/archive.tar\"\n"
                 "echo \"----> received $2\"\n" );
   setenv( "HOME_DIR", _account.home.c_str( ), 1 );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );

   ASSERT_EQ( read_file( home( "args" ) ), "demo\n" + commit + "\nalice\n" + ALICE_MD5 + "\n" );
   ASSERT_EQ( relay.text( ), "----> received " + commit + "\n" );

   auto  tar = read_tar( read_file( home( "archive.tar" ) ) );
   ASSERT_EQ( tar.entries["app.py"].content, "print( 'hi' )\n" );
}

TEST_F( Hook_bridge_test, missingReceiverDoesNotRejectPush )
{
   auto  commit = commit_files( _git, { { "a", "x" } } );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );

   ASSERT_NE( relay.text( ).find( "not available" ), std::string::npos ) << relay.text( );
   ASSERT_TRUE( relay.text( ).starts_with( "git-receive: " ) );
}

TEST_F( Hook_bridge_test, missingReceiverStillChecksEveryRevision )
{
   auto  commit = commit_files( _git, { { "a", "x" } } );

   Relay_file  relay( _dir );
   ASSERT_EQ( fault_of( [&] {
      push( ZERO_ID + " " + commit + " refs/heads/master\n" +
            ZERO_ID + " " + std::string( 40, 'e' ) + " refs/heads/next\n", relay );
   } ), Fault::corrupt_revision );

   ASSERT_NE( relay.text( ).find( "not available" ), std::string::npos ) << relay.text( );
}

TEST_F( Hook_bridge_test, failingReceiverIsReportedButAccepted )
{
   auto  commit = commit_files( _git, { { "a", "x" } } );

   set_receiver( "cat > /dev/null\necho broken\nexit 3\n" );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );

   ASSERT_EQ( relay.text( ), "broken\ngit-receive: receiver exited with status 3\n" );
}

TEST_F( Hook_bridge_test, failingReceiverRejectsWhenConfigured )
{
   auto  commit = commit_files( _git, { { "a", "x" } } );

   set_receiver( "cat > /dev/null\nexit 3\n" );
   set_config( "gitreceive.rejectOnFailure", "true" );

   Relay_file  relay( _dir );
   ASSERT_NE( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );
}

TEST_F( Hook_bridge_test, configuredReceiverOverridesDefault )
{
   auto  commit = commit_files( _git, { { "a", "x" } } );

   auto  other = _dir.path( ) / "other-receiver";
   write_script( other, "cat > /dev/null\necho other\n" );
   set_receiver( "cat > /dev/null\necho default\n" );
   set_config( "gitreceive.receiver", other.c_str( ) );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );
   ASSERT_EQ( relay.text( ), "other\n" );
}

TEST_F( Hook_bridge_test, corruptRevisionThrows )
{
   set_receiver( "cat > /dev/null\n" );

   Relay_file  relay( _dir );
   ASSERT_EQ( fault_of( [&] { push( ZERO_ID + " " + std::string( 40, 'e' ) + " refs/heads/master\n", relay ); } ),
              Fault::corrupt_revision );
}

TEST_F( Hook_bridge_test, deletionRunsNoReceiver )
{
   set_receiver( "touch \"$HOME_DIR/ran\"\ncat > /dev/null\n" );
   setenv( "HOME_DIR", _account.home.c_str( ), 1 );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( std::string( 40, 'c' ) + " " + ZERO_ID + " refs/heads/gone\n", relay ), 0 );

   ASSERT_FALSE( std::filesystem::exists( home( "ran" ) ) );
   ASSERT_EQ( relay.text( ), "" );
}

TEST_F( Hook_bridge_test, eachRefIsDeliveredSeparately )
{
   auto  one = commit_files( _git, { { "a", "one" } } );
   auto  two = commit_files( _git, { { "a", "two" } } );

   set_receiver( "cat > /dev/null\necho \"$2\" >> \"$HOME_DIR/calls\"\n" );
   setenv( "HOME_DIR", _account.home.c_str( ), 1 );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + one + " refs/heads/master\n" + ZERO_ID + " " + two + " refs/heads/next\n", relay ), 0 );

   ASSERT_EQ( read_file( home( "calls" ) ), one + "\n" + two + "\n" );

   set_config( "gitreceive.deliver", "last" );
   std::filesystem::remove( home( "calls" ) );

   ASSERT_EQ( push( ZERO_ID + " " + one + " refs/heads/master\n" + ZERO_ID + " " + two + " refs/heads/next\n", relay ), 0 );
   ASSERT_EQ( read_file( home( "calls" ) ), two + "\n" );
}

TEST_F( Hook_bridge_test, chattyReceiverDoesNotDeadlock )
{
   std::string  big( 400000, 0 );
   for ( size_t i = 0; i < big.size( ); ++i )
      big[i] = char( i * 7 + 3 );

   auto  commit = commit_files( _git, { { "big.bin", big } } );

   // 先写满输出管道再读输入
   set_receiver( "head -c 300000 /dev/zero | tr '\\0' x\n"
                 "cat | wc -c > \"$HOME_DIR/size\"\n" );
   setenv( "HOME_DIR", _account.home.c_str( ), 1 );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );

   ASSERT_EQ( relay.text( ), std::string( 300000, 'x' ) );

   auto  size = std::stoul( read_file( home( "size" ) ) );
   ASSERT_GT( size, big.size( ) );
   ASSERT_EQ( size % 10240, 0u );
}

TEST_F( Hook_bridge_test, receiverIgnoringInputIsFine )
{
   std::string  big( 400000, 'z' );
   auto  commit = commit_files( _git, { { "big.txt", big } } );

   set_receiver( "echo ignored\n" );

   Relay_file  relay( _dir );
   ASSERT_EQ( push( ZERO_ID + " " + commit + " refs/heads/master\n", relay ), 0 );
   ASSERT_EQ( relay.text( ), "ignored\n" );
}
