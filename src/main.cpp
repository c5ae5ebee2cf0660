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

#include <libgen.h>



static void check_trace( )
{
   auto  en = my_getenv( "RECEIVE_TRACE" );
   if ( en == nullptr )
      return;

   auto  v = atoi( en );
   trace_enable = !!v;
}



static void init_component( )
{
   check_trace( );

   auto  ret = git_libgit2_init( );
   if ( ret < 0 )
   {
      auto  e = git_error_last( );
      receive_err( "can't initialize libgit2: %s", e != nullptr ? e->message : "unknown" );
      exit( EXIT_FAILURE );
   }
}



static int proc_command( unsigned argc, char **argv )
{
   trace( argc, " params:" );
   for ( unsigned i = 0; i < argc; ++i )
      trace( "   ", i, ": ", argv[i] );

   return user_command( argc - 1, argv + 1 );
}



int main( int argc, char **argv )
try
{
   grv_name = basename( argv[0] );

   init_component( );

   auto  ret = proc_command( argc, argv );

   git_libgit2_shutdown( );

   return ret;
}
catch ( const Receive_error &e )
{
   trace( "fault        : ", fault_name( e.fault( ) ) );
   receive_err( "%s", e.what( ) );
   return EXIT_FAILURE;
}
catch ( const std::exception &e )
{
   receive_err( "EXCEPTION: %s", e.what( ) );
   return EXIT_FAILURE;
}
