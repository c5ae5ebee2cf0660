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
#include <fcntl.h>
#include <stdarg.h>
#include <sys/stat.h>
#include <unistd.h>

#if BOOST_VERSION >= 108600
#include <boost/asio/io_context.hpp>
#endif
#include <boost/process.hpp>



const char *grv_name = "git-receive";
bool        trace_enable;



const char * fault_name( Fault fault )
{
   switch ( fault )
   {
   case Fault::malformed_key:          return "MalformedKey";
   case Fault::no_username:            return "NoUsername";
   case Fault::path_traversal:         return "PathTraversal";
   case Fault::bad_command:            return "BadCommand";
   case Fault::io_error:               return "IOError";
   case Fault::corrupt_revision:       return "CorruptRevision";
   case Fault::receiver_unavailable:   return "ReceiverUnavailable";
   }

   return "Unknown";
}



[[noreturn]] void _receive_fail( Fault fault, const char *fmt, ... )
{
   char     buf[1024];
   va_list  ap;

   va_start( ap, fmt );
   vsnprintf( buf, sizeof( buf ), fmt, ap );
   va_end( ap );

   trace( fault_name( fault ), ": ", static_cast< const char * >( buf ) );

   throw Receive_error( fault, buf );
}



bool get_line( FILE *fp, std::string &line )
{
   constexpr size_t  BUF_SIZE = 80;

   char  buf[BUF_SIZE];

   bool  succ = false;

   line.clear( );

   while ( fgets( buf, BUF_SIZE, fp ) != nullptr )
   {
      succ = true;

      auto  n = strlen( buf );

      line.append( buf, n );

      if ( n < ( BUF_SIZE - 1 ) )
         break;

      if ( buf[BUF_SIZE-2] == '\n' )
         break;
   }

   if ( ( line.size( ) > 0 ) && ( line.back( ) == '\n' ) )
      line.pop_back( );

   return succ;
}



int  system( const std::list< std::string > &args )
{
   if ( args.empty( ) )
      receive_fail( io_error, "empty command line" );

#if BOOST_VERSION < 108600
   return boost::process::system( boost::process::args = args );
#else

   std::list< boost::string_view >   args2;
   for ( auto itr = args.begin( ); ++itr != args.end( ); )
      args2.emplace_back( *itr );

   boost::asio::io_context    ctx;
   return boost::process::execute( boost::process::process( ctx, args.front( ), args2 ) );
#endif
}



/**
 * 先写同目录下的临时文件, 再 rename 覆盖目标文件
 * 并发写入时后写者胜出, 读者永远看不到写了一半的文件
 */
void write_file_atomic( const std::filesystem::path &path, std::string_view content, mode_t mode )
{
   std::string  tmp = path.string( );
   tmp += ".XXXXXX";

   auto  fd = mkstemp( tmp.data( ) );
   if ( fd < 0 )
      receive_fail( io_error, "can't create %s: %s", tmp.c_str( ), strerror( errno ) );

   auto  fail = [&]( const char *what )
   {
      auto  err = errno;
      ::close( fd );
      ::unlink( tmp.c_str( ) );
      receive_fail( io_error, "can't %s %s: %s", what, tmp.c_str( ), strerror( err ) );
   };

   auto  ptr  = content.data( );
   auto  left = content.size( );

   while ( left > 0 )
   {
      auto  n = ::write( fd, ptr, left );
      if ( n < 0 )
      {
         if ( errno == EINTR )
            continue;

         fail( "write" );
      }

      ptr  += n;
      left -= n;
   }

   if ( ::fchmod( fd, mode ) != 0 )
      fail( "chmod" );

   if ( ::fsync( fd ) != 0 )
      fail( "sync" );

   if ( ::close( fd ) != 0 )
   {
      auto  err = errno;
      ::unlink( tmp.c_str( ) );
      receive_fail( io_error, "can't close %s: %s", tmp.c_str( ), strerror( err ) );
   }

   if ( ::rename( tmp.c_str( ), path.c_str( ) ) != 0 )
   {
      auto  err = errno;
      ::unlink( tmp.c_str( ) );
      receive_fail( io_error, "can't replace %s: %s", path.c_str( ), strerror( err ) );
   }
}
