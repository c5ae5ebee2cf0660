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
#include <signal.h>
#include <stdarg.h>
#include <unistd.h>

#include <exception>
#include <thread>

#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
namespace bp = boost::process::v1;
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
namespace bp = boost::process;
#endif



static bool write_all( int fd, const char *data, size_t size )
{
   while ( size > 0 )
   {
      auto  n = ::write( fd, data, size );
      if ( n < 0 )
      {
         if ( errno == EINTR )
            continue;

         return false;
      }

      data += n;
      size -= n;
   }

   return true;
}



/**
 * 写给推送客户端的提示, git 会加上 remote: 前缀转发
 */
static void relay_message( int fd, const char *fmt, ... ) __attribute__(( format( printf, 2, 3 ) ));

static void relay_message( int fd, const char *fmt, ... )
{
   char     buf[1024];
   va_list  ap;

   va_start( ap, fmt );
   auto  n = vsnprintf( buf, sizeof( buf ) - 1, fmt, ap );
   va_end( ap );

   if ( n < 0 )
      return;

   std::string  line = "git-receive: ";
   line.append( buf, std::min< size_t >( n, sizeof( buf ) - 2 ) );
   line += '\n';

   if ( !write_all( fd, line.data( ), line.size( ) ) )
      trace( "relay failed : ", strerror( errno ) );
}



bool Ref_update::is_delete( ) const
{
   return new_id.find_first_not_of( '0' ) == std::string::npos;
}



/**
 * pre-receive 的标准输入, 每行: <old-rev> <new-rev> <ref-name>
 */
std::vector< Ref_update > read_ref_updates( FILE *in )
{
   std::vector< Ref_update >  updates;
   std::string                line;

   while ( get_line( in, line ) )
   {
      std::vector< std::string >  parts;
      boost::split( parts, line, boost::is_space( ), boost::token_compress_on );

      parts.erase( std::remove( parts.begin( ), parts.end( ), std::string( ) ), parts.end( ) );

      if ( parts.size( ) < 3 )
      {
         trace( "skip line    : ", line );
         continue;
      }

      trace( "ref update   : ", parts[0], " ", parts[1], " ", parts[2] );

      updates.push_back( { parts[0], parts[1], parts[2] } );
   }

   return updates;
}



/**
 * 决定要投递给 receiver 的更新
 * 删除引用不投递; 配置了 gitreceive.branch 时只投递这个分支
 */
std::vector< Ref_update > select_deliveries( const std::vector< Ref_update > &updates, const Repo_config &conf )
{
   std::string  branch = conf.branch;
   if ( !branch.empty( ) && !branch.starts_with( "refs/" ) )
      branch.insert( 0, "refs/heads/" );

   std::vector< Ref_update >  out;

   for ( auto &u : updates )
   {
      if ( u.is_delete( ) )
         continue;

      if ( !branch.empty( ) && ( u.ref_name != branch ) )
         continue;

      out.push_back( u );
   }

   if ( out.size( ) > 1 )
   {
      if ( conf.deliver == Deliver::first )
         out.erase( out.begin( ) + 1, out.end( ) );

      else if ( conf.deliver == Deliver::last )
         out.erase( out.begin( ), out.end( ) - 1 );
   }

   return out;
}



/**
 * 启动 receiver, 两路数据同时流动:
 *    本线程把 tar 写入 receiver 的标准输入
 *    relay 线程把 receiver 的标准输出实时转发到 relay_fd
 *
 * 返回 receiver 的退出码
 */
int run_receiver( const std::filesystem::path &receiver, const std::vector< std::string > &args, Tree_archive &archive, int relay_fd )
{
   if ( ::access( receiver.c_str( ), X_OK ) != 0 )
      receive_fail( receiver_unavailable, "receiver %s is not available: %s", receiver.c_str( ), strerror( errno ) );

   // receiver 提前关闭输入时, 写管道得到 EPIPE 而不是被信号杀死
   ::signal( SIGPIPE, SIG_IGN );

   bp::pipe    in;
   bp::pipe    out;
   bp::child   child;

   try
   {
      child = bp::child( bp::exe = receiver.string( ), bp::args = args,
                         bp::std_in < in, bp::std_out > out,
                         bp::extend::on_exec_setup = []( auto & )
                         {
                            ::signal( SIGPIPE, SIG_DFL );
                         } );
   }
   catch ( const bp::process_error &e )
   {
      receive_fail( receiver_unavailable, "can't start receiver %s: %s", receiver.c_str( ), e.what( ) );
   }

   trace( "receiver pid : ", int( child.id( ) ) );

   std::thread  relay( [&out, relay_fd]( )
   {
      char  buf[4096];
      bool  relaying = true;

      while ( true )
      {
         int  n;

         try
         {
            n = out.read( buf, sizeof( buf ) );
         }
         catch ( const bp::process_error &e )
         {
            trace( "relay read   : ", e.what( ) );
            break;
         }

         if ( n <= 0 )
            break;

         // 客户端断开后继续读空管道, 不让 receiver 阻塞在写上
         if ( relaying && !write_all( relay_fd, buf, n ) )
         {
            trace( "relay write  : ", strerror( errno ) );
            relaying = false;
         }
      }
   } );

   bool                 feeding = true;
   std::exception_ptr   error;

   try
   {
      archive.write( [&]( const char *data, size_t size )
      {
         while ( feeding && ( size > 0 ) )
         {
            int  n;

            try
            {
               n = in.write( data, static_cast< int >( std::min< size_t >( size, 1 << 16 ) ) );
            }
            catch ( const bp::process_error &e )
            {
               if ( e.code( ).value( ) != EPIPE )
                  throw;

               trace( "receiver closed its input" );
               feeding = false;
               break;
            }

            data += n;
            size -= n;
         }
      } );
   }
   catch ( ... )
   {
      error = std::current_exception( );
   }

   in.close( );

   if ( error )
   {
      std::error_code  ec;
      child.terminate( ec );
   }

   relay.join( );

   std::error_code  ec;
   child.wait( ec );

   if ( error )
      std::rethrow_exception( error );

   if ( ec )
      receive_fail( io_error, "can't wait for receiver: %s", ec.message( ).c_str( ) );

   trace( "receiver exit: ", child.exit_code( ) );

   return child.exit_code( );
}



/**
 * pre-receive hook 的主体
 *
 * 返回值即 hook 的退出码: 0 接受推送, 非 0 拒绝
 * receiver 只是通知对象, 找不到或失败默认都不拒绝推送 (gitreceive.rejectOnFailure 可改变)
 * 读不出推送的版本说明仓库已损坏, Receive_error( corrupt_revision ) 抛给调用者
 */
int hook_bridge( git_repository *repo, FILE *in, int relay_fd, const Push_context &ctx, const Account &account )
{
   auto  conf       = load_repo_config( repo );
   auto  updates    = read_ref_updates( in );
   auto  deliveries = select_deliveries( updates, conf );

   auto  receiver = conf.receiver.empty( ) ? receiver_path( account ) : conf.receiver;

   int   status    = EXIT_SUCCESS;
   bool  available = true;

   for ( auto &u : deliveries )
   {
      trace( "deliver      : ", u.ref_name, " ", u.new_id );

      // receiver 不可用时仍然检查每个推送的版本
      Tree_archive  archive( repo, u.new_id );

      if ( !available )
         continue;

      std::vector< std::string >  args = { ctx.repo, u.new_id, ctx.user, ctx.fingerprint };

      try
      {
         auto  code = run_receiver( receiver, args, archive, relay_fd );

         if ( code != 0 )
         {
            relay_message( relay_fd, "receiver exited with status %d", code );

            if ( conf.reject_on_failure )
               status = EXIT_FAILURE;
         }
      }
      catch ( const Receive_error &e )
      {
         if ( e.fault( ) != Fault::receiver_unavailable )
            throw;

         relay_message( relay_fd, "%s", e.what( ) );
         available = false;
      }
   }

   return status;
}
