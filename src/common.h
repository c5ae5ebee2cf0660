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

#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <functional>
#include <list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/noncopyable.hpp>
#include <boost/version.hpp>

#include <git2.h>
#include <openssl/err.h>
#include <openssl/evp.h>



/**
 * 本程序运行时, 实际传入 main 函数的 argv[0] 的 basename
 */
extern const char      *grv_name;

extern bool             trace_enable;



inline const char * my_getenv( const char *name )
{
#ifdef __gnu_linux__
   return secure_getenv( name );
#else
   return getenv( name );
#endif
}



inline void trace_format( const char &ch )
{
   fprintf( stderr, "%c", ch );
}


inline void trace_format( const char * const &str )
{
   fprintf( stderr, "%s", str );
}


inline void trace_format( const std::string &str )
{
   fprintf( stderr, "%s", str.c_str( ) );
}


inline void trace_format( const std::string_view &str )
{
   for ( auto c : str )
      fprintf( stderr, "%c", c );
}


inline void trace_format( const std::filesystem::path &path )
{
   fprintf( stderr, "%s", path.c_str( ) );
}


inline void trace_format( const int &val )
{
   fprintf( stderr, "%d", val );
}


inline void trace_format( const unsigned int &val )
{
   fprintf( stderr, "%u", val );
}


inline void trace_format( const unsigned long &val )
{
   fprintf( stderr, "%lu", val );
}


inline void trace_format( const git_oid &oid )
{
   char  buf[GIT_OID_HEXSZ + 1];
   git_oid_tostr( buf, sizeof( buf ), &oid );
   fprintf( stderr, "%s", buf );
}



inline void trace_args( )
{
}


inline void trace_args( const auto &arg0, const auto &...args )
{
   trace_format( arg0 );
   trace_args( args... );
}



inline void trace( const auto &...args )
{
   if ( trace_enable ) [[unlikely]]
   {
      fprintf( stderr, "\033[95m" );

      trace_args( args... );

      fprintf( stderr, "\033[0m\n" );
   }
}



/**
 * 错误分类
 */
enum class Fault
{
   malformed_key,
   no_username,
   path_traversal,
   bad_command,
   io_error,
   corrupt_revision,
   receiver_unavailable,
};


const char * fault_name( Fault );



class Receive_error
   : public std::runtime_error
{
public:
   Receive_error( Fault fault, const std::string &message )
      : std::runtime_error( message ),
        _fault( fault )
   { }

   Fault fault( ) const
   {
      return _fault;
   }

private:
   Fault    _fault;
};



#define receive_err( fmt, ... ) \
   ({ \
      fprintf( stderr, "git-receive: " fmt "\n", ##__VA_ARGS__ ); \
      fflush( stderr ); \
   })


[[noreturn]] void _receive_fail( Fault, const char *, ... ) __attribute__(( format( printf, 2, 3 ) ));

#define receive_fail( fault, fmt, ... ) \
   _receive_fail( Fault::fault, fmt, ##__VA_ARGS__ )



#define git_ensure( ret, fault ) \
   if ( ( ret ) < 0 ) { \
      auto  e = git_error_last( ); \
      receive_fail( fault, "git error : %s", e != nullptr ? e->message : "unknown" ); \
   } else



#define ssl_ensure( ret ) \
   if ( ( ret ) == 0 ) \
   { \
      char  ssl_buf[256]; \
      ERR_error_string_n( ERR_get_error( ), ssl_buf, sizeof( ssl_buf ) ); \
      receive_fail( io_error, "openssl error : %s", ssl_buf ); \
   } else



bool get_line( FILE *, std::string & );
int  system( const std::list< std::string > & );
void write_file_atomic( const std::filesystem::path &, std::string_view, mode_t );



/**
 * libgit2 对象的持有者, 析构时调用对应的 free 函数
 */
template < typename T, void (*FREE)( T * ) >
class Git_handle
   : public boost::noncopyable
{
public:
   Git_handle( ) = default;

   ~Git_handle( )
   {
      if ( _ptr != nullptr )
         FREE( _ptr );
   }

   T ** out( )
   {
      return &_ptr;
   }

   T * get( ) const
   {
      return _ptr;
   }

   operator T * ( ) const
   {
      return _ptr;
   }

private:
   T  *_ptr = nullptr;
};


using Git_repository = Git_handle< git_repository, git_repository_free >;
using Git_object     = Git_handle< git_object,     git_object_free     >;
using Git_tree       = Git_handle< git_tree,       git_tree_free       >;
using Git_blob       = Git_handle< git_blob,       git_blob_free       >;
using Git_config     = Git_handle< git_config,     git_config_free     >;



template < size_t N >
inline void digest( uint8_t (&md)[N], const EVP_MD *type, const void *data, size_t size )
{
   unsigned int  len = 0;

   auto  ret = EVP_Digest( data, size, md, &len, type, nullptr );
   ssl_ensure( ret );

   if ( len != N )
      receive_fail( io_error, "unexpected digest length %u", len );
}



/**
 * 共享账户, 所有推送都通过这个系统账户的 ssh 登录进入
 */
struct Account
{
   std::string             name;
   std::filesystem::path   home;
};


Account current_account( const char *name = nullptr );
std::filesystem::path self_program( );
std::filesystem::path receiver_path( const Account & );
void chown_to_account( const Account &, const std::filesystem::path & );
std::string shell_quote( std::string_view );



enum class Deliver
{
   each,
   first,
   last,
};


/**
 * 从裸仓库 config 中读取的 gitreceive.* 配置
 */
struct Repo_config
{
   Deliver                 deliver           = Deliver::each;
   std::string             branch;
   std::filesystem::path   receiver;
   bool                    reject_on_failure = false;
};


Repo_config load_repo_config( git_repository * );



struct Public_key
{
   std::string    algorithm;
   std::string    body;
   std::string    blob;
   std::string    comment;
};


struct Identity
{
   std::string    username;
   std::string    fingerprint;
};


Public_key  parse_public_key( std::string_view );
std::string fingerprint( const Public_key & );
std::string fingerprint_sha256( const Public_key & );
bool        valid_username( std::string_view );
std::string resolve_username( const Public_key &, const char * );



struct Authorized_key_entry
{
   std::vector< std::pair< std::string, std::string > >   environment;
   std::filesystem::path                                  program;
   std::vector< std::string >                             options;
   Public_key                                             key;
   std::string                                            comment;

   std::string forced_command( ) const;
   std::string to_line( ) const;
};


Authorized_key_entry make_entry( const Account &, const Identity &, const Public_key &, const std::filesystem::path & );
std::filesystem::path authorized_keys_path( const Account & );
void ensure_authorized_keys( const Account & );
bool line_binds_key( std::string_view, std::string_view );
void authorize( const Account &, const Identity &, const Public_key &, const std::filesystem::path & );



struct Repository
{
   std::string             name;
   std::filesystem::path   path;
};


std::string normalize_repo_name( std::string_view );
Repository  resolve_repository( const Account &, std::string_view, bool );
std::string hook_script( const std::filesystem::path & );
void        install_hook( const Repository &, const std::filesystem::path & );



enum class Git_service
{
   receive_pack,
   upload_pack,
   upload_archive,
};


struct Ssh_command
{
   Git_service    service;
   std::string    repo;
};


/**
 * 从 run 传递到 hook 的上下文, 通过环境变量跨进程传递
 */
struct Push_context
{
   std::string    repo;
   std::string    user;
   std::string    fingerprint;

   static Push_context from_env( bool );
   void export_env( ) const;
};


struct Session
{
   Ssh_command    command;
   Repository     repository;
};


const char * service_name( Git_service );
Ssh_command  parse_ssh_command( std::string_view );
Session      prepare_session( const Account &, std::string_view, const std::filesystem::path & );
[[noreturn]] void exec_git_server( const Account &, const Session & );



using Archive_sink = std::function< void ( const char *, size_t ) >;

struct archive;


/**
 * 以 git archive --format=tar 的布局, 把某个版本的树输出为未压缩的 tar 流
 */
class Tree_archive
   : public boost::noncopyable
{
public:
   Tree_archive( git_repository *, const std::string & );

   const git_oid & tree_id( ) const
   {
      return *git_tree_id( _tree );
   }

   void write( const Archive_sink & );

private:
   static int walk( const char *, const git_tree_entry *, void * );
   static ssize_t callback_write( struct archive *, void *, const void *, size_t );

   void entry( struct archive *, const char *, const git_tree_entry * );
   void check( struct archive *, int, const char * );

   git_repository       *_repo;
   Git_tree              _tree;
   int64_t               _mtime = 0;
   const Archive_sink   *_sink  = nullptr;
   std::exception_ptr    _error;
};



struct Ref_update
{
   std::string    old_id;
   std::string    new_id;
   std::string    ref_name;

   bool is_delete( ) const;
};


std::vector< Ref_update > read_ref_updates( FILE * );
std::vector< Ref_update > select_deliveries( const std::vector< Ref_update > &, const Repo_config & );
int  run_receiver( const std::filesystem::path &, const std::vector< std::string > &, Tree_archive &, int );
int  hook_bridge( git_repository *, FILE *, int, const Push_context &, const Account & );



int user_command( unsigned argc, char **argv );
