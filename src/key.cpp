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



/**
 * 严格的 base64 解码, 长度必须是 4 的倍数, 只允许末尾最多两个 '='
 */
static bool decode_base64( std::string &out, std::string_view text )
{
   if ( text.empty( ) || ( ( text.size( ) % 4 ) != 0 ) )
      return false;

   out.resize( boost::beast::detail::base64::decoded_size( text.size( ) ) );

   auto  ret = boost::beast::detail::base64::decode( out.data( ), text.data( ), text.size( ) );

   auto  pad = text.size( ) - ret.second;
   if ( pad > 2 )
      return false;

   for ( auto i = ret.second; i < text.size( ); ++i )
   {
      if ( text[i] != '=' )
         return false;
   }

   out.resize( ret.first );
   return true;
}



/**
 * 公钥 blob 以 ssh 协议格式的字符串开头: 4 字节大端长度 + 算法名
 */
static bool blob_matches_algorithm( std::string_view blob, std::string_view algorithm )
{
   if ( blob.size( ) < 4 )
      return false;

   auto  p = reinterpret_cast< const uint8_t * >( blob.data( ) );
   size_t  len = ( size_t( p[0] ) << 24 ) | ( size_t( p[1] ) << 16 ) | ( size_t( p[2] ) << 8 ) | p[3];

   if ( len > ( blob.size( ) - 4 ) )
      return false;

   return blob.substr( 4, len ) == algorithm;
}



/**
 * 解析一行公钥: <algorithm> <base64 body> [comment]
 */
Public_key parse_public_key( std::string_view line )
{
   std::string                 text( line );
   std::vector< std::string >  parts;
   boost::split( parts, text, boost::is_space( ), boost::token_compress_on );

   parts.erase( std::remove( parts.begin( ), parts.end( ), std::string( ) ), parts.end( ) );

   if ( parts.size( ) < 2 )
      receive_fail( malformed_key, "invalid key: expected '<algorithm> <key> [comment]'" );

   Public_key  key;
   key.algorithm = std::move( parts[0] );
   key.body      = std::move( parts[1] );

   if ( !decode_base64( key.blob, key.body ) )
      receive_fail( malformed_key, "invalid key: body of %s key is not base64", key.algorithm.c_str( ) );

   if ( !blob_matches_algorithm( key.blob, key.algorithm ) )
      receive_fail( malformed_key, "invalid key: body is not a %s key", key.algorithm.c_str( ) );

   if ( parts.size( ) > 2 )
      key.comment = std::move( parts[2] );

   trace( "key          : ", key.algorithm, " ", key.comment );

   return key;
}



/**
 * 与 ssh-keygen -l -E md5 相同, 只是没有 MD5: 前缀
 */
std::string fingerprint( const Public_key &key )
{
   static constexpr char   hex[] = "0123456789abcdef";

   uint8_t  md[16];
   digest( md, EVP_md5( ), key.blob.data( ), key.blob.size( ) );

   std::string  fp;
   fp.reserve( sizeof( md ) * 3 );

   for ( auto b : md )
   {
      if ( !fp.empty( ) )
         fp += ':';

      fp += hex[b >> 4];
      fp += hex[b & 0xf];
   }

   return fp;
}



std::string fingerprint_sha256( const Public_key &key )
{
   uint8_t  md[32];
   digest( md, EVP_sha256( ), key.blob.data( ), key.blob.size( ) );

   std::string  text( boost::beast::detail::base64::encoded_size( sizeof( md ) ), 0 );

   auto  n = boost::beast::detail::base64::encode( text.data( ), md, sizeof( md ) );
   text.resize( n );

   while ( !text.empty( ) && ( text.back( ) == '=' ) )
      text.pop_back( );

   return "SHA256:" + text;
}



/**
 * 用户名会进入 authorized_keys 的 command 以及 receiver 的参数
 * 不合法直接拒绝, 不做任何替换
 */
bool valid_username( std::string_view name )
{
   static constexpr std::string_view   forbidden = "'\"`\\$;&|<>()";

   if ( name.empty( ) || ( name[0] == '-' ) )
      return false;

   for ( auto c : name )
   {
      auto  u = static_cast< unsigned char >( c );

      if ( ( u <= 0x20 ) || ( u == 0x7f ) )
         return false;

      if ( forbidden.find( c ) != std::string_view::npos )
         return false;
   }

   return true;
}



std::string resolve_username( const Public_key &key, const char *override_name )
{
   std::string  name;

   if ( ( override_name != nullptr ) && ( *override_name != 0 ) )
      name = override_name;

   else if ( !key.comment.empty( ) )
      name = key.comment;

   else
      receive_fail( no_username, "no username given and the key has no comment" );

   if ( !valid_username( name ) )
      receive_fail( no_username, "invalid username '%s'", name.c_str( ) );

   return name;
}
