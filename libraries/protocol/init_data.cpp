#include <lootbank/protocol/init_data.hpp>
#include <lootbank/protocol/config.hpp>

#include <fc/crypto/hmac.hpp>
#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/string.hpp>
#include <fc/variant_object.hpp>

#include <openssl/crypto.h>

#include <algorithm>
#include <limits>
#include <set>

namespace lootbank { namespace protocol {

namespace detail {

   inline int hex_value( char c )
   {
      if( c >= '0' && c <= '9' ) return c - '0';
      if( c >= 'a' && c <= 'f' ) return c - 'a' + 10;
      if( c >= 'A' && c <= 'F' ) return c - 'A' + 10;
      return -1;
   }

   inline string optional_string_field( const fc::variant_object& obj, const char* name )
   {
      auto itr = obj.find( name );
      if( itr == obj.end() || !itr->value().is_string() )
         return string();
      return itr->value().as_string();
   }

} // detail

bool parse_init_data( const string& payload, init_data_fields& fields )
{
   fields.clear();
   if( payload.empty() )
      return false;

   std::set< string > seen;
   size_t start = 0;
   while( start <= payload.size() )
   {
      size_t end = payload.find( '&', start );
      if( end == string::npos )
         end = payload.size();

      string segment = payload.substr( start, end - start );
      size_t eq = segment.find( '=' );
      if( eq == string::npos || eq == 0 )
         return false;

      string key = segment.substr( 0, eq );
      if( !seen.insert( key ).second )
         return false;

      fields.emplace_back( key, segment.substr( eq + 1 ) );
      start = end + 1;
   }

   return true;
}

string build_check_string( init_data_fields fields )
{
   std::sort( fields.begin(), fields.end(),
      []( const pair< string, string >& a, const pair< string, string >& b ) { return a.first < b.first; } );

   string result;
   for( const auto& f : fields )
   {
      if( !result.empty() )
         result += '\n';
      result += f.first;
      result += '=';
      result += f.second;
   }
   return result;
}

bool url_decode( const string& in, string& out )
{
   out.clear();
   out.reserve( in.size() );
   for( size_t i = 0; i < in.size(); ++i )
   {
      char c = in[i];
      if( c == '+' )
      {
         out += ' ';
      }
      else if( c == '%' )
      {
         if( i + 2 >= in.size() )
            return false;
         int hi = detail::hex_value( in[i+1] );
         int lo = detail::hex_value( in[i+2] );
         if( hi < 0 || lo < 0 )
            return false;
         out += char( ( hi << 4 ) | lo );
         i += 2;
      }
      else
      {
         out += c;
      }
   }
   return true;
}

init_data_verifier::init_data_verifier( const string& bot_token )
   : _secret( fc::sha256::hash( bot_token ) ) {}

string init_data_verifier::sign( const string& check_string )const
{
   fc::hmac< fc::sha256 > mac;
   return mac.digest( _secret.data(), uint32_t( _secret.data_size() ),
                      check_string.data(), uint32_t( check_string.size() ) ).str();
}

bool init_data_verifier::verify( const string& payload )const
{
   try
   {
      if( payload.size() > LOOTBANK_MAX_INIT_DATA_LENGTH )
      {
         wlog( "Identity payload of ${n} bytes exceeds limit", ("n", payload.size()) );
         return false;
      }

      init_data_fields fields;
      if( !parse_init_data( payload, fields ) )
      {
         wlog( "Malformed identity payload" );
         return false;
      }

      auto hash_itr = std::find_if( fields.begin(), fields.end(),
         []( const pair< string, string >& f ) { return f.first == LOOTBANK_INIT_DATA_HASH_FIELD; } );
      if( hash_itr == fields.end() || hash_itr->second.empty() )
      {
         wlog( "Identity payload carries no hash" );
         return false;
      }

      string supplied = hash_itr->second;
      fields.erase( hash_itr );

      string expected = sign( build_check_string( std::move( fields ) ) );
      if( supplied.size() != expected.size() )
         return false;

      return CRYPTO_memcmp( supplied.data(), expected.data(), expected.size() ) == 0;
   }
   catch( const fc::exception& e )
   {
      wlog( "Identity payload rejected: ${e}", ("e", e.to_string()) );
   }
   catch( const std::exception& e )
   {
      wlog( "Identity payload rejected: ${e}", ("e", e.what()) );
   }
   return false;
}

optional< platform_identity > extract_identity( const string& payload )
{
   init_data_fields fields;
   if( !parse_init_data( payload, fields ) )
      return optional< platform_identity >();

   auto field_value = [&]( const char* key ) -> const string*
   {
      for( const auto& f : fields )
         if( f.first == key )
            return &f.second;
      return nullptr;
   };

   const string* user_field = field_value( LOOTBANK_INIT_DATA_USER_FIELD );
   if( user_field == nullptr )
      return optional< platform_identity >();

   try
   {
      string user_json;
      if( !url_decode( *user_field, user_json ) )
         return optional< platform_identity >();

      fc::variant v = fc::json::from_string( user_json );
      if( !v.is_object() )
         return optional< platform_identity >();

      const fc::variant_object& obj = v.get_object();
      auto id_itr = obj.find( "id" );
      if( id_itr == obj.end() || !( id_itr->value().is_int64() || id_itr->value().is_uint64() ) )
         return optional< platform_identity >();

      platform_identity who;
      who.id         = id_itr->value().as_int64();
      who.username   = detail::optional_string_field( obj, "username" );
      who.first_name = detail::optional_string_field( obj, "first_name" );
      who.last_name  = detail::optional_string_field( obj, "last_name" );
      if( who.id <= 0 )
         return optional< platform_identity >();

      const string* auth_date = field_value( LOOTBANK_INIT_DATA_AUTH_DATE_FIELD );
      if( auth_date != nullptr )
      {
         const int64_t seconds = fc::to_int64( *auth_date );
         if( seconds >= 0 && seconds <= int64_t( std::numeric_limits< uint32_t >::max() ) )
            who.auth_date = time_point_sec( uint32_t( seconds ) );
         else
            wlog( "Ignoring out of range auth_date ${d}", ("d", *auth_date) );
      }

      return optional< platform_identity >( who );
   }
   catch( const fc::exception& e )
   {
      wlog( "Unreadable identity in payload: ${e}", ("e", e.to_string()) );
   }
   return optional< platform_identity >();
}

} } // lootbank::protocol
