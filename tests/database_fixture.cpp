#include "database_fixture.hpp"

#include <fc/io/json.hpp>
#include <fc/log/logger.hpp>
#include <fc/variant_object.hpp>

#include <boost/tuple/tuple.hpp>

#include <cctype>
#include <cstdio>

namespace lootbank { namespace test {

std::string url_encode( const std::string& in )
{
   std::string out;
   for( unsigned char c : in )
   {
      if( std::isalnum( c ) || c == '-' || c == '_' || c == '.' || c == '~' )
      {
         out += char( c );
      }
      else
      {
         char buf[4];
         std::snprintf( buf, sizeof( buf ), "%%%02X", unsigned( c ) );
         out += buf;
      }
   }
   return out;
}

std::string user_json( int64_t platform_id, const std::string& username )
{
   return fc::json::to_string( fc::mutable_variant_object()
      ( "id", platform_id )
      ( "first_name", "Test" )
      ( "last_name", "User" )
      ( "username", username )
      ( "language_code", "en" ) );
}

std::string sign_fields( const init_data_fields& fields, const std::string& bot_token )
{
   init_data_verifier signer( bot_token );

   std::string payload;
   for( const auto& f : fields )
   {
      if( !payload.empty() )
         payload += '&';
      payload += f.first + '=' + f.second;
   }

   return payload + "&hash=" + signer.sign( build_check_string( fields ) );
}

std::string make_init_data( int64_t platform_id, const std::string& username )
{
   init_data_fields fields;
   fields.emplace_back( "query_id", "AAHdF6IQAAAAAN0XohDhrOrc" );
   fields.emplace_back( "user", url_encode( user_json( platform_id, username ) ) );
   fields.emplace_back( "auth_date", std::to_string( LOOTBANK_TEST_AUTH_DATE ) );
   return sign_fields( fields );
}

database_fixture::database_fixture( const economy_config& config )
   : selector( uint64_t( 42 ) ),
     ledger( db, selector, config )
{
   database::open_args args;
   args.shared_mem_dir = data_dir.path();
   args.shared_file_size = 1024 * 1024 * 8;
   args.do_validate_invariants = true;
   db.open( args );
}

database_fixture::~database_fixture()
{
   try
   {
      db.validate_invariants();
      db.wipe( data_dir.path() );
   }
   catch( const fc::exception& e )
   {
      elog( "Failed to tear down test store: ${e}", ("e", e.to_detail_string()) );
   }
}

user_snapshot database_fixture::create_user( int64_t platform_id, int64_t balance )
{
   platform_identity who;
   who.id = platform_id;
   who.username = "user" + std::to_string( platform_id );

   auto user = ledger.get_or_create_user( who );
   set_balance( user.id, balance );
   return reload( user.id );
}

void database_fixture::set_balance( const user_id_type& user, int64_t balance )
{
   db.with_transaction( [&]()
   {
      db.modify( db.get_user( user ), [&]( user_object& u ) { u.balance = balance; } );
   });
}

item_id_type database_fixture::create_item( const std::string& name, int64_t price, rarity_type rarity )
{
   item_id_type id;
   db.with_transaction( [&]()
   {
      id = db.create_item( name, name + " description", rarity, price, "https://example.com/" + name + ".png" ).id;
   });
   return id;
}

case_id_type database_fixture::create_case( const std::string& name, int64_t price )
{
   case_id_type id;
   db.with_transaction( [&]()
   {
      id = db.create_case( name, name + " description", price ).id;
   });
   return id;
}

case_content_id_type database_fixture::add_content( const case_id_type& c, const item_id_type& i, double weight )
{
   case_content_id_type id;
   db.with_transaction( [&]()
   {
      id = db.add_case_content( db.get_case( c ), db.get_item( i ), weight ).id;
   });
   return id;
}

case_id_type database_fixture::create_single_item_case( int64_t case_price, int64_t item_price, item_id_type* item )
{
   auto item_id = create_item( "prize", item_price, lootbank::protocol::rare );
   auto case_id = create_case( "single", case_price );
   add_content( case_id, item_id, 1.0 );
   if( item != nullptr )
      *item = item_id;
   return case_id;
}

user_snapshot database_fixture::reload( const user_id_type& user )
{
   return ledger.get_user( user );
}

size_t database_fixture::count_inventory( const user_id_type& user )
{
   size_t count = 0;
   db.with_read_access( [&]()
   {
      const auto& idx = db.get_index< inventory_entry_index >().indices().get< by_owner >();
      for( auto itr = idx.lower_bound( boost::make_tuple( user ) ); itr != idx.end() && itr->owner == user; ++itr )
         ++count;
   });
   return count;
}

size_t database_fixture::count_history( const user_id_type& user )
{
   size_t count = 0;
   db.with_read_access( [&]()
   {
      const auto& idx = db.get_index< opening_record_index >().indices().get< by_user >();
      for( auto itr = idx.lower_bound( boost::make_tuple( user ) ); itr != idx.end() && itr->user == user; ++itr )
         ++count;
   });
   return count;
}

} } // lootbank::test
