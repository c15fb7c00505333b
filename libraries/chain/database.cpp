#include <lootbank/chain/database.hpp>

#include <lootbank/protocol/validation.hpp>

#include <fc/log/logger.hpp>

#include <boost/interprocess/exceptions.hpp>
#include <boost/tuple/tuple.hpp>

#include <stdexcept>

namespace lootbank { namespace chain {

using namespace lootbank::protocol;

database::database() {}

database::~database() {}

void database::open( const open_args& args )
{
   try
   {
      chainbase::database::open( args.shared_mem_dir, args.chainbase_flags, args.shared_file_size );

      initialize_indexes();

      _lock_wait_micro = args.lock_wait_micro;

      // Undo anything a previous process left uncommitted
      with_write_lock( [&]()
      {
         undo_all();
         if( args.do_validate_invariants )
            validate_invariants();
      }, _lock_wait_micro );

      ilog( "Opened store in ${dir}", ("dir", args.shared_mem_dir) );
   }
   FC_CAPTURE_LOG_AND_RETHROW( (args.shared_mem_dir)(args.shared_file_size) )
}

void database::close()
{
   try
   {
      chainbase::database::flush();
      chainbase::database::close();
   }
   FC_CAPTURE_AND_RETHROW()
}

void database::wipe( const fc::path& shared_mem_dir )
{
   close();
   chainbase::database::wipe( shared_mem_dir );
}

void database::initialize_indexes()
{
   add_index< user_index            >();
   add_index< item_index            >();
   add_index< case_index            >();
   add_index< case_content_index    >();
   add_index< inventory_entry_index >();
   add_index< opening_record_index  >();
}

void database::with_transaction( const std::function< void() >& callback )
{
   try
   {
      with_write_lock( [&]()
      {
         auto session = start_undo_session();
         callback();
         session.push();
         commit( revision() );
      }, _lock_wait_micro );
   }
   catch( const fc::exception& )
   {
      throw;
   }
   catch( const boost::interprocess::interprocess_exception& e )
   {
      elog( "Store failure: ${e}", ("e", e.what()) );
      FC_THROW_EXCEPTION( store_unavailable_exception, "Store failure: ${e}", ("e", e.what()) );
   }
   catch( const std::runtime_error& e )
   {
      wlog( "Store unavailable: ${e}", ("e", e.what()) );
      FC_THROW_EXCEPTION( store_unavailable_exception, "Store unavailable: ${e}", ("e", e.what()) );
   }
}

void database::with_read_access( const std::function< void() >& callback )
{
   try
   {
      with_read_lock( [&]()
      {
         callback();
      }, _lock_wait_micro );
   }
   catch( const fc::exception& )
   {
      throw;
   }
   catch( const std::runtime_error& e )
   {
      wlog( "Store unavailable: ${e}", ("e", e.what()) );
      FC_THROW_EXCEPTION( store_unavailable_exception, "Store unavailable: ${e}", ("e", e.what()) );
   }
}

const user_object& database::get_user( const user_id_type& id )const
{
   const auto* u = find_user( id );
   LOOTBANK_ASSERT( u != nullptr, user_not_found_exception, "User ${id} not found", ("id", id) );
   return *u;
}

const user_object* database::find_user( const user_id_type& id )const
{
   return find< user_object, by_id >( id );
}

const user_object* database::find_user_by_platform_id( platform_user_id_type platform_id )const
{
   return find< user_object, by_platform_id >( platform_id );
}

const item_object& database::get_item( const item_id_type& id )const
{
   const auto* i = find_item( id );
   LOOTBANK_ASSERT( i != nullptr, item_not_found_exception, "Item ${id} not found", ("id", id) );
   return *i;
}

const item_object* database::find_item( const item_id_type& id )const
{
   return find< item_object, by_id >( id );
}

const case_object& database::get_case( const case_id_type& id )const
{
   const auto* c = find_case( id );
   LOOTBANK_ASSERT( c != nullptr, case_not_found_exception, "Case ${id} not found", ("id", id) );
   return *c;
}

const case_object* database::find_case( const case_id_type& id )const
{
   return find< case_object, by_id >( id );
}

const inventory_entry_object& database::get_inventory_entry( const inventory_entry_id_type& id )const
{
   const auto* e = find_inventory_entry( id );
   LOOTBANK_ASSERT( e != nullptr, inventory_entry_not_found_exception, "Inventory entry ${id} not found", ("id", id) );
   return *e;
}

const inventory_entry_object* database::find_inventory_entry( const inventory_entry_id_type& id )const
{
   return find< inventory_entry_object, by_id >( id );
}

const item_object& database::create_item( const string& name, const string& description, rarity_type rarity,
                                          const share_type& price, const string& image_url )
{ try {
   validate_display_name( name );
   validate_description( description );
   validate_image_url( image_url );
   validate_price( price );
   FC_ASSERT( is_valid_rarity( rarity ), "Unknown rarity ${r}", ("r", int( rarity )) );

   return create< item_object >( [&]( item_object& i )
   {
      from_string( i.name, name );
      from_string( i.description, description );
      from_string( i.image_url, image_url );
      i.rarity = rarity;
      i.price = price;
      i.active = true;
      i.created = fc::time_point::now();
   });
} FC_CAPTURE_AND_RETHROW( (name)(price) ) }

const case_object& database::create_case( const string& name, const string& description,
                                          const share_type& price, const string& image_url )
{ try {
   validate_display_name( name );
   validate_description( description );
   validate_image_url( image_url );
   validate_price( price );

   return create< case_object >( [&]( case_object& c )
   {
      from_string( c.name, name );
      from_string( c.description, description );
      from_string( c.image_url, image_url );
      c.price = price;
      c.active = true;
      c.created = fc::time_point::now();
   });
} FC_CAPTURE_AND_RETHROW( (name)(price) ) }

const case_content_object& database::add_case_content( const case_object& c, const item_object& i, double weight )
{ try {
   validate_weight( weight );

   return create< case_content_object >( [&]( case_content_object& cc )
   {
      cc.case_id = c.id;
      cc.item = i.id;
      cc.weight = weight;
      cc.active = true;
   });
} FC_CAPTURE_AND_RETHROW( (c.id)(i.id)(weight) ) }

void database::set_item_active( const item_object& i, bool active )
{
   modify( i, [&]( item_object& obj ) { obj.active = active; } );
}

void database::set_case_active( const case_object& c, bool active )
{
   modify( c, [&]( case_object& obj ) { obj.active = active; } );
}

void database::set_case_content_active( const case_content_object& content, bool active )
{
   modify( content, [&]( case_content_object& obj ) { obj.active = active; } );
}

void database::remove_case( const case_object& c )
{ try {
   const case_id_type case_id = c.id;

   const auto& content_idx = get_index< case_content_index >().indices().get< by_case >();
   auto content_itr = content_idx.lower_bound( boost::make_tuple( case_id ) );
   while( content_itr != content_idx.end() && content_itr->case_id == case_id )
   {
      const auto& current = *content_itr;
      ++content_itr;
      remove( current );
   }

   const auto& history_idx = get_index< opening_record_index >().indices().get< by_case >();
   auto history_itr = history_idx.lower_bound( boost::make_tuple( case_id ) );
   while( history_itr != history_idx.end() && history_itr->case_id == case_id )
   {
      const auto& current = *history_itr;
      ++history_itr;
      remove( current );
   }

   // Owned items survive their source case; the reference is cleared instead
   const auto& inventory_idx = get_index< inventory_entry_index >().indices().get< by_source_case >();
   vector< const inventory_entry_object* > orphaned;
   for( auto itr = inventory_idx.lower_bound( boost::make_tuple( case_id._id ) );
        itr != inventory_idx.end() && itr->source_case_key() == case_id._id; ++itr )
      orphaned.push_back( &*itr );

   for( const auto* entry : orphaned )
      modify( *entry, []( inventory_entry_object& e ) { e.source_case.reset(); } );

   remove( c );
} FC_CAPTURE_AND_RETHROW( (c.id) ) }

void database::remove_item( const item_object& i )
{ try {
   const item_id_type item_id = i.id;

   const auto& content_idx = get_index< case_content_index >().indices().get< by_item >();
   auto content_itr = content_idx.lower_bound( boost::make_tuple( item_id ) );
   while( content_itr != content_idx.end() && content_itr->item == item_id )
   {
      const auto& current = *content_itr;
      ++content_itr;
      remove( current );
   }

   const auto& inventory_idx = get_index< inventory_entry_index >().indices().get< by_item >();
   auto inventory_itr = inventory_idx.lower_bound( boost::make_tuple( item_id ) );
   while( inventory_itr != inventory_idx.end() && inventory_itr->item == item_id )
   {
      const auto& current = *inventory_itr;
      ++inventory_itr;
      remove( current );
   }

   const auto& history_idx = get_index< opening_record_index >().indices().get< by_item >();
   auto history_itr = history_idx.lower_bound( boost::make_tuple( item_id ) );
   while( history_itr != history_idx.end() && history_itr->item == item_id )
   {
      const auto& current = *history_itr;
      ++history_itr;
      remove( current );
   }

   remove( i );
} FC_CAPTURE_AND_RETHROW( (i.id) ) }

void database::adjust_balance( const user_object& u, const share_type& delta )
{
   LOOTBANK_ASSERT( u.balance + delta >= share_type( 0 ), insufficient_funds_exception,
                    "Insufficient funds: balance ${b}, change ${d}", ("b", u.balance)("d", delta) );

   modify( u, [&]( user_object& usr )
   {
      usr.balance += delta;
      usr.last_update = fc::time_point::now();
   });

   _balance_adjusted_signal( u, delta );
}

boost::signals2::connection database::add_balance_adjusted_handler( const balance_adjusted_handler_t& func )
{
   return _balance_adjusted_signal.connect( func );
}

void database::validate_invariants()const
{
   try
   {
      const auto& user_idx = get_index< user_index >().indices();
      for( auto itr = user_idx.begin(); itr != user_idx.end(); ++itr )
      {
         FC_ASSERT( itr->balance.value >= 0, "Negative balance", ("user", itr->id)("balance", itr->balance) );
         FC_ASSERT( itr->total_spent.value >= 0, "Negative spend counter", ("user", itr->id) );
      }

      const auto& content_idx = get_index< case_content_index >().indices();
      for( auto itr = content_idx.begin(); itr != content_idx.end(); ++itr )
      {
         FC_ASSERT( find_case( itr->case_id ) != nullptr, "Case content references a missing case", ("content", itr->id) );
         FC_ASSERT( find_item( itr->item ) != nullptr, "Case content references a missing item", ("content", itr->id) );
      }

      const auto& inventory_idx = get_index< inventory_entry_index >().indices();
      for( auto itr = inventory_idx.begin(); itr != inventory_idx.end(); ++itr )
      {
         FC_ASSERT( find_user( itr->owner ) != nullptr, "Inventory entry without owner", ("entry", itr->id) );
         FC_ASSERT( find_item( itr->item ) != nullptr, "Inventory entry without item", ("entry", itr->id) );
         FC_ASSERT( itr->sold == itr->sold_price.valid(), "Sale price must be set exactly when sold", ("entry", itr->id) );
         if( itr->source_case.valid() )
            FC_ASSERT( find_case( *itr->source_case ) != nullptr, "Inventory entry references a missing case", ("entry", itr->id) );
      }

      const auto& history_idx = get_index< opening_record_index >().indices();
      for( auto itr = history_idx.begin(); itr != history_idx.end(); ++itr )
      {
         FC_ASSERT( itr->spent.value >= 0, "Negative spend in history", ("record", itr->id) );
      }
   }
   FC_CAPTURE_LOG_AND_RETHROW( (revision()) )
}

} } // lootbank::chain
