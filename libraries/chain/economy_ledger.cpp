#include <lootbank/chain/economy_ledger.hpp>

#include <lootbank/protocol/exceptions.hpp>

#include <fc/log/logger.hpp>

#include <boost/tuple/tuple.hpp>

namespace lootbank { namespace chain {

using namespace lootbank::protocol;

economy_ledger::economy_ledger( database& db, weighted_selector& selector, const economy_config& config )
   : _db( db ), _catalog( db ), _selector( selector ), _config( config )
{
   FC_ASSERT( _config.starting_balance.value >= 0, "Starting balance must not be negative",
              ("starting_balance", _config.starting_balance) );
   FC_ASSERT( _config.sell_ratio <= LOOTBANK_100_PERCENT, "Sell ratio cannot exceed 100%",
              ("sell_ratio", _config.sell_ratio) );
}

user_snapshot economy_ledger::get_or_create_user( const platform_identity& who )
{ try {
   FC_ASSERT( who.id > 0, "Invalid platform user id" );

   optional< user_snapshot > existing;
   _db.with_read_access( [&]()
   {
      const user_object* u = _db.find_user_by_platform_id( who.id );
      if( u != nullptr )
         existing = user_snapshot( *u );
   });
   if( existing.valid() )
      return *existing;

   // Re-check under the write lock; a concurrent first contact may have won
   user_snapshot result;
   _db.with_transaction( [&]()
   {
      const user_object* u = _db.find_user_by_platform_id( who.id );
      if( u == nullptr )
      {
         const time_point_sec now = fc::time_point::now();
         u = &_db.create< user_object >( [&]( user_object& usr )
         {
            usr.platform_id = who.id;
            from_string( usr.username, who.username );
            from_string( usr.first_name, who.first_name );
            from_string( usr.last_name, who.last_name );
            usr.balance = _config.starting_balance;
            usr.created = now;
            usr.last_update = now;
         });

         ilog( "Created user ${u} for platform user ${p} with balance ${b}",
               ("u", u->id)("p", who.id)("b", _config.starting_balance) );
      }
      result = user_snapshot( *u );
   });

   return result;
} FC_CAPTURE_AND_RETHROW( (who.id) ) }

user_snapshot economy_ledger::get_user( const user_id_type& user )const
{
   user_snapshot result;
   _db.with_read_access( [&]()
   {
      result = user_snapshot( _db.get_user( user ) );
   });
   return result;
}

open_case_result economy_ledger::open_case( const user_id_type& user, const case_id_type& case_id )
{ try {
   open_case_result result;

   _db.with_transaction( [&]()
   {
      const auto& usr = _db.get_user( user );

      const case_object* c = _db.find_case( case_id );
      LOOTBANK_ASSERT( c != nullptr, case_not_found_exception, "Case ${c} not found", ("c", case_id) );
      LOOTBANK_ASSERT( c->active, case_inactive_exception, "Case ${c} is not active", ("c", case_id) );

      const auto pool = _catalog.active_contents( case_id );
      LOOTBANK_ASSERT( !pool.empty(), empty_pool_exception, "Case ${c} has no eligible contents", ("c", case_id) );

      const share_type price = c->price;
      LOOTBANK_ASSERT( usr.balance >= price, insufficient_funds_exception,
                       "Balance ${b} is below case price ${p}", ("b", usr.balance)("p", price) );

      const weighted_item& drawn = _selector.select( pool );
      const time_point_sec now = fc::time_point::now();

      _db.adjust_balance( usr, -price );

      _db.modify( usr, [&]( user_object& u )
      {
         u.total_spent += price;
         u.cases_opened++;
      });

      const auto& entry = _db.create< inventory_entry_object >( [&]( inventory_entry_object& e )
      {
         e.owner = usr.id;
         e.item = drawn.item.id;
         e.source_case = case_id;
         e.created = now;
      });

      _db.create< opening_record_object >( [&]( opening_record_object& r )
      {
         r.user = usr.id;
         r.case_id = case_id;
         r.item = drawn.item.id;
         r.spent = price;
         r.created = now;
      });

      result.item = drawn.item;
      result.inventory_entry = entry.id;
      result.new_balance = usr.balance;
   });

   ilog( "User ${u} opened case ${c} and drew item ${i}, balance now ${b}",
         ("u", user)("c", case_id)("i", result.item.id)("b", result.new_balance) );

   return result;
} FC_CAPTURE_AND_RETHROW( (user)(case_id) ) }

sell_item_result economy_ledger::sell_item( const user_id_type& user, const inventory_entry_id_type& entry_id )
{ try {
   sell_item_result result;

   _db.with_transaction( [&]()
   {
      const auto& usr = _db.get_user( user );

      const inventory_entry_object* entry = _db.find_inventory_entry( entry_id );
      LOOTBANK_ASSERT( entry != nullptr && entry->owner == user, inventory_entry_not_found_exception,
                       "Inventory entry ${e} not owned by user ${u}", ("e", entry_id)("u", user) );
      LOOTBANK_ASSERT( !entry->sold, item_already_sold_exception,
                       "Inventory entry ${e} was already sold", ("e", entry_id) );

      const auto& item = _db.get_item( entry->item );
      const share_type proceeds = sale_proceeds( item.price );

      _db.modify( *entry, [&]( inventory_entry_object& e )
      {
         e.sold = true;
         e.sold_price = proceeds;
      });

      _db.adjust_balance( usr, proceeds );

      result.proceeds = proceeds;
      result.new_balance = usr.balance;
   });

   ilog( "User ${u} sold inventory entry ${e} for ${p}, balance now ${b}",
         ("u", user)("e", entry_id)("p", result.proceeds)("b", result.new_balance) );

   return result;
} FC_CAPTURE_AND_RETHROW( (user)(entry_id) ) }

vector< inventory_listing > economy_ledger::inventory( const user_id_type& user )const
{
   vector< inventory_listing > result;

   _db.with_read_access( [&]()
   {
      _db.get_user( user );

      const auto& owner_idx = _db.get_index< inventory_entry_index >().indices().get< by_owner >();
      for( auto itr = owner_idx.lower_bound( boost::make_tuple( user, false ) );
           itr != owner_idx.end() && itr->owner == user && !itr->sold; ++itr )
      {
         result.emplace_back( *itr, _db.get_item( itr->item ) );
      }
   });

   return result;
}

share_type economy_ledger::sale_proceeds( const share_type& price )const
{
   FC_ASSERT( price.value >= 0, "Price must not be negative", ("price", price) );

   const int64_t ratio = _config.sell_ratio;
   return ( price.value / LOOTBANK_100_PERCENT ) * ratio
        + ( price.value % LOOTBANK_100_PERCENT ) * ratio / LOOTBANK_100_PERCENT;
}

} } // lootbank::chain
