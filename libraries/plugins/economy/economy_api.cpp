#include <lootbank/plugins/economy/economy_api.hpp>

#include <fc/log/logger.hpp>

namespace lootbank { namespace plugins { namespace economy {

using namespace lootbank::protocol;

namespace detail {

   /**
    * Runs body and folds failures from the economy taxonomy into the
    * returned record. Other exceptions are rethrown untouched.
    */
   template< typename Return, typename Body >
   Return report_outcome( Body&& body )
   {
      Return ret;
      try
      {
         body( ret );
         ret.success = true;
      }
      catch( const fc::exception& e )
      {
         economy_error_kind kind = classify_economy_error( e );
         if( kind == no_error )
            throw;

         dlog( "Request rejected (${k}): ${e}", ("k", kind)("e", e.to_string()) );
         ret = Return();
         ret.success = false;
         ret.error_kind = kind;
         ret.error = e.to_string();
      }
      return ret;
   }

} // detail

economy_api::economy_api( chain::database& db, chain::economy_ledger& ledger, const init_data_verifier& verifier )
   : _db( db ), _ledger( ledger ), _verifier( verifier ), _catalog( db ) {}

chain::user_snapshot economy_api::authenticate( const string& init_data )
{
   LOOTBANK_ASSERT( _verifier.verify( init_data ), authentication_failure_exception,
                    "Identity payload failed verification", ("size", init_data.size()) );

   auto who = extract_identity( init_data );
   LOOTBANK_ASSERT( who.valid(), authentication_failure_exception,
                    "Identity payload does not name a user", ("size", init_data.size()) );

   return _ledger.get_or_create_user( *who );
}

open_case_return economy_api::open_case( const open_case_args& args )
{
   return detail::report_outcome< open_case_return >( [&]( open_case_return& ret )
   {
      const auto user = authenticate( args.init_data );
      LOOTBANK_ASSERT( args.case_id >= 0, case_not_found_exception, "Case ${c} not found", ("c", args.case_id) );

      auto result = _ledger.open_case( user.id, chain::case_id_type( args.case_id ) );
      ret.item = result.item;
      ret.inventory_entry_id = result.inventory_entry._id;
      ret.new_balance = result.new_balance;
   });
}

sell_item_return economy_api::sell_item( const sell_item_args& args )
{
   return detail::report_outcome< sell_item_return >( [&]( sell_item_return& ret )
   {
      const auto user = authenticate( args.init_data );
      LOOTBANK_ASSERT( args.inventory_entry_id >= 0, inventory_entry_not_found_exception,
                       "Inventory entry ${e} not found", ("e", args.inventory_entry_id) );

      auto result = _ledger.sell_item( user.id, chain::inventory_entry_id_type( args.inventory_entry_id ) );
      ret.proceeds = result.proceeds;
      ret.new_balance = result.new_balance;
   });
}

list_cases_return economy_api::list_cases()
{
   return detail::report_outcome< list_cases_return >( [&]( list_cases_return& ret )
   {
      _db.with_read_access( [&]()
      {
         ret.cases = _catalog.list_active_cases();
      });
   });
}

list_inventory_return economy_api::list_inventory( const list_inventory_args& args )
{
   return detail::report_outcome< list_inventory_return >( [&]( list_inventory_return& ret )
   {
      const auto user = authenticate( args.init_data );
      ret.items = _ledger.inventory( user.id );
   });
}

get_user_return economy_api::get_user( const get_user_args& args )
{
   return detail::report_outcome< get_user_return >( [&]( get_user_return& ret )
   {
      ret.user = authenticate( args.init_data );
   });
}

} } } // lootbank::plugins::economy
