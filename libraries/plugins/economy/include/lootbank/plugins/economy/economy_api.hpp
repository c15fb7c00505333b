#pragma once

#include <lootbank/chain/economy_ledger.hpp>

#include <lootbank/protocol/exceptions.hpp>
#include <lootbank/protocol/init_data.hpp>

#include <fc/optional.hpp>

namespace lootbank { namespace plugins { namespace economy {

using std::string;
using std::vector;
using fc::optional;

using lootbank::protocol::share_type;
using lootbank::protocol::economy_error_kind;

struct open_case_args
{
   string         init_data;
   int64_t        case_id = 0;
};

struct open_case_return
{
   bool                                success = false;
   economy_error_kind                  error_kind = lootbank::protocol::no_error;
   optional< string >                  error;
   optional< chain::item_snapshot >    item;
   int64_t                             inventory_entry_id = 0;
   share_type                          new_balance = 0;
};

struct sell_item_args
{
   string         init_data;
   int64_t        inventory_entry_id = 0;
};

struct sell_item_return
{
   bool                 success = false;
   economy_error_kind   error_kind = lootbank::protocol::no_error;
   optional< string >   error;
   share_type           proceeds = 0;
   share_type           new_balance = 0;
};

struct list_cases_return
{
   bool                                success = false;
   economy_error_kind                  error_kind = lootbank::protocol::no_error;
   optional< string >                  error;
   vector< chain::case_listing >       cases;
};

struct list_inventory_args
{
   string         init_data;
};

struct list_inventory_return
{
   bool                                success = false;
   economy_error_kind                  error_kind = lootbank::protocol::no_error;
   optional< string >                  error;
   vector< chain::inventory_listing >  items;
};

struct get_user_args
{
   string         init_data;
};

struct get_user_return
{
   bool                                success = false;
   economy_error_kind                  error_kind = lootbank::protocol::no_error;
   optional< string >                  error;
   optional< chain::user_snapshot >    user;
};

/**
 * Request surface of the economy, independent of any transport.
 *
 * Every call that acts for a user first authenticates its identity payload.
 * Failures from the economy's error taxonomy come back as success = false
 * with an error_kind; anything else is a fault and propagates.
 */
class economy_api
{
   public:
      economy_api( chain::database& db, chain::economy_ledger& ledger, const protocol::init_data_verifier& verifier );

      open_case_return        open_case( const open_case_args& args );
      sell_item_return        sell_item( const sell_item_args& args );
      list_cases_return       list_cases();
      list_inventory_return   list_inventory( const list_inventory_args& args );
      get_user_return         get_user( const get_user_args& args );

   private:
      chain::user_snapshot authenticate( const string& init_data );

      chain::database&                       _db;
      chain::economy_ledger&                 _ledger;
      const protocol::init_data_verifier&    _verifier;
      chain::catalog_reader                  _catalog;
};

} } } // lootbank::plugins::economy

FC_REFLECT( lootbank::plugins::economy::open_case_args, (init_data)(case_id) )
FC_REFLECT( lootbank::plugins::economy::open_case_return,
            (success)(error_kind)(error)(item)(inventory_entry_id)(new_balance) )
FC_REFLECT( lootbank::plugins::economy::sell_item_args, (init_data)(inventory_entry_id) )
FC_REFLECT( lootbank::plugins::economy::sell_item_return,
            (success)(error_kind)(error)(proceeds)(new_balance) )
FC_REFLECT( lootbank::plugins::economy::list_cases_return, (success)(error_kind)(error)(cases) )
FC_REFLECT( lootbank::plugins::economy::list_inventory_args, (init_data) )
FC_REFLECT( lootbank::plugins::economy::list_inventory_return, (success)(error_kind)(error)(items) )
FC_REFLECT( lootbank::plugins::economy::get_user_args, (init_data) )
FC_REFLECT( lootbank::plugins::economy::get_user_return, (success)(error_kind)(error)(user) )
