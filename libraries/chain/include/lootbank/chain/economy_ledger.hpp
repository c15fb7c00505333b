#pragma once

#include <lootbank/chain/catalog_reader.hpp>
#include <lootbank/chain/database.hpp>
#include <lootbank/chain/snapshot_objects.hpp>
#include <lootbank/chain/weighted_selector.hpp>

#include <lootbank/protocol/config.hpp>
#include <lootbank/protocol/types.hpp>

namespace lootbank { namespace chain {

struct economy_config
{
   share_type  starting_balance = LOOTBANK_DEFAULT_STARTING_BALANCE;
   uint16_t    sell_ratio = LOOTBANK_DEFAULT_SELL_RATIO;   ///< basis points of the base price paid on sale
};

struct open_case_result
{
   item_snapshot              item;
   inventory_entry_id_type    inventory_entry;
   share_type                 new_balance = 0;
};

struct sell_item_result
{
   share_type                 proceeds = 0;
   share_type                 new_balance = 0;
};

/**
 * Sole writer of balances, inventories and the opening history.
 *
 * open_case() and sell_item() each run as one store transaction holding the
 * write lock from the first read to the last write, so concurrent requests
 * for the same user are serialised and a failure at any step leaves no
 * trace.
 */
class economy_ledger
{
   public:
      economy_ledger( database& db, weighted_selector& selector, const economy_config& config = economy_config() );

      /**
       * Returns the user for a platform identity, creating it with the
       * starting balance on first contact. Idempotent under concurrency.
       */
      user_snapshot get_or_create_user( const protocol::platform_identity& who );

      user_snapshot get_user( const user_id_type& user )const;

      /**
       * @throws user_not_found_exception, case_not_found_exception,
       *         case_inactive_exception, empty_pool_exception,
       *         insufficient_funds_exception, store_unavailable_exception
       */
      open_case_result open_case( const user_id_type& user, const case_id_type& case_id );

      /**
       * @throws inventory_entry_not_found_exception when the entry does not
       *         exist or belongs to another user
       * @throws item_already_sold_exception when the entry was already sold
       */
      sell_item_result sell_item( const user_id_type& user, const inventory_entry_id_type& entry );

      /// Unsold entries of a user, oldest first
      vector< inventory_listing > inventory( const user_id_type& user )const;

      /// floor( price * sell_ratio ), exact in integer arithmetic
      share_type sale_proceeds( const share_type& price )const;

      const economy_config& config()const { return _config; }

   private:
      database&            _db;
      catalog_reader       _catalog;
      weighted_selector&   _selector;
      economy_config       _config;
};

} } // lootbank::chain

FC_REFLECT( lootbank::chain::economy_config, (starting_balance)(sell_ratio) )
FC_REFLECT( lootbank::chain::open_case_result, (item)(inventory_entry)(new_balance) )
FC_REFLECT( lootbank::chain::sell_item_result, (proceeds)(new_balance) )
