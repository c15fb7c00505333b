#pragma once

#include <lootbank/chain/database.hpp>
#include <lootbank/chain/snapshot_objects.hpp>

namespace lootbank { namespace chain {

/**
 * Read-only view of cases and their draw pools.
 *
 * Takes no locks: callers already hold the store's read or write lock.
 */
class catalog_reader
{
   public:
      explicit catalog_reader( const database& db );

      /**
       * Draw pool of a case: rows that are active and whose item is active.
       * Rows with a non-positive weight are skipped. An empty result means
       * the case cannot be opened.
       */
      vector< weighted_item > active_contents( const case_id_type& case_id )const;

      /// Every active case with its draw pool, ordered by id
      vector< case_listing > list_active_cases()const;

   private:
      const database& _db;
};

} } // lootbank::chain
