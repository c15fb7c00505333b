#include <lootbank/chain/catalog_reader.hpp>

#include <fc/log/logger.hpp>

#include <boost/tuple/tuple.hpp>

#include <cmath>

namespace lootbank { namespace chain {

catalog_reader::catalog_reader( const database& db )
   : _db( db ) {}

vector< weighted_item > catalog_reader::active_contents( const case_id_type& case_id )const
{
   vector< weighted_item > result;

   const auto& content_idx = _db.get_index< case_content_index >().indices().get< by_case >();
   for( auto itr = content_idx.lower_bound( boost::make_tuple( case_id ) );
        itr != content_idx.end() && itr->case_id == case_id; ++itr )
   {
      if( !itr->active )
         continue;

      const item_object* item = _db.find_item( itr->item );
      if( item == nullptr || !item->active )
         continue;

      if( !std::isfinite( itr->weight ) || itr->weight <= 0 )
      {
         wlog( "Skipping case content ${id} with weight ${w}", ("id", itr->id)("w", itr->weight) );
         continue;
      }

      weighted_item entry;
      entry.item = item_snapshot( *item );
      entry.weight = itr->weight;
      result.push_back( std::move( entry ) );
   }

   return result;
}

vector< case_listing > catalog_reader::list_active_cases()const
{
   vector< case_listing > result;

   const auto& case_idx = _db.get_index< case_index >().indices().get< by_active >();
   for( auto itr = case_idx.lower_bound( boost::make_tuple( true ) );
        itr != case_idx.end() && itr->active; ++itr )
   {
      case_listing listing;
      listing.info = case_snapshot( *itr );
      listing.contents = active_contents( itr->id );
      result.push_back( std::move( listing ) );
   }

   return result;
}

} } // lootbank::chain
