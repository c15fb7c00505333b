#include <lootbank/protocol/exceptions.hpp>

namespace lootbank { namespace protocol {

economy_error_kind classify_economy_error( const fc::exception& e )
{
   if( dynamic_cast< const authentication_failure_exception* >( &e ) )
      return authentication_failure;
   if( dynamic_cast< const not_found_exception* >( &e ) )
      return not_found;
   if( dynamic_cast< const empty_pool_exception* >( &e ) )
      return empty_pool;
   if( dynamic_cast< const insufficient_funds_exception* >( &e ) )
      return insufficient_funds;
   if( dynamic_cast< const conflict_exception* >( &e ) )
      return conflict;
   if( dynamic_cast< const store_unavailable_exception* >( &e ) )
      return store_unavailable;
   return no_error;
}

} } // lootbank::protocol
