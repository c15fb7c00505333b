#pragma once

#include <fc/exception/exception.hpp>
#include <fc/reflect/reflect.hpp>

#define LOOTBANK_ASSERT( expr, exc_type, FORMAT, ... )                \
   FC_MULTILINE_MACRO_BEGIN                                           \
   if( !(expr) )                                                      \
      FC_THROW_EXCEPTION( exc_type, FORMAT, __VA_ARGS__ );            \
   FC_MULTILINE_MACRO_END

namespace lootbank { namespace protocol {

   FC_DECLARE_EXCEPTION( economy_exception, 5000000, "economy exception" )

   FC_DECLARE_DERIVED_EXCEPTION( authentication_failure_exception, lootbank::protocol::economy_exception,
                                 5010000, "identity payload rejected" )

   FC_DECLARE_DERIVED_EXCEPTION( not_found_exception,               lootbank::protocol::economy_exception,
                                 5020000, "object not found" )
   FC_DECLARE_DERIVED_EXCEPTION( user_not_found_exception,          lootbank::protocol::not_found_exception,
                                 5020001, "user not found" )
   FC_DECLARE_DERIVED_EXCEPTION( case_not_found_exception,          lootbank::protocol::not_found_exception,
                                 5020002, "case not found" )
   FC_DECLARE_DERIVED_EXCEPTION( case_inactive_exception,           lootbank::protocol::not_found_exception,
                                 5020003, "case is not active" )
   FC_DECLARE_DERIVED_EXCEPTION( item_not_found_exception,          lootbank::protocol::not_found_exception,
                                 5020004, "item not found" )
   FC_DECLARE_DERIVED_EXCEPTION( inventory_entry_not_found_exception, lootbank::protocol::not_found_exception,
                                 5020005, "inventory entry not found" )

   FC_DECLARE_DERIVED_EXCEPTION( empty_pool_exception,              lootbank::protocol::economy_exception,
                                 5030000, "no eligible contents to draw from" )

   FC_DECLARE_DERIVED_EXCEPTION( insufficient_funds_exception,      lootbank::protocol::economy_exception,
                                 5040000, "insufficient funds" )

   FC_DECLARE_DERIVED_EXCEPTION( conflict_exception,                lootbank::protocol::economy_exception,
                                 5050000, "concurrent modification conflict" )
   FC_DECLARE_DERIVED_EXCEPTION( item_already_sold_exception,       lootbank::protocol::conflict_exception,
                                 5050001, "inventory entry already sold" )

   FC_DECLARE_DERIVED_EXCEPTION( store_unavailable_exception,       lootbank::protocol::economy_exception,
                                 5060000, "store unavailable" )

   /**
    * Kind of failure reported across the request boundary. Callers use it to
    * tell rejected identities apart from business-rule failures.
    */
   enum economy_error_kind
   {
      no_error,
      authentication_failure,
      not_found,
      empty_pool,
      insufficient_funds,
      conflict,
      store_unavailable
   };

   /**
    * Maps an exception from the economy taxonomy onto its error kind.
    * Returns no_error for exceptions outside the taxonomy.
    */
   economy_error_kind classify_economy_error( const fc::exception& e );

} } // lootbank::protocol

FC_REFLECT_ENUM( lootbank::protocol::economy_error_kind,
                 (no_error)
                 (authentication_failure)
                 (not_found)
                 (empty_pool)
                 (insufficient_funds)
                 (conflict)
                 (store_unavailable)
               )
