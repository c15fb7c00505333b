#pragma once

#include <lootbank/chain/lootbank_object_types.hpp>

namespace lootbank { namespace chain {

   /**
    * Ownership of one item by one user. An entry moves from owned to sold
    * exactly once; sold entries are never modified again.
    */
   class inventory_entry_object : public object< inventory_entry_object_type, inventory_entry_object >
   {
      public:
         template< typename Constructor, typename Allocator >
         inventory_entry_object( Constructor&& c, allocator< Allocator > a )
         {
            c( *this );
         }

         inventory_entry_object(){}

         id_type                    id;

         user_id_type               owner;
         item_id_type               item;
         optional< case_id_type >   source_case;   /// cleared when the case is removed

         bool                       sold = false;
         optional< share_type >     sold_price;    /// set only when sold

         time_point_sec             created;

         int64_t source_case_key()const { return source_case.valid() ? source_case->_id : -1; }
   };

   /// 开箱记录, append only
   class opening_record_object : public object< opening_record_object_type, opening_record_object >
   {
      public:
         template< typename Constructor, typename Allocator >
         opening_record_object( Constructor&& c, allocator< Allocator > a )
         {
            c( *this );
         }

         opening_record_object(){}

         id_type           id;

         user_id_type      user;
         case_id_type      case_id;
         item_id_type      item;
         share_type        spent = 0;

         time_point_sec    created;
   };

   /**
    * @ingroup object_index
    */
   struct by_owner;
   struct by_item;
   struct by_source_case;
   typedef multi_index_container<
      inventory_entry_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< inventory_entry_object, inventory_entry_id_type, &inventory_entry_object::id > >,
         ordered_unique< tag< by_owner >,
            composite_key< inventory_entry_object,
               member< inventory_entry_object, user_id_type, &inventory_entry_object::owner >,
               member< inventory_entry_object, bool, &inventory_entry_object::sold >,
               member< inventory_entry_object, inventory_entry_id_type, &inventory_entry_object::id >
            >
         >,
         ordered_unique< tag< by_item >,
            composite_key< inventory_entry_object,
               member< inventory_entry_object, item_id_type, &inventory_entry_object::item >,
               member< inventory_entry_object, inventory_entry_id_type, &inventory_entry_object::id >
            >
         >,
         ordered_unique< tag< by_source_case >,
            composite_key< inventory_entry_object,
               const_mem_fun< inventory_entry_object, int64_t, &inventory_entry_object::source_case_key >,
               member< inventory_entry_object, inventory_entry_id_type, &inventory_entry_object::id >
            >
         >
      >,
      allocator< inventory_entry_object >
   > inventory_entry_index;

   struct by_user;
   struct by_case;
   typedef multi_index_container<
      opening_record_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< opening_record_object, opening_record_id_type, &opening_record_object::id > >,
         ordered_unique< tag< by_user >,
            composite_key< opening_record_object,
               member< opening_record_object, user_id_type, &opening_record_object::user >,
               member< opening_record_object, opening_record_id_type, &opening_record_object::id >
            >
         >,
         ordered_unique< tag< by_case >,
            composite_key< opening_record_object,
               member< opening_record_object, case_id_type, &opening_record_object::case_id >,
               member< opening_record_object, opening_record_id_type, &opening_record_object::id >
            >
         >,
         ordered_unique< tag< by_item >,
            composite_key< opening_record_object,
               member< opening_record_object, item_id_type, &opening_record_object::item >,
               member< opening_record_object, opening_record_id_type, &opening_record_object::id >
            >
         >
      >,
      allocator< opening_record_object >
   > opening_record_index;

} } // lootbank::chain

FC_REFLECT( lootbank::chain::inventory_entry_object,
             (id)(owner)(item)(source_case)
             (sold)(sold_price)
             (created)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::inventory_entry_object, lootbank::chain::inventory_entry_index )

FC_REFLECT( lootbank::chain::opening_record_object,
             (id)(user)(case_id)(item)(spent)
             (created)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::opening_record_object, lootbank::chain::opening_record_index )
