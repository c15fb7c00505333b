#pragma once

#include <lootbank/chain/lootbank_object_types.hpp>

namespace lootbank { namespace chain {

   // 可收藏物品
   class item_object : public object< item_object_type, item_object >
   {
      item_object() = delete;

      public:
         template< typename Constructor, typename Allocator >
         item_object( Constructor&& c, allocator< Allocator > a )
            :name( a ), description( a ), image_url( a )
         {
            c( *this );
         }

         id_type           id;

         shared_string     name;
         shared_string     description;
         shared_string     image_url;

         rarity_type       rarity = lootbank::protocol::common;
         share_type        price = 0;       /// base price, also the buy-back reference
         bool              active = true;

         time_point_sec    created;
   };

   class case_object : public object< case_object_type, case_object >
   {
      case_object() = delete;

      public:
         template< typename Constructor, typename Allocator >
         case_object( Constructor&& c, allocator< Allocator > a )
            :name( a ), description( a ), image_url( a )
         {
            c( *this );
         }

         id_type           id;

         shared_string     name;
         shared_string     description;
         shared_string     image_url;

         share_type        price = 0;       /// cost of one opening
         bool              active = true;

         time_point_sec    created;
   };

   /**
    * Places an item in a case's draw pool. Weights are relative to the other
    * rows of the same case and are never normalised.
    */
   class case_content_object : public object< case_content_object_type, case_content_object >
   {
      public:
         template< typename Constructor, typename Allocator >
         case_content_object( Constructor&& c, allocator< Allocator > a )
         {
            c( *this );
         }

         case_content_object(){}

         id_type           id;

         case_id_type      case_id;
         item_id_type      item;
         double            weight = 0;
         bool              active = true;
   };

   /**
    * @ingroup object_index
    */
   typedef multi_index_container<
      item_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< item_object, item_id_type, &item_object::id > >
      >,
      allocator< item_object >
   > item_index;

   struct by_active;
   typedef multi_index_container<
      case_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< case_object, case_id_type, &case_object::id > >,
         ordered_unique< tag< by_active >,
            composite_key< case_object,
               member< case_object, bool, &case_object::active >,
               member< case_object, case_id_type, &case_object::id >
            >
         >
      >,
      allocator< case_object >
   > case_index;

   struct by_case;
   struct by_item;
   typedef multi_index_container<
      case_content_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< case_content_object, case_content_id_type, &case_content_object::id > >,
         ordered_unique< tag< by_case >,
            composite_key< case_content_object,
               member< case_content_object, case_id_type, &case_content_object::case_id >,
               member< case_content_object, case_content_id_type, &case_content_object::id >
            >
         >,
         ordered_unique< tag< by_item >,
            composite_key< case_content_object,
               member< case_content_object, item_id_type, &case_content_object::item >,
               member< case_content_object, case_content_id_type, &case_content_object::id >
            >
         >
      >,
      allocator< case_content_object >
   > case_content_index;

} } // lootbank::chain

FC_REFLECT( lootbank::chain::item_object,
             (id)(name)(description)(image_url)
             (rarity)(price)(active)
             (created)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::item_object, lootbank::chain::item_index )

FC_REFLECT( lootbank::chain::case_object,
             (id)(name)(description)(image_url)
             (price)(active)
             (created)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::case_object, lootbank::chain::case_index )

FC_REFLECT( lootbank::chain::case_content_object,
             (id)(case_id)(item)(weight)(active)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::case_content_object, lootbank::chain::case_content_index )
