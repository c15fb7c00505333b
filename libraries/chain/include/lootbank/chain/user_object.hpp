#pragma once

#include <lootbank/chain/lootbank_object_types.hpp>

namespace lootbank { namespace chain {

   class user_object : public object< user_object_type, user_object >
   {
      user_object() = delete;

      public:
         template< typename Constructor, typename Allocator >
         user_object( Constructor&& c, allocator< Allocator > a )
            :username( a ), first_name( a ), last_name( a )
         {
            c( *this );
         }

         id_type                 id;

         platform_user_id_type   platform_id = 0;   ///< id assigned by the messaging platform, immutable

         shared_string           username;
         shared_string           first_name;
         shared_string           last_name;

         share_type              balance = 0;       ///< never negative
         share_type              total_spent = 0;
         uint32_t                cases_opened = 0;

         time_point_sec          created;
         time_point_sec          last_update;
   };

   /**
    * @ingroup object_index
    */
   struct by_platform_id;
   typedef multi_index_container<
      user_object,
      indexed_by<
         ordered_unique< tag< by_id >, member< user_object, user_id_type, &user_object::id > >,
         ordered_unique< tag< by_platform_id >, member< user_object, platform_user_id_type, &user_object::platform_id > >
      >,
      allocator< user_object >
   > user_index;

} } // lootbank::chain

FC_REFLECT( lootbank::chain::user_object,
             (id)(platform_id)
             (username)(first_name)(last_name)
             (balance)(total_spent)(cases_opened)
             (created)(last_update)
          )

CHAINBASE_SET_INDEX_TYPE( lootbank::chain::user_object, lootbank::chain::user_index )
