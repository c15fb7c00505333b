#pragma once

#include <lootbank/chain/user_object.hpp>
#include <lootbank/chain/catalog_objects.hpp>
#include <lootbank/chain/inventory_objects.hpp>

namespace lootbank { namespace chain {

/*
 * Plain copies of stored objects. They own their strings and stay valid after
 * the store lock that produced them has been released.
 */

struct user_snapshot
{
   user_snapshot( const user_object& u ) :
      id( u.id ),
      platform_id( u.platform_id ),
      username( to_string( u.username ) ),
      first_name( to_string( u.first_name ) ),
      last_name( to_string( u.last_name ) ),
      balance( u.balance ),
      total_spent( u.total_spent ),
      cases_opened( u.cases_opened ),
      created( u.created ),
      last_update( u.last_update )
   {}

   user_snapshot() {}

   user_id_type            id;
   platform_user_id_type   platform_id = 0;
   string                  username;
   string                  first_name;
   string                  last_name;
   share_type              balance = 0;
   share_type              total_spent = 0;
   uint32_t                cases_opened = 0;
   time_point_sec          created;
   time_point_sec          last_update;
};

struct item_snapshot
{
   item_snapshot( const item_object& i ) :
      id( i.id ),
      name( to_string( i.name ) ),
      description( to_string( i.description ) ),
      image_url( to_string( i.image_url ) ),
      rarity( i.rarity ),
      price( i.price )
   {}

   item_snapshot() {}

   item_id_type   id;
   string         name;
   string         description;
   string         image_url;
   rarity_type    rarity = lootbank::protocol::common;
   share_type     price = 0;
};

struct case_snapshot
{
   case_snapshot( const case_object& c ) :
      id( c.id ),
      name( to_string( c.name ) ),
      description( to_string( c.description ) ),
      image_url( to_string( c.image_url ) ),
      price( c.price )
   {}

   case_snapshot() {}

   case_id_type   id;
   string         name;
   string         description;
   string         image_url;
   share_type     price = 0;
};

/// One eligible entry of a draw pool
struct weighted_item
{
   item_snapshot  item;
   double         weight = 0;
};

struct case_listing
{
   case_snapshot              info;
   vector< weighted_item >    contents;
};

struct inventory_listing
{
   inventory_listing( const inventory_entry_object& e, const item_object& i ) :
      id( e.id ),
      item( i ),
      source_case( e.source_case ),
      created( e.created )
   {}

   inventory_listing() {}

   inventory_entry_id_type    id;
   item_snapshot              item;
   optional< case_id_type >   source_case;
   time_point_sec             created;
};

} } // lootbank::chain

FC_REFLECT( lootbank::chain::user_snapshot,
            (id)(platform_id)(username)(first_name)(last_name)
            (balance)(total_spent)(cases_opened)
            (created)(last_update) )

FC_REFLECT( lootbank::chain::item_snapshot,
            (id)(name)(description)(image_url)(rarity)(price) )

FC_REFLECT( lootbank::chain::case_snapshot,
            (id)(name)(description)(image_url)(price) )

FC_REFLECT( lootbank::chain::weighted_item, (item)(weight) )

FC_REFLECT( lootbank::chain::case_listing, (info)(contents) )

FC_REFLECT( lootbank::chain::inventory_listing, (id)(item)(source_case)(created) )
