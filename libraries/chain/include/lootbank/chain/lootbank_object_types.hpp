#pragma once

#include <chainbase/chainbase.hpp>

#include <lootbank/protocol/types.hpp>
#include <lootbank/protocol/config.hpp>

#include <fc/variant.hpp>

#include <boost/multi_index_container.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/mem_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/multi_index/composite_key.hpp>

namespace lootbank { namespace chain {

using namespace boost::multi_index;

using boost::multi_index_container;

using chainbase::object;
using chainbase::oid;
using chainbase::allocator;

using lootbank::protocol::share_type;
using lootbank::protocol::platform_user_id_type;
using lootbank::protocol::rarity_type;
using lootbank::protocol::time_point_sec;
using lootbank::protocol::optional;
using lootbank::protocol::string;
using lootbank::protocol::vector;

typedef chainbase::shared_string shared_string;

inline std::string to_string( const shared_string& str ) { return std::string( str.begin(), str.end() ); }
inline void from_string( shared_string& out, const std::string& in ){ out.assign( in.begin(), in.end() ); }

struct by_id;

enum object_type
{
   user_object_type,
   item_object_type,
   case_object_type,
   case_content_object_type,
   inventory_entry_object_type,
   opening_record_object_type
};

class user_object;
class item_object;
class case_object;
class case_content_object;
class inventory_entry_object;
class opening_record_object;

typedef oid< user_object            > user_id_type;
typedef oid< item_object            > item_id_type;
typedef oid< case_object            > case_id_type;
typedef oid< case_content_object    > case_content_id_type;
typedef oid< inventory_entry_object > inventory_entry_id_type;
typedef oid< opening_record_object  > opening_record_id_type;

} } // lootbank::chain

namespace fc
{
   class variant;

   template<typename T>
   void to_variant( const chainbase::oid<T>& var, variant& vo )
   {
      vo = var._id;
   }

   template<typename T>
   void from_variant( const variant& vo, chainbase::oid<T>& var )
   {
      var._id = vo.as_int64();
   }

   inline void to_variant( const chainbase::shared_string& s, variant& var )
   {
      var = std::string( s.begin(), s.end() );
   }

   inline void from_variant( const variant& var, chainbase::shared_string& s )
   {
      auto str = var.as_string();
      s.assign( str.begin(), str.end() );
   }
}

FC_REFLECT_ENUM( lootbank::chain::object_type,
                 (user_object_type)
                 (item_object_type)
                 (case_object_type)
                 (case_content_object_type)
                 (inventory_entry_object_type)
                 (opening_record_object_type)
               )
