#pragma once

#include <fc/optional.hpp>
#include <fc/reflect/reflect.hpp>
#include <fc/safe.hpp>
#include <fc/time.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lootbank { namespace protocol {

using std::string;
using std::vector;
using std::pair;

using fc::optional;
using fc::time_point;
using fc::time_point_sec;

typedef fc::safe< int64_t >   share_type;
typedef int64_t               platform_user_id_type;

/// Rarity tiers an item can be tagged with
enum rarity_type
{
   common,
   rare,
   epic,
   legendary
};

/// An authenticated user as asserted by a verified identity payload
struct platform_identity
{
   platform_user_id_type   id = 0;
   string                  username;
   string                  first_name;
   string                  last_name;
   time_point_sec          auth_date;
};

} } // lootbank::protocol

FC_REFLECT_ENUM( lootbank::protocol::rarity_type,
                 (common)
                 (rare)
                 (epic)
                 (legendary)
               )

FC_REFLECT( lootbank::protocol::platform_identity,
            (id)(username)(first_name)(last_name)(auth_date)
          )
