
#pragma once

#include <lootbank/protocol/config.hpp>
#include <lootbank/protocol/types.hpp>

#include <fc/utf8.hpp>

#include <cmath>

namespace lootbank { namespace protocol {

inline bool is_valid_rarity( rarity_type r )
{
   return r >= common && r <= legendary;
}

inline void validate_display_name( const string& name )
{
   FC_ASSERT( name.size() > 0, "name is empty" );
   FC_ASSERT( name.size() <= LOOTBANK_MAX_NAME_LENGTH, "name is too long" );
   FC_ASSERT( fc::is_utf8( name ), "name not formatted in UTF8" );
}

inline void validate_description( const string& description )
{
   FC_ASSERT( description.size() <= LOOTBANK_MAX_DESCRIPTION_LENGTH, "description is too long" );
   FC_ASSERT( fc::is_utf8( description ), "description not formatted in UTF8" );
}

inline void validate_image_url( const string& url )
{
   FC_ASSERT( url.size() <= LOOTBANK_MAX_URL_LENGTH, "image url is too long" );
}

inline void validate_price( const share_type& price )
{
   FC_ASSERT( price.value >= 0, "price must not be negative", ("price", price) );
}

inline void validate_weight( double weight )
{
   FC_ASSERT( std::isfinite( weight ) && weight > 0, "weight must be positive", ("weight", weight) );
}

} }
