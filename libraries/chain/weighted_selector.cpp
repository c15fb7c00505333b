#include <lootbank/chain/weighted_selector.hpp>

#include <lootbank/protocol/validation.hpp>

namespace lootbank { namespace chain {

using namespace lootbank::protocol;

weighted_selector::weighted_selector()
   : _engine( std::random_device()() ) {}

weighted_selector::weighted_selector( uint64_t seed )
   : _engine( seed ) {}

weighted_selector::weighted_selector( uniform_source source )
   : _source( std::move( source ) ) {}

double weighted_selector::next_uniform()
{
   boost::mutex::scoped_lock lock( _mtx );
   if( _source )
      return _source();
   return std::uniform_real_distribution< double >( 0.0, 1.0 )( _engine );
}

size_t weighted_selector::select_index( const std::vector< double >& weights )
{
   LOOTBANK_ASSERT( !weights.empty(), empty_pool_exception, "Cannot draw from an empty pool", ("size", weights.size()) );

   double total = 0;
   for( double w : weights )
   {
      validate_weight( w );
      total += w;
   }

   double u = next_uniform();
   FC_ASSERT( u >= 0.0 && u < 1.0, "Uniform source out of range", ("u", u) );

   const double point = u * total;
   double running = 0;
   for( size_t i = 0; i < weights.size(); ++i )
   {
      running += weights[i];
      if( running > point )
         return i;
   }

   // Rounding can leave the running sum a hair below point
   return weights.size() - 1;
}

} } // lootbank::chain
