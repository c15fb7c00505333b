#pragma once

#include <lootbank/protocol/exceptions.hpp>

#include <boost/thread/mutex.hpp>

#include <cstdint>
#include <functional>
#include <random>
#include <vector>

namespace lootbank { namespace chain {

/**
 * Draws one candidate with probability proportional to its weight.
 *
 * Weights are relative: a pool weighted [0.1, 0.1] behaves exactly like one
 * weighted [50, 50]. The uniform source can be replaced for deterministic
 * draws without touching the selection walk. Safe to call from several
 * threads at once.
 */
class weighted_selector
{
   public:
      /// Returns values uniformly distributed in [0, 1)
      typedef std::function< double() > uniform_source;

      /// Seeds the engine from std::random_device
      weighted_selector();
      explicit weighted_selector( uint64_t seed );
      explicit weighted_selector( uniform_source source );

      /**
       * @return the index of the drawn weight
       * @throws empty_pool_exception when weights is empty
       * @throws fc::assert_exception when a weight is not a positive finite number
       */
      size_t select_index( const std::vector< double >& weights );

      /// Candidate must expose a `weight` member
      template< typename Candidate >
      const Candidate& select( const std::vector< Candidate >& candidates )
      {
         std::vector< double > weights;
         weights.reserve( candidates.size() );
         for( const auto& c : candidates )
            weights.push_back( c.weight );
         return candidates[ select_index( weights ) ];
      }

   private:
      double next_uniform();

      std::mt19937_64   _engine;
      uniform_source    _source;
      boost::mutex      _mtx;
};

} } // lootbank::chain
