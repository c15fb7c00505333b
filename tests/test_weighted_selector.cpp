#include <catch2/catch.hpp>

#include <lootbank/chain/weighted_selector.hpp>
#include <lootbank/chain/snapshot_objects.hpp>

#include <atomic>
#include <cmath>
#include <limits>
#include <thread>

using namespace lootbank::chain;
using namespace lootbank::protocol;

namespace {

   weighted_selector::uniform_source fixed(double u) {
      return [u]() { return u; };
   }

}

// ============================================================================
// Distribution
// ============================================================================

TEST_CASE("Draw frequency follows relative weights", "[selector]") {
   weighted_selector selector(uint64_t(1234));
   const std::vector<double> weights = {1, 1, 2};

   const int draws = 100000;
   int counts[3] = {0, 0, 0};
   for (int i = 0; i < draws; ++i)
      counts[selector.select_index(weights)]++;

   REQUIRE(double(counts[2]) / draws == Approx(0.50).margin(0.01));
   REQUIRE(double(counts[0]) / draws == Approx(0.25).margin(0.01));
   REQUIRE(double(counts[1]) / draws == Approx(0.25).margin(0.01));
}

TEST_CASE("Weights are relative and never need to sum to one", "[selector]") {
   for (double u : {0.0, 0.2, 0.49, 0.5, 0.75, 0.999}) {
      weighted_selector small(fixed(u));
      weighted_selector large(fixed(u));

      REQUIRE(small.select_index({0.1, 0.1}) == large.select_index({50, 50}));
   }
}

TEST_CASE("A single candidate is always drawn", "[selector]") {
   weighted_selector selector(uint64_t(7));

   for (int i = 0; i < 1000; ++i)
      REQUIRE(selector.select_index({0.0001}) == 0);
}

// ============================================================================
// Selection walk
// ============================================================================

TEST_CASE("The walk picks the first running sum above the drawn point", "[selector]") {
   const std::vector<double> weights = {1, 1, 2};

   SECTION("Lowest value picks the first candidate") {
      weighted_selector selector(fixed(0.0));
      REQUIRE(selector.select_index(weights) == 0);
   }

   SECTION("A point on a boundary belongs to the next candidate") {
      weighted_selector selector(fixed(0.25));
      REQUIRE(selector.select_index(weights) == 1);
   }

   SECTION("Middle of the second band") {
      weighted_selector selector(fixed(0.3));
      REQUIRE(selector.select_index(weights) == 1);
   }

   SECTION("Upper half goes to the heaviest candidate") {
      weighted_selector selector(fixed(0.5));
      REQUIRE(selector.select_index(weights) == 2);
   }

   SECTION("Highest value picks the last candidate") {
      weighted_selector selector(fixed(std::nextafter(1.0, 0.0)));
      REQUIRE(selector.select_index(weights) == 2);
   }
}

TEST_CASE("select returns the drawn candidate", "[selector]") {
   std::vector<weighted_item> pool(2);
   pool[0].item.name = "common knife";
   pool[0].weight = 3;
   pool[1].item.name = "golden knife";
   pool[1].weight = 1;

   weighted_selector low(fixed(0.1));
   REQUIRE(low.select(pool).item.name == "common knife");

   weighted_selector high(fixed(0.9));
   REQUIRE(high.select(pool).item.name == "golden knife");
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("An empty pool cannot be drawn from", "[selector][errors]") {
   weighted_selector selector(uint64_t(1));

   REQUIRE_THROWS_AS(selector.select_index(std::vector<double>()), empty_pool_exception);
   REQUIRE_THROWS_AS(selector.select(std::vector<weighted_item>()), empty_pool_exception);
}

TEST_CASE("Weights must be positive finite numbers", "[selector][errors]") {
   weighted_selector selector(uint64_t(1));

   const std::vector<double> zero = {1, 0};
   const std::vector<double> negative = {1, -2};
   const std::vector<double> not_a_number = {1, std::numeric_limits<double>::quiet_NaN()};
   const std::vector<double> infinite = {std::numeric_limits<double>::infinity()};

   REQUIRE_THROWS_AS(selector.select_index(zero), fc::assert_exception);
   REQUIRE_THROWS_AS(selector.select_index(negative), fc::assert_exception);
   REQUIRE_THROWS_AS(selector.select_index(not_a_number), fc::assert_exception);
   REQUIRE_THROWS_AS(selector.select_index(infinite), fc::assert_exception);
}

TEST_CASE("A uniform source outside [0, 1) is rejected", "[selector][errors]") {
   const std::vector<double> weights = {1, 1};

   weighted_selector one(fixed(1.0));
   REQUIRE_THROWS_AS(one.select_index(weights), fc::assert_exception);

   weighted_selector negative(fixed(-0.1));
   REQUIRE_THROWS_AS(negative.select_index(weights), fc::assert_exception);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("One selector can be shared between threads", "[selector][threads]") {
   weighted_selector selector(uint64_t(99));
   const std::vector<double> weights = {5, 3, 2};
   std::atomic<int> out_of_range(0);
   std::atomic<int> total(0);

   std::vector<std::thread> workers;
   for (int t = 0; t < 4; ++t) {
      workers.emplace_back([&]() {
         for (int i = 0; i < 10000; ++i) {
            if (selector.select_index(weights) >= weights.size())
               out_of_range++;
            total++;
         }
      });
   }
   for (auto& w : workers)
      w.join();

   REQUIRE(out_of_range.load() == 0);
   REQUIRE(total.load() == 40000);
}
