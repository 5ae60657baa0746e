#include <algorithm>
#include <numeric>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "plaid/common/types.hpp"
#include "plaid/core/random.hpp"
#include "plaid/exceptions.hpp"

using plaid::SizeType;
using plaid::core::RandomSource;

TEST_CASE("RandomSource", "[random]") {
    SECTION("Same seed, same draws") {
        RandomSource first(11U);
        RandomSource second(11U);
        for (int i = 0; i < 100; ++i) {
            REQUIRE(first.uniform() == second.uniform());
            REQUIRE(first.uniform_index(17) == second.uniform_index(17));
        }
    }
    SECTION("Reseeding restarts the stream") {
        RandomSource rng(3U);
        const auto first = rng.uniform();
        (void)rng.uniform();
        rng.seed(3U);
        REQUIRE(rng.uniform() == first);
        REQUIRE(rng.get_seed() == 3U);
    }
    SECTION("Draws stay in range") {
        RandomSource rng(5U);
        for (int i = 0; i < 1000; ++i) {
            const auto u = rng.uniform();
            REQUIRE(u >= 0.0);
            REQUIRE(u < 1.0);
            REQUIRE(rng.uniform_index(3) < 3);
        }
        REQUIRE(rng.uniform_index(1) == 0);
        REQUIRE_THROWS_AS(rng.uniform_index(0),
                          plaid::error_check::DetailedException);
    }
    SECTION("Shuffle is a permutation") {
        RandomSource rng(9U);
        std::vector<SizeType> values(20);
        std::iota(values.begin(), values.end(), 0);
        rng.shuffle(values);
        std::vector<SizeType> sorted = values;
        std::ranges::sort(sorted);
        std::vector<SizeType> expected(20);
        std::iota(expected.begin(), expected.end(), 0);
        REQUIRE(sorted == expected);
    }
}
