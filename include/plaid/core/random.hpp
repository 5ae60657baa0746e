#pragma once

#include <cstdint>
#include <random>
#include <span>

#include <boost/random/mersenne_twister.hpp>

#include "plaid/common/types.hpp"

namespace plaid::core {

/**
 * @brief Seedable source of the uniform draws used by the selection step.
 *
 * Wraps a Mersenne Twister engine so that a fixed seed reproduces the same
 * sequence of ranker picks and document draws. Not thread-safe: use one
 * instance per thread.
 */
class RandomSource {
public:
    explicit RandomSource(std::uint32_t seed = std::random_device{}());

    // Uniform real in [0, 1)
    [[nodiscard]] double uniform();
    // Uniform integer in [0, n), n must be > 0
    [[nodiscard]] SizeType uniform_index(SizeType n);
    // In-place Fisher-Yates shuffle
    void shuffle(std::span<SizeType> values);
    void seed(std::uint32_t seed);

    [[nodiscard]] std::uint32_t get_seed() const noexcept { return m_seed; }

private:
    std::uint32_t m_seed;
    boost::random::mt19937 m_engine;
};

} // namespace plaid::core
