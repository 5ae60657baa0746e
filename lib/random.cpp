#include "plaid/core/random.hpp"

#include <utility>

#include <boost/random/uniform_int_distribution.hpp>
#include <boost/random/uniform_real_distribution.hpp>

#include "plaid/exceptions.hpp"

namespace plaid::core {

RandomSource::RandomSource(std::uint32_t seed)
    : m_seed(seed),
      m_engine(seed) {}

double RandomSource::uniform() {
    boost::random::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(m_engine);
}

SizeType RandomSource::uniform_index(SizeType n) {
    error_check::check_greater(n, 0U, "uniform_index: n must be positive");
    boost::random::uniform_int_distribution<SizeType> dist(0, n - 1);
    return dist(m_engine);
}

void RandomSource::shuffle(std::span<SizeType> values) {
    for (SizeType i = values.size(); i > 1; --i) {
        boost::random::uniform_int_distribution<SizeType> dist(0, i - 1);
        std::swap(values[i - 1], values[dist(m_engine)]);
    }
}

void RandomSource::seed(std::uint32_t seed) {
    m_seed = seed;
    m_engine.seed(seed);
}

} // namespace plaid::core
