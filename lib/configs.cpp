#include "plaid/search/configs.hpp"

#include <random>

#include <spdlog/spdlog.h>

#include "plaid/exceptions.hpp"

namespace plaid::search {

ProbabilisticConfig::ProbabilisticConfig(double tau,
                                         std::optional<std::uint32_t> seed)
    : m_tau(tau),
      m_seed(seed.value_or(std::random_device{}())),
      m_fixed_seed(seed.has_value()) {
    validate();
    spdlog::info("ProbabilisticConfig: tau={}, seed={}, fixed_seed={}", m_tau,
                 m_seed, m_fixed_seed);
}

void ProbabilisticConfig::validate() const {
    error_check::check_positive_finite(m_tau,
                                       "tau must be positive and finite");
}

} // namespace plaid::search
