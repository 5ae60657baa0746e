#include "plaid/core/distribution.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

#include <spdlog/spdlog.h>

#include "plaid/exceptions.hpp"

namespace plaid::core {

double PowerLawWeightCache::weight(double tau, SizeType rank) {
    error_check::check_greater(rank, 0U, "weight: rank is 1-based");
    return get_or_extend(tau, rank)[rank - 1];
}

std::span<const double> PowerLawWeightCache::prefix(double tau, SizeType n) {
    const auto& weights = get_or_extend(tau, n);
    return {weights.data(), n};
}

SizeType PowerLawWeightCache::size(double tau) const {
    const auto it = m_weights.find(tau);
    return it == m_weights.end() ? 0 : it->second.size();
}

std::vector<double>& PowerLawWeightCache::get_or_extend(double tau,
                                                        SizeType n) {
    error_check::check_positive_finite(tau, "tau must be positive and finite");
    auto& weights = m_weights[tau];
    if (weights.size() >= n) {
        return weights;
    }
    weights.reserve(n);
    for (SizeType r = weights.size() + 1; r <= n; ++r) {
        weights.push_back(1.0 / std::pow(static_cast<double>(r), tau));
    }
    return weights;
}

const std::vector<double>& CumulativeDistributionCache::table(double tau,
                                                              SizeType n) {
    error_check::check_greater(n, 0U, "table: n must be positive");
    const TableKey key{.tau = tau, .n = n};
    if (const auto it = m_tables.find(key); it != m_tables.end()) {
        return it->second;
    }

    const auto weights = m_weights.prefix(tau, n);
    // Same summation order as the numerator below, so the running sum at
    // n - 1 equals the denominator bit for bit.
    const double denominator =
        std::accumulate(weights.begin(), weights.end(), 0.0);
    std::vector<double> cumulation(n);
    double numerator = 0.0;
    for (SizeType i = 0; i < n; ++i) {
        numerator += weights[i];
        cumulation[i] = numerator / denominator;
    }
    cumulation[n - 1] = 1.0;

    spdlog::debug("CumulativeDistributionCache: built table tau={}, n={}",
                  tau, n);
    return m_tables.emplace(key, std::move(cumulation)).first->second;
}

SizeType
CumulativeDistributionCache::sample_index(double tau, SizeType n, double u) {
    error_check::check(u >= 0.0 && u < 1.0,
                       "sample_index: draw must lie in [0, 1)");
    const auto& cumulation = table(tau, n);
    const auto it          = std::ranges::upper_bound(cumulation, u);
    error_check::check(it != cumulation.end(),
                       "sample_index: draw fell past the cumulative table");
    return static_cast<SizeType>(std::distance(cumulation.begin(), it));
}

} // namespace plaid::core
