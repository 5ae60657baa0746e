#pragma once

#include <cstdint>
#include <optional>

#include "plaid/common/types.hpp"

namespace plaid::search {

class ProbabilisticConfig {
public:
    explicit ProbabilisticConfig(
        double tau                         = kDefaultTau,
        std::optional<std::uint32_t> seed = std::nullopt);

    // Getters
    [[nodiscard]] double get_tau() const { return m_tau; }
    [[nodiscard]] std::uint32_t get_seed() const { return m_seed; }
    [[nodiscard]] bool has_fixed_seed() const { return m_fixed_seed; }

private:
    void validate() const;

    double m_tau;
    std::uint32_t m_seed;
    bool m_fixed_seed;
};

} // namespace plaid::search
