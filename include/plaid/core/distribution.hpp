#pragma once

#include <compare>
#include <iterator>
#include <map>
#include <span>
#include <unordered_map>
#include <vector>

#include "plaid/common/types.hpp"
#include "plaid/core/random.hpp"
#include "plaid/core/removable_sequence.hpp"
#include "plaid/exceptions.hpp"

namespace plaid::core {

/**
 * @brief Memoized power-law rank weights \f$ w_\tau(r) = 1 / r^\tau \f$.
 *
 * One table per distinct tau, extended lazily up to the largest rank
 * requested so far. Entries are never invalidated.
 */
class PowerLawWeightCache {
public:
    /**
     * @brief Weight of a 1-based rank.
     *
     * @param tau  Skew parameter (positive, finite).
     * @param rank 1-based rank (must be >= 1).
     * @return 1 / rank^tau
     */
    [[nodiscard]] double weight(double tau, SizeType rank);

    /**
     * @brief First @p n weights for @p tau, ranks 1..n.
     *
     * The span is invalidated by the next call that extends the same table.
     */
    [[nodiscard]] std::span<const double> prefix(double tau, SizeType n);

    // Number of ranks memoized for tau (0 if tau was never requested)
    [[nodiscard]] SizeType size(double tau) const;

private:
    std::vector<double>& get_or_extend(double tau, SizeType n);

    std::unordered_map<double, std::vector<double>> m_weights;
};

/**
 * @brief Memoized cumulative selection tables keyed by (tau, n).
 *
 * Entry i of table(tau, n) is the probability of picking one of the first
 * i + 1 surviving ranks out of n. The last entry is exactly 1.0, so a uniform
 * draw in [0, 1) always lands inside the table.
 */
class CumulativeDistributionCache {
public:
    CumulativeDistributionCache() = default;

    CumulativeDistributionCache(const CumulativeDistributionCache&) = delete;
    CumulativeDistributionCache&
    operator=(const CumulativeDistributionCache&)              = delete;
    CumulativeDistributionCache(CumulativeDistributionCache&&) = default;
    CumulativeDistributionCache&
    operator=(CumulativeDistributionCache&&) = default;
    ~CumulativeDistributionCache()           = default;

    // Reference stays valid for the lifetime of the cache.
    [[nodiscard]] const std::vector<double>& table(double tau, SizeType n);

    /**
     * @brief Map a uniform draw to a 0-based rank.
     *
     * @param tau Skew parameter.
     * @param n   Number of surviving ranks (>= 1).
     * @param u   Uniform draw in [0, 1).
     * @return First index i with u < table(tau, n)[i].
     *
     * @complex **O(log n)** via binary search over the monotonic table.
     */
    [[nodiscard]] SizeType sample_index(double tau, SizeType n, double u);

    /**
     * @brief Rank-biased draw of one surviving element of @p seq.
     *
     * Higher tau sharpens the bias toward the top surviving ranks. The
     * returned reference points into the sequence's pool and is invalidated
     * once the element is removed.
     *
     * @throws error_check::DetailedException if @p seq is empty.
     */
    template <DocumentId Doc>
    [[nodiscard]] const Doc&
    choose(double tau, const RemovableSequence<Doc>& seq, RandomSource& rng) {
        error_check::check(!seq.empty(),
                           "choose: cannot draw from an empty sequence");
        const auto idx = sample_index(tau, seq.length(), rng.uniform());
        auto it        = seq.begin();
        std::advance(it, static_cast<IndexType>(idx));
        return *it;
    }

    [[nodiscard]] SizeType ntables() const noexcept { return m_tables.size(); }
    [[nodiscard]] PowerLawWeightCache& weights() noexcept { return m_weights; }

private:
    struct TableKey {
        double tau;
        SizeType n;
        auto operator<=>(const TableKey&) const = default;
    };

    PowerLawWeightCache m_weights;
    std::map<TableKey, std::vector<double>> m_tables;
};

} // namespace plaid::core
