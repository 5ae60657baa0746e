#pragma once

#include <span>
#include <vector>

#include "plaid/common/types.hpp"

namespace plaid::evaluation {

/**
 * @brief Count clicks credited to each ranker.
 *
 * @param ranker_indices Ranker of origin for every displayed position.
 * @param nrankers       Number of rankers that took part.
 * @param clicks         Clicked positions (may repeat; each click counts).
 * @return Vector of size @p nrankers with the click count per ranker.
 *
 * @throws error_check::DetailedException if a click lies outside
 *         [0, ranker_indices.size()) or a position names a ranker outside
 *         [0, nrankers).
 */
std::vector<SizeType> tally_clicks(std::span<const SizeType> ranker_indices,
                                   SizeType nrankers,
                                   std::span<const SizeType> clicks);

// (i, j) for every pair where counts[i] > counts[j]; ties emit nothing
Outcome pairwise_outcome(std::span<const SizeType> counts);

// tally_clicks followed by pairwise_outcome
Outcome evaluate(std::span<const SizeType> ranker_indices,
                 SizeType nrankers,
                 std::span<const SizeType> clicks);

/**
 * @brief Running pairwise win tallies over many evaluated impressions.
 */
class PreferenceMatrix {
public:
    explicit PreferenceMatrix(SizeType nrankers);

    void add(const Outcome& outcome);
    void reset() noexcept;

    [[nodiscard]] SizeType get_wins(SizeType winner, SizeType loser) const;
    // Share of decided impressions between i and j that i won, 0.5 if none
    [[nodiscard]] double win_rate(SizeType i, SizeType j) const;

    [[nodiscard]] SizeType get_nrankers() const noexcept { return m_nrankers; }
    [[nodiscard]] SizeType get_nimpressions() const noexcept {
        return m_nimpressions;
    }
    [[nodiscard]] const std::vector<SizeType>& get_wins() const noexcept {
        return m_wins;
    }

private:
    SizeType m_nrankers;
    SizeType m_nimpressions{};
    std::vector<SizeType> m_wins;
};

} // namespace plaid::evaluation
