#include "plaid/evaluation/outcome.hpp"

#include <algorithm>

#include "plaid/exceptions.hpp"

namespace plaid::evaluation {

std::vector<SizeType> tally_clicks(std::span<const SizeType> ranker_indices,
                                   SizeType nrankers,
                                   std::span<const SizeType> clicks) {
    std::vector<SizeType> counts(nrankers, 0);
    for (const auto click : clicks) {
        error_check::check_range(click, ranker_indices.size(),
                                 "evaluate: click position out of bounds");
        const auto ranker = ranker_indices[click];
        error_check::check_range(ranker, nrankers,
                                 "evaluate: ranker index out of bounds");
        ++counts[ranker];
    }
    return counts;
}

Outcome pairwise_outcome(std::span<const SizeType> counts) {
    Outcome outcome;
    const auto nrankers = counts.size();
    for (SizeType i = 0; i < nrankers; ++i) {
        for (SizeType j = i + 1; j < nrankers; ++j) {
            if (counts[i] > counts[j]) {
                outcome.emplace(i, j);
            } else if (counts[i] < counts[j]) {
                outcome.emplace(j, i);
            }
        }
    }
    return outcome;
}

Outcome evaluate(std::span<const SizeType> ranker_indices,
                 SizeType nrankers,
                 std::span<const SizeType> clicks) {
    const auto counts = tally_clicks(ranker_indices, nrankers, clicks);
    return pairwise_outcome(counts);
}

PreferenceMatrix::PreferenceMatrix(SizeType nrankers)
    : m_nrankers(nrankers),
      m_wins(nrankers * nrankers, 0) {
    error_check::check_greater(m_nrankers, 0U,
                               "PreferenceMatrix: nrankers must be positive");
}

void PreferenceMatrix::add(const Outcome& outcome) {
    for (const auto& [winner, loser] : outcome) {
        error_check::check_range(winner, m_nrankers,
                                 "PreferenceMatrix: winner index");
        error_check::check_range(loser, m_nrankers,
                                 "PreferenceMatrix: loser index");
    }
    for (const auto& [winner, loser] : outcome) {
        ++m_wins[(winner * m_nrankers) + loser];
    }
    ++m_nimpressions;
}

void PreferenceMatrix::reset() noexcept {
    std::ranges::fill(m_wins, 0);
    m_nimpressions = 0;
}

SizeType PreferenceMatrix::get_wins(SizeType winner, SizeType loser) const {
    error_check::check_range(winner, m_nrankers,
                             "PreferenceMatrix: winner index");
    error_check::check_range(loser, m_nrankers,
                             "PreferenceMatrix: loser index");
    return m_wins[(winner * m_nrankers) + loser];
}

double PreferenceMatrix::win_rate(SizeType i, SizeType j) const {
    const auto won     = get_wins(i, j);
    const auto decided = won + get_wins(j, i);
    if (decided == 0) {
        return 0.5;
    }
    return static_cast<double>(won) / static_cast<double>(decided);
}

} // namespace plaid::evaluation
