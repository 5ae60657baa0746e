#pragma once

#include <span>
#include <vector>

#include "plaid/common/types.hpp"
#include "plaid/interleaving/result.hpp"

namespace plaid::interleaving {

/**
 * @brief Contract shared by every interleaving method.
 *
 * @tparam Doc Document identifier type.
 */
template <DocumentId Doc> class InterleavingMethod {
public:
    virtual ~InterleavingMethod() = default;

    // Blend two rankings into at most k documents
    virtual InterleavedResult<Doc>
    interleave(SizeType k, std::span<const Doc> a, std::span<const Doc> b) = 0;

    // Blend any number (>= 1) of rankings into at most k documents
    virtual InterleavedResult<Doc>
    multileave(SizeType k, std::span<const std::vector<Doc>> lists) = 0;

    /**
     * @brief Infer pairwise ranker preferences from clicks.
     *
     * @param result Ranking produced by interleave() or multileave().
     * @param clicks Clicked positions in @p result.
     * @return Set of (winner, loser) ranker index pairs.
     */
    [[nodiscard]] virtual Outcome
    evaluate(const InterleavedResult<Doc>& result,
             std::span<const SizeType> clicks) const = 0;

protected:
    InterleavingMethod()                                         = default;
    InterleavingMethod(const InterleavingMethod&)                = default;
    InterleavingMethod& operator=(const InterleavingMethod&)     = default;
    InterleavingMethod(InterleavingMethod&&) noexcept            = default;
    InterleavingMethod& operator=(InterleavingMethod&&) noexcept = default;
};

} // namespace plaid::interleaving
