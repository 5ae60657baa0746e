#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "plaid/common/types.hpp"
#include "plaid/core/distribution.hpp"
#include "plaid/core/removable_sequence.hpp"
#include "plaid/interleaving/method.hpp"
#include "plaid/interleaving/result.hpp"
#include "plaid/search/configs.hpp"

namespace plaid::interleaving {

/**
 * @brief Probabilistic interleaving and multileaving.
 *
 * Every step picks a ranker and draws one of its surviving documents with
 * probability proportional to 1 / r^tau, where r is the document's rank among
 * the surviving documents of that ranker. The chosen document is then
 * removed from every ranker's list, so overlapping lists never produce a
 * duplicate.
 *
 * The engine owns its random source and node pool and is not thread-safe.
 * The cumulative-table cache can be shared between engines; sharing it
 * across threads needs external synchronization.
 *
 * @tparam Doc Document identifier type (std::uint64_t or std::string).
 */
template <DocumentId Doc>
class Probabilistic final : public InterleavingMethod<Doc> {
public:
    explicit Probabilistic(double tau = kDefaultTau);
    explicit Probabilistic(
        const search::ProbabilisticConfig& cfg,
        std::shared_ptr<core::CumulativeDistributionCache> cache = nullptr);

    // --- Rule of five: PIMPL ---
    ~Probabilistic() override;
    Probabilistic(Probabilistic&&) noexcept;
    Probabilistic& operator=(Probabilistic&&) noexcept;
    Probabilistic(const Probabilistic&)            = delete;
    Probabilistic& operator=(const Probabilistic&) = delete;

    /**
     * @brief Interleave two rankings.
     *
     * Each step picks one of the rankers that still has surviving documents
     * uniformly at random.
     *
     * @param k Maximum length of the result (must be > 0).
     * @return Result of length min(k, number of distinct documents in a, b).
     */
    InterleavedResult<Doc> interleave(SizeType k,
                                      std::span<const Doc> a,
                                      std::span<const Doc> b) override;

    /**
     * @brief Multileave any number of rankings.
     *
     * Rankers take turns in rounds; each round visits every ranker with
     * surviving documents once, in a fresh random order. Stops mid-round as
     * soon as k documents have been chosen.
     *
     * @throws error_check::DetailedException if @p lists is empty or k == 0.
     */
    InterleavedResult<Doc>
    multileave(SizeType k, std::span<const std::vector<Doc>> lists) override;

    [[nodiscard]] Outcome
    evaluate(const InterleavedResult<Doc>& result,
             std::span<const SizeType> clicks) const override;

    [[nodiscard]] double get_tau() const noexcept;
    [[nodiscard]] std::uint32_t get_seed() const noexcept;
    void reseed(std::uint32_t seed);
    [[nodiscard]] const std::shared_ptr<core::CumulativeDistributionCache>&
    get_cache() const noexcept;
    [[nodiscard]] const core::NodePool<Doc>& get_pool() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

using ProbabilisticU64    = Probabilistic<std::uint64_t>;
using ProbabilisticString = Probabilistic<std::string>;

extern template class Probabilistic<std::uint64_t>;
extern template class Probabilistic<std::string>;

} // namespace plaid::interleaving
