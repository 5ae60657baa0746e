#include "plaid/interleaving/probabilistic.hpp"

#include <algorithm>
#include <memory>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "plaid/core/random.hpp"
#include "plaid/evaluation/outcome.hpp"
#include "plaid/exceptions.hpp"

namespace plaid::interleaving {

template <DocumentId Doc> class Probabilistic<Doc>::Impl {
public:
    using Sequence  = core::RemovableSequence<Doc>;
    using Sequences = std::vector<Sequence>;

    Impl(const search::ProbabilisticConfig& cfg,
         std::shared_ptr<core::CumulativeDistributionCache> cache)
        : m_tau(cfg.get_tau()),
          m_rng(cfg.get_seed()),
          m_cache(cache ? std::move(cache)
                        : std::make_shared<core::CumulativeDistributionCache>()) {
    }

    ~Impl()                      = default;
    Impl(const Impl&)            = delete;
    Impl& operator=(const Impl&) = delete;
    Impl(Impl&&)                 = delete;
    Impl& operator=(Impl&&)      = delete;

    InterleavedResult<Doc>
    interleave(SizeType k, std::span<const Doc> a, std::span<const Doc> b) {
        error_check::check_greater(k, 0U, "interleave: k must be positive");
        InterleavedResult<Doc> result(2);
        result.reserve(std::min(k, a.size() + b.size()));
        Sequences sequences;
        sequences.reserve(2);
        sequences.emplace_back(m_pool, a);
        sequences.emplace_back(m_pool, b);

        std::vector<SizeType> active;
        while (result.size() < k) {
            collect_active(sequences, active);
            if (active.empty()) {
                break;
            }
            const auto ranker_index = active[m_rng.uniform_index(active.size())];
            advance(sequences, ranker_index, result);
        }
        drain(sequences);
        spdlog::debug("Probabilistic::interleave: k={}, |a|={}, |b|={}, "
                      "produced {} documents",
                      k, a.size(), b.size(), result.size());
        return result;
    }

    InterleavedResult<Doc>
    multileave(SizeType k, std::span<const std::vector<Doc>> lists) {
        error_check::check_greater(k, 0U, "multileave: k must be positive");
        error_check::check(!lists.empty(),
                           "multileave: at least one ranking is required");
        InterleavedResult<Doc> result(lists.size());
        result.reserve(std::min(k, total_length(lists)));
        Sequences sequences;
        sequences.reserve(lists.size());
        for (const auto& list : lists) {
            sequences.emplace_back(m_pool, std::span<const Doc>(list));
        }

        std::vector<SizeType> round;
        while (result.size() < k) {
            collect_active(sequences, round);
            if (round.empty()) {
                break;
            }
            m_rng.shuffle(round);
            for (const auto ranker_index : round) {
                // Emptied earlier in this round by cross-list removal
                if (sequences[ranker_index].empty()) {
                    continue;
                }
                advance(sequences, ranker_index, result);
                if (result.size() >= k) {
                    break;
                }
            }
        }
        drain(sequences);
        spdlog::debug("Probabilistic::multileave: k={}, nrankers={}, "
                      "produced {} documents",
                      k, lists.size(), result.size());
        return result;
    }

    Outcome evaluate(const InterleavedResult<Doc>& result,
                     std::span<const SizeType> clicks) const {
        return evaluation::evaluate(result.get_ranker_indices(),
                                    result.get_nrankers(), clicks);
    }

    double get_tau() const noexcept { return m_tau; }
    std::uint32_t get_seed() const noexcept { return m_rng.get_seed(); }
    void reseed(std::uint32_t seed) { m_rng.seed(seed); }
    const std::shared_ptr<core::CumulativeDistributionCache>&
    get_cache() const noexcept {
        return m_cache;
    }
    const core::NodePool<Doc>& get_pool() const noexcept { return m_pool; }

private:
    double m_tau;
    core::RandomSource m_rng;
    std::shared_ptr<core::CumulativeDistributionCache> m_cache;
    core::NodePool<Doc> m_pool;

    static void collect_active(const Sequences& sequences,
                               std::vector<SizeType>& active) {
        active.clear();
        for (SizeType i = 0; i < sequences.size(); ++i) {
            if (!sequences[i].empty()) {
                active.push_back(i);
            }
        }
    }

    static SizeType total_length(std::span<const std::vector<Doc>> lists) {
        SizeType total = 0;
        for (const auto& list : lists) {
            total += list.size();
        }
        return total;
    }

    static void drain(Sequences& sequences) noexcept {
        for (auto& sequence : sequences) {
            sequence.drain();
        }
    }

    // Draw from one ranker, then remove the document from every ranker so it
    // cannot surface twice and the surviving lengths stay consistent.
    void advance(Sequences& sequences,
                 SizeType ranker_index,
                 InterleavedResult<Doc>& result) {
        const Doc document =
            m_cache->choose(m_tau, sequences[ranker_index], m_rng);
        result.append(document, ranker_index);
        for (auto& sequence : sequences) {
            sequence.remove(document);
        }
    }
};

template <DocumentId Doc>
Probabilistic<Doc>::Probabilistic(double tau)
    : Probabilistic(search::ProbabilisticConfig(tau)) {}
template <DocumentId Doc>
Probabilistic<Doc>::Probabilistic(
    const search::ProbabilisticConfig& cfg,
    std::shared_ptr<core::CumulativeDistributionCache> cache)
    : m_impl(std::make_unique<Impl>(cfg, std::move(cache))) {}
template <DocumentId Doc> Probabilistic<Doc>::~Probabilistic() = default;
template <DocumentId Doc>
Probabilistic<Doc>::Probabilistic(Probabilistic&& other) noexcept = default;
template <DocumentId Doc>
Probabilistic<Doc>&
Probabilistic<Doc>::operator=(Probabilistic&& other) noexcept = default;

template <DocumentId Doc>
InterleavedResult<Doc> Probabilistic<Doc>::interleave(SizeType k,
                                                      std::span<const Doc> a,
                                                      std::span<const Doc> b) {
    return m_impl->interleave(k, a, b);
}
template <DocumentId Doc>
InterleavedResult<Doc>
Probabilistic<Doc>::multileave(SizeType k,
                               std::span<const std::vector<Doc>> lists) {
    return m_impl->multileave(k, lists);
}
template <DocumentId Doc>
Outcome Probabilistic<Doc>::evaluate(const InterleavedResult<Doc>& result,
                                     std::span<const SizeType> clicks) const {
    return m_impl->evaluate(result, clicks);
}
template <DocumentId Doc>
double Probabilistic<Doc>::get_tau() const noexcept {
    return m_impl->get_tau();
}
template <DocumentId Doc>
std::uint32_t Probabilistic<Doc>::get_seed() const noexcept {
    return m_impl->get_seed();
}
template <DocumentId Doc> void Probabilistic<Doc>::reseed(std::uint32_t seed) {
    m_impl->reseed(seed);
}
template <DocumentId Doc>
const std::shared_ptr<core::CumulativeDistributionCache>&
Probabilistic<Doc>::get_cache() const noexcept {
    return m_impl->get_cache();
}
template <DocumentId Doc>
const core::NodePool<Doc>& Probabilistic<Doc>::get_pool() const noexcept {
    return m_impl->get_pool();
}

// Explicit instantiation
template class Probabilistic<std::uint64_t>;
template class Probabilistic<std::string>;

} // namespace plaid::interleaving
