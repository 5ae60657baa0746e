#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <numeric>
#include <random>
#include <vector>

#include <benchmark/benchmark.h>
#include <spdlog/spdlog.h>

#include "plaid/interleaving/probabilistic.hpp"

namespace plaid::interleaving {

class RankingsFixture : public benchmark::Fixture {
public:
    void SetUp(const ::benchmark::State& state) override {
        spdlog::set_level(spdlog::level::warn);
        ndocs = static_cast<size_t>(state.range(0));
    }

    void TearDown(const ::benchmark::State& /*unused*/) override {}

    // A ranking over [0, 2 * ndocs) with about half the documents shared
    std::vector<std::uint64_t> generate_ranking(std::mt19937& gen) const {
        std::vector<std::uint64_t> pool(2 * ndocs);
        std::iota(pool.begin(), pool.end(), 0);
        std::shuffle(pool.begin(), pool.end(), gen);
        pool.resize(ndocs);
        return pool;
    }

    size_t ndocs{};
};

BENCHMARK_DEFINE_F(RankingsFixture,
                   BM_plaid_interleave)(benchmark::State& state) {
    std::mt19937 gen(42);
    const auto a = generate_ranking(gen);
    const auto b = generate_ranking(gen);
    ProbabilisticU64 method(search::ProbabilisticConfig(3.0, 42U));
    const auto k = std::min<size_t>(ndocs, 10);
    for (auto _ : state) {
        auto result = method.interleave(k, a, b);
        benchmark::DoNotOptimize(result);
    }
}

BENCHMARK_DEFINE_F(RankingsFixture,
                   BM_plaid_multileave)(benchmark::State& state) {
    std::mt19937 gen(42);
    std::vector<std::vector<std::uint64_t>> lists;
    for (int i = 0; i < 5; ++i) {
        lists.push_back(generate_ranking(gen));
    }
    ProbabilisticU64 method(search::ProbabilisticConfig(3.0, 42U));
    const auto k = std::min<size_t>(ndocs, 10);
    for (auto _ : state) {
        auto result = method.multileave(k, lists);
        benchmark::DoNotOptimize(result);
    }
}

constexpr size_t kMinNdocs = 1 << 4;
constexpr size_t kMaxNdocs = 1 << 12;

BENCHMARK_REGISTER_F(RankingsFixture, BM_plaid_interleave)
    ->RangeMultiplier(4)
    ->Range(kMinNdocs, kMaxNdocs);

BENCHMARK_REGISTER_F(RankingsFixture, BM_plaid_multileave)
    ->RangeMultiplier(4)
    ->Range(kMinNdocs, kMaxNdocs);

} // namespace plaid::interleaving

BENCHMARK_MAIN();
