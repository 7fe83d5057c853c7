#include <benchmark/benchmark.h>

#include "../src/hint.hpp"
#include "../src/inverse.hpp"
#include "../src/roster.hpp"

static inline const auto roster{ptndle::roster::loadFallbackRoster()};

static void BM_computeHintAllPairs(benchmark::State& state) {
    for (auto _ : state) {
        for (const auto& target : roster) {
            for (const auto& guess : roster) {
                auto result = ptndle::hint::computeHint(target, guess);
                benchmark::DoNotOptimize(result);
            }
        }
    }
}
BENCHMARK(BM_computeHintAllPairs);

static void BM_matchesAllTriples(benchmark::State& state) {
    for (auto _ : state) {
        size_t count = 0;
        for (const auto& target : roster) {
            for (const auto& guess : roster) {
                const auto result = ptndle::hint::computeHint(target, guess);
                for (const auto& candidate : roster) {
                    count += ptndle::hint::matches(result, guess, candidate);
                }
            }
        }
        benchmark::DoNotOptimize(count);
    }
}
BENCHMARK(BM_matchesAllTriples);

static void BM_parseHint(benchmark::State& state) {
    for (auto _ : state) {
        auto result = ptndle::hint::Hint::parse("^^ 0 0 ~ 1");
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_parseHint);

BENCHMARK_MAIN();
