#include <benchmark/benchmark.h>

#include "../src/gather.hpp"
#include "../src/optimalPlayer.hpp"
#include "../src/roster.hpp"

static inline const auto roster{ptndle::roster::loadFallbackRoster()};

static void BM_openingGuess(benchmark::State& state) {
    ptndle::player::OptimalPlayer player{roster};
    for (auto _ : state) {
        auto suggestion = player.nextGuess();
        benchmark::DoNotOptimize(suggestion);
    }
}
BENCHMARK(BM_openingGuess);

static void BM_simulateAll(benchmark::State& state) {
    size_t numThreads = state.range(0);
    for (auto _ : state) {
        auto records = ptndle::gather::simulateAll(roster, numThreads, false);
        benchmark::DoNotOptimize(records);
    }
}

BENCHMARK(BM_simulateAll)
    ->Arg(1ul)
    ->Arg(2ul)
    ->Arg(4ul)
    ->Arg(8ul);
