#include <benchmark/benchmark.h>

#include <causal/clock/vector_clock.hpp>
#include <cstdint>

using namespace causal::clock;

using IdVectorClock = VectorClock<uint32_t>;

static auto make_clock(uint32_t width, uint32_t offset) -> IdVectorClock {
    IdVectorClock clock;
    for (uint32_t host = 0; host < width; ++host) {
        for (uint32_t i = 0; i <= (host + offset) % 3; ++i) {
            clock = clock.incremented(host);
        }
    }
    return clock;
}

static void clock_Incremented(benchmark::State &state) {
    const auto width = static_cast<uint32_t>(state.range(0));
    auto clock = make_clock(width, 0);
    uint32_t host = 0;
    for (auto _ : state) {
        auto next = clock.incremented(host);
        benchmark::DoNotOptimize(next);
        host = (host + 1) % width;
    }
    state.SetItemsProcessed(state.iterations());
}

static void clock_MergeWith(benchmark::State &state) {
    const auto width = static_cast<uint32_t>(state.range(0));
    auto a = make_clock(width, 0);
    auto b = make_clock(width, 1);
    for (auto _ : state) {
        auto merged = a.merge_with(b);
        benchmark::DoNotOptimize(merged);
    }
    state.SetItemsProcessed(state.iterations());
}

static void clock_TemporalRelationConcurrent(benchmark::State &state) {
    const auto width = static_cast<uint32_t>(state.range(0));
    auto a = make_clock(width, 0);
    auto b = make_clock(width, 1);
    for (auto _ : state) {
        auto relation = a.temporal_relation(b);
        benchmark::DoNotOptimize(relation);
    }
    state.SetItemsProcessed(state.iterations());
}

static void clock_TemporalRelationCaused(benchmark::State &state) {
    const auto width = static_cast<uint32_t>(state.range(0));
    auto a = make_clock(width, 0);
    auto b = a.incremented(width - 1);
    for (auto _ : state) {
        auto relation = a.temporal_relation(b);
        benchmark::DoNotOptimize(relation);
    }
    state.SetItemsProcessed(state.iterations());
}

BENCHMARK(clock_Incremented)->Arg(4)->Arg(16)->Arg(64)->Arg(256);

BENCHMARK(clock_MergeWith)->Arg(4)->Arg(16)->Arg(64)->Arg(256);

BENCHMARK(clock_TemporalRelationConcurrent)
    ->Arg(4)
    ->Arg(16)
    ->Arg(64)
    ->Arg(256);

BENCHMARK(clock_TemporalRelationCaused)->Arg(4)->Arg(16)->Arg(64)->Arg(256);
