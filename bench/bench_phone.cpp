/**
 * @file  bench/bench_phone.cpp
 * @brief Google Benchmark suite for the NANP normalizer.
 *
 * Benchmarks
 * ----------
 *   BM_Canonicalize_*   valid, prefixed and invalid inputs
 *   BM_AreaCode, BM_Pretty, BM_Parse
 *
 * Build (CMake):
 *   cmake --build build --target bench_phone
 *   ./build/bench_phone --benchmark_format=json
 */

#include "benchmark/benchmark.h"

#include "nanp/phone.hpp"

#include <cstdint>
#include <string>

static void BM_Canonicalize_Plain(benchmark::State& state) {
    const std::string raw = "3035551212";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::canonicalize(raw));
    }
}
BENCHMARK(BM_Canonicalize_Plain);

static void BM_Canonicalize_International(benchmark::State& state) {
    const std::string raw = "+1 (303) 555-1212";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::canonicalize(raw));
    }
}
BENCHMARK(BM_Canonicalize_International);

static void BM_Canonicalize_Letters(benchmark::State& state) {
    const std::string raw = "1-800-FLOWERS";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::canonicalize(raw));
    }
}
BENCHMARK(BM_Canonicalize_Letters);

/// Long garbage input; cost should scale linearly with length.
static void BM_Canonicalize_LongInput(benchmark::State& state) {
    const std::string raw(static_cast<std::size_t>(state.range(0)), '-');
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::canonicalize(raw));
    }
    state.SetBytesProcessed(static_cast<int64_t>(state.iterations()) * state.range(0));
}
BENCHMARK(BM_Canonicalize_LongInput)->RangeMultiplier(8)->Range(64, 1 << 18);

static void BM_AreaCode(benchmark::State& state) {
    const std::string raw = "+1 (303) 555-1212";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::area_code(raw));
    }
}
BENCHMARK(BM_AreaCode);

static void BM_Pretty(benchmark::State& state) {
    const std::string raw = "+1 (303) 555-1212";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::pretty(raw));
    }
}
BENCHMARK(BM_Pretty);

static void BM_Parse(benchmark::State& state) {
    const std::string raw = "+1 (303) 555-1212";
    for (auto _ : state) {
        benchmark::DoNotOptimize(nanp::phone::parse(raw));
    }
}
BENCHMARK(BM_Parse);

BENCHMARK_MAIN();
