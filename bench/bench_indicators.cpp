/**
 * @file  bench/bench_indicators.cpp
 * @brief Google Benchmark suite for the window transforms and indicators.
 *
 * Module:  bench/
 *
 * Benchmarks
 * ----------
 *   BM_RollingSum / BM_RollingMax / BM_EwmMean   window primitives
 *   BM_AdaptiveSmooth                            the sequential VIDYA scan
 *   BM_T3 / BM_Vidya / BM_Bbands / BM_Atr        full indicators, bundled path
 *   BM_Catalog_All                               every catalog entry, defaults
 *
 * Build (CMake):
 *   cmake -DTAI_BUILD_BENCH=ON ..
 *   cmake --build build --target bench_indicators
 *   ./build/bench_indicators --benchmark_format=json
 *
 * Throughput units: items/second (bars processed).
 * Custom counter "Mbars_per_sec" = throughput / 1e6.
 */

#include "benchmark/benchmark.h"

#include "tai/catalog.hpp"
#include "tai/log.hpp"
#include "tai/overlap.hpp"
#include "tai/recurrence.hpp"
#include "tai/volatility.hpp"
#include "tai/window.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <vector>

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Deterministic OHLCV bars: a slow sine trend with a faster ripple.
static tai::OhlcvColumns make_bars(std::size_t n) {
    tai::OhlcvColumns d;
    for (std::size_t i = 0; i < n; ++i) {
        const double t = static_cast<double>(i);
        const double c = 100.0 + 10.0 * std::sin(t / 50.0) + std::sin(t / 3.0);
        d.timestamp.push_back(t);
        d.open.push_back(c - 0.25);
        d.high.push_back(c + 1.0);
        d.low.push_back(c - 1.0);
        d.close.push_back(c);
        d.volume.push_back(1.0e5 + 1.0e4 * std::cos(t / 7.0));
    }
    return d;
}

static void set_rate(benchmark::State& state, std::size_t n) {
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
    state.counters["Mbars_per_sec"] = benchmark::Counter(
        static_cast<double>(state.iterations()) * static_cast<double>(n) / 1e6,
        benchmark::Counter::kIsRate);
}

static const tai::Options kBundled{.talib = false};

// ── Window primitives ──────────────────────────────────────────────────────────

static void BM_RollingSum(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::rolling_sum(d.close, 14);
        benchmark::DoNotOptimize(out.data());
    }
    set_rate(state, n);
}
BENCHMARK(BM_RollingSum)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_RollingMax(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::rolling_max(d.high, 20);
        benchmark::DoNotOptimize(out.data());
    }
    set_rate(state, n);
}
BENCHMARK(BM_RollingMax)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_EwmMean(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::ewm_mean(d.close, 2.0 / 11.0, false, 0);
        benchmark::DoNotOptimize(out.data());
    }
    set_rate(state, n);
}
BENCHMARK(BM_EwmMean)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_AdaptiveSmooth(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    const std::vector<double> k(n, 0.4);
    for (auto _ : state) {
        auto out = tai::adaptive_smooth(d.close, k, 2.0 / 15.0, 14);
        benchmark::DoNotOptimize(out.data());
    }
    set_rate(state, n);
}
BENCHMARK(BM_AdaptiveSmooth)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

// ── Indicators ─────────────────────────────────────────────────────────────────

static void BM_T3(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::t3(d.close, {}, kBundled);
        benchmark::DoNotOptimize(out);
    }
    set_rate(state, n);
}
BENCHMARK(BM_T3)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Vidya(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::vidya(d.close, {}, kBundled);
        benchmark::DoNotOptimize(out);
    }
    set_rate(state, n);
}
BENCHMARK(BM_Vidya)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Bbands(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::bbands(d.close, {.length = 20}, kBundled);
        benchmark::DoNotOptimize(out);
    }
    set_rate(state, n);
}
BENCHMARK(BM_Bbands)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Atr(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        auto out = tai::atr(d.high, d.low, d.close, {}, kBundled);
        benchmark::DoNotOptimize(out);
    }
    set_rate(state, n);
}
BENCHMARK(BM_Atr)->RangeMultiplier(4)->Range(256, 65536)->Unit(benchmark::kMicrosecond);

static void BM_Catalog_All(benchmark::State& state) {
    tai::log::set_level(tai::log::Level::Off);
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto d = make_bars(n);
    for (auto _ : state) {
        for (const auto& e : tai::catalog::entries()) {
            auto out = tai::catalog::compute(e.name, d);
            benchmark::DoNotOptimize(out);
        }
    }
    set_rate(state, n * tai::catalog::entries().size());
}
BENCHMARK(BM_Catalog_All)->RangeMultiplier(8)->Range(1024, 65536)->Unit(benchmark::kMillisecond);
