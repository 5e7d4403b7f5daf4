// SPDX-License-Identifier: MIT
/// @file greek_latency.cc
/// @brief Latency benchmark: per-query time for pricer creation, price, each Greek
///        and a full dashboard heat map sweep
///
/// Usage:
///   ./build/benchmarks/greek_latency --benchmark_filter=Heatmap

#include "src/option/european_option.hpp"
#include "src/option/sensitivity_sweep.hpp"
#include <benchmark/benchmark.h>
#include <stdexcept>

using namespace bsm;

namespace {

// Shared query point
constexpr MarketSnapshot kSnapshot{
    .spot = 100.0, .strike = 100.0, .maturity = 0.5, .rate = 0.05, .volatility = 0.20};

const EuropeanOptionPricer& GetPricer() {
    static const EuropeanOptionPricer pricer = [] {
        auto created = EuropeanOptionPricer::create(kSnapshot);
        if (!created) throw std::runtime_error("GetPricer: invalid snapshot");
        return *created;
    }();
    return pricer;
}

void BM_Create(benchmark::State& state) {
    for (auto _ : state) {
        auto pricer = EuropeanOptionPricer::create(kSnapshot);
        benchmark::DoNotOptimize(pricer);
    }
}
BENCHMARK(BM_Create);

void BM_Price(benchmark::State& state) {
    const auto& pricer = GetPricer();
    for (auto _ : state) {
        benchmark::DoNotOptimize(pricer.call_price());
    }
}
BENCHMARK(BM_Price);

void BM_Greek(benchmark::State& state) {
    const auto& pricer = GetPricer();
    const auto greek = static_cast<Greek>(state.range(0));
    state.SetLabel(to_string(greek));
    for (auto _ : state) {
        benchmark::DoNotOptimize(pricer.greek(greek, OptionType::PUT));
    }
}
BENCHMARK(BM_Greek)->DenseRange(static_cast<int>(Greek::Delta), static_cast<int>(Greek::Rho));

void BM_AllGreeks(benchmark::State& state) {
    const auto& pricer = GetPricer();
    for (auto _ : state) {
        benchmark::DoNotOptimize(pricer.greeks(OptionType::CALL));
    }
}
BENCHMARK(BM_AllGreeks);

void BM_Heatmap(benchmark::State& state) {
    const auto n = static_cast<size_t>(state.range(0));
    HeatmapConfig config = default_heatmap_config(kSnapshot);
    config.spot_axis.n_points = n;
    config.vol_axis.n_points = n;

    for (auto _ : state) {
        auto heatmap = compute_price_heatmap(kSnapshot, config);
        if (!heatmap) {
            state.SkipWithError("heat map sweep failed");
            break;
        }
        benchmark::DoNotOptimize(heatmap->call_values.data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n * n));
}
BENCHMARK(BM_Heatmap)->Arg(20)->Arg(100)->Arg(500)->Unit(benchmark::kMicrosecond);

}  // namespace

BENCHMARK_MAIN();
