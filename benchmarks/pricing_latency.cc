// SPDX-License-Identifier: MIT
/// @file pricing_latency.cc
/// @brief Latency benchmark: per-call time for pricing, Greeks, IV and bulk generators
///
/// Reports ns/call for the closed-form kernels and us/call for the chain,
/// strategy and surface generators.

#include "src/analytics/iv_surface.hpp"
#include "src/analytics/option_chain.hpp"
#include "src/analytics/probability.hpp"
#include "src/analytics/strategy.hpp"
#include "src/analytics/strike_ladder.hpp"
#include "src/analytics/volatility_estimator.hpp"
#include "src/option/european_option.hpp"
#include "src/option/iv_solver.hpp"
#include <benchmark/benchmark.h>
#include <cmath>
#include <vector>

using namespace kumquat;

namespace {

// Shared query point
constexpr double S = 100.0, K = 100.0, tau = 0.25, sigma = 0.30, rate = 0.05;
constexpr int days = 90;

std::vector<double> MakeCloses(size_t n) {
    std::vector<double> closes(n);
    double p = 100.0;
    for (size_t i = 0; i < n; ++i) {
        closes[i] = p;
        p *= 1.0 + 0.01 * std::sin(0.7 * static_cast<double>(i));
    }
    return closes;
}

}  // namespace

// ===========================================================================
// Closed-form kernels
// ===========================================================================

static void BM_Price_Unchecked(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(bs_price(OptionType::CALL, S, K, tau, rate, sigma));
    }
}
BENCHMARK(BM_Price_Unchecked);

static void BM_Price_Validated(benchmark::State& state) {
    OptionQuote quote(OptionType::PUT, S, K, days, rate, sigma);
    for (auto _ : state) {
        benchmark::DoNotOptimize(european_price(quote));
    }
}
BENCHMARK(BM_Price_Validated);

static void BM_Greeks(benchmark::State& state) {
    OptionQuote quote(OptionType::CALL, S, K, days, rate, sigma);
    for (auto _ : state) {
        benchmark::DoNotOptimize(european_greeks(quote));
    }
}
BENCHMARK(BM_Greeks);

static void BM_ImpliedVol(benchmark::State& state) {
    const double strike = static_cast<double>(state.range(0));
    const double price = bs_price(OptionType::CALL, S, strike, tau, rate, sigma);
    IVQuery query(OptionType::CALL, S, strike, days, rate, price);
    IVSolver solver;
    for (auto _ : state) {
        benchmark::DoNotOptimize(solver.solve(query));
    }
}
BENCHMARK(BM_ImpliedVol)->Arg(80)->Arg(100)->Arg(130);

static void BM_Probabilities(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(probabilities(S, 110.0, sigma, 30));
    }
}
BENCHMARK(BM_Probabilities);

static void BM_HistoricalVolatility(benchmark::State& state) {
    auto closes = MakeCloses(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(annualized_volatility(closes));
    }
}
BENCHMARK(BM_HistoricalVolatility)->Arg(30)->Arg(252)->Arg(2520);

// ===========================================================================
// Bulk generators
// ===========================================================================

static void BM_Chain(benchmark::State& state) {
    auto strikes = strike_ladder(S, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(generate_chain(S, sigma, strikes, 30));
    }
}
BENCHMARK(BM_Chain)->Arg(10)->Arg(50)->Unit(benchmark::kMicrosecond);

static void BM_IronCondor(benchmark::State& state) {
    for (auto _ : state) {
        benchmark::DoNotOptimize(iron_condor(S, 90.0, 95.0, 105.0, 110.0, 0.25, 30));
    }
}
BENCHMARK(BM_IronCondor)->Unit(benchmark::kMicrosecond);

static void BM_Surface(benchmark::State& state) {
    std::vector<int> expiries{7, 14, 30, 45, 60, 90, 120, 180};
    for (auto _ : state) {
        benchmark::DoNotOptimize(generate_surface(S, sigma, expiries,
                                                  static_cast<size_t>(state.range(0))));
    }
}
BENCHMARK(BM_Surface)->Arg(11)->Arg(101)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
