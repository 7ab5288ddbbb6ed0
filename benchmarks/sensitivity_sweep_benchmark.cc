// SPDX-License-Identifier: MIT
// Sensitivity sweep throughput: serial vs OpenMP cells, and grid size scaling.

#include <benchmark/benchmark.h>
#include <vector>

#include "src/math/rate_axis.hpp"
#include "src/valuation/dcf_model.hpp"
#include "src/valuation/sensitivity_analyzer.hpp"

using namespace fairvalue;

namespace {

ValuationInputs benchmark_inputs(size_t horizon) {
    ValuationInputs in;
    in.base_revenue = 60.9;
    in.schedule = GrowthSchedule::linear_taper(0.70, 0.05, 0.70, horizon);
    in.discount_rate = 0.12;
    in.terminal_growth_rate = 0.035;
    in.net_debt = -11.0;
    in.shares_outstanding = 2.46;
    return in;
}

}  // namespace

// Benchmark: single end-to-end valuation
static void BM_ValueCompany(benchmark::State& state) {
    const auto inputs = benchmark_inputs(static_cast<size_t>(state.range(0)));

    for (auto _ : state) {
        auto report = value_company(inputs);
        benchmark::DoNotOptimize(report);
    }

    state.SetItemsProcessed(state.iterations());
}

// Benchmark: n x n sweep, serial
static void BM_Sweep_Serial(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto inputs = benchmark_inputs(10);
    const auto wacc = linspace(0.08, 0.16, n).value();
    const auto growth = linspace(0.00, 0.06, n).value();

    SensitivityAnalyzer analyzer;
    analyzer.set_parallel(false);

    for (auto _ : state) {
        auto grid = analyzer.sweep(inputs, wacc, growth);
        benchmark::DoNotOptimize(grid);
    }

    state.SetItemsProcessed(state.iterations() * n * n);
    state.SetLabel("serial");
}

// Benchmark: n x n sweep, OpenMP
static void BM_Sweep_Parallel(benchmark::State& state) {
    const size_t n = static_cast<size_t>(state.range(0));
    const auto inputs = benchmark_inputs(10);
    const auto wacc = linspace(0.08, 0.16, n).value();
    const auto growth = linspace(0.00, 0.06, n).value();

    SweepConfig config;
    config.min_parallel_cells = 1;
    SensitivityAnalyzer analyzer(config);

    for (auto _ : state) {
        auto grid = analyzer.sweep(inputs, wacc, growth);
        benchmark::DoNotOptimize(grid);
    }

    state.SetItemsProcessed(state.iterations() * n * n);
    state.SetLabel("openmp");
}

BENCHMARK(BM_ValueCompany)->Arg(5)->Arg(10)->Arg(30);
BENCHMARK(BM_Sweep_Serial)->Arg(6)->Arg(32)->Arg(128)->Arg(512)->Unit(benchmark::kMicrosecond);
BENCHMARK(BM_Sweep_Parallel)->Arg(6)->Arg(32)->Arg(128)->Arg(512)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
