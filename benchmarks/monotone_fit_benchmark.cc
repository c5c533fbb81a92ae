// SPDX-License-Identifier: MIT
#include <benchmark/benchmark.h>
#include "monocurve/curve/ispline_basis.hpp"
#include "monocurve/curve/monotone_fitter.hpp"
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/calibration/two_factor_calibrator.hpp"
#include <cmath>
#include <vector>

namespace monocurve {

// Noisy saturating curve on [0, 1]
static std::vector<double> generate_targets(const std::vector<double>& x) {
    std::vector<double> y(x.size());
    for (size_t i = 0; i < x.size(); ++i) {
        y[i] = std::tanh(3.0 * x[i]) + 0.05 * std::sin(40.0 * x[i]);
    }
    return y;
}

static std::vector<ObservationCell> generate_table(size_t n_a, size_t n_b) {
    std::vector<ObservationCell> cells;
    cells.reserve(n_a * n_b);
    for (size_t i = 0; i < n_a; ++i) {
        for (size_t j = 0; j < n_b; ++j) {
            const double a = static_cast<double>(i);
            const double b = static_cast<double>(j);
            const double eta = -2.5 + 0.8 * std::sqrt(a) + 0.15 * b;
            cells.push_back({.level_a = a, .level_b = b,
                             .probability = 1.0 / (1.0 + std::exp(-eta)),
                             .weight = 1.0 + 0.1 * a});
        }
    }
    return cells;
}

static void BM_ISplineBasis(benchmark::State& state) {
    const size_t n_points = static_cast<size_t>(state.range(0));
    auto basis = ISplineBasis::create({.n_basis = 8, .degree = 3, .x_min = 0.0, .x_max = 1.0});
    if (!basis) {
        state.SkipWithError("Failed to create ISplineBasis");
        return;
    }
    auto points = uniform_grid(0.0, 1.0, n_points);

    for (auto _ : state) {
        auto I = basis->evaluate(points);
        benchmark::DoNotOptimize(I.data());
    }

    state.SetComplexityN(state.range(0));
}

static void BM_MonotoneFit(benchmark::State& state) {
    const size_t n_samples = static_cast<size_t>(state.range(0));
    auto x = uniform_grid(0.0, 1.0, n_samples);
    auto y = generate_targets(x);

    MonotoneFitConfig config;
    config.n_basis = 8;

    for (auto _ : state) {
        auto fit = fit_monotone_spline(x, y, config);
        if (!fit) {
            state.SkipWithError("Fit failed");
            return;
        }
        benchmark::DoNotOptimize(fit->objective);
    }

    state.SetComplexityN(state.range(0));
}

static void BM_TwoFactorCalibration(benchmark::State& state) {
    const size_t n_levels = static_cast<size_t>(state.range(0));
    auto cells = generate_table(n_levels, n_levels);

    TwoFactorConfig config;
    config.factor_a.anchor = 0.0;
    config.factor_b.anchor = 0.0;

    for (auto _ : state) {
        auto result = calibrate_two_factor(cells, config);
        if (!result) {
            state.SkipWithError("Calibration failed");
            return;
        }
        benchmark::DoNotOptimize(result->global_intercept);
    }
}

BENCHMARK(BM_ISplineBasis)
    ->Arg(100)
    ->Arg(1000)
    ->Arg(10000)
    ->Unit(benchmark::kMicrosecond)
    ->Complexity();

BENCHMARK(BM_MonotoneFit)
    ->Arg(25)
    ->Arg(100)
    ->Arg(400)
    ->Unit(benchmark::kMillisecond)
    ->Complexity();

// Typical binned tables are 5-20 levels per factor
BENCHMARK(BM_TwoFactorCalibration)
    ->Arg(5)
    ->Arg(10)
    ->Arg(20)
    ->Unit(benchmark::kMillisecond);

}  // namespace monocurve

BENCHMARK_MAIN();
