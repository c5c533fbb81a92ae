// SPDX-License-Identifier: MIT
/**
 * @file monotone_fitter.hpp
 * @brief Weighted least-squares fitting of monotone I-spline curves
 *
 * Fits f(x) = b + Σ_j c_j · I_j(x) with c_j = softplus(θ_j) ≥ 0 by minimizing
 *
 *   Σ_i w_i (y_i - f(x_i))² + λ Σ_j (c_{j+1} - c_j)²
 *
 * over θ (and b when no anchor is given) with L-BFGS. Weights are
 * renormalized to sum to 1.
 *
 * With an anchor (x0, y0) the intercept is not a free parameter:
 * b = y0 - Σ_j c_j · I_j(x0), so f(x0) = y0 holds exactly for every θ.
 *
 * The objective is non-convex in θ. The fit is run from the zero start and
 * from n_restarts - 1 seeded Gaussian perturbations of it; the lowest
 * objective wins.
 */

#pragma once

#include "monocurve/curve/curve_parameters.hpp"
#include "monocurve/math/lbfgs.hpp"
#include "monocurve/support/error_types.hpp"
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace monocurve {

/// Exact point the fitted curve must pass through
struct CurveAnchor {
    double x;
    double y;
};

/// Monotone fit configuration
struct MonotoneFitConfig {
    size_t n_basis = 6;
    size_t degree = 3;
    double smoothness_penalty = 0.001;          ///< λ on squared coefficient differences

    std::optional<std::vector<double>> weights; ///< Per-sample weights (default uniform)
    std::optional<CurveAnchor> anchor;          ///< Exact (x0, y0) constraint
    std::optional<double> x_min;                ///< Domain bound (default min x)
    std::optional<double> x_max;                ///< Domain bound (default max x)

    size_t n_restarts = 3;                      ///< Optimizer starts, including the unperturbed one
    double perturbation_scale = 0.5;            ///< Std. dev. of restart perturbations
    uint64_t seed = 42;                         ///< Seed for restart perturbations

    LBFGSConfig optimizer{};
};

/// Fitted curve with its diagnostics
struct MonotoneFit {
    CurveParameters parameters;
    FitDiagnostics diagnostics;
    double objective = 0.0;   ///< Penalized objective of the winning run
};

/// Validate fit settings that do not depend on the data
[[nodiscard]] std::optional<ConfigError> validate_monotone_fit_config(const MonotoneFitConfig& config);

/// Fit a monotone curve to (x, y) samples
///
/// @param x Sample locations
/// @param y Targets (same size as x)
/// @param config Fit configuration
/// @return Fitted curve, or ValidationError for bad samples or weights,
///         or ConfigError for bad settings (including all-zero weights)
[[nodiscard]] std::expected<MonotoneFit, CalibrationError>
fit_monotone_spline(std::span<const double> x,
                    std::span<const double> y,
                    const MonotoneFitConfig& config = {});

}  // namespace monocurve
