// SPDX-License-Identifier: MIT
/**
 * @file spline_evaluator.hpp
 * @brief Evaluation of fitted monotone curves
 *
 * The evaluator rebuilds the I-spline basis from the configuration embedded
 * in CurveParameters, so a curve evaluates identically at fit time, after
 * persistence and in downstream consumers.
 *
 * Points outside [x_min, x_max] are extrapolated by the end polynomial
 * pieces. Monotonicity is only guaranteed inside the domain.
 */

#pragma once

#include "monocurve/curve/curve_parameters.hpp"
#include "monocurve/curve/ispline_basis.hpp"
#include "monocurve/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace monocurve {

/// Number of grid points used for monotonicity verification
inline constexpr size_t kMonotoneGridPoints = 200;

/// Allowed decrease between consecutive grid values
inline constexpr double kMonotoneTolerance = 1e-10;

/// Evaluator bound to one fitted curve
class SplineEvaluator {
public:
    /// Create evaluator for a curve
    ///
    /// @return Evaluator, or ConfigError if the basis configuration is invalid
    ///         or the coefficient count does not match n_basis
    [[nodiscard]] static std::expected<SplineEvaluator, ConfigError>
    create(const CurveParameters& parameters);

    /// Curve value at x
    [[nodiscard]] double operator()(double x) const;

    /// Curve values at each point
    [[nodiscard]] std::vector<double> evaluate(std::span<const double> points) const;

    /// Check f(x_{i+1}) - f(x_i) ≥ -tolerance on a uniform grid over [x_min, x_max]
    ///
    /// Fires the monotonicity_violation probe for the first offending pair.
    [[nodiscard]] bool is_monotone(size_t n_grid = kMonotoneGridPoints,
                                   double tolerance = kMonotoneTolerance) const;

    [[nodiscard]] const CurveParameters& parameters() const noexcept { return parameters_; }

private:
    SplineEvaluator(CurveParameters parameters, ISplineBasis basis);

    CurveParameters parameters_;
    ISplineBasis basis_;
};

/// Evaluate a curve at each point
[[nodiscard]] std::expected<std::vector<double>, ConfigError>
evaluate_spline(std::span<const double> points, const CurveParameters& parameters);

/// Evaluate a curve at a single point
[[nodiscard]] std::expected<double, ConfigError>
evaluate_spline(double x, const CurveParameters& parameters);

/// Verify that a curve is non-decreasing over its domain
///
/// @param parameters Curve to check
/// @param n_grid Number of uniformly spaced grid points (≥ 2)
/// @param tolerance Allowed decrease between neighbours
[[nodiscard]] std::expected<bool, ConfigError>
check_monotone(const CurveParameters& parameters,
               size_t n_grid = kMonotoneGridPoints,
               double tolerance = kMonotoneTolerance);

/// Uniform grid of n points over [lo, hi] (endpoints included)
[[nodiscard]] std::vector<double> uniform_grid(double lo, double hi, size_t n);

}  // namespace monocurve
