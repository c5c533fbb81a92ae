// SPDX-License-Identifier: MIT
/**
 * @file two_factor_calibrator.hpp
 * @brief Two-stage calibration of an additive logit model over two factors
 *
 * Given a binned probability table P(level_a, level_b), finds monotone
 * curves f_A, f_B and a global intercept g such that
 *
 *   logit P(a, b) ≈ g + f_A(a) + f_B(b),   f_A(anchor_A) = f_B(anchor_B) = 0
 *
 * Stage 1 (discrete): one effect per distinct level of each factor, fitted
 * to the clamped log-odds by weighted least squares with soft monotonicity
 * and smoothness penalties. Monotonicity here is best effort.
 *
 * Stage 2 (continuous): each centered effect vector is refit with the
 * monotone fitter, which guarantees non-decreasing curves, and the curves
 * are shifted to evaluate to zero at their anchors.
 *
 * Example:
 * @code
 * std::vector<ObservationCell> cells = {
 *     {.level_a = 1.0, .level_b = 1.0, .probability = 0.10, .weight = 1.0},
 *     ...
 * };
 * TwoFactorConfig config{.factor_a = {.anchor = 3.75}, .factor_b = {.anchor = 512.0}};
 * auto result = calibrate_two_factor(cells, config);
 * if (result) {
 *     double logit = result->global_intercept + ...;
 * }
 * @endcode
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
#include <string>
#include <vector>

namespace monocurve {

/// One cell of the observed probability table
///
/// Fields are optional so that incomplete records from ingestion surface as
/// ValidationError instead of silently defaulting.
struct ObservationCell {
    std::optional<double> level_a;
    std::optional<double> level_b;
    std::optional<double> probability;  ///< Observed probability in [0, 1]
    std::optional<double> weight;       ///< Non-negative; zero excludes the cell
};

/// Curve settings for one factor
struct FactorConfig {
    double anchor = 0.0;                 ///< Input at which the curve is zero
    size_t n_basis = 6;
    size_t degree = 3;
    double smoothness_penalty = 0.001;
    std::optional<double> x_min;         ///< Curve domain (default: level range)
    std::optional<double> x_max;
};

/// Two-factor calibration configuration
struct TwoFactorConfig {
    FactorConfig factor_a;
    FactorConfig factor_b;

    // Discrete stage
    double monotonicity_weight = 100.0;  ///< Weight of Σ min(0, Δα)²
    double smoothness_weight = 0.01;     ///< Weight of Σ Δα²
    double initial_effect_span = 2.0;    ///< Start from evenly spaced effects in [-span, span]
    double probability_floor = 0.01;
    double probability_ceiling = 0.99;

    // Continuous stage
    size_t n_restarts = 3;
    uint64_t seed = 42;

    LBFGSConfig optimizer{};
};

/// Discrete per-level effects of one factor, centered on its anchor level
struct DiscreteEffects {
    std::vector<double> levels;   ///< Distinct levels, ascending
    std::vector<double> effects;  ///< One effect per level
    size_t anchor_index = 0;      ///< Level nearest the anchor (first on ties)
};

/// Diagnostics of a two-factor calibration
struct TwoFactorDiagnostics {
    double rmse = 0.0;                 ///< Weighted RMSE of the discrete fit, probability scale
    double r2 = 0.0;                   ///< Weighted R² of the discrete fit, probability scale
    bool monotone_a = true;            ///< Continuous curve A non-decreasing on its domain
    bool monotone_b = true;
    bool discrete_monotone_a = true;   ///< Discrete effects of A non-decreasing
    bool discrete_monotone_b = true;
    bool converged = false;            ///< Discrete-stage optimizer converged
    size_t iterations = 0;             ///< Discrete-stage iterations
    FitDiagnostics curve_a;            ///< Stage-2 fit of factor A
    FitDiagnostics curve_b;
    double anchor_a = 0.0;
    double anchor_b = 0.0;
    size_t n_cells_used = 0;           ///< Cells with positive weight
    std::vector<std::string> warnings;
};

/// Output of calibrate_two_factor()
struct TwoFactorCalibration {
    CurveParameters curve_a;           ///< f_A, zero at anchor A
    CurveParameters curve_b;           ///< f_B, zero at anchor B
    double global_intercept = 0.0;     ///< Log-odds at the anchor cell
    TwoFactorDiagnostics diagnostics;
    DiscreteEffects discrete_a;
    DiscreteEffects discrete_b;
};

/// Validate calibration settings
[[nodiscard]] std::optional<ConfigError> validate_two_factor_config(const TwoFactorConfig& config);

/// Calibrate two monotone curves to a binned probability table
///
/// @param cells Observed cells; zero-weight cells are ignored
/// @param config Calibration settings
/// @return Calibration, or ValidationError for malformed cells,
///         or ConfigError for bad settings or all-zero weights
[[nodiscard]] std::expected<TwoFactorCalibration, CalibrationError>
calibrate_two_factor(std::span<const ObservationCell> cells, const TwoFactorConfig& config);

}  // namespace monocurve
