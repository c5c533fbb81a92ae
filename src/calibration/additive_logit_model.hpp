// SPDX-License-Identifier: MIT
#pragma once

#include "monocurve/calibration/two_factor_calibrator.hpp"
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/support/error_types.hpp"
#include <Eigen/Dense>
#include <expected>
#include <span>
#include <vector>

namespace monocurve {

/// Observed versus predicted probability for one cell
struct CellComparison {
    double level_a;
    double level_b;
    double observed;    ///< Observed probability (unclamped)
    double predicted;   ///< Model probability
    double residual;    ///< observed - predicted
    double weight;
};

/// Read-only view of a calibrated additive logit model
///
///   score(a, b)       = f_A(a) + f_B(b)
///   logit(a, b)       = global_intercept + score(a, b)
///   probability(a, b) = 1 / (1 + exp(-logit(a, b)))
///
/// score is zero at the anchor pair, so global_intercept is the log-odds of
/// the reference cell.
class AdditiveLogitModel {
public:
    /// Build from two curves and a global intercept
    [[nodiscard]] static std::expected<AdditiveLogitModel, ConfigError>
    create(const CurveParameters& curve_a, const CurveParameters& curve_b, double global_intercept);

    /// Build from a calibration result
    [[nodiscard]] static std::expected<AdditiveLogitModel, ConfigError>
    from_calibration(const TwoFactorCalibration& calibration);

    [[nodiscard]] double score(double level_a, double level_b) const;
    [[nodiscard]] double logit(double level_a, double level_b) const;
    [[nodiscard]] double probability(double level_a, double level_b) const;

    /// Probability over the grid levels_a × levels_b (rows = levels_a)
    [[nodiscard]] Eigen::MatrixXd probability_grid(std::span<const double> levels_a,
                                                   std::span<const double> levels_b) const;

    /// Compare model probabilities against observed cells
    ///
    /// @return One comparison per cell in input order, or ValidationError
    ///         naming the first cell with a missing field
    [[nodiscard]] std::expected<std::vector<CellComparison>, ValidationError>
    compare_cells(std::span<const ObservationCell> cells) const;

    [[nodiscard]] double global_intercept() const noexcept { return global_intercept_; }
    [[nodiscard]] const SplineEvaluator& curve_a() const noexcept { return curve_a_; }
    [[nodiscard]] const SplineEvaluator& curve_b() const noexcept { return curve_b_; }

private:
    AdditiveLogitModel(SplineEvaluator curve_a, SplineEvaluator curve_b, double global_intercept);

    SplineEvaluator curve_a_;
    SplineEvaluator curve_b_;
    double global_intercept_;
};

}  // namespace monocurve
