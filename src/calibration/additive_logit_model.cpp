// SPDX-License-Identifier: MIT
#include "monocurve/calibration/additive_logit_model.hpp"
#include "monocurve/math/smooth_transforms.hpp"
#include <cmath>

namespace monocurve {

std::expected<AdditiveLogitModel, ConfigError>
AdditiveLogitModel::create(const CurveParameters& curve_a, const CurveParameters& curve_b,
                           double global_intercept) {
    if (!std::isfinite(global_intercept)) {
        return std::unexpected(ConfigError{ConfigErrorCode::NonFiniteAnchor, global_intercept});
    }
    auto a = SplineEvaluator::create(curve_a);
    if (!a) {
        return std::unexpected(a.error());
    }
    auto b = SplineEvaluator::create(curve_b);
    if (!b) {
        return std::unexpected(b.error());
    }
    return AdditiveLogitModel(std::move(*a), std::move(*b), global_intercept);
}

std::expected<AdditiveLogitModel, ConfigError>
AdditiveLogitModel::from_calibration(const TwoFactorCalibration& calibration) {
    return create(calibration.curve_a, calibration.curve_b, calibration.global_intercept);
}

AdditiveLogitModel::AdditiveLogitModel(SplineEvaluator curve_a, SplineEvaluator curve_b,
                                       double global_intercept)
    : curve_a_(std::move(curve_a))
    , curve_b_(std::move(curve_b))
    , global_intercept_(global_intercept)
{}

double AdditiveLogitModel::score(double level_a, double level_b) const {
    return curve_a_(level_a) + curve_b_(level_b);
}

double AdditiveLogitModel::logit(double level_a, double level_b) const {
    return global_intercept_ + score(level_a, level_b);
}

double AdditiveLogitModel::probability(double level_a, double level_b) const {
    return sigmoid(logit(level_a, level_b));
}

Eigen::MatrixXd AdditiveLogitModel::probability_grid(std::span<const double> levels_a,
                                                     std::span<const double> levels_b) const {
    const std::vector<double> fa = curve_a_.evaluate(levels_a);
    const std::vector<double> fb = curve_b_.evaluate(levels_b);

    Eigen::MatrixXd grid(static_cast<Eigen::Index>(fa.size()), static_cast<Eigen::Index>(fb.size()));
    for (size_t i = 0; i < fa.size(); ++i) {
        for (size_t j = 0; j < fb.size(); ++j) {
            grid(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                sigmoid(global_intercept_ + fa[i] + fb[j]);
        }
    }
    return grid;
}

std::expected<std::vector<CellComparison>, ValidationError>
AdditiveLogitModel::compare_cells(std::span<const ObservationCell> cells) const {
    std::vector<CellComparison> comparisons;
    comparisons.reserve(cells.size());

    for (size_t i = 0; i < cells.size(); ++i) {
        const auto& cell = cells[i];
        if (!cell.level_a) {
            return std::unexpected(ValidationError{ValidationErrorCode::MissingLevelA, 0.0, i});
        }
        if (!cell.level_b) {
            return std::unexpected(ValidationError{ValidationErrorCode::MissingLevelB, 0.0, i});
        }
        if (!cell.probability) {
            return std::unexpected(ValidationError{ValidationErrorCode::MissingProbability, 0.0, i});
        }

        const double predicted = probability(*cell.level_a, *cell.level_b);
        comparisons.push_back(CellComparison{
            .level_a = *cell.level_a,
            .level_b = *cell.level_b,
            .observed = *cell.probability,
            .predicted = predicted,
            .residual = *cell.probability - predicted,
            .weight = cell.weight.value_or(1.0)
        });
    }
    return comparisons;
}

}  // namespace monocurve
