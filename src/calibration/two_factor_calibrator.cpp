// SPDX-License-Identifier: MIT
#include "monocurve/calibration/two_factor_calibrator.hpp"
#include "monocurve/curve/monotone_fitter.hpp"
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/math/smooth_transforms.hpp"
#include "monocurve/support/monocurve_trace.h"
#include <algorithm>
#include <cmath>

namespace monocurve {

namespace {

/// Positive-weight cells in log-odds form
struct PreparedCells {
    std::vector<size_t> index_a;      ///< Level index into levels_a
    std::vector<size_t> index_b;
    std::vector<double> probability;  ///< Clamped observed probability
    std::vector<double> log_odds;     ///< logit(probability)
    std::vector<double> weight;       ///< Cell weight as given
    double total_weight = 0.0;
    std::vector<double> levels_a;     ///< Distinct, ascending
    std::vector<double> levels_b;
};

std::vector<double> distinct_levels(std::vector<double> values) {
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

size_t level_index(const std::vector<double>& levels, double value) {
    return static_cast<size_t>(std::distance(
        levels.begin(), std::lower_bound(levels.begin(), levels.end(), value)));
}

/// Index of the level nearest to target (first on ties)
size_t nearest_level(const std::vector<double>& levels, double target) {
    size_t best = 0;
    for (size_t i = 1; i < levels.size(); ++i) {
        if (std::abs(levels[i] - target) < std::abs(levels[best] - target)) {
            best = i;
        }
    }
    return best;
}

std::optional<ValidationError> validate_cell(const ObservationCell& cell, size_t i) {
    if (!cell.level_a) {
        return ValidationError{ValidationErrorCode::MissingLevelA, 0.0, i};
    }
    if (!cell.level_b) {
        return ValidationError{ValidationErrorCode::MissingLevelB, 0.0, i};
    }
    if (!cell.probability) {
        return ValidationError{ValidationErrorCode::MissingProbability, 0.0, i};
    }
    if (!cell.weight) {
        return ValidationError{ValidationErrorCode::MissingWeight, 0.0, i};
    }
    if (!std::isfinite(*cell.level_a)) {
        return ValidationError{ValidationErrorCode::NonFiniteValue, *cell.level_a, i};
    }
    if (!std::isfinite(*cell.level_b)) {
        return ValidationError{ValidationErrorCode::NonFiniteValue, *cell.level_b, i};
    }
    if (!(*cell.probability >= 0.0 && *cell.probability <= 1.0)) {
        return ValidationError{ValidationErrorCode::ProbabilityOutOfRange, *cell.probability, i};
    }
    if (!std::isfinite(*cell.weight)) {
        return ValidationError{ValidationErrorCode::NonFiniteValue, *cell.weight, i};
    }
    if (*cell.weight < 0.0) {
        return ValidationError{ValidationErrorCode::NegativeWeight, *cell.weight, i};
    }
    return std::nullopt;
}

std::expected<PreparedCells, CalibrationError>
prepare_cells(std::span<const ObservationCell> cells, const TwoFactorConfig& config) {
    if (cells.empty()) {
        return std::unexpected(CalibrationError{ValidationError{ValidationErrorCode::EmptyInput}});
    }

    // Validate everything before producing anything
    for (size_t i = 0; i < cells.size(); ++i) {
        if (auto err = validate_cell(cells[i], i)) {
            MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_TWO_FACTOR, static_cast<int>(err->code), i, err->value);
            return std::unexpected(CalibrationError{*err});
        }
    }

    std::vector<double> raw_a, raw_b;
    PreparedCells prepared;
    double& total_weight = prepared.total_weight;

    for (const auto& cell : cells) {
        if (*cell.weight == 0.0) {
            continue;
        }
        const double p = std::clamp(*cell.probability,
                                    config.probability_floor, config.probability_ceiling);
        raw_a.push_back(*cell.level_a);
        raw_b.push_back(*cell.level_b);
        prepared.probability.push_back(p);
        prepared.log_odds.push_back(logit(p));
        prepared.weight.push_back(*cell.weight);
        total_weight += *cell.weight;
    }

    if (prepared.weight.empty() || !(total_weight > 0.0)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_TWO_FACTOR,
                                         static_cast<int>(ConfigErrorCode::ZeroTotalWeight), 0, total_weight);
        return std::unexpected(CalibrationError{ConfigError{ConfigErrorCode::ZeroTotalWeight, total_weight}});
    }
    prepared.levels_a = distinct_levels(raw_a);
    prepared.levels_b = distinct_levels(raw_b);
    prepared.index_a.reserve(raw_a.size());
    prepared.index_b.reserve(raw_b.size());
    for (size_t i = 0; i < raw_a.size(); ++i) {
        prepared.index_a.push_back(level_index(prepared.levels_a, raw_a[i]));
        prepared.index_b.push_back(level_index(prepared.levels_b, raw_b[i]));
    }
    return prepared;
}

/// Penalized least squares over concatenated effects [α_A; α_B]
class DiscreteObjective {
public:
    DiscreteObjective(const PreparedCells& cells, double monotonicity_weight, double smoothness_weight)
        : cells_(cells)
        , n_a_(cells.levels_a.size())
        , n_b_(cells.levels_b.size())
        , monotonicity_weight_(monotonicity_weight)
        , smoothness_weight_(smoothness_weight)
    {}

    double operator()(const Eigen::VectorXd& alpha, Eigen::VectorXd& grad) const {
        grad.setZero();
        double f = 0.0;

        const auto offset_b = static_cast<Eigen::Index>(n_a_);
        for (size_t i = 0; i < cells_.log_odds.size(); ++i) {
            const auto ia = static_cast<Eigen::Index>(cells_.index_a[i]);
            const auto ib = offset_b + static_cast<Eigen::Index>(cells_.index_b[i]);
            const double r = cells_.log_odds[i] - alpha(ia) - alpha(ib);
            const double wr = cells_.weight[i] * r;
            f += wr * r;
            grad(ia) -= 2.0 * wr;
            grad(ib) -= 2.0 * wr;
        }

        f += shape_penalty(alpha, 0, n_a_, grad);
        f += shape_penalty(alpha, offset_b, n_b_, grad);
        return f;
    }

private:
    /// Soft monotonicity and smoothness penalty on one factor's block
    double shape_penalty(const Eigen::VectorXd& alpha, Eigen::Index offset, size_t n,
                         Eigen::VectorXd& grad) const {
        double f = 0.0;
        for (size_t j = 0; j + 1 < n; ++j) {
            const Eigen::Index k = offset + static_cast<Eigen::Index>(j);
            const double diff = alpha(k + 1) - alpha(k);
            double weight = smoothness_weight_;
            if (diff < 0.0) {
                weight += monotonicity_weight_;
            }
            f += weight * diff * diff;
            grad(k + 1) += 2.0 * weight * diff;
            grad(k) -= 2.0 * weight * diff;
        }
        return f;
    }

    const PreparedCells& cells_;
    size_t n_a_;
    size_t n_b_;
    double monotonicity_weight_;
    double smoothness_weight_;
};

/// n evenly spaced values in [-span, span]; a single value sits at -span
Eigen::VectorXd initial_effects(size_t n, double span) {
    if (n == 1) {
        return Eigen::VectorXd::Constant(1, -span);
    }
    return Eigen::VectorXd::LinSpaced(static_cast<Eigen::Index>(n), -span, span);
}

bool is_non_decreasing(const std::vector<double>& values) {
    for (size_t i = 1; i < values.size(); ++i) {
        if (values[i] - values[i - 1] < -kMonotoneTolerance) {
            return false;
        }
    }
    return true;
}

std::optional<ConfigError> validate_factor_config(const FactorConfig& factor) {
    if (!std::isfinite(factor.anchor)) {
        return ConfigError{ConfigErrorCode::NonFiniteAnchor, factor.anchor};
    }
    if (factor.n_basis == 0 || factor.n_basis < factor.degree) {
        return ConfigError{ConfigErrorCode::InvalidBasisSize, static_cast<double>(factor.n_basis)};
    }
    if (!(factor.smoothness_penalty >= 0.0) || !std::isfinite(factor.smoothness_penalty)) {
        return ConfigError{ConfigErrorCode::NegativePenalty, factor.smoothness_penalty};
    }
    if (factor.x_min && factor.x_max && !(*factor.x_min < *factor.x_max)) {
        return ConfigError{ConfigErrorCode::InvalidDomainBounds, *factor.x_max};
    }
    return std::nullopt;
}

/// Stage-2 fit of one factor's centered effects
std::expected<MonotoneFit, CalibrationError>
fit_factor_curve(const DiscreteEffects& discrete, const FactorConfig& factor,
                 const TwoFactorConfig& config) {
    const MonotoneFitConfig fit_config{
        .n_basis = factor.n_basis,
        .degree = factor.degree,
        .smoothness_penalty = factor.smoothness_penalty,
        .weights = std::nullopt,
        .anchor = std::nullopt,
        .x_min = factor.x_min,
        .x_max = factor.x_max,
        .n_restarts = config.n_restarts,
        .perturbation_scale = 0.5,
        .seed = config.seed,
        .optimizer = config.optimizer
    };
    return fit_monotone_spline(discrete.levels, discrete.effects, fit_config);
}

}  // namespace

std::optional<ConfigError> validate_two_factor_config(const TwoFactorConfig& config) {
    if (auto err = validate_factor_config(config.factor_a)) {
        return err;
    }
    if (auto err = validate_factor_config(config.factor_b)) {
        return err;
    }
    if (!(config.monotonicity_weight >= 0.0) || !std::isfinite(config.monotonicity_weight)) {
        return ConfigError{ConfigErrorCode::NegativePenalty, config.monotonicity_weight};
    }
    if (!(config.smoothness_weight >= 0.0) || !std::isfinite(config.smoothness_weight)) {
        return ConfigError{ConfigErrorCode::NegativePenalty, config.smoothness_weight};
    }
    if (!(config.initial_effect_span >= 0.0) || !std::isfinite(config.initial_effect_span)) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, config.initial_effect_span};
    }
    if (!(config.probability_floor > 0.0 && config.probability_floor < config.probability_ceiling
          && config.probability_ceiling < 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidProbabilityClamp, config.probability_floor};
    }
    if (config.n_restarts == 0) {
        return ConfigError{ConfigErrorCode::InvalidRestartCount, 0.0};
    }
    return validate_lbfgs_config(config.optimizer);
}

std::expected<TwoFactorCalibration, CalibrationError>
calibrate_two_factor(std::span<const ObservationCell> cells, const TwoFactorConfig& config) {
    if (auto err = validate_two_factor_config(config)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_TWO_FACTOR, static_cast<int>(err->code), 0, err->value);
        return std::unexpected(CalibrationError{*err});
    }

    // Stage: validate and convert to log-odds
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_VALIDATE, cells.size());
    auto prepared = prepare_cells(cells, config);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }
    const PreparedCells& data = *prepared;
    const size_t n_a = data.levels_a.size();
    const size_t n_b = data.levels_b.size();

    MONOCURVE_TRACE_ALGO_START(MODULE_TWO_FACTOR, data.weight.size(), n_a, n_b);

    // Stage: discrete effects
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_DISCRETE_FIT, n_a + n_b);
    Eigen::VectorXd start(static_cast<Eigen::Index>(n_a + n_b));
    start << initial_effects(n_a, config.initial_effect_span),
             initial_effects(n_b, config.initial_effect_span);

    const DiscreteObjective objective(data, config.monotonicity_weight, config.smoothness_weight);
    const LBFGSResult discrete_run = lbfgs_minimize(objective, std::move(start), config.optimizer);
    if (!discrete_run.converged) {
        MONOCURVE_TRACE_CONVERGENCE_FAILED(MODULE_TWO_FACTOR, 0, discrete_run.iterations, discrete_run.f);
    }

    const Eigen::VectorXd alpha_a = discrete_run.x.head(static_cast<Eigen::Index>(n_a));
    const Eigen::VectorXd alpha_b = discrete_run.x.tail(static_cast<Eigen::Index>(n_b));

    // Stage: center on anchor levels
    const size_t anchor_a = nearest_level(data.levels_a, config.factor_a.anchor);
    const size_t anchor_b = nearest_level(data.levels_b, config.factor_b.anchor);
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_CENTER, anchor_a);

    const double global_intercept = alpha_a(static_cast<Eigen::Index>(anchor_a))
                                  + alpha_b(static_cast<Eigen::Index>(anchor_b));

    auto centered = [](const Eigen::VectorXd& alpha, const std::vector<double>& levels, size_t anchor) {
        DiscreteEffects effects{.levels = levels, .effects = {}, .anchor_index = anchor};
        const double reference = alpha(static_cast<Eigen::Index>(anchor));
        effects.effects.reserve(static_cast<size_t>(alpha.size()));
        for (Eigen::Index j = 0; j < alpha.size(); ++j) {
            effects.effects.push_back(alpha(j) - reference);
        }
        return effects;
    };
    DiscreteEffects discrete_a = centered(alpha_a, data.levels_a, anchor_a);
    DiscreteEffects discrete_b = centered(alpha_b, data.levels_b, anchor_b);

    // Stage: continuous monotone curves
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_CURVE_FIT, 2);
    auto fit_a = fit_factor_curve(discrete_a, config.factor_a, config);
    if (!fit_a) {
        return std::unexpected(fit_a.error());
    }
    auto fit_b = fit_factor_curve(discrete_b, config.factor_b, config);
    if (!fit_b) {
        return std::unexpected(fit_b.error());
    }

    // Stage: shift curves to zero at the exact anchor inputs
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_REANCHOR, 2);
    CurveParameters curve_a = std::move(fit_a->parameters);
    CurveParameters curve_b = std::move(fit_b->parameters);

    auto evaluator_a = SplineEvaluator::create(curve_a);
    auto evaluator_b = SplineEvaluator::create(curve_b);
    if (!evaluator_a) {
        return std::unexpected(CalibrationError{evaluator_a.error()});
    }
    if (!evaluator_b) {
        return std::unexpected(CalibrationError{evaluator_b.error()});
    }
    curve_a.intercept -= (*evaluator_a)(config.factor_a.anchor);
    curve_b.intercept -= (*evaluator_b)(config.factor_b.anchor);

    // Stage: diagnostics on the probability scale
    MONOCURVE_TRACE_CALIBRATION_STAGE(CALIBRATION_STAGE_DIAGNOSTICS, data.weight.size());
    // Diagnostics weight each cell by w_i / Σw
    double weighted_mean = 0.0;
    for (size_t i = 0; i < data.probability.size(); ++i) {
        weighted_mean += data.weight[i] * data.probability[i];
    }
    weighted_mean /= data.total_weight;
    double ss_res = 0.0;
    double ss_tot = 0.0;
    bool constant_targets = true;
    for (size_t i = 0; i < data.probability.size(); ++i) {
        const double predicted = sigmoid(alpha_a(static_cast<Eigen::Index>(data.index_a[i]))
                                       + alpha_b(static_cast<Eigen::Index>(data.index_b[i])));
        const double residual = data.probability[i] - predicted;
        const double deviation = data.probability[i] - weighted_mean;
        ss_res += data.weight[i] * residual * residual;
        ss_tot += data.weight[i] * deviation * deviation;
        constant_targets = constant_targets && data.probability[i] == data.probability[0];
    }

    TwoFactorDiagnostics diagnostics{
        .rmse = std::sqrt(ss_res / data.total_weight),
        .r2 = (ss_tot > 0.0 && !constant_targets) ? 1.0 - ss_res / ss_tot : 0.0,
        .monotone_a = fit_a->diagnostics.is_monotone,
        .monotone_b = fit_b->diagnostics.is_monotone,
        .discrete_monotone_a = is_non_decreasing(discrete_a.effects),
        .discrete_monotone_b = is_non_decreasing(discrete_b.effects),
        .converged = discrete_run.converged,
        .iterations = discrete_run.iterations,
        .curve_a = std::move(fit_a->diagnostics),
        .curve_b = std::move(fit_b->diagnostics),
        .anchor_a = config.factor_a.anchor,
        .anchor_b = config.factor_b.anchor,
        .n_cells_used = data.weight.size(),
        .warnings = {}
    };

    auto& warnings = diagnostics.warnings;
    if (!diagnostics.converged) {
        warnings.push_back("discrete stage did not converge: "
                           + discrete_run.failure_reason.value_or("unknown reason"));
    }
    if (!diagnostics.discrete_monotone_a) {
        warnings.push_back("discrete effects of factor A are not monotone");
    }
    if (!diagnostics.discrete_monotone_b) {
        warnings.push_back("discrete effects of factor B are not monotone");
    }
    if (!diagnostics.curve_a.converged) {
        warnings.push_back("curve fit of factor A did not converge: " + diagnostics.curve_a.message);
    }
    if (!diagnostics.curve_b.converged) {
        warnings.push_back("curve fit of factor B did not converge: " + diagnostics.curve_b.message);
    }
    if (!diagnostics.monotone_a) {
        warnings.push_back("curve of factor A is not monotone on its domain");
    }
    if (!diagnostics.monotone_b) {
        warnings.push_back("curve of factor B is not monotone on its domain");
    }

    MONOCURVE_TRACE_ALGO_COMPLETE(MODULE_TWO_FACTOR, discrete_run.iterations, diagnostics.rmse);

    return TwoFactorCalibration{
        .curve_a = std::move(curve_a),
        .curve_b = std::move(curve_b),
        .global_intercept = global_intercept,
        .diagnostics = std::move(diagnostics),
        .discrete_a = std::move(discrete_a),
        .discrete_b = std::move(discrete_b)
    };
}

}  // namespace monocurve
