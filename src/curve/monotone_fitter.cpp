// SPDX-License-Identifier: MIT
#include "monocurve/curve/monotone_fitter.hpp"
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/math/smooth_transforms.hpp"
#include "monocurve/support/monocurve_trace.h"
#include "monocurve/support/parallel.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace monocurve {

namespace {

/// Penalized weighted least-squares objective over (θ, [b])
///
/// Without anchor: r = y - b - B·c, parameters [θ_0..θ_{n-1}, b].
/// With anchor:    r = (y - y0) - (B - 1·aᵀ)·c, parameters [θ_0..θ_{n-1}],
///                 where a is the basis row at x0.
class MonotoneObjective {
public:
    MonotoneObjective(Eigen::MatrixXd design, Eigen::VectorXd target,
                      Eigen::VectorXd weights, double lambda, bool anchored)
        : design_(std::move(design))
        , target_(std::move(target))
        , weights_(std::move(weights))
        , lambda_(lambda)
        , anchored_(anchored)
    {}

    [[nodiscard]] Eigen::Index n_basis() const noexcept { return design_.cols(); }
    [[nodiscard]] Eigen::Index n_params() const noexcept { return n_basis() + (anchored_ ? 0 : 1); }

    /// Coefficients c = softplus(θ)
    [[nodiscard]] Eigen::VectorXd coefficients(const Eigen::VectorXd& params) const {
        const Eigen::Index n = n_basis();
        Eigen::VectorXd c(n);
        for (Eigen::Index j = 0; j < n; ++j) {
            c(j) = softplus(params(j));
        }
        return c;
    }

    double operator()(const Eigen::VectorXd& params, Eigen::VectorXd& grad) const {
        const Eigen::Index n = n_basis();
        const Eigen::VectorXd c = coefficients(params);

        Eigen::VectorXd residual = target_ - design_ * c;
        if (!anchored_) {
            residual.array() -= params(n);
        }
        const Eigen::VectorXd wr = weights_.cwiseProduct(residual);

        double f = residual.dot(wr);
        Eigen::VectorXd grad_c = -2.0 * (design_.transpose() * wr);

        for (Eigen::Index j = 0; j + 1 < n; ++j) {
            const double diff = c(j + 1) - c(j);
            f += lambda_ * diff * diff;
            grad_c(j) -= 2.0 * lambda_ * diff;
            grad_c(j + 1) += 2.0 * lambda_ * diff;
        }

        for (Eigen::Index j = 0; j < n; ++j) {
            grad(j) = grad_c(j) * sigmoid(params(j));
        }
        if (!anchored_) {
            grad(n) = -2.0 * wr.sum();
        }
        return f;
    }

private:
    Eigen::MatrixXd design_;
    Eigen::VectorXd target_;
    Eigen::VectorXd weights_;
    double lambda_;
    bool anchored_;
};

std::optional<ValidationError> validate_samples(std::span<const double> x,
                                                std::span<const double> y,
                                                const std::optional<std::vector<double>>& weights) {
    if (x.empty()) {
        return ValidationError{ValidationErrorCode::EmptyInput};
    }
    if (x.size() != y.size()) {
        return ValidationError{ValidationErrorCode::SizeMismatch,
                               static_cast<double>(y.size()), x.size()};
    }
    if (weights && weights->size() != x.size()) {
        return ValidationError{ValidationErrorCode::SizeMismatch,
                               static_cast<double>(weights->size()), x.size()};
    }
    for (size_t i = 0; i < x.size(); ++i) {
        if (!std::isfinite(x[i])) {
            return ValidationError{ValidationErrorCode::NonFiniteValue, x[i], i};
        }
        if (!std::isfinite(y[i])) {
            return ValidationError{ValidationErrorCode::NonFiniteValue, y[i], i};
        }
    }
    if (weights) {
        for (size_t i = 0; i < weights->size(); ++i) {
            const double w = (*weights)[i];
            if (!std::isfinite(w)) {
                return ValidationError{ValidationErrorCode::NonFiniteValue, w, i};
            }
            if (w < 0.0) {
                return ValidationError{ValidationErrorCode::NegativeWeight, w, i};
            }
        }
    }
    return std::nullopt;
}

}  // namespace

std::optional<ConfigError> validate_monotone_fit_config(const MonotoneFitConfig& config) {
    if (config.n_basis == 0 || config.n_basis < config.degree) {
        return ConfigError{ConfigErrorCode::InvalidBasisSize, static_cast<double>(config.n_basis)};
    }
    if (!(config.smoothness_penalty >= 0.0) || !std::isfinite(config.smoothness_penalty)) {
        return ConfigError{ConfigErrorCode::NegativePenalty, config.smoothness_penalty};
    }
    if (config.n_restarts == 0) {
        return ConfigError{ConfigErrorCode::InvalidRestartCount, 0.0};
    }
    if (!(config.perturbation_scale >= 0.0) || !std::isfinite(config.perturbation_scale)) {
        return ConfigError{ConfigErrorCode::InvalidRestartCount, config.perturbation_scale};
    }
    if (config.anchor && (!std::isfinite(config.anchor->x) || !std::isfinite(config.anchor->y))) {
        return ConfigError{ConfigErrorCode::NonFiniteAnchor,
                           std::isfinite(config.anchor->x) ? config.anchor->y : config.anchor->x};
    }
    return validate_lbfgs_config(config.optimizer);
}

std::expected<MonotoneFit, CalibrationError>
fit_monotone_spline(std::span<const double> x,
                    std::span<const double> y,
                    const MonotoneFitConfig& config)
{
    if (auto err = validate_monotone_fit_config(config)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_MONOTONE_FIT, static_cast<int>(err->code), 0, err->value);
        return std::unexpected(CalibrationError{*err});
    }
    if (auto err = validate_samples(x, y, config.weights)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_MONOTONE_FIT, static_cast<int>(err->code), err->index, err->value);
        return std::unexpected(CalibrationError{*err});
    }

    const size_t m = x.size();
    const size_t n = config.n_basis;

    // Normalized weights
    Eigen::VectorXd w(static_cast<Eigen::Index>(m));
    if (config.weights) {
        for (size_t i = 0; i < m; ++i) {
            w(static_cast<Eigen::Index>(i)) = (*config.weights)[i];
        }
    } else {
        w.setOnes();
    }
    const double total_weight = w.sum();
    if (!(total_weight > 0.0)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_MONOTONE_FIT,
                                         static_cast<int>(ConfigErrorCode::ZeroTotalWeight), 0, total_weight);
        return std::unexpected(CalibrationError{ConfigError{ConfigErrorCode::ZeroTotalWeight, total_weight}});
    }
    w /= total_weight;

    const auto [x_lo, x_hi] = std::minmax_element(x.begin(), x.end());
    const BasisConfig basis_config{
        .n_basis = n,
        .degree = config.degree,
        .x_min = config.x_min.value_or(*x_lo),
        .x_max = config.x_max.value_or(*x_hi)
    };
    auto basis = ISplineBasis::create(basis_config);
    if (!basis) {
        return std::unexpected(CalibrationError{basis.error()});
    }

    MONOCURVE_TRACE_ALGO_START(MODULE_MONOTONE_FIT, m, n, config.n_restarts);

    const Eigen::MatrixXd B = basis->evaluate(x);
    const Eigen::Map<const Eigen::VectorXd> y_vec(y.data(), static_cast<Eigen::Index>(m));
    const bool anchored = config.anchor.has_value();

    Eigen::VectorXd anchor_row;
    Eigen::MatrixXd design = B;
    Eigen::VectorXd target = y_vec;
    if (anchored) {
        const double x0 = config.anchor->x;
        anchor_row = basis->evaluate(std::span<const double>(&x0, 1)).row(0).transpose();
        design.rowwise() -= anchor_row.transpose();
        target.array() -= config.anchor->y;
    }

    const MonotoneObjective objective(std::move(design), std::move(target), w,
                                      config.smoothness_penalty, anchored);
    const Eigen::Index n_params = objective.n_params();

    // Starting points: zero coefficients' parameters (and mean target as
    // intercept), then seeded perturbations drawn up front in restart order
    Eigen::VectorXd start = Eigen::VectorXd::Zero(n_params);
    if (!anchored) {
        start(static_cast<Eigen::Index>(n)) = y_vec.mean();
    }

    std::vector<Eigen::VectorXd> starts(config.n_restarts, start);
    if (config.perturbation_scale > 0.0) {
        std::mt19937_64 rng(config.seed);
        std::normal_distribution<double> perturbation(0.0, config.perturbation_scale);
        for (size_t k = 1; k < config.n_restarts; ++k) {
            for (Eigen::Index j = 0; j < n_params; ++j) {
                starts[k](j) += perturbation(rng);
            }
        }
    }

    std::vector<LBFGSResult> runs(config.n_restarts);

    MONOCURVE_PRAGMA_PARALLEL_FOR_DYNAMIC
    for (size_t k = 0; k < config.n_restarts; ++k) {
        runs[k] = lbfgs_minimize(objective, starts[k], config.optimizer);
    }

    // Lowest objective wins; strict comparison keeps the earliest run on ties
    size_t best = 0;
    for (size_t k = 0; k < runs.size(); ++k) {
        MONOCURVE_TRACE_FIT_RESTART(k, runs[k].f, runs[k].iterations);
        if (!std::isfinite(runs[best].f) || runs[k].f < runs[best].f) {
            best = k;
        }
    }
    const LBFGSResult& run = runs[best];

    // Assemble curve
    const Eigen::VectorXd c = objective.coefficients(run.x);
    const double intercept = anchored
        ? config.anchor->y - anchor_row.dot(c)
        : run.x(static_cast<Eigen::Index>(n));

    CurveParameters parameters{
        .coefficients = std::vector<double>(c.data(), c.data() + c.size()),
        .intercept = intercept,
        .basis = basis_config,
        .knots = basis->knots()
    };

    // Diagnostics against the targets
    Eigen::VectorXd fitted = B * c;
    fitted.array() += intercept;
    const Eigen::VectorXd residual = y_vec - fitted;
    const double ss_res = residual.cwiseProduct(residual).dot(w);
    const double y_bar = w.dot(y_vec);
    const double ss_tot = (y_vec.array() - y_bar).square().matrix().dot(w);
    const bool constant_targets = (y_vec.array() == y_vec(0)).all();

    auto evaluator = SplineEvaluator::create(parameters);
    if (!evaluator) {
        return std::unexpected(CalibrationError{evaluator.error()});
    }

    FitDiagnostics diagnostics{
        .rmse = std::sqrt(ss_res),
        .r2 = (ss_tot > 0.0 && !constant_targets) ? 1.0 - ss_res / ss_tot : 0.0,
        .is_monotone = evaluator->is_monotone(),
        .converged = run.converged,
        .iterations = run.iterations,
        .message = run.failure_reason.value_or("")
    };

    if (!run.converged) {
        MONOCURVE_TRACE_CONVERGENCE_FAILED(MODULE_MONOTONE_FIT, best, run.iterations, run.f);
    }
    MONOCURVE_TRACE_ALGO_COMPLETE(MODULE_MONOTONE_FIT, config.n_restarts, run.f);

    return MonotoneFit{
        .parameters = std::move(parameters),
        .diagnostics = std::move(diagnostics),
        .objective = run.f
    };
}

}  // namespace monocurve
