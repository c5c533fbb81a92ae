// SPDX-License-Identifier: MIT
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/support/monocurve_trace.h"

namespace monocurve {

std::vector<double> uniform_grid(double lo, double hi, size_t n) {
    std::vector<double> grid(n, lo);
    if (n < 2) {
        return grid;
    }
    const double step = (hi - lo) / static_cast<double>(n - 1);
    for (size_t i = 0; i < n; ++i) {
        grid[i] = lo + static_cast<double>(i) * step;
    }
    grid[n - 1] = hi;
    return grid;
}

std::expected<SplineEvaluator, ConfigError>
SplineEvaluator::create(const CurveParameters& parameters) {
    auto basis = ISplineBasis::create(parameters.basis);
    if (!basis) {
        return std::unexpected(basis.error());
    }
    if (parameters.coefficients.size() != parameters.basis.n_basis) {
        return std::unexpected(ConfigError{ConfigErrorCode::InvalidBasisSize,
                                           static_cast<double>(parameters.coefficients.size())});
    }
    return SplineEvaluator(parameters, std::move(*basis));
}

SplineEvaluator::SplineEvaluator(CurveParameters parameters, ISplineBasis basis)
    : parameters_(std::move(parameters))
    , basis_(std::move(basis))
{}

double SplineEvaluator::operator()(double x) const {
    std::vector<double> row(basis_.n_basis());
    basis_.evaluate_row(x, row);

    double value = parameters_.intercept;
    for (size_t j = 0; j < row.size(); ++j) {
        value += parameters_.coefficients[j] * row[j];
    }
    return value;
}

std::vector<double> SplineEvaluator::evaluate(std::span<const double> points) const {
    const Eigen::MatrixXd I = basis_.evaluate(points);
    const Eigen::Map<const Eigen::VectorXd> c(parameters_.coefficients.data(),
                                              static_cast<Eigen::Index>(parameters_.coefficients.size()));

    Eigen::VectorXd values = I * c;
    values.array() += parameters_.intercept;
    return std::vector<double>(values.data(), values.data() + values.size());
}

bool SplineEvaluator::is_monotone(size_t n_grid, double tolerance) const {
    const auto grid = uniform_grid(parameters_.basis.x_min, parameters_.basis.x_max, n_grid);
    const auto values = evaluate(grid);

    for (size_t i = 1; i < values.size(); ++i) {
        const double diff = values[i] - values[i - 1];
        if (diff < -tolerance) {
            MONOCURVE_TRACE_MONOTONICITY_VIOLATION(MODULE_MONOTONE_FIT, i, diff);
            return false;
        }
    }
    return true;
}

std::expected<std::vector<double>, ConfigError>
evaluate_spline(std::span<const double> points, const CurveParameters& parameters) {
    auto evaluator = SplineEvaluator::create(parameters);
    if (!evaluator) {
        return std::unexpected(evaluator.error());
    }
    return evaluator->evaluate(points);
}

std::expected<double, ConfigError>
evaluate_spline(double x, const CurveParameters& parameters) {
    auto evaluator = SplineEvaluator::create(parameters);
    if (!evaluator) {
        return std::unexpected(evaluator.error());
    }
    return (*evaluator)(x);
}

std::expected<bool, ConfigError>
check_monotone(const CurveParameters& parameters, size_t n_grid, double tolerance) {
    auto evaluator = SplineEvaluator::create(parameters);
    if (!evaluator) {
        return std::unexpected(evaluator.error());
    }
    return evaluator->is_monotone(n_grid, tolerance);
}

}  // namespace monocurve
