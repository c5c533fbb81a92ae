// SPDX-License-Identifier: MIT
#include "monocurve/curve/ispline_basis.hpp"
#include "monocurve/math/bspline_basis.hpp"
#include "monocurve/support/monocurve_trace.h"
#include <algorithm>
#include <cmath>

namespace monocurve {

std::optional<ConfigError> validate_basis_config(const BasisConfig& config) {
    if (config.n_basis == 0 || config.n_basis < config.degree) {
        return ConfigError{ConfigErrorCode::InvalidBasisSize,
                           static_cast<double>(config.n_basis)};
    }
    if (!std::isfinite(config.x_min)) {
        return ConfigError{ConfigErrorCode::InvalidDomainBounds, config.x_min};
    }
    if (!std::isfinite(config.x_max) || !(config.x_min < config.x_max)) {
        return ConfigError{ConfigErrorCode::InvalidDomainBounds, config.x_max};
    }
    return std::nullopt;
}

std::vector<double> make_knots(const BasisConfig& config) {
    return clamped_uniform_knots<double>(config.n_basis + 1, config.degree,
                                         config.x_min, config.x_max);
}

std::expected<ISplineBasis, ConfigError> ISplineBasis::create(const BasisConfig& config) {
    if (auto err = validate_basis_config(config)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_ISPLINE_BASIS, static_cast<int>(err->code), 0, err->value);
        return std::unexpected(*err);
    }
    return ISplineBasis(config, make_knots(config));
}

ISplineBasis::ISplineBasis(BasisConfig config, std::vector<double> knots)
    : config_(config)
    , knots_(std::move(knots))
    , scale_(config.n_basis, 1.0)
{
    std::vector<double> row(config_.n_basis);
    std::vector<double> bspline(config_.n_basis + 1);
    std::vector<double> scratch(3 * (config_.degree + 1));
    cumulative_row(config_.x_max, row, bspline, scratch);

    for (size_t j = 0; j < config_.n_basis; ++j) {
        if (row[j] != 0.0) {
            scale_[j] = 1.0 / row[j];
        }
    }
}

void ISplineBasis::cumulative_row(double x, std::span<double> row,
                                  std::span<double> bspline, std::span<double> scratch) const {
    const size_t p = config_.degree;
    const size_t n_bspline = config_.n_basis + 1;

    std::span<double> N = scratch.subspan(0, p + 1);
    std::span<double> left = scratch.subspan(p + 1, p + 1);
    std::span<double> right = scratch.subspan(2 * (p + 1), p + 1);

    std::fill(bspline.begin(), bspline.end(), 0.0);
    const size_t span = find_span(knots_, p, x);
    basis_functions<double>(knots_, span, p, x, N, left, right);
    for (size_t r = 0; r <= p; ++r) {
        bspline[span - p + r] = N[r];
    }

    // Reverse cumulative sum, dropping B_0
    double acc = 0.0;
    for (size_t l = n_bspline - 1; l >= 1; --l) {
        acc += bspline[l];
        row[l - 1] = acc;
    }
}

void ISplineBasis::evaluate_row(double x, std::span<double> row) const {
    std::vector<double> bspline(config_.n_basis + 1);
    std::vector<double> scratch(3 * (config_.degree + 1));
    cumulative_row(x, row, bspline, scratch);
    for (size_t j = 0; j < config_.n_basis; ++j) {
        row[j] *= scale_[j];
    }
}

Eigen::MatrixXd ISplineBasis::evaluate(std::span<const double> points) const {
    const size_t n_points = points.size();
    const size_t n = config_.n_basis;

    Eigen::MatrixXd I(static_cast<Eigen::Index>(n_points), static_cast<Eigen::Index>(n));

    std::vector<double> row(n);
    std::vector<double> bspline(n + 1);
    std::vector<double> scratch(3 * (config_.degree + 1));

    for (size_t i = 0; i < n_points; ++i) {
        cumulative_row(points[i], row, bspline, scratch);
        for (size_t j = 0; j < n; ++j) {
            I(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = row[j] * scale_[j];
        }
    }
    return I;
}

std::expected<Eigen::MatrixXd, ConfigError>
build_ispline_basis(std::span<const double> points, const BasisConfig& config) {
    auto basis = ISplineBasis::create(config);
    if (!basis) {
        return std::unexpected(basis.error());
    }
    MONOCURVE_TRACE_ALGO_START(MODULE_ISPLINE_BASIS, points.size(), config.n_basis, config.degree);
    return basis->evaluate(points);
}

}  // namespace monocurve
