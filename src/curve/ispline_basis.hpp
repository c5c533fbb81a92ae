// SPDX-License-Identifier: MIT
/**
 * @file ispline_basis.hpp
 * @brief Monotone I-spline basis built from clamped B-splines
 *
 * Each basis function I_j is a reverse cumulative sum of B-splines, so every
 * column is non-decreasing in x. A non-negative combination of columns plus
 * an intercept is therefore a non-decreasing curve.
 *
 * Construction for n_basis functions of degree p on [x_min, x_max]:
 * 1. Clamped B-spline basis B_0..B_{n_basis} (n_basis+1 functions, order p+1)
 * 2. I_j = Σ_{l=j+1..n_basis} B_l  (B_0 is dropped)
 * 3. I_j /= I_j(x_max)  (divisor 1 when the value is zero)
 *
 * Inside the domain every column lies in [0, 1], is 0 at x_min and 1 at
 * x_max. Outside the domain the end polynomial pieces are continued.
 *
 * Example:
 * @code
 * auto basis = ISplineBasis::create({.n_basis = 6, .degree = 3, .x_min = 2.0, .x_max = 4.0});
 * if (basis) {
 *     Eigen::MatrixXd I = basis->evaluate(points);  // points.size() × 6
 * }
 * @endcode
 */

#pragma once

#include "monocurve/support/error_types.hpp"
#include <Eigen/Dense>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace monocurve {

/// Basis size, degree and domain of an I-spline basis
struct BasisConfig {
    size_t n_basis = 6;   ///< Number of I-spline functions (≥ 1, ≥ degree)
    size_t degree = 3;    ///< Polynomial degree of the underlying B-splines
    double x_min = 0.0;   ///< Left domain bound
    double x_max = 1.0;   ///< Right domain bound (> x_min)
};

/// Validate basis configuration
///
/// @return ConfigError{InvalidBasisSize} if n_basis is 0 or below degree,
///         ConfigError{InvalidDomainBounds} if bounds are not finite or not ordered
[[nodiscard]] std::optional<ConfigError> validate_basis_config(const BasisConfig& config);

/// Knot sequence for a basis configuration
///
/// degree+1 repeated knots at each bound plus n_basis - degree evenly spaced
/// interior knots. A pure function of the configuration.
[[nodiscard]] std::vector<double> make_knots(const BasisConfig& config);

/// I-spline basis with its knot sequence and normalization precomputed
class ISplineBasis {
public:
    /// Create basis for a configuration
    ///
    /// @return Basis, or ConfigError if the configuration is invalid
    [[nodiscard]] static std::expected<ISplineBasis, ConfigError> create(const BasisConfig& config);

    /// Evaluate all basis functions at each point
    ///
    /// @param points Evaluation points (may lie outside the domain)
    /// @return Matrix of shape points.size() × n_basis
    [[nodiscard]] Eigen::MatrixXd evaluate(std::span<const double> points) const;

    /// Evaluate all basis functions at a single point
    ///
    /// @param x Evaluation point
    /// @param row Output, size n_basis
    void evaluate_row(double x, std::span<double> row) const;

    [[nodiscard]] const BasisConfig& config() const noexcept { return config_; }
    [[nodiscard]] const std::vector<double>& knots() const noexcept { return knots_; }
    [[nodiscard]] size_t n_basis() const noexcept { return config_.n_basis; }

private:
    ISplineBasis(BasisConfig config, std::vector<double> knots);

    /// Unnormalized cumulative row: Σ_{l>j} B_l(x)
    void cumulative_row(double x, std::span<double> row,
                        std::span<double> bspline, std::span<double> scratch) const;

    BasisConfig config_;
    std::vector<double> knots_;
    std::vector<double> scale_;   ///< 1 / I_j(x_max), or 1 when I_j(x_max) = 0
};

/// Evaluate the I-spline basis for a configuration at the given points
///
/// Convenience wrapper around ISplineBasis::create() and evaluate().
///
/// @return Matrix of shape points.size() × n_basis, or ConfigError
[[nodiscard]] std::expected<Eigen::MatrixXd, ConfigError>
build_ispline_basis(std::span<const double> points, const BasisConfig& config);

}  // namespace monocurve
