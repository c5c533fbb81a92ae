// SPDX-License-Identifier: MIT
#pragma once

#include "monocurve/curve/ispline_basis.hpp"
#include <cstddef>
#include <numeric>
#include <string>
#include <vector>

namespace monocurve {

/// Fitted monotone curve f(x) = intercept + Σ_j coefficients[j] · I_j(x)
///
/// Coefficients are non-negative, so f is non-decreasing on [x_min, x_max]
/// and f(x_max) = intercept + Σ coefficients.
struct CurveParameters {
    std::vector<double> coefficients;  ///< n_basis non-negative weights
    double intercept = 0.0;
    BasisConfig basis;
    std::vector<double> knots;         ///< make_knots(basis), kept for consumers

    /// Curve value at x_max
    [[nodiscard]] double value_at_max() const {
        return std::accumulate(coefficients.begin(), coefficients.end(), intercept);
    }
};

/// Quality report produced once per fit
struct FitDiagnostics {
    double rmse = 0.0;          ///< sqrt(Σ w r²) with Σ w = 1
    double r2 = 0.0;            ///< Weighted R² (0 when targets have no variance)
    bool is_monotone = true;    ///< Non-decreasing on a 200-point grid within 1e-10
    bool converged = false;     ///< Optimizer met its tolerance
    size_t iterations = 0;      ///< Iterations of the winning optimizer run
    std::string message;        ///< Optimizer stop reason, empty when converged
};

}  // namespace monocurve
