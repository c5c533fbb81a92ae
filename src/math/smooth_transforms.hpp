// SPDX-License-Identifier: MIT
#pragma once

#include <algorithm>
#include <cmath>

namespace monocurve {

/// Above this argument softplus(t) and t agree to double precision
inline constexpr double kSoftplusLinearThreshold = 30.0;

/// softplus(t) = log(1 + e^t), overflow-free
///
/// Maps the real line onto (0, ∞). Used to turn unconstrained optimizer
/// parameters into non-negative basis coefficients.
[[nodiscard]] inline double softplus(double t) noexcept {
    if (t > kSoftplusLinearThreshold) {
        return t;
    }
    return std::log1p(std::exp(t));
}

/// Logistic sigmoid 1 / (1 + e^-t), also the derivative of softplus
[[nodiscard]] inline double sigmoid(double t) noexcept {
    if (t >= 0.0) {
        return 1.0 / (1.0 + std::exp(-t));
    }
    const double e = std::exp(t);
    return e / (1.0 + e);
}

/// Log-odds log(p / (1 - p))
///
/// Returns ±∞ at p = 1 and p = 0; callers clamp first.
[[nodiscard]] inline double logit(double p) noexcept {
    return std::log(p / (1.0 - p));
}

/// Log-odds of p after clamping to [lo, hi]
[[nodiscard]] inline double clamped_logit(double p, double lo = 0.01, double hi = 0.99) noexcept {
    return logit(std::clamp(p, lo, hi));
}

}  // namespace monocurve
