// SPDX-License-Identifier: MIT
/**
 * @file lbfgs.hpp
 * @brief L-BFGS minimization through LBFGSpp
 *
 * Runs LBFGSpp::LBFGSBSolver (More-Thuente line search) for the fitters,
 * configured by LBFGSConfig and reported as LBFGSResult. Bound constraints
 * are expressed by the caller through reparameterization (see softplus in
 * smooth_transforms.hpp), so the solver runs with infinite bounds.
 *
 * Termination:
 * - ‖∇f‖∞ ≤ gtol (converged)
 * - |f_{k-1} - f_k| / max(|f_{k-1}|, |f_k|, 1) ≤ ftol (converged)
 * - max_iter iterations (not converged)
 * - solver throws from the line search (not converged, best point kept)
 */

#pragma once

#include "monocurve/support/error_types.hpp"
#include "monocurve/support/monocurve_trace.h"
#include <Eigen/Dense>
#include <LBFGSB.h>
#include <cmath>
#include <concepts>
#include <cstddef>
#include <exception>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace monocurve {

/// Configuration for the L-BFGS minimizer
struct LBFGSConfig {
    /// Maximum number of iterations
    size_t max_iter = 2000;

    /// Number of correction pairs kept for the inverse-Hessian estimate
    size_t history = 10;

    /// Relative objective-reduction tolerance
    double ftol = 1e-12;

    /// Infinity-norm gradient tolerance
    double gtol = 1e-8;

    /// Objective evaluations allowed per line search
    size_t max_line_search = 40;

    double c1 = 1e-4;  ///< Sufficient decrease (Armijo) constant
    double c2 = 0.9;   ///< Curvature constant
};

/// Result of an L-BFGS run
struct LBFGSResult {
    /// Final iterate (best point reached even when not converged)
    Eigen::VectorXd x;

    /// Objective at x
    double f;

    /// Number of solver iterations (0 when the line search aborted the run)
    size_t iterations;

    /// Number of objective/gradient evaluations
    size_t evaluations;

    /// True if gtol or ftol was met
    bool converged;

    /// Why the run stopped without converging
    std::optional<std::string> failure_reason;
};

/// Objective returning f(x) and writing ∇f(x) into grad
///
/// grad is pre-sized to x.size() by the caller.
template<typename F>
concept GradientObjective = requires(F f, const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
    { f(x, grad) } -> std::convertible_to<double>;
};

/// Validate L-BFGS settings
///
/// Accepts exactly the settings LBFGSpp::LBFGSBParam::check_param accepts.
///
/// @return ConfigError{InvalidOptimizerSettings} naming the offending value, or nullopt
[[nodiscard]] inline std::optional<ConfigError> validate_lbfgs_config(const LBFGSConfig& config) {
    constexpr auto kIntMax = static_cast<size_t>(std::numeric_limits<int>::max());
    if (config.max_iter == 0 || config.max_iter > kIntMax) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, static_cast<double>(config.max_iter)};
    }
    if (config.history == 0 || config.history > kIntMax) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, static_cast<double>(config.history)};
    }
    if (config.max_line_search == 0 || config.max_line_search > kIntMax) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings,
                           static_cast<double>(config.max_line_search)};
    }
    if (!(config.ftol >= 0.0)) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, config.ftol};
    }
    if (!(config.gtol >= 0.0)) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, config.gtol};
    }
    if (!(config.c1 > 0.0 && config.c1 < 0.5)) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, config.c1};
    }
    if (!(config.c2 > config.c1 && config.c2 < 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidOptimizerSettings, config.c2};
    }
    return std::nullopt;
}

namespace detail {

/// Solver parameters for a validated config
inline LBFGSpp::LBFGSBParam<double> to_lbfgsb_param(const LBFGSConfig& config) {
    LBFGSpp::LBFGSBParam<double> param;
    param.m = static_cast<int>(config.history);
    param.epsilon = config.gtol;
    param.epsilon_rel = 0.0;
    param.past = 1;
    param.delta = config.ftol;
    param.max_iterations = static_cast<int>(config.max_iter);
    param.max_linesearch = static_cast<int>(config.max_line_search);
    param.ftol = config.c1;
    param.wolfe = config.c2;
    return param;
}

/// Counts evaluations and remembers the lowest finite one
///
/// LBFGSpp leaves x at the last trial point when the line search throws,
/// so the best evaluated point is tracked here.
template<typename F>
class TrackedObjective {
public:
    TrackedObjective(F& fun, const Eigen::VectorXd& x0, double f0, const Eigen::VectorXd& g0)
        : fun_(fun), best_x_(x0), best_g_(g0), best_f_(f0) {}

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) {
        const double f = fun_(x, grad);
        ++evaluations_;
        if (std::isfinite(f) && f < best_f_) {
            best_f_ = f;
            best_x_ = x;
            best_g_ = grad;
        }
        return f;
    }

    const Eigen::VectorXd& best_x() const noexcept { return best_x_; }
    const Eigen::VectorXd& best_grad() const noexcept { return best_g_; }
    double best_f() const noexcept { return best_f_; }
    size_t evaluations() const noexcept { return evaluations_; }

private:
    F& fun_;
    Eigen::VectorXd best_x_;
    Eigen::VectorXd best_g_;
    double best_f_;
    size_t evaluations_ = 0;
};

}  // namespace detail

/// Minimize fun starting from x0 using L-BFGS
///
/// The objective must be continuously differentiable.
///
/// @tparam F Objective satisfying GradientObjective
/// @param fun Objective and gradient
/// @param x0 Starting point
/// @param config Optimizer settings (assumed validated)
/// @return Final iterate and convergence status
template<GradientObjective F>
LBFGSResult lbfgs_minimize(F&& fun, Eigen::VectorXd x0, const LBFGSConfig& config) {
    const auto n = x0.size();
    Eigen::VectorXd g0(n);
    const double f0 = fun(x0, g0);

    MONOCURVE_TRACE_OPTIMIZER_START(static_cast<size_t>(n), config.max_iter, f0);

    auto finish = [&](Eigen::VectorXd x, double f, size_t iterations, size_t evaluations,
                      bool converged, std::optional<std::string> reason) {
        MONOCURVE_TRACE_OPTIMIZER_COMPLETE(iterations, f, converged ? 1 : 0);
        return LBFGSResult{
            .x = std::move(x),
            .f = f,
            .iterations = iterations,
            .evaluations = evaluations,
            .converged = converged,
            .failure_reason = std::move(reason)
        };
    };

    if (!std::isfinite(f0) || !g0.allFinite()) {
        return finish(std::move(x0), f0, 0, 1, false, "Objective is not finite at the starting point");
    }
    if (n == 0 || g0.template lpNorm<Eigen::Infinity>() <= config.gtol) {
        return finish(std::move(x0), f0, 0, 1, true, std::nullopt);
    }

    using Objective = std::remove_reference_t<F>;
    detail::TrackedObjective<Objective> tracked(fun, x0, f0, g0);

    const Eigen::VectorXd lower = Eigen::VectorXd::Constant(n, -std::numeric_limits<double>::infinity());
    const Eigen::VectorXd upper = Eigen::VectorXd::Constant(n, std::numeric_limits<double>::infinity());
    LBFGSpp::LBFGSBSolver<double> solver(detail::to_lbfgsb_param(config));

    // Keep the best evaluated point when the solver throws
    auto aborted = [&](const std::exception& e) {
        const bool at_minimum = tracked.best_grad().template lpNorm<Eigen::Infinity>() <= config.gtol;
        std::optional<std::string> reason;
        if (!at_minimum) {
            reason = e.what();
        }
        return finish(tracked.best_x(), tracked.best_f(), 0, 1 + tracked.evaluations(),
                      at_minimum, std::move(reason));
    };

    Eigen::VectorXd x = x0;
    double fx = f0;
    try {
        const int niter = solver.minimize(tracked, x, fx, lower, upper);
        const auto iterations = static_cast<size_t>(niter);
        const double grad_norm = solver.final_grad_norm();
        MONOCURVE_TRACE_OPTIMIZER_ITER(iterations, fx, grad_norm, 0.0);

        const bool converged = iterations < config.max_iter || grad_norm <= config.gtol;
        std::optional<std::string> reason;
        if (!converged) {
            reason = "Maximum number of iterations reached";
        }
        return finish(std::move(x), fx, iterations, 1 + tracked.evaluations(), converged, std::move(reason));
    } catch (const std::runtime_error& e) {
        // Line search exhausted its budget or the step underflowed
        return aborted(e);
    } catch (const std::logic_error& e) {
        // Search direction is not a descent direction
        return aborted(e);
    }
}

}  // namespace monocurve
