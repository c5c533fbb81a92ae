// SPDX-License-Identifier: MIT
/**
 * @file lbfgs_test.cc
 * @brief Tests for the LBFGSpp-backed minimizer and its settings
 */

#include <gtest/gtest.h>
#include "monocurve/math/lbfgs.hpp"

#include <cmath>
#include <limits>

using namespace monocurve;

namespace {

/// Separable quadratic Σ a_i (x_i - b_i)²
struct Quadratic {
    Eigen::VectorXd a;
    Eigen::VectorXd b;

    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) const {
        const Eigen::VectorXd r = x - b;
        grad = 2.0 * a.cwiseProduct(r);
        return a.dot(r.cwiseProduct(r));
    }
};

struct Rosenbrock {
    double operator()(const Eigen::VectorXd& x, Eigen::VectorXd& grad) const {
        const double u = 1.0 - x(0);
        const double v = x(1) - x(0) * x(0);
        grad(0) = -2.0 * u - 400.0 * x(0) * v;
        grad(1) = 200.0 * v;
        return u * u + 100.0 * v * v;
    }
};

}  // namespace

// ===========================================================================
// Convergence
// ===========================================================================

TEST(LBFGSTest, MinimizesIllConditionedQuadratic) {
    Eigen::VectorXd a(4), b(4);
    a << 1.0, 10.0, 100.0, 1000.0;
    b << 1.0, -2.0, 0.5, 3.0;
    Quadratic q{a, b};

    auto result = lbfgs_minimize(q, Eigen::VectorXd::Zero(4), LBFGSConfig{});

    EXPECT_TRUE(result.converged);
    EXPECT_FALSE(result.failure_reason.has_value());
    for (Eigen::Index i = 0; i < 4; ++i) {
        EXPECT_NEAR(result.x(i), b(i), 1e-5) << "component " << i;
    }
    EXPECT_LT(result.f, 1e-9);
    EXPECT_GT(result.iterations, 0u);
    EXPECT_GE(result.evaluations, result.iterations);
}

TEST(LBFGSTest, MinimizesRosenbrock) {
    Eigen::VectorXd x0(2);
    x0 << -1.2, 1.0;

    auto result = lbfgs_minimize(Rosenbrock{}, x0, LBFGSConfig{});

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x(0), 1.0, 1e-4);
    EXPECT_NEAR(result.x(1), 1.0, 1e-4);
}

TEST(LBFGSTest, StartAtOptimumTakesNoSteps) {
    Eigen::VectorXd a = Eigen::VectorXd::Ones(3);
    Eigen::VectorXd b(3);
    b << 1.0, 2.0, 3.0;
    Quadratic q{a, b};

    auto result = lbfgs_minimize(q, b, LBFGSConfig{});

    EXPECT_TRUE(result.converged);
    EXPECT_EQ(result.iterations, 0u);
    EXPECT_EQ(result.evaluations, 1u);
    EXPECT_DOUBLE_EQ(result.f, 0.0);
}

TEST(LBFGSTest, SmallHistoryStillConverges) {
    Eigen::VectorXd a(3), b(3);
    a << 1.0, 50.0, 2500.0;
    b << -1.0, 1.0, 2.0;
    Quadratic q{a, b};

    LBFGSConfig config;
    config.history = 1;
    auto result = lbfgs_minimize(q, Eigen::VectorXd::Zero(3), config);

    EXPECT_TRUE(result.converged);
    EXPECT_NEAR(result.x(2), 2.0, 1e-5);
}

// ===========================================================================
// Failure modes
// ===========================================================================

TEST(LBFGSTest, IterationLimitReportsNotConverged) {
    Eigen::VectorXd x0(2);
    x0 << -1.2, 1.0;

    LBFGSConfig config;
    config.max_iter = 1;
    auto result = lbfgs_minimize(Rosenbrock{}, x0, config);

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 1u);
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, "Maximum number of iterations reached");
    EXPECT_TRUE(std::isfinite(result.f));
}

TEST(LBFGSTest, NonFiniteStartIsReported) {
    auto bad = [](const Eigen::VectorXd&, Eigen::VectorXd& grad) {
        grad.setZero();
        return std::numeric_limits<double>::quiet_NaN();
    };

    auto result = lbfgs_minimize(bad, Eigen::VectorXd::Zero(2), LBFGSConfig{});

    EXPECT_FALSE(result.converged);
    EXPECT_EQ(result.iterations, 0u);
    ASSERT_TRUE(result.failure_reason.has_value());
    EXPECT_EQ(*result.failure_reason, "Objective is not finite at the starting point");
}

// ===========================================================================
// Settings validation
// ===========================================================================

TEST(LBFGSTest, DefaultConfigIsValid) {
    EXPECT_FALSE(validate_lbfgs_config(LBFGSConfig{}).has_value());
}

TEST(LBFGSTest, RejectsInvalidSettings) {
    LBFGSConfig zero_iter;
    zero_iter.max_iter = 0;
    auto err = validate_lbfgs_config(zero_iter);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::InvalidOptimizerSettings);

    LBFGSConfig zero_history;
    zero_history.history = 0;
    EXPECT_TRUE(validate_lbfgs_config(zero_history).has_value());

    LBFGSConfig inverted_wolfe;
    inverted_wolfe.c1 = 0.95;
    inverted_wolfe.c2 = 0.9;
    EXPECT_TRUE(validate_lbfgs_config(inverted_wolfe).has_value());

    LBFGSConfig loose_armijo;
    loose_armijo.c1 = 0.5;
    err = validate_lbfgs_config(loose_armijo);
    ASSERT_TRUE(err.has_value());
    EXPECT_DOUBLE_EQ(err->value, 0.5);

    LBFGSConfig zero_line_search;
    zero_line_search.max_line_search = 0;
    EXPECT_TRUE(validate_lbfgs_config(zero_line_search).has_value());

    LBFGSConfig negative_tol;
    negative_tol.gtol = -1.0;
    err = validate_lbfgs_config(negative_tol);
    ASSERT_TRUE(err.has_value());
    EXPECT_DOUBLE_EQ(err->value, -1.0);
}
