// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "monocurve/calibration/additive_logit_model.hpp"
#include "monocurve/math/smooth_transforms.hpp"

#include <cmath>
#include <limits>
#include <vector>

using namespace monocurve;

namespace {

/// f(x) = intercept + slope · (x - x_min) on [x_min, x_max]
CurveParameters linear_curve(double x_min, double x_max, double slope, double intercept) {
    BasisConfig basis{.n_basis = 1, .degree = 1, .x_min = x_min, .x_max = x_max};
    return CurveParameters{
        .coefficients = {slope * (x_max - x_min)},
        .intercept = intercept,
        .basis = basis,
        .knots = make_knots(basis)
    };
}

class AdditiveLogitModelTest : public ::testing::Test {
protected:
    void SetUp() override {
        // f_A(a) = 0.5 (a - 1), f_B(b) = 0.25 (b - 2), g = -1
        auto model = AdditiveLogitModel::create(linear_curve(1.0, 5.0, 0.5, 0.0),
                                                linear_curve(0.0, 4.0, 0.25, -0.5),
                                                -1.0);
        ASSERT_TRUE(model.has_value());
        model_.emplace(std::move(*model));
    }

    const AdditiveLogitModel& model() const { return *model_; }

private:
    std::optional<AdditiveLogitModel> model_;
};

}  // namespace

// ===========================================================================
// Evaluation
// ===========================================================================

TEST_F(AdditiveLogitModelTest, ScoreIsZeroAtAnchorPair) {
    EXPECT_NEAR(model().score(1.0, 2.0), 0.0, 1e-12);
    EXPECT_NEAR(model().logit(1.0, 2.0), -1.0, 1e-12);
    EXPECT_NEAR(model().probability(1.0, 2.0), sigmoid(-1.0), 1e-12);
}

TEST_F(AdditiveLogitModelTest, ScoreIsAdditive) {
    EXPECT_NEAR(model().score(3.0, 4.0), 1.0 + 0.5, 1e-12);
    EXPECT_NEAR(model().logit(3.0, 4.0), -1.0 + 1.5, 1e-12);
    EXPECT_NEAR(model().probability(5.0, 0.0), sigmoid(-1.0 + 2.0 - 0.5), 1e-12);
}

TEST_F(AdditiveLogitModelTest, ProbabilityIsMonotoneInBothFactors) {
    double prev = 0.0;
    for (double a = 1.0; a <= 5.0; a += 0.5) {
        const double p = model().probability(a, 1.0);
        EXPECT_GE(p, prev);
        prev = p;
    }
    prev = 0.0;
    for (double b = 0.0; b <= 4.0; b += 0.5) {
        const double p = model().probability(3.0, b);
        EXPECT_GE(p, prev);
        prev = p;
    }
}

TEST_F(AdditiveLogitModelTest, GridMatchesPointwise) {
    std::vector<double> levels_a = {1.0, 2.0, 4.5};
    std::vector<double> levels_b = {0.0, 3.0};
    Eigen::MatrixXd grid = model().probability_grid(levels_a, levels_b);
    ASSERT_EQ(grid.rows(), 3);
    ASSERT_EQ(grid.cols(), 2);
    for (size_t i = 0; i < levels_a.size(); ++i) {
        for (size_t j = 0; j < levels_b.size(); ++j) {
            EXPECT_NEAR(grid(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)),
                        model().probability(levels_a[i], levels_b[j]), 1e-12);
        }
    }
}

TEST_F(AdditiveLogitModelTest, CompareCellsReportsResiduals) {
    std::vector<ObservationCell> cells = {
        {.level_a = 1.0, .level_b = 2.0, .probability = 0.3, .weight = 2.0},
        {.level_a = 3.0, .level_b = 4.0, .probability = 0.6, .weight = std::nullopt},
    };
    auto comparisons = model().compare_cells(cells);
    ASSERT_TRUE(comparisons.has_value());
    ASSERT_EQ(comparisons->size(), 2u);

    const auto& first = (*comparisons)[0];
    EXPECT_DOUBLE_EQ(first.observed, 0.3);
    EXPECT_NEAR(first.predicted, sigmoid(-1.0), 1e-12);
    EXPECT_NEAR(first.residual, 0.3 - sigmoid(-1.0), 1e-12);
    EXPECT_DOUBLE_EQ(first.weight, 2.0);

    EXPECT_DOUBLE_EQ((*comparisons)[1].weight, 1.0);
    EXPECT_DOUBLE_EQ((*comparisons)[1].level_a, 3.0);
}

TEST_F(AdditiveLogitModelTest, CompareCellsRejectsIncompleteCell) {
    std::vector<ObservationCell> cells = {
        {.level_a = 1.0, .level_b = 2.0, .probability = 0.3, .weight = 1.0},
        {.level_a = 3.0, .level_b = std::nullopt, .probability = 0.6, .weight = 1.0},
    };
    auto comparisons = model().compare_cells(cells);
    ASSERT_FALSE(comparisons.has_value());
    EXPECT_EQ(comparisons.error().code, ValidationErrorCode::MissingLevelB);
    EXPECT_EQ(comparisons.error().index, 1u);
}

// ===========================================================================
// Construction
// ===========================================================================

TEST(AdditiveLogitModelCreateTest, RejectsNonFiniteIntercept) {
    auto model = AdditiveLogitModel::create(linear_curve(0.0, 1.0, 1.0, 0.0),
                                            linear_curve(0.0, 1.0, 1.0, 0.0),
                                            std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(model.has_value());
    EXPECT_EQ(model.error().code, ConfigErrorCode::NonFiniteAnchor);
}

TEST(AdditiveLogitModelCreateTest, RejectsInvalidCurve) {
    auto broken = linear_curve(0.0, 1.0, 1.0, 0.0);
    broken.coefficients.push_back(1.0);
    auto model = AdditiveLogitModel::create(linear_curve(0.0, 1.0, 1.0, 0.0), broken, 0.0);
    ASSERT_FALSE(model.has_value());
    EXPECT_EQ(model.error().code, ConfigErrorCode::InvalidBasisSize);
}

TEST(AdditiveLogitModelCreateTest, FromCalibrationUsesItsIntercept) {
    TwoFactorCalibration calibration{
        .curve_a = linear_curve(0.0, 1.0, 1.0, 0.0),
        .curve_b = linear_curve(0.0, 1.0, 2.0, 0.0),
        .global_intercept = -0.5,
        .diagnostics = {},
        .discrete_a = {},
        .discrete_b = {}
    };
    auto model = AdditiveLogitModel::from_calibration(calibration);
    ASSERT_TRUE(model.has_value());
    EXPECT_DOUBLE_EQ(model->global_intercept(), -0.5);
    EXPECT_NEAR(model->logit(1.0, 1.0), -0.5 + 1.0 + 2.0, 1e-12);
}
