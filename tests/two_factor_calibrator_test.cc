// SPDX-License-Identifier: MIT
/**
 * @file two_factor_calibrator_test.cc
 * @brief Tests for two-stage additive logit calibration
 */

#include <gtest/gtest.h>
#include "monocurve/calibration/two_factor_calibrator.hpp"
#include "monocurve/curve/spline_evaluator.hpp"
#include "monocurve/math/smooth_transforms.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

using namespace monocurve;

namespace {

ObservationCell cell(double a, double b, double p, double w = 1.0) {
    return ObservationCell{.level_a = a, .level_b = b, .probability = p, .weight = w};
}

std::vector<ObservationCell> two_by_two() {
    return {
        cell(1.0, 1.0, 0.10),
        cell(1.0, 2.0, 0.20),
        cell(2.0, 1.0, 0.25),
        cell(2.0, 2.0, 0.45),
    };
}

TwoFactorConfig anchored_at(double anchor_a, double anchor_b) {
    TwoFactorConfig config;
    config.factor_a.anchor = anchor_a;
    config.factor_b.anchor = anchor_b;
    return config;
}

/// logit P = -2 + 0.5 (a - 1) + 0.3 (b - 1) on a 4 × 4 table
std::vector<ObservationCell> additive_table() {
    std::vector<ObservationCell> cells;
    for (int a = 1; a <= 4; ++a) {
        for (int b = 1; b <= 4; ++b) {
            const double eta = -2.0 + 0.5 * (a - 1) + 0.3 * (b - 1);
            cells.push_back(cell(a, b, sigmoid(eta)));
        }
    }
    return cells;
}

bool non_decreasing(const std::vector<double>& v) {
    return std::is_sorted(v.begin(), v.end());
}

bool has_warning(const TwoFactorDiagnostics& d, const std::string& text) {
    return std::any_of(d.warnings.begin(), d.warnings.end(),
                       [&](const std::string& w) { return w.find(text) != std::string::npos; });
}

}  // namespace

// ===========================================================================
// Calibration behaviour
// ===========================================================================

TEST(TwoFactorCalibratorTest, TwoByTwoTable) {
    auto cells = two_by_two();
    auto result = calibrate_two_factor(cells, anchored_at(1.0, 1.0));
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& r = *result;
    EXPECT_EQ(r.discrete_a.levels, (std::vector<double>{1.0, 2.0}));
    EXPECT_EQ(r.discrete_b.levels, (std::vector<double>{1.0, 2.0}));
    EXPECT_EQ(r.discrete_a.anchor_index, 0u);
    EXPECT_EQ(r.discrete_b.anchor_index, 0u);

    EXPECT_TRUE(non_decreasing(r.discrete_a.effects));
    EXPECT_TRUE(non_decreasing(r.discrete_b.effects));
    EXPECT_DOUBLE_EQ(r.discrete_a.effects[0], 0.0);
    EXPECT_DOUBLE_EQ(r.discrete_b.effects[0], 0.0);
    EXPECT_GT(r.discrete_a.effects[1], r.discrete_b.effects[1]);

    EXPECT_NEAR(r.global_intercept, logit(0.10), 0.1);

    auto fa = evaluate_spline(1.0, r.curve_a);
    auto fb = evaluate_spline(1.0, r.curve_b);
    ASSERT_TRUE(fa.has_value());
    ASSERT_TRUE(fb.has_value());
    EXPECT_NEAR(*fa, 0.0, 1e-9);
    EXPECT_NEAR(*fb, 0.0, 1e-9);

    EXPECT_EQ(r.diagnostics.n_cells_used, 4u);
    EXPECT_TRUE(r.diagnostics.monotone_a);
    EXPECT_TRUE(r.diagnostics.monotone_b);
    EXPECT_TRUE(r.diagnostics.discrete_monotone_a);
    EXPECT_TRUE(r.diagnostics.discrete_monotone_b);
    EXPECT_TRUE(r.diagnostics.converged);
    EXPECT_DOUBLE_EQ(r.diagnostics.anchor_a, 1.0);
    EXPECT_DOUBLE_EQ(r.diagnostics.anchor_b, 1.0);
    EXPECT_LT(r.diagnostics.rmse, 0.02);
}

TEST(TwoFactorCalibratorTest, RecoversAdditiveTruth) {
    auto cells = additive_table();
    auto result = calibrate_two_factor(cells, anchored_at(1.0, 1.0));
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& d = result->diagnostics;
    EXPECT_GT(d.r2, 0.99);
    EXPECT_LT(d.rmse, 0.02);
    EXPECT_NEAR(result->global_intercept, -2.0, 0.1);

    // Discrete effects follow the true slopes
    const auto& ea = result->discrete_a.effects;
    const auto& eb = result->discrete_b.effects;
    ASSERT_EQ(ea.size(), 4u);
    ASSERT_EQ(eb.size(), 4u);
    EXPECT_NEAR(ea[3], 1.5, 0.15);
    EXPECT_NEAR(eb[3], 0.9, 0.15);

    // Continuous curves track the discrete effects
    for (size_t j = 0; j < 4; ++j) {
        auto fa = evaluate_spline(result->discrete_a.levels[j], result->curve_a);
        ASSERT_TRUE(fa.has_value());
        EXPECT_NEAR(*fa, ea[j], 0.05) << "level " << j;
    }
}

TEST(TwoFactorCalibratorTest, AnchorSnapsToNearestLevel) {
    std::vector<ObservationCell> cells;
    for (double a : {1.0, 2.0, 3.0}) {
        for (double b : {10.0, 20.0}) {
            cells.push_back(cell(a, b, 0.1 + 0.1 * a + 0.005 * b));
        }
    }

    auto near = calibrate_two_factor(cells, anchored_at(2.4, 20.0));
    ASSERT_TRUE(near.has_value()) << near.error();
    EXPECT_EQ(near->discrete_a.anchor_index, 1u);
    EXPECT_EQ(near->discrete_b.anchor_index, 1u);
    EXPECT_DOUBLE_EQ(near->discrete_a.effects[1], 0.0);

    // Tie between 2 and 3: first level wins
    auto tie = calibrate_two_factor(cells, anchored_at(2.5, 10.0));
    ASSERT_TRUE(tie.has_value()) << tie.error();
    EXPECT_EQ(tie->discrete_a.anchor_index, 1u);

    // The curve is zero at the exact anchor input, not at the snapped level
    auto at_anchor = evaluate_spline(2.4, near->curve_a);
    ASSERT_TRUE(at_anchor.has_value());
    EXPECT_NEAR(*at_anchor, 0.0, 1e-9);
}

TEST(TwoFactorCalibratorTest, ZeroWeightCellIsExcluded) {
    auto cells = two_by_two();
    cells.push_back(cell(5.0, 1.0, 0.9, 0.0));

    auto result = calibrate_two_factor(cells, anchored_at(1.0, 1.0));
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_EQ(result->discrete_a.levels, (std::vector<double>{1.0, 2.0}));
    EXPECT_EQ(result->diagnostics.n_cells_used, 4u);
    EXPECT_DOUBLE_EQ(result->curve_a.basis.x_max, 2.0);
}

TEST(TwoFactorCalibratorTest, ExtremeProbabilitiesAreClamped) {
    std::vector<ObservationCell> cells = {
        cell(1.0, 1.0, 0.0),
        cell(1.0, 2.0, 0.5),
        cell(2.0, 1.0, 0.5),
        cell(2.0, 2.0, 1.0),
    };

    auto result = calibrate_two_factor(cells, anchored_at(1.0, 1.0));
    ASSERT_TRUE(result.has_value()) << result.error();
    EXPECT_TRUE(std::isfinite(result->global_intercept));
    EXPECT_GE(result->global_intercept, logit(0.01) - 0.5);
    EXPECT_TRUE(std::isfinite(result->diagnostics.rmse));
    EXPECT_TRUE(std::isfinite(result->curve_a.intercept));
}

TEST(TwoFactorCalibratorTest, WeightsShiftTheFit) {
    // Two conflicting observations of the same cell pair
    std::vector<ObservationCell> heavy_low = {
        cell(1.0, 1.0, 0.10, 9.0),
        cell(1.0, 1.0, 0.50, 1.0),
        cell(2.0, 2.0, 0.60, 1.0),
    };
    std::vector<ObservationCell> heavy_high = {
        cell(1.0, 1.0, 0.10, 1.0),
        cell(1.0, 1.0, 0.50, 9.0),
        cell(2.0, 2.0, 0.60, 1.0),
    };

    auto low = calibrate_two_factor(heavy_low, anchored_at(1.0, 1.0));
    auto high = calibrate_two_factor(heavy_high, anchored_at(1.0, 1.0));
    ASSERT_TRUE(low.has_value());
    ASSERT_TRUE(high.has_value());
    EXPECT_LT(low->global_intercept, high->global_intercept);
}

TEST(TwoFactorCalibratorTest, LargerWeightsTightenDiscreteFit) {
    // logit P = -3 + 4 i/11 + 2 j/11 on a 12 × 12 table
    auto table = [](double w) {
        std::vector<ObservationCell> cells;
        for (int i = 0; i < 12; ++i) {
            for (int j = 0; j < 12; ++j) {
                const double eta = -3.0 + 4.0 * i / 11.0 + 2.0 * j / 11.0;
                cells.push_back(cell(i, j, sigmoid(eta), w));
            }
        }
        return cells;
    };
    auto span = [](const DiscreteEffects& e) { return e.effects.back() - e.effects.front(); };

    auto unit_cells = table(1.0);
    auto heavy_cells = table(1000.0);
    auto unit = calibrate_two_factor(unit_cells, anchored_at(0.0, 0.0));
    auto heavy = calibrate_two_factor(heavy_cells, anchored_at(0.0, 0.0));
    ASSERT_TRUE(unit.has_value()) << unit.error();
    ASSERT_TRUE(heavy.has_value()) << heavy.error();

    // Smoothness shrinks the spans; heavier data leaves less room for it
    const double unit_error_a = std::abs(span(unit->discrete_a) - 4.0);
    const double heavy_error_a = std::abs(span(heavy->discrete_a) - 4.0);
    EXPECT_LT(heavy_error_a, unit_error_a);
    EXPECT_NEAR(span(heavy->discrete_a), 4.0, 0.01);
    EXPECT_NEAR(span(heavy->discrete_b), 2.0, 0.01);
    EXPECT_NEAR(heavy->global_intercept, -3.0, 0.01);
}

TEST(TwoFactorCalibratorTest, SoftMonotonicityCanBeDisabled) {
    // Factor A decreases strongly in the data
    std::vector<ObservationCell> cells;
    const double pa[] = {0.6, 0.3, 0.1};
    for (int i = 0; i < 3; ++i) {
        cells.push_back(cell(i + 1.0, 1.0, pa[i]));
        cells.push_back(cell(i + 1.0, 2.0, pa[i] + 0.05));
    }

    TwoFactorConfig config = anchored_at(1.0, 1.0);
    config.monotonicity_weight = 0.0;
    auto result = calibrate_two_factor(cells, config);
    ASSERT_TRUE(result.has_value()) << result.error();

    const auto& d = result->diagnostics;
    EXPECT_FALSE(d.discrete_monotone_a);
    EXPECT_TRUE(has_warning(d, "discrete effects of factor A are not monotone"));
    // Stage 2 still produces a non-decreasing curve
    EXPECT_TRUE(d.monotone_a);
    for (double c : result->curve_a.coefficients) {
        EXPECT_GE(c, 0.0);
    }
}

TEST(TwoFactorCalibratorTest, SingleLevelNeedsExplicitDomain) {
    std::vector<ObservationCell> cells = {
        cell(1.0, 5.0, 0.2),
        cell(2.0, 5.0, 0.4),
    };

    auto without_domain = calibrate_two_factor(cells, anchored_at(1.0, 5.0));
    ASSERT_FALSE(without_domain.has_value());
    ASSERT_TRUE(is_config_error(without_domain.error()));
    EXPECT_EQ(std::get<ConfigError>(without_domain.error()).code, ConfigErrorCode::InvalidDomainBounds);

    TwoFactorConfig config = anchored_at(1.0, 5.0);
    config.factor_b.x_min = 0.0;
    config.factor_b.x_max = 10.0;
    auto with_domain = calibrate_two_factor(cells, config);
    ASSERT_TRUE(with_domain.has_value()) << with_domain.error();
    ASSERT_EQ(with_domain->discrete_b.effects.size(), 1u);
    EXPECT_DOUBLE_EQ(with_domain->discrete_b.effects[0], 0.0);
}

TEST(TwoFactorCalibratorTest, ReproducibleForFixedSeed) {
    auto cells = additive_table();
    auto first = calibrate_two_factor(cells, anchored_at(2.0, 3.0));
    auto second = calibrate_two_factor(cells, anchored_at(2.0, 3.0));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->global_intercept, second->global_intercept);
    EXPECT_EQ(first->curve_a.coefficients, second->curve_a.coefficients);
    EXPECT_EQ(first->curve_b.coefficients, second->curve_b.coefficients);
}

// ===========================================================================
// Input validation
// ===========================================================================

TEST(TwoFactorCalibratorTest, RejectsEmptyTable) {
    std::vector<ObservationCell> cells;
    auto result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(error_code(result.error()), static_cast<int>(ValidationErrorCode::EmptyInput));
}

TEST(TwoFactorCalibratorTest, ReportsMissingFieldsWithIndex) {
    struct Case {
        ObservationCell cell;
        ValidationErrorCode code;
    };
    const std::vector<Case> cases = {
        {{.level_a = std::nullopt, .level_b = 1.0, .probability = 0.5, .weight = 1.0},
         ValidationErrorCode::MissingLevelA},
        {{.level_a = 1.0, .level_b = std::nullopt, .probability = 0.5, .weight = 1.0},
         ValidationErrorCode::MissingLevelB},
        {{.level_a = 1.0, .level_b = 1.0, .probability = std::nullopt, .weight = 1.0},
         ValidationErrorCode::MissingProbability},
        {{.level_a = 1.0, .level_b = 1.0, .probability = 0.5, .weight = std::nullopt},
         ValidationErrorCode::MissingWeight},
    };

    for (const auto& c : cases) {
        auto cells = two_by_two();
        cells.insert(cells.begin() + 2, c.cell);
        auto result = calibrate_two_factor(cells, TwoFactorConfig{});
        ASSERT_FALSE(result.has_value());
        ASSERT_TRUE(std::holds_alternative<ValidationError>(result.error()));
        const auto& err = std::get<ValidationError>(result.error());
        EXPECT_EQ(err.code, c.code);
        EXPECT_EQ(err.index, 2u);
    }
}

TEST(TwoFactorCalibratorTest, RejectsProbabilityOutOfRange) {
    auto cells = two_by_two();
    cells[1].probability = 1.5;
    auto result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    const auto& err = std::get<ValidationError>(result.error());
    EXPECT_EQ(err.code, ValidationErrorCode::ProbabilityOutOfRange);
    EXPECT_DOUBLE_EQ(err.value, 1.5);
    EXPECT_EQ(err.index, 1u);

    cells[1].probability = std::numeric_limits<double>::quiet_NaN();
    result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(std::get<ValidationError>(result.error()).code, ValidationErrorCode::ProbabilityOutOfRange);
}

TEST(TwoFactorCalibratorTest, RejectsNonFiniteLevel) {
    auto cells = two_by_two();
    cells[3].level_b = std::numeric_limits<double>::infinity();
    auto result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    const auto& err = std::get<ValidationError>(result.error());
    EXPECT_EQ(err.code, ValidationErrorCode::NonFiniteValue);
    EXPECT_EQ(err.index, 3u);
}

TEST(TwoFactorCalibratorTest, RejectsNegativeWeight) {
    auto cells = two_by_two();
    cells[0].weight = -1.0;
    auto result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    const auto& err = std::get<ValidationError>(result.error());
    EXPECT_EQ(err.code, ValidationErrorCode::NegativeWeight);
    EXPECT_EQ(err.index, 0u);
}

TEST(TwoFactorCalibratorTest, RejectsAllZeroWeights) {
    auto cells = two_by_two();
    for (auto& c : cells) {
        c.weight = 0.0;
    }
    auto result = calibrate_two_factor(cells, TwoFactorConfig{});
    ASSERT_FALSE(result.has_value());
    ASSERT_TRUE(is_config_error(result.error()));
    EXPECT_EQ(std::get<ConfigError>(result.error()).code, ConfigErrorCode::ZeroTotalWeight);
}

// ===========================================================================
// Configuration validation
// ===========================================================================

TEST(TwoFactorCalibratorTest, DefaultConfigIsValid) {
    EXPECT_FALSE(validate_two_factor_config(TwoFactorConfig{}).has_value());
}

TEST(TwoFactorCalibratorTest, RejectsInvalidConfig) {
    TwoFactorConfig clamp;
    clamp.probability_floor = 0.6;
    clamp.probability_ceiling = 0.4;
    auto err = validate_two_factor_config(clamp);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::InvalidProbabilityClamp);

    TwoFactorConfig restarts;
    restarts.n_restarts = 0;
    err = validate_two_factor_config(restarts);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::InvalidRestartCount);

    TwoFactorConfig anchor;
    anchor.factor_b.anchor = std::numeric_limits<double>::quiet_NaN();
    err = validate_two_factor_config(anchor);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::NonFiniteAnchor);

    TwoFactorConfig basis;
    basis.factor_a.n_basis = 2;
    err = validate_two_factor_config(basis);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::InvalidBasisSize);

    TwoFactorConfig penalty;
    penalty.monotonicity_weight = -1.0;
    err = validate_two_factor_config(penalty);
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, ConfigErrorCode::NegativePenalty);

    // Errors surface through the entry point as well
    auto cells = two_by_two();
    auto result = calibrate_two_factor(cells, clamp);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(is_config_error(result.error()));
}
