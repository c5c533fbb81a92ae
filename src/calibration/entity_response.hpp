// SPDX-License-Identifier: MIT
/**
 * @file entity_response.hpp
 * @brief Per-entity logistic response on the additive score
 *
 * Each entity (e.g. an institution with its own selection rate) responds to
 * the calibrated score C = f_A(a) + f_B(b) through
 *
 *   logit P = intercept + slope · C
 *
 * The intercept comes from the entity's observed rate. The slope comes from
 * the score spread between a low and a high reference point of the entity's
 * population: a narrow spread means the entity discriminates steeply on
 * the score. The raw slope is shrunk toward a group default and clamped.
 *
 * A two-stage entity (e.g. screening then final selection) uses a second
 * intercept from its second-stage rate and a flatter second-stage slope.
 */

#pragma once

#include "monocurve/calibration/additive_logit_model.hpp"
#include "monocurve/support/error_types.hpp"
#include <expected>
#include <optional>
#include <span>

namespace monocurve {

/// Settings for entity response derivation
struct EntityResponseConfig {
    double rate_floor = 0.01;          ///< Observed rates are clamped to [floor, ceiling]
    double rate_ceiling = 0.99;
    double min_score_spread = 0.1;     ///< Below this the group slope is used as raw slope
    double shrinkage = 0.5;            ///< Weight of the group slope in the blend
    double slope_min = 0.3;
    double slope_max = 2.0;
    double stage2_ratio = 0.5;         ///< Second-stage slope as a fraction of the first
    double default_stage1_rate = 0.10; ///< Used when the stage-1 rate is missing or ≤ 0
    double default_stage2_rate = 0.40; ///< Used when the stage-2 rate is missing or ≤ 0
};

/// Reference point of an entity's population in factor space
struct ReferencePoint {
    double level_a;
    double level_b;
};

/// logit P = intercept + slope · score
struct EntityResponse {
    double intercept;
    double slope;
};

/// Slope derived from an entity's score spread
struct SlopeEstimate {
    double slope;           ///< First-stage slope after shrinkage and clamping
    double stage2_slope;    ///< stage2_ratio · slope
    double score_spread;    ///< C(high) - C(low)
    bool used_spread;       ///< False when the spread was too small and the group slope was used
};

/// Inputs describing one entity
struct EntityObservation {
    std::optional<double> stage1_rate;   ///< Observed first-stage rate
    std::optional<double> stage2_rate;   ///< Observed second-stage rate
    ReferencePoint low;                  ///< e.g. 25th percentile of the entity's population
    ReferencePoint high;                 ///< e.g. 75th percentile
    double group_slope = 1.0;            ///< Default slope of the entity's group
};

/// Both stages of an entity's response
struct TwoStageResponse {
    EntityResponse stage1;
    EntityResponse stage2;
    SlopeEstimate slope;
};

/// Validate entity response settings
[[nodiscard]] std::optional<ConfigError> validate_entity_config(const EntityResponseConfig& config);

/// Intercept from an observed rate
///
/// logit of the rate clamped to [rate_floor, rate_ceiling]; the default rate
/// is used when the observed rate is missing, non-finite or non-positive.
[[nodiscard]] double derive_intercept(std::optional<double> observed_rate,
                                      double default_rate,
                                      const EntityResponseConfig& config = {});

/// Slope from the score spread between two reference points
///
/// raw = 1 / (C(high) - C(low)) when the spread exceeds min_score_spread,
/// otherwise group_slope; then slope = clamp(shrinkage · group_slope +
/// (1 - shrinkage) · raw, slope_min, slope_max).
[[nodiscard]] SlopeEstimate derive_slope(const AdditiveLogitModel& model,
                                         const ReferencePoint& low,
                                         const ReferencePoint& high,
                                         double group_slope,
                                         const EntityResponseConfig& config = {});

/// Derive both stages of an entity's response
[[nodiscard]] std::expected<TwoStageResponse, ConfigError>
derive_entity_response(const AdditiveLogitModel& model,
                       const EntityObservation& entity,
                       const EntityResponseConfig& config = {});

/// P = 1 / (1 + exp(-(intercept + slope · score)))
[[nodiscard]] double response_probability(const EntityResponse& response, double score);

/// Probability of passing both stages at a given score
[[nodiscard]] double two_stage_probability(const TwoStageResponse& response, double score);

/// Probability of at least one success among independent trials: 1 - Π(1 - p_i)
[[nodiscard]] double probability_at_least_one(std::span<const double> probabilities);

}  // namespace monocurve
