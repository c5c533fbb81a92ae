// SPDX-License-Identifier: MIT
#include "monocurve/calibration/entity_response.hpp"
#include "monocurve/math/smooth_transforms.hpp"
#include "monocurve/support/monocurve_trace.h"
#include <algorithm>
#include <cmath>

namespace monocurve {

std::optional<ConfigError> validate_entity_config(const EntityResponseConfig& config) {
    if (!(config.rate_floor > 0.0 && config.rate_floor < config.rate_ceiling
          && config.rate_ceiling < 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidProbabilityClamp, config.rate_floor};
    }
    if (!(config.shrinkage >= 0.0 && config.shrinkage <= 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidShrinkage, config.shrinkage};
    }
    if (!(config.min_score_spread > 0.0) || !std::isfinite(config.min_score_spread)) {
        return ConfigError{ConfigErrorCode::InvalidShrinkage, config.min_score_spread};
    }
    if (!(config.slope_min > 0.0 && config.slope_min <= config.slope_max)
        || !std::isfinite(config.slope_max)) {
        return ConfigError{ConfigErrorCode::InvalidShrinkage, config.slope_min};
    }
    if (!(config.stage2_ratio >= 0.0) || !std::isfinite(config.stage2_ratio)) {
        return ConfigError{ConfigErrorCode::InvalidShrinkage, config.stage2_ratio};
    }
    if (!(config.default_stage1_rate > 0.0 && config.default_stage1_rate < 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidProbabilityClamp, config.default_stage1_rate};
    }
    if (!(config.default_stage2_rate > 0.0 && config.default_stage2_rate < 1.0)) {
        return ConfigError{ConfigErrorCode::InvalidProbabilityClamp, config.default_stage2_rate};
    }
    return std::nullopt;
}

double derive_intercept(std::optional<double> observed_rate,
                        double default_rate,
                        const EntityResponseConfig& config) {
    double rate = default_rate;
    if (observed_rate && std::isfinite(*observed_rate) && *observed_rate > 0.0) {
        rate = *observed_rate;
    }
    return clamped_logit(rate, config.rate_floor, config.rate_ceiling);
}

SlopeEstimate derive_slope(const AdditiveLogitModel& model,
                           const ReferencePoint& low,
                           const ReferencePoint& high,
                           double group_slope,
                           const EntityResponseConfig& config) {
    const double spread = model.score(high.level_a, high.level_b)
                        - model.score(low.level_a, low.level_b);

    const bool used_spread = spread > config.min_score_spread;
    const double raw = used_spread ? 1.0 / spread : group_slope;

    const double blended = config.shrinkage * group_slope + (1.0 - config.shrinkage) * raw;
    const double slope = std::clamp(blended, config.slope_min, config.slope_max);

    return SlopeEstimate{
        .slope = slope,
        .stage2_slope = config.stage2_ratio * slope,
        .score_spread = spread,
        .used_spread = used_spread
    };
}

std::expected<TwoStageResponse, ConfigError>
derive_entity_response(const AdditiveLogitModel& model,
                       const EntityObservation& entity,
                       const EntityResponseConfig& config) {
    if (auto err = validate_entity_config(config)) {
        MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_ENTITY, static_cast<int>(err->code), 0, err->value);
        return std::unexpected(*err);
    }
    if (!std::isfinite(entity.group_slope)) {
        return std::unexpected(ConfigError{ConfigErrorCode::InvalidShrinkage, entity.group_slope});
    }

    const SlopeEstimate slope = derive_slope(model, entity.low, entity.high, entity.group_slope, config);
    return TwoStageResponse{
        .stage1 = {
            .intercept = derive_intercept(entity.stage1_rate, config.default_stage1_rate, config),
            .slope = slope.slope
        },
        .stage2 = {
            .intercept = derive_intercept(entity.stage2_rate, config.default_stage2_rate, config),
            .slope = slope.stage2_slope
        },
        .slope = slope
    };
}

double response_probability(const EntityResponse& response, double score) {
    return sigmoid(response.intercept + response.slope * score);
}

double two_stage_probability(const TwoStageResponse& response, double score) {
    return response_probability(response.stage1, score) * response_probability(response.stage2, score);
}

double probability_at_least_one(std::span<const double> probabilities) {
    double none = 1.0;
    for (double p : probabilities) {
        none *= (1.0 - std::clamp(p, 0.0, 1.0));
    }
    return 1.0 - none;
}

}  // namespace monocurve
