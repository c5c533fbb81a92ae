// SPDX-License-Identifier: MIT
#pragma once

#include "monocurve/calibration/two_factor_calibrator.hpp"
#include "monocurve/curve/curve_parameters.hpp"
#include "monocurve/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace monocurve {

/// Serializable representation of one fitted curve.
/// Plain vectors, no I/O dependencies.
struct CurveRecord {
    std::string name;
    std::vector<double> coefficients;
    double intercept = 0.0;
    size_t n_basis = 0;
    size_t degree = 0;
    double x_min = 0.0;
    double x_max = 0.0;
    std::vector<double> knots;
};

/// Calibration diagnostics stored alongside the curves
struct CalibrationSummary {
    double rmse = 0.0;
    double r2 = 0.0;
    bool monotone_a = true;
    bool monotone_b = true;
    bool discrete_monotone_a = true;
    bool discrete_monotone_b = true;
    bool converged = false;
    size_t iterations = 0;
    double anchor_a = 0.0;
    double anchor_b = 0.0;
    double spline_r2_a = 0.0;
    double spline_r2_b = 0.0;
};

/// Serializable representation of a two-factor calibration
struct CalibrationRecord {
    std::vector<CurveRecord> curves;   ///< curves[0] is factor A, curves[1] is factor B
    double global_intercept = 0.0;
    CalibrationSummary calibration;
};

/// Curve record from fitted parameters
[[nodiscard]] CurveRecord to_record(const CurveParameters& parameters, std::string name);

/// Calibration record with curves named name_a and name_b
[[nodiscard]] CalibrationRecord to_record(const TwoFactorCalibration& calibration,
                                          std::string name_a = "factor_a",
                                          std::string name_b = "factor_b");

/// Rebuild curve parameters from a record
///
/// @return Parameters, or SerializationError{InvalidRecord} when the basis
///         configuration is invalid, the coefficient count is wrong, or the
///         stored knots differ from the knots the configuration produces
[[nodiscard]] std::expected<CurveParameters, SerializationError>
to_curve_parameters(const CurveRecord& record);

/// Look up a curve by name
[[nodiscard]] const CurveRecord* find_curve(const CalibrationRecord& record, std::string_view name);

}  // namespace monocurve
