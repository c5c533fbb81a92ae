// SPDX-License-Identifier: MIT
#include "monocurve/serialization/calibration_record.hpp"
#include "monocurve/curve/ispline_basis.hpp"

namespace monocurve {

CurveRecord to_record(const CurveParameters& parameters, std::string name) {
    return CurveRecord{
        .name = std::move(name),
        .coefficients = parameters.coefficients,
        .intercept = parameters.intercept,
        .n_basis = parameters.basis.n_basis,
        .degree = parameters.basis.degree,
        .x_min = parameters.basis.x_min,
        .x_max = parameters.basis.x_max,
        .knots = parameters.knots
    };
}

CalibrationRecord to_record(const TwoFactorCalibration& calibration,
                            std::string name_a, std::string name_b) {
    const auto& diag = calibration.diagnostics;

    CalibrationRecord record;
    record.curves.push_back(to_record(calibration.curve_a, std::move(name_a)));
    record.curves.push_back(to_record(calibration.curve_b, std::move(name_b)));
    record.global_intercept = calibration.global_intercept;
    record.calibration = CalibrationSummary{
        .rmse = diag.rmse,
        .r2 = diag.r2,
        .monotone_a = diag.monotone_a,
        .monotone_b = diag.monotone_b,
        .discrete_monotone_a = diag.discrete_monotone_a,
        .discrete_monotone_b = diag.discrete_monotone_b,
        .converged = diag.converged,
        .iterations = diag.iterations,
        .anchor_a = diag.anchor_a,
        .anchor_b = diag.anchor_b,
        .spline_r2_a = diag.curve_a.r2,
        .spline_r2_b = diag.curve_b.r2
    };
    return record;
}

std::expected<CurveParameters, SerializationError>
to_curve_parameters(const CurveRecord& record) {
    const BasisConfig basis{
        .n_basis = record.n_basis,
        .degree = record.degree,
        .x_min = record.x_min,
        .x_max = record.x_max
    };
    if (validate_basis_config(basis)) {
        return std::unexpected(SerializationError{SerializationErrorCode::InvalidRecord,
                                                  record.name + ": invalid basis configuration"});
    }
    if (record.coefficients.size() != record.n_basis) {
        return std::unexpected(SerializationError{SerializationErrorCode::InvalidRecord,
                                                  record.name + ": coefficient count"});
    }
    std::vector<double> knots = make_knots(basis);
    if (knots != record.knots) {
        return std::unexpected(SerializationError{SerializationErrorCode::InvalidRecord,
                                                  record.name + ": knot sequence"});
    }
    return CurveParameters{
        .coefficients = record.coefficients,
        .intercept = record.intercept,
        .basis = basis,
        .knots = std::move(knots)
    };
}

const CurveRecord* find_curve(const CalibrationRecord& record, std::string_view name) {
    for (const auto& curve : record.curves) {
        if (curve.name == name) {
            return &curve;
        }
    }
    return nullptr;
}

}  // namespace monocurve
