// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <variant>

namespace monocurve {

/// Error codes for malformed input data (observations, sample vectors)
enum class ValidationErrorCode {
    EmptyInput,
    SizeMismatch,
    NonFiniteValue,
    NegativeWeight,
    ProbabilityOutOfRange,
    MissingLevelA,
    MissingLevelB,
    MissingProbability,
    MissingWeight
};

/// Detailed validation error for input data failures
struct ValidationError {
    ValidationErrorCode code;
    double value;  // The offending value (0 if not applicable)
    size_t index;  // Index of the offending sample or cell

    ValidationError(ValidationErrorCode code,
                    double value = 0.0,
                    size_t index = 0)
        : code(code), value(value), index(index) {}
};

/// Error codes for invalid fit or calibration settings
enum class ConfigErrorCode {
    InvalidBasisSize,
    InvalidDomainBounds,
    NegativePenalty,
    ZeroTotalWeight,
    InvalidRestartCount,
    InvalidOptimizerSettings,
    NonFiniteAnchor,
    InvalidProbabilityClamp,
    InvalidShrinkage
};

/// Detailed configuration error
struct ConfigError {
    ConfigErrorCode code;
    double value;  // The offending setting (0 if not applicable)

    ConfigError(ConfigErrorCode code, double value = 0.0)
        : code(code), value(value) {}
};

/// Error codes for persistence failures
enum class SerializationErrorCode {
    FileOpenFailed,
    WriteFailed,
    ReadFailed,
    MissingMetadata,
    MissingColumn,
    ColumnTypeMismatch,
    VersionMismatch,
    ParseFailed,
    ChecksumMismatch,
    InvalidRecord
};

/// Detailed persistence error
struct SerializationError {
    SerializationErrorCode code;
    std::string detail;  // Key, column or path involved
};

/// Error surfaced by fitting and calibration entry points
using CalibrationError = std::variant<ValidationError, ConfigError>;

/// Get error code as integer for diagnostics
inline int error_code(const CalibrationError& error) {
    return std::visit([](const auto& e) -> int {
        return static_cast<int>(e.code);
    }, error);
}

/// True if the error was caused by settings rather than data
inline bool is_config_error(const CalibrationError& error) {
    return std::holds_alternative<ConfigError>(error);
}

inline std::ostream& operator<<(std::ostream& os, const ValidationError& err) {
    os << "ValidationError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const ConfigError& err) {
    os << "ConfigError{code=" << static_cast<int>(err.code)
       << ", value=" << err.value << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const SerializationError& err) {
    os << "SerializationError{code=" << static_cast<int>(err.code)
       << ", detail=" << err.detail << "}";
    return os;
}

inline std::ostream& operator<<(std::ostream& os, const CalibrationError& err) {
    std::visit([&os](const auto& e) { os << e; }, err);
    return os;
}

}  // namespace monocurve
