// SPDX-License-Identifier: MIT
#pragma once

#include "monocurve/serialization/calibration_record.hpp"
#include "monocurve/support/error_types.hpp"

#include <expected>
#include <filesystem>

namespace monocurve {

enum class ParquetCompression {
    NONE,
    SNAPPY,
    ZSTD,
};

struct ParquetWriteOptions {
    ParquetCompression compression = ParquetCompression::ZSTD;
};

/// Write a CalibrationRecord to a Parquet file.
///
/// One row per curve; global intercept and calibration diagnostics are
/// stored as file key-value metadata under the "monocurve." prefix.
[[nodiscard]] std::expected<void, SerializationError>
write_parquet(const CalibrationRecord& record,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts = {});

/// Read a CalibrationRecord from a Parquet file.
///
/// Verifies the format version and the CRC64 of every coefficient vector.
[[nodiscard]] std::expected<CalibrationRecord, SerializationError>
read_parquet(const std::filesystem::path& path);

}  // namespace monocurve
