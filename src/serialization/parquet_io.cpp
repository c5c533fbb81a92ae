// SPDX-License-Identifier: MIT
#include "monocurve/serialization/parquet_io.hpp"
#include "monocurve/support/checksum.hpp"
#include "monocurve/support/monocurve_trace.h"

#include <arrow/api.h>
#include <arrow/builder.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <charconv>
#include <cstdint>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace monocurve {

namespace {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* FORMAT_VERSION = "1.0";
constexpr const char* KEY_PREFIX = "monocurve.";

// ============================================================================
// Helpers
// ============================================================================

SerializationError serialization_error(SerializationErrorCode code, std::string detail) {
    MONOCURVE_TRACE_VALIDATION_ERROR(MODULE_SERIALIZATION, static_cast<int>(code), 0, 0.0);
    return SerializationError{code, std::move(detail)};
}

/// Check an Arrow Status; return SerializationError with the status message on failure.
#define MONOCURVE_ARROW_CHECK(expr, code)         \
    do {                                          \
        auto _s = (expr);                         \
        if (!_s.ok()) {                           \
            return std::unexpected(               \
                serialization_error(code, _s.ToString())); \
        }                                         \
    } while (0)

/// Check an Arrow Result and assign; return SerializationError on failure.
#define MONOCURVE_ARROW_ASSIGN(var, expr, code)   \
    auto _result_##var = (expr);                  \
    if (!_result_##var.ok()) {                    \
        return std::unexpected(                   \
            serialization_error(code, _result_##var.status().ToString())); \
    }                                             \
    auto var = std::move(_result_##var).ValueUnsafe()

std::string key(const std::string& name) {
    return std::string(KEY_PREFIX) + name;
}

std::string double_to_string(double v) {
    std::ostringstream oss;
    oss.precision(17);
    oss << v;
    return oss.str();
}

std::string bool_to_string(bool v) {
    return v ? "true" : "false";
}

std::expected<double, SerializationError> parse_double(const std::string& s) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(serialization_error(SerializationErrorCode::ParseFailed, s));
    }
    return value;
}

std::expected<size_t, SerializationError> parse_size_t(const std::string& s) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::unexpected(serialization_error(SerializationErrorCode::ParseFailed, s));
    }
    return value;
}

std::expected<bool, SerializationError> parse_bool(const std::string& s) {
    if (s == "true") return true;
    if (s == "false") return false;
    return std::unexpected(serialization_error(SerializationErrorCode::ParseFailed, s));
}

// ============================================================================
// Schema
// ============================================================================

std::shared_ptr<arrow::Schema> make_parquet_schema(
    const std::shared_ptr<arrow::KeyValueMetadata>& metadata) {

    auto list_double = arrow::list(arrow::float64());

    auto fields = arrow::FieldVector{
        arrow::field("name", arrow::utf8()),
        arrow::field("coefficients", list_double),
        arrow::field("intercept", arrow::float64()),
        arrow::field("n_basis", arrow::int32()),
        arrow::field("degree", arrow::int32()),
        arrow::field("x_min", arrow::float64()),
        arrow::field("x_max", arrow::float64()),
        arrow::field("knots", list_double),
        arrow::field("checksum_coefficients", arrow::int64()),
    };

    return arrow::schema(fields, metadata);
}

// ============================================================================
// Write helpers
// ============================================================================

/// Append a std::vector<double> to a ListBuilder<DoubleBuilder>.
arrow::Status append_double_list(
    arrow::ListBuilder& list_builder,
    const std::vector<double>& vec) {

    ARROW_RETURN_NOT_OK(list_builder.Append());
    auto& value_builder =
        static_cast<arrow::DoubleBuilder&>(*list_builder.value_builder());
    return value_builder.AppendValues(vec);
}

// ============================================================================
// Read helpers
// ============================================================================

/// Extract a list-of-double column value at row i.
std::vector<double> read_double_list(
    const std::shared_ptr<arrow::Array>& col, int64_t row) {

    auto list_arr =
        std::static_pointer_cast<arrow::ListArray>(col);
    auto values_arr =
        std::static_pointer_cast<arrow::DoubleArray>(list_arr->values());

    int32_t start = list_arr->value_offset(row);
    int32_t end = list_arr->value_offset(row + 1);

    std::vector<double> result;
    result.reserve(static_cast<size_t>(end - start));
    for (int32_t j = start; j < end; ++j) {
        result.push_back(values_arr->Value(j));
    }
    return result;
}

}  // anonymous namespace

// ============================================================================
// write_parquet
// ============================================================================

std::expected<void, SerializationError>
write_parquet(const CalibrationRecord& record,
              const std::filesystem::path& path,
              const ParquetWriteOptions& opts) {

    auto pool = arrow::default_memory_pool();
    const auto& cal = record.calibration;

    MONOCURVE_TRACE_ALGO_START(MODULE_SERIALIZATION, record.curves.size(), 0, 0);

    // ---- File-level metadata ----
    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append(key("format_version"), FORMAT_VERSION);
    metadata->Append(key("global_intercept"), double_to_string(record.global_intercept));
    metadata->Append(key("calibration.rmse"), double_to_string(cal.rmse));
    metadata->Append(key("calibration.r2"), double_to_string(cal.r2));
    metadata->Append(key("calibration.monotone_a"), bool_to_string(cal.monotone_a));
    metadata->Append(key("calibration.monotone_b"), bool_to_string(cal.monotone_b));
    metadata->Append(key("calibration.discrete_monotone_a"), bool_to_string(cal.discrete_monotone_a));
    metadata->Append(key("calibration.discrete_monotone_b"), bool_to_string(cal.discrete_monotone_b));
    metadata->Append(key("calibration.converged"), bool_to_string(cal.converged));
    metadata->Append(key("calibration.iterations"), std::to_string(cal.iterations));
    metadata->Append(key("calibration.anchor_a"), double_to_string(cal.anchor_a));
    metadata->Append(key("calibration.anchor_b"), double_to_string(cal.anchor_b));
    metadata->Append(key("calibration.spline_r2_a"), double_to_string(cal.spline_r2_a));
    metadata->Append(key("calibration.spline_r2_b"), double_to_string(cal.spline_r2_b));

    auto schema = make_parquet_schema(metadata);

    // ---- Column builders ----
    arrow::StringBuilder name_b(pool);
    arrow::ListBuilder coefficients_b(pool,
        std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::DoubleBuilder intercept_b(pool);
    arrow::Int32Builder n_basis_b(pool);
    arrow::Int32Builder degree_b(pool);
    arrow::DoubleBuilder x_min_b(pool);
    arrow::DoubleBuilder x_max_b(pool);
    arrow::ListBuilder knots_b(pool,
        std::make_shared<arrow::DoubleBuilder>(pool));
    arrow::Int64Builder checksum_b(pool);

    constexpr auto kWrite = SerializationErrorCode::WriteFailed;

    // ---- Populate rows ----
    for (const auto& curve : record.curves) {
        MONOCURVE_ARROW_CHECK(name_b.Append(curve.name), kWrite);
        MONOCURVE_ARROW_CHECK(append_double_list(coefficients_b, curve.coefficients), kWrite);
        MONOCURVE_ARROW_CHECK(intercept_b.Append(curve.intercept), kWrite);
        MONOCURVE_ARROW_CHECK(n_basis_b.Append(static_cast<int32_t>(curve.n_basis)), kWrite);
        MONOCURVE_ARROW_CHECK(degree_b.Append(static_cast<int32_t>(curve.degree)), kWrite);
        MONOCURVE_ARROW_CHECK(x_min_b.Append(curve.x_min), kWrite);
        MONOCURVE_ARROW_CHECK(x_max_b.Append(curve.x_max), kWrite);
        MONOCURVE_ARROW_CHECK(append_double_list(knots_b, curve.knots), kWrite);

        uint64_t crc = crc64(std::span<const double>(curve.coefficients));
        MONOCURVE_ARROW_CHECK(checksum_b.Append(static_cast<int64_t>(crc)), kWrite);
    }

    // ---- Finalize arrays ----
    std::shared_ptr<arrow::Array> name_a, coefficients_a, intercept_a,
        n_basis_a, degree_a, x_min_a, x_max_a, knots_a, checksum_a;

    MONOCURVE_ARROW_CHECK(name_b.Finish(&name_a), kWrite);
    MONOCURVE_ARROW_CHECK(coefficients_b.Finish(&coefficients_a), kWrite);
    MONOCURVE_ARROW_CHECK(intercept_b.Finish(&intercept_a), kWrite);
    MONOCURVE_ARROW_CHECK(n_basis_b.Finish(&n_basis_a), kWrite);
    MONOCURVE_ARROW_CHECK(degree_b.Finish(&degree_a), kWrite);
    MONOCURVE_ARROW_CHECK(x_min_b.Finish(&x_min_a), kWrite);
    MONOCURVE_ARROW_CHECK(x_max_b.Finish(&x_max_a), kWrite);
    MONOCURVE_ARROW_CHECK(knots_b.Finish(&knots_a), kWrite);
    MONOCURVE_ARROW_CHECK(checksum_b.Finish(&checksum_a), kWrite);

    // ---- Build table ----
    auto table = arrow::Table::Make(schema, {
        name_a, coefficients_a, intercept_a, n_basis_a, degree_a,
        x_min_a, x_max_a, knots_a, checksum_a,
    });

    // ---- Writer properties ----
    auto props_builder = parquet::WriterProperties::Builder();
    switch (opts.compression) {
        case ParquetCompression::NONE:
            props_builder.compression(arrow::Compression::UNCOMPRESSED);
            break;
        case ParquetCompression::SNAPPY:
            props_builder.compression(arrow::Compression::SNAPPY);
            break;
        case ParquetCompression::ZSTD:
            props_builder.compression(arrow::Compression::ZSTD);
            break;
    }
    auto writer_props = props_builder.build();

    auto arrow_props = parquet::ArrowWriterProperties::Builder()
        .store_schema()->build();

    // ---- Write file ----
    MONOCURVE_ARROW_ASSIGN(outfile,
        arrow::io::FileOutputStream::Open(path.string()),
        SerializationErrorCode::FileOpenFailed);

    MONOCURVE_ARROW_CHECK(parquet::arrow::WriteTable(
        *table, pool, outfile, /*chunk_size=*/1024,
        writer_props, arrow_props), kWrite);

    MONOCURVE_ARROW_CHECK(outfile->Close(), kWrite);

    MONOCURVE_TRACE_ALGO_COMPLETE(MODULE_SERIALIZATION, record.curves.size(), 0.0);
    return {};
}

// ============================================================================
// read_parquet
// ============================================================================

std::expected<CalibrationRecord, SerializationError>
read_parquet(const std::filesystem::path& path) {

    auto pool = arrow::default_memory_pool();

    // ---- Open file ----
    MONOCURVE_ARROW_ASSIGN(infile,
        arrow::io::ReadableFile::Open(path.string()),
        SerializationErrorCode::FileOpenFailed);

    MONOCURVE_ARROW_ASSIGN(reader,
        parquet::arrow::OpenFile(infile, pool),
        SerializationErrorCode::ReadFailed);

    std::shared_ptr<arrow::Table> table;
    MONOCURVE_ARROW_CHECK(reader->ReadTable(&table), SerializationErrorCode::ReadFailed);

    // ---- Read file-level metadata ----
    auto kv = table->schema()->metadata();
    if (!kv) {
        return std::unexpected(serialization_error(SerializationErrorCode::MissingMetadata, "schema"));
    }

    // Helper to find metadata value by key
    auto get_meta = [&](const std::string& name)
        -> std::expected<std::string, SerializationError> {
        auto idx = kv->FindKey(key(name));
        if (idx < 0) {
            return std::unexpected(serialization_error(SerializationErrorCode::MissingMetadata, key(name)));
        }
        return kv->value(idx);
    };

    // Validate format version first
    {
        auto v = get_meta("format_version");
        if (!v) return std::unexpected(v.error());
        if (*v != FORMAT_VERSION) {
            return std::unexpected(serialization_error(SerializationErrorCode::VersionMismatch, *v));
        }
    }

    CalibrationRecord record;
    auto& cal = record.calibration;

    const std::pair<const char*, double*> double_fields[] = {
        {"global_intercept", &record.global_intercept},
        {"calibration.rmse", &cal.rmse},
        {"calibration.r2", &cal.r2},
        {"calibration.anchor_a", &cal.anchor_a},
        {"calibration.anchor_b", &cal.anchor_b},
        {"calibration.spline_r2_a", &cal.spline_r2_a},
        {"calibration.spline_r2_b", &cal.spline_r2_b},
    };
    for (const auto& [name, target] : double_fields) {
        auto v = get_meta(name);
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_double(*v);
        if (!parsed) return std::unexpected(parsed.error());
        *target = *parsed;
    }

    const std::pair<const char*, bool*> bool_fields[] = {
        {"calibration.monotone_a", &cal.monotone_a},
        {"calibration.monotone_b", &cal.monotone_b},
        {"calibration.discrete_monotone_a", &cal.discrete_monotone_a},
        {"calibration.discrete_monotone_b", &cal.discrete_monotone_b},
        {"calibration.converged", &cal.converged},
    };
    for (const auto& [name, target] : bool_fields) {
        auto v = get_meta(name);
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_bool(*v);
        if (!parsed) return std::unexpected(parsed.error());
        *target = *parsed;
    }

    {
        auto v = get_meta("calibration.iterations");
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_size_t(*v);
        if (!parsed) return std::unexpected(parsed.error());
        cal.iterations = *parsed;
    }

    // ---- Column accessors ----
    // Combine chunks into a single array per column
    auto get_array = [&](const std::string& name, arrow::Type::type expected_type)
        -> std::expected<std::shared_ptr<arrow::Array>, SerializationError> {
        auto col = table->GetColumnByName(name);
        if (!col) {
            return std::unexpected(serialization_error(SerializationErrorCode::MissingColumn, name));
        }

        std::shared_ptr<arrow::Array> arr;
        if (col->num_chunks() == 0) {
            auto empty = arrow::MakeEmptyArray(col->type(), pool);
            if (!empty.ok()) {
                return std::unexpected(serialization_error(SerializationErrorCode::ReadFailed, name));
            }
            arr = *empty;
        } else if (col->num_chunks() == 1) {
            arr = col->chunk(0);
        } else {
            auto combined = arrow::Concatenate(col->chunks(), pool);
            if (!combined.ok()) {
                return std::unexpected(serialization_error(SerializationErrorCode::ReadFailed, name));
            }
            arr = *combined;
        }

        if (arr->type_id() != expected_type) {
            return std::unexpected(serialization_error(SerializationErrorCode::ColumnTypeMismatch, name));
        }
        return arr;
    };

    auto name_res = get_array("name", arrow::Type::STRING);
    if (!name_res) return std::unexpected(name_res.error());
    auto coefficients_res = get_array("coefficients", arrow::Type::LIST);
    if (!coefficients_res) return std::unexpected(coefficients_res.error());
    auto intercept_res = get_array("intercept", arrow::Type::DOUBLE);
    if (!intercept_res) return std::unexpected(intercept_res.error());
    auto n_basis_res = get_array("n_basis", arrow::Type::INT32);
    if (!n_basis_res) return std::unexpected(n_basis_res.error());
    auto degree_res = get_array("degree", arrow::Type::INT32);
    if (!degree_res) return std::unexpected(degree_res.error());
    auto x_min_res = get_array("x_min", arrow::Type::DOUBLE);
    if (!x_min_res) return std::unexpected(x_min_res.error());
    auto x_max_res = get_array("x_max", arrow::Type::DOUBLE);
    if (!x_max_res) return std::unexpected(x_max_res.error());
    auto knots_res = get_array("knots", arrow::Type::LIST);
    if (!knots_res) return std::unexpected(knots_res.error());
    auto checksum_res = get_array("checksum_coefficients", arrow::Type::INT64);
    if (!checksum_res) return std::unexpected(checksum_res.error());

    auto name_a = std::static_pointer_cast<arrow::StringArray>(*name_res);
    auto intercept_a = std::static_pointer_cast<arrow::DoubleArray>(*intercept_res);
    auto n_basis_a = std::static_pointer_cast<arrow::Int32Array>(*n_basis_res);
    auto degree_a = std::static_pointer_cast<arrow::Int32Array>(*degree_res);
    auto x_min_a = std::static_pointer_cast<arrow::DoubleArray>(*x_min_res);
    auto x_max_a = std::static_pointer_cast<arrow::DoubleArray>(*x_max_res);
    auto checksum_a = std::static_pointer_cast<arrow::Int64Array>(*checksum_res);

    int64_t n_rows = table->num_rows();
    record.curves.resize(static_cast<size_t>(n_rows));

    for (int64_t i = 0; i < n_rows; ++i) {
        auto& curve = record.curves[static_cast<size_t>(i)];

        curve.name = name_a->GetString(i);
        curve.coefficients = read_double_list(*coefficients_res, i);
        curve.intercept = intercept_a->Value(i);
        if (n_basis_a->Value(i) < 0 || degree_a->Value(i) < 0) {
            return std::unexpected(serialization_error(SerializationErrorCode::InvalidRecord, curve.name));
        }
        curve.n_basis = static_cast<size_t>(n_basis_a->Value(i));
        curve.degree = static_cast<size_t>(degree_a->Value(i));
        curve.x_min = x_min_a->Value(i);
        curve.x_max = x_max_a->Value(i);
        curve.knots = read_double_list(*knots_res, i);

        // Verify checksum
        uint64_t stored_crc = static_cast<uint64_t>(checksum_a->Value(i));
        uint64_t computed_crc = crc64(std::span<const double>(curve.coefficients));
        if (stored_crc != computed_crc) {
            return std::unexpected(serialization_error(SerializationErrorCode::ChecksumMismatch, curve.name));
        }
    }

    return record;
}

}  // namespace monocurve
