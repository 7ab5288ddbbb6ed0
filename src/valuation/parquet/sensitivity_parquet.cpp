// SPDX-License-Identifier: MIT
#include "src/valuation/parquet/sensitivity_parquet.hpp"
#include "src/support/valuation_trace.h"

#include <arrow/api.h>
#include <arrow/builder.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fairvalue {

namespace {

// ============================================================================
// Constants
// ============================================================================

constexpr const char* FORMAT_VERSION = "1.0";

constexpr const char* KEY_FORMAT_VERSION = "fairvalue.format_version";
constexpr const char* KEY_ROWS = "fairvalue.rows";
constexpr const char* KEY_COLS = "fairvalue.cols";

// ============================================================================
// Helpers
// ============================================================================

ExportError export_error(ExportErrorCode code, std::string detail) {
    return ExportError{code, std::move(detail)};
}

/// Check an Arrow Status and return ExportError on failure.
#define FAIRVALUE_ARROW_CHECK(expr, code)              \
    do {                                               \
        auto _s = (expr);                              \
        if (!_s.ok()) {                                \
            return std::unexpected(                    \
                export_error(code, _s.ToString()));    \
        }                                              \
    } while (0)

/// Check an Arrow Result and assign; return ExportError on failure.
#define FAIRVALUE_ARROW_ASSIGN(var, expr, code)        \
    auto _result_##var = (expr);                       \
    if (!_result_##var.ok()) {                         \
        return std::unexpected(export_error(           \
            code, _result_##var.status().ToString())); \
    }                                                  \
    auto var = std::move(_result_##var).ValueUnsafe()

std::optional<ValuationErrorCode> parse_error_code(std::string_view name) {
    constexpr ValuationErrorCode all_codes[] = {
        ValuationErrorCode::InvalidSchedule,
        ValuationErrorCode::InvalidRateRelationship,
        ValuationErrorCode::InvalidShareCount,
        ValuationErrorCode::InvalidBaseRevenue,
        ValuationErrorCode::InvalidRate,
        ValuationErrorCode::InvalidNetDebt,
        ValuationErrorCode::InvalidMarketPrice,
        ValuationErrorCode::InvalidAxis,
        ValuationErrorCode::InvalidCapitalStructure,
        ValuationErrorCode::InvalidHistory,
    };
    for (auto code : all_codes) {
        if (to_string(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

std::optional<size_t> parse_size_t(const std::string& s) {
    try {
        size_t pos = 0;
        size_t v = std::stoull(s, &pos);
        if (pos != s.size()) {
            return std::nullopt;
        }
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// Schema
// ============================================================================

std::shared_ptr<arrow::Schema> make_parquet_schema(
    const std::shared_ptr<arrow::KeyValueMetadata>& metadata) {

    auto fields = arrow::FieldVector{
        arrow::field("discount_rate_index", arrow::int32(), /*nullable=*/false),
        arrow::field("terminal_growth_index", arrow::int32(), /*nullable=*/false),
        arrow::field("discount_rate", arrow::float64(), /*nullable=*/false),
        arrow::field("terminal_growth_rate", arrow::float64(), /*nullable=*/false),
        arrow::field("implied_per_share", arrow::float64()),
        arrow::field("error_code", arrow::utf8()),
        arrow::field("error_value", arrow::float64()),
        arrow::field("error_index", arrow::int64()),
    };

    return arrow::schema(fields, metadata);
}

}  // anonymous namespace

// ============================================================================
// write_sensitivity_parquet
// ============================================================================

std::expected<void, ExportError>
write_sensitivity_parquet(const SensitivityGrid& grid,
                          const std::filesystem::path& path,
                          const ParquetWriteOptions& opts) {
    constexpr auto kWrite = ExportErrorCode::WriteFailed;

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_EXPORT, grid.rows(), grid.cols(),
                               static_cast<int>(opts.compression));

    auto pool = arrow::default_memory_pool();

    // ---- File-level metadata ----
    auto metadata = std::make_shared<arrow::KeyValueMetadata>();
    metadata->Append(KEY_FORMAT_VERSION, FORMAT_VERSION);
    metadata->Append(KEY_ROWS, std::to_string(grid.rows()));
    metadata->Append(KEY_COLS, std::to_string(grid.cols()));

    auto schema = make_parquet_schema(metadata);

    // ---- Column builders ----
    arrow::Int32Builder dr_index_b(pool);
    arrow::Int32Builder tg_index_b(pool);
    arrow::DoubleBuilder dr_b(pool);
    arrow::DoubleBuilder tg_b(pool);
    arrow::DoubleBuilder value_b(pool);
    arrow::StringBuilder error_code_b(pool);
    arrow::DoubleBuilder error_value_b(pool);
    arrow::Int64Builder error_index_b(pool);

    const auto dr_axis = grid.discount_rate_axis();
    const auto tg_axis = grid.terminal_growth_axis();

    // ---- Populate rows ----
    for (size_t i = 0; i < grid.rows(); ++i) {
        for (size_t j = 0; j < grid.cols(); ++j) {
            FAIRVALUE_ARROW_CHECK(dr_index_b.Append(static_cast<int32_t>(i)), kWrite);
            FAIRVALUE_ARROW_CHECK(tg_index_b.Append(static_cast<int32_t>(j)), kWrite);
            FAIRVALUE_ARROW_CHECK(dr_b.Append(dr_axis[i]), kWrite);
            FAIRVALUE_ARROW_CHECK(tg_b.Append(tg_axis[j]), kWrite);

            const SensitivityCell& cell = grid.at(i, j);
            if (cell) {
                FAIRVALUE_ARROW_CHECK(value_b.Append(*cell), kWrite);
                FAIRVALUE_ARROW_CHECK(error_code_b.AppendNull(), kWrite);
                FAIRVALUE_ARROW_CHECK(error_value_b.AppendNull(), kWrite);
                FAIRVALUE_ARROW_CHECK(error_index_b.AppendNull(), kWrite);
            } else {
                const ValuationError& err = cell.error();
                FAIRVALUE_ARROW_CHECK(value_b.AppendNull(), kWrite);
                FAIRVALUE_ARROW_CHECK(error_code_b.Append(std::string(to_string(err.code))), kWrite);
                FAIRVALUE_ARROW_CHECK(error_value_b.Append(err.value), kWrite);
                FAIRVALUE_ARROW_CHECK(error_index_b.Append(static_cast<int64_t>(err.index)), kWrite);
            }
        }
    }

    // ---- Finalize arrays ----
    std::shared_ptr<arrow::Array> dr_index_a, tg_index_a, dr_a, tg_a,
        value_a, error_code_a, error_value_a, error_index_a;

    FAIRVALUE_ARROW_CHECK(dr_index_b.Finish(&dr_index_a), kWrite);
    FAIRVALUE_ARROW_CHECK(tg_index_b.Finish(&tg_index_a), kWrite);
    FAIRVALUE_ARROW_CHECK(dr_b.Finish(&dr_a), kWrite);
    FAIRVALUE_ARROW_CHECK(tg_b.Finish(&tg_a), kWrite);
    FAIRVALUE_ARROW_CHECK(value_b.Finish(&value_a), kWrite);
    FAIRVALUE_ARROW_CHECK(error_code_b.Finish(&error_code_a), kWrite);
    FAIRVALUE_ARROW_CHECK(error_value_b.Finish(&error_value_a), kWrite);
    FAIRVALUE_ARROW_CHECK(error_index_b.Finish(&error_index_a), kWrite);

    // ---- Build table ----
    auto table = arrow::Table::Make(schema, {
        dr_index_a, tg_index_a, dr_a, tg_a,
        value_a, error_code_a, error_value_a, error_index_a,
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
    FAIRVALUE_ARROW_ASSIGN(outfile,
        arrow::io::FileOutputStream::Open(path.string()), kWrite);

    FAIRVALUE_ARROW_CHECK(parquet::arrow::WriteTable(
        *table, pool, outfile, /*chunk_size=*/4096,
        writer_props, arrow_props), kWrite);

    FAIRVALUE_ARROW_CHECK(outfile->Close(), kWrite);

    FAIRVALUE_TRACE_ALGO_COMPLETE(FAIRVALUE_MODULE_EXPORT, grid.size(), grid.failed_count());
    return {};
}

// ============================================================================
// read_sensitivity_parquet
// ============================================================================

std::expected<SensitivityGrid, ExportError>
read_sensitivity_parquet(const std::filesystem::path& path) {
    constexpr auto kRead = ExportErrorCode::ReadFailed;
    constexpr auto kSchema = ExportErrorCode::SchemaMismatch;

    auto pool = arrow::default_memory_pool();

    // ---- Open file ----
    FAIRVALUE_ARROW_ASSIGN(infile,
        arrow::io::ReadableFile::Open(path.string()), kRead);

    FAIRVALUE_ARROW_ASSIGN(reader,
        parquet::arrow::OpenFile(infile, pool), kRead);

    std::shared_ptr<arrow::Table> table;
    FAIRVALUE_ARROW_CHECK(reader->ReadTable(&table), kRead);

    // ---- Read file-level metadata ----
    auto kv = table->schema()->metadata();
    if (!kv) {
        return std::unexpected(export_error(kSchema, "missing file metadata"));
    }

    auto get_meta = [&](const std::string& key)
        -> std::expected<std::string, ExportError> {
        auto idx = kv->FindKey(key);
        if (idx < 0) {
            return std::unexpected(export_error(kSchema, "missing metadata key " + key));
        }
        return kv->value(idx);
    };

    // Validate format version first
    {
        auto v = get_meta(KEY_FORMAT_VERSION);
        if (!v) return std::unexpected(v.error());
        if (*v != FORMAT_VERSION) {
            return std::unexpected(export_error(kSchema, "unsupported format version " + *v));
        }
    }

    size_t rows = 0;
    size_t cols = 0;
    {
        auto v = get_meta(KEY_ROWS);
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_size_t(*v);
        if (!parsed) return std::unexpected(export_error(kSchema, "bad row count " + *v));
        rows = *parsed;
    }
    {
        auto v = get_meta(KEY_COLS);
        if (!v) return std::unexpected(v.error());
        auto parsed = parse_size_t(*v);
        if (!parsed) return std::unexpected(export_error(kSchema, "bad column count " + *v));
        cols = *parsed;
    }

    const int64_t n_rows = table->num_rows();
    if (rows == 0 || cols == 0 || static_cast<size_t>(n_rows) != rows * cols) {
        return std::unexpected(export_error(kSchema, "row count does not match grid shape"));
    }

    // ---- Column accessors ----
    // Combine chunks into a single array per column, checking name and type
    auto get_array = [&](const std::string& name, arrow::Type::type expected)
        -> std::expected<std::shared_ptr<arrow::Array>, ExportError> {
        auto col = table->GetColumnByName(name);
        if (!col || col->num_chunks() == 0) {
            return std::unexpected(export_error(kSchema, "missing column " + name));
        }
        if (col->type()->id() != expected) {
            return std::unexpected(export_error(kSchema, "unexpected type for column " + name));
        }
        if (col->num_chunks() == 1) {
            return col->chunk(0);
        }
        auto combined = arrow::Concatenate(col->chunks(), pool);
        if (!combined.ok()) {
            return std::unexpected(export_error(kRead, combined.status().ToString()));
        }
        return *combined;
    };

    auto dr_index_res = get_array("discount_rate_index", arrow::Type::INT32);
    if (!dr_index_res) return std::unexpected(dr_index_res.error());
    auto tg_index_res = get_array("terminal_growth_index", arrow::Type::INT32);
    if (!tg_index_res) return std::unexpected(tg_index_res.error());
    auto dr_res = get_array("discount_rate", arrow::Type::DOUBLE);
    if (!dr_res) return std::unexpected(dr_res.error());
    auto tg_res = get_array("terminal_growth_rate", arrow::Type::DOUBLE);
    if (!tg_res) return std::unexpected(tg_res.error());
    auto value_res = get_array("implied_per_share", arrow::Type::DOUBLE);
    if (!value_res) return std::unexpected(value_res.error());
    auto error_code_res = get_array("error_code", arrow::Type::STRING);
    if (!error_code_res) return std::unexpected(error_code_res.error());
    auto error_value_res = get_array("error_value", arrow::Type::DOUBLE);
    if (!error_value_res) return std::unexpected(error_value_res.error());
    auto error_index_res = get_array("error_index", arrow::Type::INT64);
    if (!error_index_res) return std::unexpected(error_index_res.error());

    auto dr_index_a = std::static_pointer_cast<arrow::Int32Array>(*dr_index_res);
    auto tg_index_a = std::static_pointer_cast<arrow::Int32Array>(*tg_index_res);
    auto dr_a = std::static_pointer_cast<arrow::DoubleArray>(*dr_res);
    auto tg_a = std::static_pointer_cast<arrow::DoubleArray>(*tg_res);
    auto value_a = std::static_pointer_cast<arrow::DoubleArray>(*value_res);
    auto error_code_a = std::static_pointer_cast<arrow::StringArray>(*error_code_res);
    auto error_value_a = std::static_pointer_cast<arrow::DoubleArray>(*error_value_res);
    auto error_index_a = std::static_pointer_cast<arrow::Int64Array>(*error_index_res);

    std::vector<double> discount_rates(rows);
    std::vector<double> terminal_growth_rates(cols);
    std::vector<SensitivityCell> cells;
    cells.reserve(rows * cols);

    // Rows are row-major; the index columns must agree with the position
    for (int64_t k = 0; k < n_rows; ++k) {
        const size_t i = static_cast<size_t>(k) / cols;
        const size_t j = static_cast<size_t>(k) % cols;
        if (dr_index_a->Value(k) != static_cast<int32_t>(i) ||
            tg_index_a->Value(k) != static_cast<int32_t>(j)) {
            return std::unexpected(export_error(kSchema,
                "cell out of row-major order at row " + std::to_string(k)));
        }
        if (j == 0) discount_rates[i] = dr_a->Value(k);
        if (i == 0) terminal_growth_rates[j] = tg_a->Value(k);

        if (!value_a->IsNull(k)) {
            cells.emplace_back(value_a->Value(k));
            continue;
        }

        if (error_code_a->IsNull(k) || error_value_a->IsNull(k) || error_index_a->IsNull(k)) {
            return std::unexpected(export_error(kSchema,
                "invalid cell without error at row " + std::to_string(k)));
        }
        auto code = parse_error_code(error_code_a->GetView(k));
        if (!code) {
            return std::unexpected(export_error(kSchema,
                "unknown error code " + error_code_a->GetString(k)));
        }
        cells.emplace_back(std::unexpect, *code, error_value_a->Value(k),
                           static_cast<size_t>(error_index_a->Value(k)));
    }

    auto grid = SensitivityGrid::create(std::move(discount_rates),
                                        std::move(terminal_growth_rates),
                                        std::move(cells));
    if (!grid) {
        return std::unexpected(export_error(kSchema, "inconsistent grid shape"));
    }
    return std::move(*grid);
}

}  // namespace fairvalue
