// SPDX-License-Identifier: MIT
#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/sensitivity_grid.hpp"

#include <expected>
#include <filesystem>

namespace fairvalue {

enum class ParquetCompression {
    NONE,
    SNAPPY,
    ZSTD,
};

struct ParquetWriteOptions {
    ParquetCompression compression = ParquetCompression::ZSTD;
};

/// Write a SensitivityGrid to a Parquet file, one row per cell in row-major order.
///
/// Columns: discount_rate_index, terminal_growth_index, discount_rate,
/// terminal_growth_rate, implied_per_share (null for invalid cells),
/// error_code / error_value / error_index (null for valid cells).
/// File metadata carries the format version and the grid shape.
[[nodiscard]] std::expected<void, ExportError>
write_sensitivity_parquet(const SensitivityGrid& grid,
                          const std::filesystem::path& path,
                          const ParquetWriteOptions& opts = {});

/// Read a SensitivityGrid written by write_sensitivity_parquet().
[[nodiscard]] std::expected<SensitivityGrid, ExportError>
read_sensitivity_parquet(const std::filesystem::path& path);

}  // namespace fairvalue
