// SPDX-License-Identifier: MIT

// Parquet round-trip tests: sweep -> write_sensitivity_parquet ->
// read_sensitivity_parquet -> compare, plus schema and error handling.

#include <gtest/gtest.h>

#include <arrow/api.h>
#include <arrow/io/api.h>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "src/math/rate_axis.hpp"
#include "src/valuation/parquet/sensitivity_parquet.hpp"
#include "src/valuation/sensitivity_analyzer.hpp"

namespace fairvalue {
namespace {

// ===========================================================================
// Test fixture: manages temp file creation and cleanup
// ===========================================================================

class SensitivityParquetTest : public ::testing::Test {
protected:
    std::filesystem::path temp_path_;

    void SetUp() override {
        temp_path_ = std::filesystem::temp_directory_path() /
                     ("fairvalue_parquet_test_" +
                      std::to_string(::testing::UnitTest::GetInstance()
                                         ->current_test_info()->line()) +
                      ".parquet");
    }

    void TearDown() override {
        std::filesystem::remove(temp_path_);
    }

    /// 4 x 5 sweep whose low-rate corner is invalid (r <= g)
    static SensitivityGrid make_grid() {
        ValuationInputs in;
        in.base_revenue = 60.92;
        in.schedule = GrowthSchedule::constant(0.25, 0.35, 5);
        in.net_debt = -11.0;
        in.shares_outstanding = 2.46;

        auto wacc = linspace(0.03, 0.12, 4).value();
        auto growth = linspace(0.01, 0.05, 5).value();
        return SensitivityAnalyzer().sweep(in, wacc, growth).value();
    }

    static void expect_grids_equal(const SensitivityGrid& a, const SensitivityGrid& b) {
        ASSERT_EQ(a.rows(), b.rows());
        ASSERT_EQ(a.cols(), b.cols());
        for (size_t i = 0; i < a.rows(); ++i) {
            EXPECT_EQ(a.discount_rate_axis()[i], b.discount_rate_axis()[i]);
        }
        for (size_t j = 0; j < a.cols(); ++j) {
            EXPECT_EQ(a.terminal_growth_axis()[j], b.terminal_growth_axis()[j]);
        }
        for (size_t k = 0; k < a.size(); ++k) {
            EXPECT_EQ(a.cells()[k], b.cells()[k]) << "cell " << k;
        }
        EXPECT_EQ(a.failed_count(), b.failed_count());
    }
};

// ===========================================================================
// Round trip
// ===========================================================================

TEST_F(SensitivityParquetTest, RoundTripPreservesAxesAndCells) {
    SensitivityGrid grid = make_grid();
    ASSERT_GT(grid.failed_count(), 0u);
    ASSERT_LT(grid.failed_count(), grid.size());

    auto written = write_sensitivity_parquet(grid, temp_path_);
    ASSERT_TRUE(written.has_value()) << written.error();

    auto read = read_sensitivity_parquet(temp_path_);
    ASSERT_TRUE(read.has_value()) << read.error();
    expect_grids_equal(grid, *read);
}

TEST_F(SensitivityParquetTest, RoundTripEveryCompression) {
    SensitivityGrid grid = make_grid();
    for (auto compression : {ParquetCompression::NONE,
                             ParquetCompression::SNAPPY,
                             ParquetCompression::ZSTD}) {
        ParquetWriteOptions opts;
        opts.compression = compression;
        ASSERT_TRUE(write_sensitivity_parquet(grid, temp_path_, opts).has_value());

        auto read = read_sensitivity_parquet(temp_path_);
        ASSERT_TRUE(read.has_value()) << read.error();
        expect_grids_equal(grid, *read);
    }
}

// ===========================================================================
// File layout
// ===========================================================================

TEST_F(SensitivityParquetTest, OneRowPerCellWithNullMarkers) {
    SensitivityGrid grid = make_grid();
    ASSERT_TRUE(write_sensitivity_parquet(grid, temp_path_).has_value());

    auto infile = arrow::io::ReadableFile::Open(temp_path_.string()).ValueOrDie();
    auto reader = parquet::arrow::OpenFile(infile, arrow::default_memory_pool()).ValueOrDie();
    std::shared_ptr<arrow::Table> table;
    ASSERT_TRUE(reader->ReadTable(&table).ok());

    EXPECT_EQ(table->num_rows(), static_cast<int64_t>(grid.size()));
    EXPECT_EQ(table->num_columns(), 8);

    auto kv = table->schema()->metadata();
    ASSERT_NE(kv, nullptr);
    EXPECT_EQ(kv->Get("fairvalue.rows").ValueOrDie(), std::to_string(grid.rows()));
    EXPECT_EQ(kv->Get("fairvalue.cols").ValueOrDie(), std::to_string(grid.cols()));

    auto values = table->GetColumnByName("implied_per_share");
    auto codes = table->GetColumnByName("error_code");
    ASSERT_NE(values, nullptr);
    ASSERT_NE(codes, nullptr);
    EXPECT_EQ(values->null_count(), static_cast<int64_t>(grid.failed_count()));
    EXPECT_EQ(codes->null_count(), static_cast<int64_t>(grid.size() - grid.failed_count()));
}

// ===========================================================================
// Error handling
// ===========================================================================

TEST_F(SensitivityParquetTest, MissingFileIsReadFailure) {
    auto read = read_sensitivity_parquet(temp_path_);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, ExportErrorCode::ReadFailed);
}

TEST_F(SensitivityParquetTest, NonParquetFileIsReadFailure) {
    {
        std::ofstream out(temp_path_);
        out << "discount_rate,terminal_growth_rate\n0.1,0.03\n";
    }
    auto read = read_sensitivity_parquet(temp_path_);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, ExportErrorCode::ReadFailed);
}

TEST_F(SensitivityParquetTest, ForeignParquetIsSchemaMismatch) {
    // A valid Parquet file without the grid metadata
    arrow::DoubleBuilder builder;
    ASSERT_TRUE(builder.Append(1.0).ok());
    std::shared_ptr<arrow::Array> arr;
    ASSERT_TRUE(builder.Finish(&arr).ok());
    auto table = arrow::Table::Make(
        arrow::schema({arrow::field("x", arrow::float64())}), {arr});

    auto outfile = arrow::io::FileOutputStream::Open(temp_path_.string()).ValueOrDie();
    ASSERT_TRUE(parquet::arrow::WriteTable(*table, arrow::default_memory_pool(),
                                           outfile, 1024).ok());
    ASSERT_TRUE(outfile->Close().ok());

    auto read = read_sensitivity_parquet(temp_path_);
    ASSERT_FALSE(read.has_value());
    EXPECT_EQ(read.error().code, ExportErrorCode::SchemaMismatch);
}

TEST_F(SensitivityParquetTest, UnwritablePathIsWriteFailure) {
    SensitivityGrid grid = make_grid();
    auto bad_path = temp_path_ / "no_such_dir" / "grid.parquet";
    auto written = write_sensitivity_parquet(grid, bad_path);
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error().code, ExportErrorCode::WriteFailed);
}

}  // namespace
}  // namespace fairvalue
