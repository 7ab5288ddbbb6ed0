// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/math/rate_axis.hpp"
#include "src/valuation/dcf_model.hpp"
#include "src/valuation/sensitivity_analyzer.hpp"

#include <vector>

namespace fairvalue {
namespace {

ValuationInputs taper_inputs() {
    ValuationInputs in;
    in.base_revenue = 60.9;
    in.schedule = GrowthSchedule::linear_taper(0.70, 0.30, 0.70, 5);
    in.discount_rate = 0.12;
    in.terminal_growth_rate = 0.035;
    in.net_debt = -11.0;
    in.shares_outstanding = 2.46;
    return in;
}

TEST(SensitivityAnalyzerTest, GridDimensionsFollowAxes) {
    auto wacc = linspace(0.10, 0.15, 6).value();
    auto growth = linspace(0.03, 0.05, 6).value();

    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->rows(), 6u);
    EXPECT_EQ(grid->cols(), 6u);
    EXPECT_EQ(grid->size(), 36u);
    EXPECT_TRUE(grid->all_valid());

    for (size_t i = 0; i < wacc.size(); ++i) {
        EXPECT_DOUBLE_EQ(grid->discount_rate_axis()[i], wacc[i]);
    }
}

TEST(SensitivityAnalyzerTest, EveryCellMatchesSingleValuation) {
    std::vector<double> wacc = {0.09, 0.12};
    std::vector<double> growth = {0.02, 0.04};
    const ValuationInputs base = taper_inputs();

    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(base, wacc, growth);
    ASSERT_TRUE(grid.has_value());

    for (size_t i = 0; i < wacc.size(); ++i) {
        for (size_t j = 0; j < growth.size(); ++j) {
            ValuationInputs in = base;
            in.discount_rate = wacc[i];
            in.terminal_growth_rate = growth[j];
            auto report = value_company(in);
            ASSERT_TRUE(report.has_value());
            ASSERT_TRUE(grid->value(i, j).has_value());
            EXPECT_DOUBLE_EQ(*grid->value(i, j), report->valuation.implied_per_share_value);
        }
    }
}

TEST(SensitivityAnalyzerTest, ValueFallsAlongDiscountAxisAndRisesAlongGrowthAxis) {
    auto wacc = linspace(0.10, 0.15, 6).value();
    auto growth = linspace(0.03, 0.05, 6).value();
    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(grid.has_value());

    for (size_t i = 1; i < grid->rows(); ++i) {
        EXPECT_LT(*grid->value(i, 0), *grid->value(i - 1, 0));
    }
    for (size_t j = 1; j < grid->cols(); ++j) {
        EXPECT_GT(*grid->value(0, j), *grid->value(0, j - 1));
    }
}

TEST(SensitivityAnalyzerTest, InvalidCellsRecordedAndSweepContinues) {
    // Row 0 (r = 0.04) is invalid against g = 0.04 and 0.05
    std::vector<double> wacc = {0.04, 0.10};
    std::vector<double> growth = {0.03, 0.04, 0.05};

    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->size(), 6u);
    EXPECT_EQ(grid->failed_count(), 2u);

    EXPECT_TRUE(grid->is_valid(0, 0));
    EXPECT_FALSE(grid->is_valid(0, 1));
    EXPECT_FALSE(grid->is_valid(0, 2));
    for (size_t j = 0; j < 3; ++j) {
        EXPECT_TRUE(grid->is_valid(1, j));
    }

    const auto& cell = grid->at(0, 2);
    EXPECT_EQ(cell.error().code, ValuationErrorCode::InvalidRateRelationship);
    EXPECT_EQ(cell.error().index, grid->flat_index(0, 2));
}

TEST(SensitivityAnalyzerTest, TerminalGrowthBelowMinusOneMarksCellInvalid) {
    std::vector<double> wacc = {0.10};
    std::vector<double> growth = {-1.5, 0.03};

    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->failed_count(), 1u);
    EXPECT_FALSE(grid->value(0, 0).has_value());
    EXPECT_EQ(grid->at(0, 0).error().code, ValuationErrorCode::InvalidRate);
    EXPECT_EQ(grid->at(0, 0).error().index, grid->flat_index(0, 0));
    EXPECT_TRUE(grid->is_valid(0, 1));
}

TEST(SensitivityAnalyzerTest, AllCellsInvalidStillProducesGrid) {
    std::vector<double> wacc = {0.02, 0.03};
    std::vector<double> growth = {0.05};
    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->failed_count(), 2u);
}

TEST(SensitivityAnalyzerTest, InputRatePairIgnored) {
    ValuationInputs in = taper_inputs();
    in.discount_rate = 0.01;
    in.terminal_growth_rate = 0.50;  // Would fail value_company

    std::vector<double> wacc = {0.12};
    std::vector<double> growth = {0.035};
    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(in, wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_TRUE(grid->all_valid());
}

TEST(SensitivityAnalyzerTest, FixedInputErrorsAbortSweep) {
    std::vector<double> wacc = {0.10};
    std::vector<double> growth = {0.03};
    SensitivityAnalyzer analyzer;

    ValuationInputs no_shares = taper_inputs();
    no_shares.shares_outstanding = 0.0;
    auto a = analyzer.sweep(no_shares, wacc, growth);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ValuationErrorCode::InvalidShareCount);

    ValuationInputs no_schedule = taper_inputs();
    no_schedule.schedule = GrowthSchedule{};
    auto b = analyzer.sweep(no_schedule, wacc, growth);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ValuationErrorCode::InvalidSchedule);
}

TEST(SensitivityAnalyzerTest, EmptyAxisRejected) {
    std::vector<double> wacc = {0.10};
    std::vector<double> empty;
    SensitivityAnalyzer analyzer;

    auto a = analyzer.sweep(taper_inputs(), empty, wacc);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ValuationErrorCode::InvalidAxis);

    auto b = analyzer.sweep(taper_inputs(), wacc, empty);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ValuationErrorCode::InvalidAxis);
}

TEST(SensitivityAnalyzerTest, ParallelAndSerialSweepsIdentical) {
    auto wacc = linspace(0.05, 0.15, 21).value();
    auto growth = linspace(0.00, 0.08, 17).value();  // Crosses r <= g near the corner

    SweepConfig parallel_config;
    parallel_config.min_parallel_cells = 1;
    SensitivityAnalyzer parallel(parallel_config);
    SensitivityAnalyzer serial;
    serial.set_parallel(false);

    auto p = parallel.sweep(taper_inputs(), wacc, growth);
    auto s = serial.sweep(taper_inputs(), wacc, growth);
    ASSERT_TRUE(p.has_value());
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(p->size(), s->size());
    EXPECT_EQ(p->failed_count(), s->failed_count());
    EXPECT_GT(s->failed_count(), 0u);

    for (size_t k = 0; k < s->size(); ++k) {
        EXPECT_EQ(p->cells()[k], s->cells()[k]);
    }
}

TEST(SensitivityAnalyzerTest, SweepOverExistingProjection) {
    auto projection = project(100.0, GrowthSchedule(std::vector<GrowthPeriod>{{0.20, 0.35}}));
    ASSERT_TRUE(projection.has_value());

    std::vector<double> wacc = {0.10};
    std::vector<double> growth = {0.03};
    SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(*projection, 0.0, 10.0, wacc, growth);
    ASSERT_TRUE(grid.has_value());
    EXPECT_NEAR(*grid->value(0, 0), 60.0, 1e-10);
}

TEST(SensitivityAnalyzerTest, ConfigAccessors) {
    SensitivityAnalyzer analyzer;
    EXPECT_TRUE(analyzer.config().parallel);
    analyzer.set_parallel(false).set_parallel(true);
    EXPECT_TRUE(analyzer.config().parallel);
}

}  // namespace
}  // namespace fairvalue
