// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/valuation/growth_schedule.hpp"

#include <limits>
#include <vector>

using namespace fairvalue;

TEST(GrowthScheduleTest, ConstantRepeatsAssumption) {
    auto schedule = GrowthSchedule::constant(0.25, 0.35, 4);
    ASSERT_EQ(schedule.horizon(), 4u);
    for (size_t t = 0; t < schedule.horizon(); ++t) {
        EXPECT_DOUBLE_EQ(schedule[t].growth_rate, 0.25);
        EXPECT_DOUBLE_EQ(schedule[t].margin, 0.35);
    }
    EXPECT_TRUE(schedule.validate().has_value());
}

TEST(GrowthScheduleTest, WithConstantMarginKeepsRateOrder) {
    std::vector<double> rates = {0.70, 0.60, 0.50, 0.40, 0.30};
    auto schedule = GrowthSchedule::with_constant_margin(rates, 0.70);
    ASSERT_EQ(schedule.horizon(), 5u);
    for (size_t t = 0; t < rates.size(); ++t) {
        EXPECT_DOUBLE_EQ(schedule[t].growth_rate, rates[t]);
        EXPECT_DOUBLE_EQ(schedule[t].margin, 0.70);
    }
}

TEST(GrowthScheduleTest, LinearTaperHitsBothEndpoints) {
    // Deceleration from 70% to 30% over five years
    auto schedule = GrowthSchedule::linear_taper(0.70, 0.30, 0.70, 5);
    ASSERT_EQ(schedule.horizon(), 5u);
    EXPECT_DOUBLE_EQ(schedule[0].growth_rate, 0.70);
    EXPECT_NEAR(schedule[1].growth_rate, 0.60, 1e-12);
    EXPECT_NEAR(schedule[2].growth_rate, 0.50, 1e-12);
    EXPECT_NEAR(schedule[3].growth_rate, 0.40, 1e-12);
    EXPECT_EQ(schedule[4].growth_rate, 0.30);
}

TEST(GrowthScheduleTest, LinearTaperSinglePeriodUsesFirstRate) {
    auto schedule = GrowthSchedule::linear_taper(0.70, 0.30, 0.70, 1);
    ASSERT_EQ(schedule.horizon(), 1u);
    EXPECT_DOUBLE_EQ(schedule[0].growth_rate, 0.70);
}

TEST(GrowthScheduleTest, FromRatesZipsPerPeriodMargins) {
    std::vector<double> rates = {0.20, 0.10};
    std::vector<double> margins = {0.30, 0.40};
    auto schedule = GrowthSchedule::from_rates(rates, margins);
    ASSERT_TRUE(schedule.has_value());
    EXPECT_DOUBLE_EQ((*schedule)[1].growth_rate, 0.10);
    EXPECT_DOUBLE_EQ((*schedule)[1].margin, 0.40);
}

TEST(GrowthScheduleTest, FromRatesSizeMismatch) {
    std::vector<double> rates = {0.20, 0.10, 0.05};
    std::vector<double> margins = {0.30};
    auto schedule = GrowthSchedule::from_rates(rates, margins);
    ASSERT_FALSE(schedule.has_value());
    EXPECT_EQ(schedule.error().code, ValuationErrorCode::InvalidSchedule);
}

TEST(GrowthScheduleTest, EmptyScheduleInvalid) {
    GrowthSchedule schedule;
    EXPECT_TRUE(schedule.empty());
    auto ok = schedule.validate();
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValuationErrorCode::InvalidSchedule);
}

TEST(GrowthScheduleTest, GrowthAtMinusOneInvalid) {
    GrowthSchedule schedule(std::vector<GrowthPeriod>{{0.10, 0.3}, {-1.0, 0.3}, {0.05, 0.3}});
    auto ok = schedule.validate();
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValuationErrorCode::InvalidSchedule);
    EXPECT_DOUBLE_EQ(ok.error().value, -1.0);
    EXPECT_EQ(ok.error().index, 1u);
}

TEST(GrowthScheduleTest, ContractionAboveMinusOneIsValid) {
    GrowthSchedule schedule(std::vector<GrowthPeriod>{{-0.11, 0.3}, {-0.5, 0.3}});
    EXPECT_TRUE(schedule.validate().has_value());
}

TEST(GrowthScheduleTest, NonFiniteMarginInvalid) {
    GrowthSchedule schedule(std::vector<GrowthPeriod>{{0.10, std::numeric_limits<double>::quiet_NaN()}});
    auto ok = schedule.validate();
    ASSERT_FALSE(ok.has_value());
    EXPECT_EQ(ok.error().code, ValuationErrorCode::InvalidSchedule);
    EXPECT_EQ(ok.error().index, 0u);
}
