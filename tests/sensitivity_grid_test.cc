// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include "src/valuation/sensitivity_grid.hpp"

#include <stdexcept>
#include <vector>

using namespace fairvalue;

namespace {

std::vector<SensitivityCell> two_by_three_cells() {
    return {
        10.0, 11.0, std::unexpected(ValuationError(ValuationErrorCode::InvalidRateRelationship, 0.0, 2)),
        20.0, 21.0, 22.0,
    };
}

}  // namespace

TEST(SensitivityGridTest, ShapeAndRowMajorLayout) {
    auto grid = SensitivityGrid::create({0.08, 0.10}, {0.02, 0.03, 0.08}, two_by_three_cells());
    ASSERT_TRUE(grid.has_value());
    EXPECT_EQ(grid->rows(), 2u);
    EXPECT_EQ(grid->cols(), 3u);
    EXPECT_EQ(grid->size(), 6u);
    EXPECT_EQ(grid->flat_index(1, 2), 5u);

    EXPECT_DOUBLE_EQ(grid->at(0, 1).value(), 11.0);
    EXPECT_DOUBLE_EQ(grid->at(1, 0).value(), 20.0);
    EXPECT_DOUBLE_EQ(grid->discount_rate_axis()[1], 0.10);
    EXPECT_DOUBLE_EQ(grid->terminal_growth_axis()[2], 0.08);
}

TEST(SensitivityGridTest, InvalidCellKeepsError) {
    auto grid = SensitivityGrid::create({0.08, 0.10}, {0.02, 0.03, 0.08}, two_by_three_cells());
    ASSERT_TRUE(grid.has_value());

    EXPECT_FALSE(grid->is_valid(0, 2));
    EXPECT_FALSE(grid->value(0, 2).has_value());
    EXPECT_EQ(grid->at(0, 2).error().code, ValuationErrorCode::InvalidRateRelationship);
    EXPECT_EQ(grid->failed_count(), 1u);
    EXPECT_FALSE(grid->all_valid());
    EXPECT_DOUBLE_EQ(grid->value(1, 2).value(), 22.0);
}

TEST(SensitivityGridTest, AtThrowsOutsideGrid) {
    auto grid = SensitivityGrid::create({0.08, 0.10}, {0.02, 0.03, 0.08}, two_by_three_cells());
    ASSERT_TRUE(grid.has_value());
    EXPECT_THROW(grid->at(2, 0), std::out_of_range);
    EXPECT_THROW(grid->at(0, 3), std::out_of_range);
}

TEST(SensitivityGridTest, EmptyAxisRejected) {
    auto a = SensitivityGrid::create({}, {0.02}, {});
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ValuationErrorCode::InvalidAxis);
    EXPECT_EQ(a.error().index, 0u);

    auto b = SensitivityGrid::create({0.08}, {}, {});
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ValuationErrorCode::InvalidAxis);
    EXPECT_EQ(b.error().index, 1u);
}

TEST(SensitivityGridTest, CellCountMustMatchShape) {
    auto grid = SensitivityGrid::create({0.08, 0.10}, {0.02}, {SensitivityCell{1.0}});
    ASSERT_FALSE(grid.has_value());
    EXPECT_EQ(grid.error().code, ValuationErrorCode::InvalidAxis);
}
