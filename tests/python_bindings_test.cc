// SPDX-License-Identifier: MIT
#include <gtest/gtest.h>
#include <pybind11/embed.h>
#include <pybind11/stl.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace py = pybind11;

namespace {

// One interpreter for the whole suite; CPython does not restart cleanly
class PythonBindingsTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        interpreter_ = std::make_unique<py::scoped_interpreter>();
    }

    static void TearDownTestSuite() {
        interpreter_.reset();
    }

    py::module_ fv() { return py::module_::import("fairvalue"); }

    py::object scenario_inputs() {
        py::module_ m = fv();
        py::object inputs = m.attr("ValuationInputs")();
        inputs.attr("base_revenue") = 100.0;
        inputs.attr("schedule") = m.attr("GrowthSchedule").attr("with_constant_margin")(
            std::vector<double>{0.20}, 0.35);
        inputs.attr("discount_rate") = 0.10;
        inputs.attr("terminal_growth_rate") = 0.03;
        inputs.attr("net_debt") = 0.0;
        inputs.attr("shares_outstanding") = 10.0;
        return inputs;
    }

    static std::unique_ptr<py::scoped_interpreter> interpreter_;
};

std::unique_ptr<py::scoped_interpreter> PythonBindingsTest::interpreter_;

TEST_F(PythonBindingsTest, ValueCompanyMatchesScenario) {
    py::object report = fv().attr("value_company")(scenario_inputs());
    py::object valuation = report.attr("valuation");

    EXPECT_NEAR(valuation.attr("enterprise_value").cast<double>(), 600.0, 1e-9);
    EXPECT_NEAR(valuation.attr("implied_per_share_value").cast<double>(), 60.0, 1e-9);
    EXPECT_NEAR(report.attr("terminal_value").cast<double>(), 618.0, 1e-9);
    EXPECT_TRUE(report.attr("upside_percent").is_none());
}

TEST_F(PythonBindingsTest, SensitivityReturnsNoneForInvalidCells) {
    py::object rows = fv().attr("sensitivity")(
        scenario_inputs(), std::vector<double>{0.10, 0.04}, std::vector<double>{0.03, 0.05});
    auto grid = rows.cast<std::vector<std::vector<std::optional<double>>>>();

    ASSERT_EQ(grid.size(), 2u);
    ASSERT_EQ(grid[0].size(), 2u);
    ASSERT_TRUE(grid[0][0].has_value());
    EXPECT_NEAR(*grid[0][0], 60.0, 1e-9);
    EXPECT_TRUE(grid[0][1].has_value());
    // r = 0.04 is valid against g = 0.03 only
    EXPECT_TRUE(grid[1][0].has_value());
    EXPECT_FALSE(grid[1][1].has_value());
}

TEST_F(PythonBindingsTest, LibraryErrorsRaiseValueError) {
    py::object inputs = scenario_inputs();
    inputs.attr("terminal_growth_rate") = 0.10;

    try {
        fv().attr("value_company")(inputs);
        FAIL() << "expected ValueError";
    } catch (const py::error_already_set& e) {
        EXPECT_TRUE(e.matches(PyExc_ValueError));
        EXPECT_NE(std::string(e.what()).find("InvalidRateRelationship"), std::string::npos);
    }
}

TEST_F(PythonBindingsTest, WeightedAverageCostOfCapital) {
    py::module_ m = fv();
    py::object cs = m.attr("CapitalStructure")();
    cs.attr("risk_free_rate") = 0.0347;
    cs.attr("equity_beta") = 1.84;
    cs.attr("market_risk_premium") = 0.055;
    cs.attr("cost_of_debt") = 0.024;
    cs.attr("tax_rate") = 0.02;
    cs.attr("debt_weight") = 0.13;
    cs.attr("equity_weight") = 0.87;

    EXPECT_NEAR(m.attr("weighted_average_cost_of_capital")(cs).cast<double>(), 0.1212906, 1e-7);
}

}  // namespace
