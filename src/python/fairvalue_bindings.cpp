// SPDX-License-Identifier: MIT
/**
 * @file fairvalue_bindings.cpp
 * @brief Python bindings for the fairvalue DCF library using pybind11
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <sstream>
#include "src/math/rate_axis.hpp"
#include "src/valuation/cost_of_capital.hpp"
#include "src/valuation/dcf_model.hpp"
#include "src/valuation/growth_schedule.hpp"
#include "src/valuation/historical_growth.hpp"
#include "src/valuation/segment_forecast.hpp"
#include "src/valuation/sensitivity_analyzer.hpp"

namespace py = pybind11;

namespace {

// Raise a ValuationError as ValueError naming the error code
[[noreturn]] void throw_valuation_error(const fairvalue::ValuationError& err) {
    std::ostringstream oss;
    oss << fairvalue::to_string(err.code) << " (value=" << err.value
        << ", index=" << err.index << ")";
    throw py::value_error(oss.str());
}

// Unwrap an expected, raising ValueError on failure
template <typename T>
T unwrap(std::expected<T, fairvalue::ValuationError> result) {
    if (!result.has_value()) {
        throw_valuation_error(result.error());
    }
    return std::move(result.value());
}

}  // anonymous namespace

PYBIND11_MODULE(fairvalue, m) {
    m.doc() = "Python bindings for the fairvalue discounted cash flow valuation engine";

    py::enum_<fairvalue::ValuationErrorCode>(m, "ValuationErrorCode")
        .value("InvalidSchedule", fairvalue::ValuationErrorCode::InvalidSchedule)
        .value("InvalidRateRelationship", fairvalue::ValuationErrorCode::InvalidRateRelationship)
        .value("InvalidShareCount", fairvalue::ValuationErrorCode::InvalidShareCount)
        .value("InvalidBaseRevenue", fairvalue::ValuationErrorCode::InvalidBaseRevenue)
        .value("InvalidRate", fairvalue::ValuationErrorCode::InvalidRate)
        .value("InvalidNetDebt", fairvalue::ValuationErrorCode::InvalidNetDebt)
        .value("InvalidMarketPrice", fairvalue::ValuationErrorCode::InvalidMarketPrice)
        .value("InvalidAxis", fairvalue::ValuationErrorCode::InvalidAxis)
        .value("InvalidCapitalStructure", fairvalue::ValuationErrorCode::InvalidCapitalStructure)
        .value("InvalidHistory", fairvalue::ValuationErrorCode::InvalidHistory);

    // =========================================================================
    // Growth schedule
    // =========================================================================

    py::class_<fairvalue::GrowthPeriod>(m, "GrowthPeriod")
        .def(py::init<>())
        .def(py::init([](double growth_rate, double margin) {
            return fairvalue::GrowthPeriod{growth_rate, margin};
        }), py::arg("growth_rate"), py::arg("margin"))
        .def_readwrite("growth_rate", &fairvalue::GrowthPeriod::growth_rate)
        .def_readwrite("margin", &fairvalue::GrowthPeriod::margin);

    py::class_<fairvalue::GrowthSchedule>(m, "GrowthSchedule")
        .def(py::init<>())
        .def(py::init<std::vector<fairvalue::GrowthPeriod>>(), py::arg("periods"))
        .def_readwrite("periods", &fairvalue::GrowthSchedule::periods)
        .def_static("constant", &fairvalue::GrowthSchedule::constant,
            py::arg("growth_rate"), py::arg("margin"), py::arg("horizon"),
            "Same growth rate and margin for every period")
        .def_static("with_constant_margin",
            [](const std::vector<double>& growth_rates, double margin) {
                return fairvalue::GrowthSchedule::with_constant_margin(growth_rates, margin);
            },
            py::arg("growth_rates"), py::arg("margin"),
            "Per-period growth rates with a single margin")
        .def_static("linear_taper", &fairvalue::GrowthSchedule::linear_taper,
            py::arg("first_rate"), py::arg("last_rate"), py::arg("margin"), py::arg("horizon"),
            "Growth decelerating linearly from first_rate to last_rate")
        .def_static("from_rates",
            [](const std::vector<double>& growth_rates, const std::vector<double>& margins) {
                return unwrap(fairvalue::GrowthSchedule::from_rates(growth_rates, margins));
            },
            py::arg("growth_rates"), py::arg("margins"),
            "Zip per-period growth rates and margins")
        .def_property_readonly("horizon", &fairvalue::GrowthSchedule::horizon)
        .def("__len__", &fairvalue::GrowthSchedule::horizon)
        .def("__repr__", [](const fairvalue::GrowthSchedule& self) {
            return "<GrowthSchedule horizon=" + std::to_string(self.horizon()) + ">";
        });

    // =========================================================================
    // Single valuation
    // =========================================================================

    py::class_<fairvalue::ValuationInputs>(m, "ValuationInputs")
        .def(py::init<>())
        .def_readwrite("base_revenue", &fairvalue::ValuationInputs::base_revenue)
        .def_readwrite("schedule", &fairvalue::ValuationInputs::schedule)
        .def_readwrite("discount_rate", &fairvalue::ValuationInputs::discount_rate)
        .def_readwrite("terminal_growth_rate", &fairvalue::ValuationInputs::terminal_growth_rate)
        .def_readwrite("net_debt", &fairvalue::ValuationInputs::net_debt)
        .def_readwrite("shares_outstanding", &fairvalue::ValuationInputs::shares_outstanding)
        .def_readwrite("current_price", &fairvalue::ValuationInputs::current_price);

    py::class_<fairvalue::ProjectedPeriod>(m, "ProjectedPeriod")
        .def_readonly("period", &fairvalue::ProjectedPeriod::period)
        .def_readonly("revenue", &fairvalue::ProjectedPeriod::revenue)
        .def_readonly("free_cash_flow", &fairvalue::ProjectedPeriod::free_cash_flow);

    py::class_<fairvalue::DiscountedFlow>(m, "DiscountedFlow")
        .def_readonly("period", &fairvalue::DiscountedFlow::period)
        .def_readonly("nominal", &fairvalue::DiscountedFlow::nominal)
        .def_readonly("present_value", &fairvalue::DiscountedFlow::present_value);

    py::class_<fairvalue::ValuationResult>(m, "ValuationResult")
        .def_readonly("enterprise_value", &fairvalue::ValuationResult::enterprise_value)
        .def_readonly("equity_value", &fairvalue::ValuationResult::equity_value)
        .def_readonly("implied_per_share_value", &fairvalue::ValuationResult::implied_per_share_value)
        .def_readonly("discount_rate", &fairvalue::ValuationResult::discount_rate)
        .def_readonly("terminal_growth_rate", &fairvalue::ValuationResult::terminal_growth_rate)
        .def("__repr__", [](const fairvalue::ValuationResult& self) {
            return "<ValuationResult ev=" + std::to_string(self.enterprise_value) +
                   " equity=" + std::to_string(self.equity_value) +
                   " per_share=" + std::to_string(self.implied_per_share_value) + ">";
        });

    py::class_<fairvalue::DcfReport>(m, "DcfReport")
        .def_property_readonly("projection", [](const fairvalue::DcfReport& self) {
            return self.projection.periods();
        })
        .def_property_readonly("discounted_flows", [](const fairvalue::DcfReport& self) {
            return self.discounting.flows;
        })
        .def_property_readonly("terminal_value", [](const fairvalue::DcfReport& self) {
            return self.discounting.terminal_value;
        })
        .def_property_readonly("discounted_terminal_value", [](const fairvalue::DcfReport& self) {
            return self.discounting.discounted_terminal_value;
        })
        .def_readonly("valuation", &fairvalue::DcfReport::valuation)
        .def_readonly("upside_percent", &fairvalue::DcfReport::upside_percent);

    m.def("value_company",
        [](const fairvalue::ValuationInputs& inputs) {
            return unwrap(fairvalue::value_company(inputs));
        },
        py::arg("inputs"),
        R"pbdoc(
            Value a company: project, discount, aggregate.

            Args:
                inputs: ValuationInputs

            Returns:
                DcfReport with projection, discounted flows and valuation

            Raises:
                ValueError: On invalid inputs, named by error code
        )pbdoc");

    // =========================================================================
    // Sensitivity sweep
    // =========================================================================

    m.def("linspace",
        [](double start, double stop, size_t count) {
            return unwrap(fairvalue::linspace(start, stop, count));
        },
        py::arg("start"), py::arg("stop"), py::arg("count"),
        "Evenly spaced values on [start, stop], endpoints included");

    m.def("sensitivity",
        [](const fairvalue::ValuationInputs& inputs,
           const std::vector<double>& discount_rates,
           const std::vector<double>& terminal_growth_rates,
           bool parallel) {
            fairvalue::SensitivityAnalyzer analyzer;
            analyzer.set_parallel(parallel);

            std::expected<fairvalue::SensitivityGrid, fairvalue::ValuationError> result =
                std::unexpected(fairvalue::ValuationError(fairvalue::ValuationErrorCode::InvalidAxis));
            {
                py::gil_scoped_release release;
                result = analyzer.sweep(inputs, discount_rates, terminal_growth_rates);
            }
            const fairvalue::SensitivityGrid grid = unwrap(std::move(result));

            // Rows follow discount_rates, columns terminal_growth_rates
            py::list rows;
            for (size_t i = 0; i < grid.rows(); ++i) {
                py::list row;
                for (size_t j = 0; j < grid.cols(); ++j) {
                    auto v = grid.value(i, j);
                    row.append(v ? py::cast(*v) : py::none());
                }
                rows.append(row);
            }
            return rows;
        },
        py::arg("inputs"), py::arg("discount_rates"), py::arg("terminal_growth_rates"),
        py::arg("parallel") = true,
        R"pbdoc(
            Implied per-share value over discount rate x terminal growth.

            Args:
                inputs: ValuationInputs (its rate pair is ignored)
                discount_rates: Row axis
                terminal_growth_rates: Column axis
                parallel: Use OpenMP threads when available

            Returns:
                List of rows; a cell is None where terminal growth >= discount rate

            Raises:
                ValueError: On invalid fixed inputs or empty axes
        )pbdoc");

    // =========================================================================
    // Cost of capital and historical growth
    // =========================================================================

    py::class_<fairvalue::CapitalStructure>(m, "CapitalStructure")
        .def(py::init<>())
        .def_readwrite("risk_free_rate", &fairvalue::CapitalStructure::risk_free_rate)
        .def_readwrite("equity_beta", &fairvalue::CapitalStructure::equity_beta)
        .def_readwrite("market_risk_premium", &fairvalue::CapitalStructure::market_risk_premium)
        .def_readwrite("cost_of_debt", &fairvalue::CapitalStructure::cost_of_debt)
        .def_readwrite("tax_rate", &fairvalue::CapitalStructure::tax_rate)
        .def_readwrite("debt_weight", &fairvalue::CapitalStructure::debt_weight)
        .def_readwrite("equity_weight", &fairvalue::CapitalStructure::equity_weight);

    m.def("cost_of_equity",
        [](double risk_free_rate, double equity_beta, double market_risk_premium) {
            return unwrap(fairvalue::cost_of_equity(risk_free_rate, equity_beta, market_risk_premium));
        },
        py::arg("risk_free_rate"), py::arg("equity_beta"), py::arg("market_risk_premium"),
        "CAPM cost of equity");

    m.def("weighted_average_cost_of_capital",
        [](const fairvalue::CapitalStructure& cs) {
            return unwrap(fairvalue::weighted_average_cost_of_capital(cs));
        },
        py::arg("capital_structure"), "WACC of a capital structure");

    m.def("period_growth",
        [](double prior, double current) {
            return unwrap(fairvalue::period_growth(prior, current));
        },
        py::arg("prior"), py::arg("current"));

    m.def("compound_annual_growth",
        [](double first, double last, size_t periods) {
            return unwrap(fairvalue::compound_annual_growth(first, last, periods));
        },
        py::arg("first"), py::arg("last"), py::arg("periods"));

    m.def("geometric_mean_growth",
        [](const std::vector<double>& rates) {
            return unwrap(fairvalue::geometric_mean_growth(rates));
        },
        py::arg("rates"));

    // =========================================================================
    // Segment forecast
    // =========================================================================

    py::class_<fairvalue::Segment>(m, "Segment")
        .def(py::init<>())
        .def(py::init([](std::string name, double base_revenue, double growth_rate,
                         std::vector<double> mix_multipliers) {
            return fairvalue::Segment{std::move(name), base_revenue, growth_rate,
                                      std::move(mix_multipliers)};
        }), py::arg("name"), py::arg("base_revenue"), py::arg("growth_rate"),
            py::arg("mix_multipliers"))
        .def_readwrite("name", &fairvalue::Segment::name)
        .def_readwrite("base_revenue", &fairvalue::Segment::base_revenue)
        .def_readwrite("growth_rate", &fairvalue::Segment::growth_rate)
        .def_readwrite("mix_multipliers", &fairvalue::Segment::mix_multipliers);

    py::class_<fairvalue::SegmentForecastConfig>(m, "SegmentForecastConfig")
        .def(py::init<>())
        .def_readwrite("horizon", &fairvalue::SegmentForecastConfig::horizon)
        .def_readwrite("base_gross_margin", &fairvalue::SegmentForecastConfig::base_gross_margin)
        .def_readwrite("gross_margin_step", &fairvalue::SegmentForecastConfig::gross_margin_step)
        .def_readwrite("gross_margin_floor", &fairvalue::SegmentForecastConfig::gross_margin_floor)
        .def_readwrite("net_income_margin", &fairvalue::SegmentForecastConfig::net_income_margin);

    py::class_<fairvalue::SegmentPeriodForecast>(m, "SegmentPeriodForecast")
        .def_readonly("period", &fairvalue::SegmentPeriodForecast::period)
        .def_readonly("segment_revenues", &fairvalue::SegmentPeriodForecast::segment_revenues)
        .def_readonly("segment_shares", &fairvalue::SegmentPeriodForecast::segment_shares)
        .def_readonly("total_revenue", &fairvalue::SegmentPeriodForecast::total_revenue)
        .def_readonly("gross_margin", &fairvalue::SegmentPeriodForecast::gross_margin)
        .def_readonly("net_income", &fairvalue::SegmentPeriodForecast::net_income);

    py::class_<fairvalue::SegmentForecast>(m, "SegmentForecast")
        .def_property_readonly("segment_names", &fairvalue::SegmentForecast::segment_names)
        .def_property_readonly("base_total_revenue", &fairvalue::SegmentForecast::base_total_revenue)
        .def_property_readonly("periods", &fairvalue::SegmentForecast::periods)
        .def("to_growth_schedule",
            [](const fairvalue::SegmentForecast& self, double fcf_margin) {
                return unwrap(self.to_growth_schedule(fcf_margin));
            },
            py::arg("fcf_margin"),
            "Total-revenue path as a GrowthSchedule with a constant margin");

    m.def("forecast_segments",
        [](const std::vector<fairvalue::Segment>& segments,
           const fairvalue::SegmentForecastConfig& config) {
            return unwrap(fairvalue::forecast_segments(segments, config));
        },
        py::arg("segments"), py::arg("config"));
}
