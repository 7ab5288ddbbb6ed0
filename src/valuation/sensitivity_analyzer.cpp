// SPDX-License-Identifier: MIT
#include "src/valuation/sensitivity_analyzer.hpp"
#include "src/math/rate_axis.hpp"
#include "src/support/parallel.hpp"
#include "src/support/valuation_trace.h"
#include "src/valuation/discounting_engine.hpp"
#include "src/valuation/valuation_aggregator.hpp"

namespace fairvalue {

namespace {

/// One cell: discount + aggregate for a single rate pair
SensitivityCell evaluate_cell(std::span<const double> cash_flows,
                              double discount_rate,
                              double terminal_growth_rate,
                              double net_debt,
                              double shares_outstanding) {
    auto discounted = discount(cash_flows, discount_rate, terminal_growth_rate);
    if (!discounted) {
        return std::unexpected(discounted.error());
    }
    auto valuation = aggregate(*discounted, net_debt, shares_outstanding);
    if (!valuation) {
        return std::unexpected(valuation.error());
    }
    return valuation->implied_per_share_value;
}

}  // anonymous namespace

std::expected<SensitivityGrid, ValuationError>
SensitivityAnalyzer::sweep(const ValuationInputs& inputs,
                           std::span<const double> discount_rate_axis,
                           std::span<const double> terminal_growth_axis) const {
    auto fixed_ok = validate_fixed_inputs(inputs);
    if (!fixed_ok) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_SENSITIVITY,
            static_cast<int>(fixed_ok.error().code), fixed_ok.error().value, fixed_ok.error().index);
        return std::unexpected(fixed_ok.error());
    }

    // Projection runs once; only discounting and aggregation vary per cell
    auto projection = project(inputs.base_revenue, inputs.schedule);
    if (!projection) {
        return std::unexpected(projection.error());
    }

    return sweep(*projection, inputs.net_debt, inputs.shares_outstanding,
                 discount_rate_axis, terminal_growth_axis);
}

std::expected<SensitivityGrid, ValuationError>
SensitivityAnalyzer::sweep(const Projection& projection,
                           double net_debt,
                           double shares_outstanding,
                           std::span<const double> discount_rate_axis,
                           std::span<const double> terminal_growth_axis) const {
    if (auto ok = validate_axis(discount_rate_axis); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_axis(terminal_growth_axis); !ok) {
        return std::unexpected(ok.error());
    }
    if (projection.horizon() == 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidSchedule, 0.0));
    }
    if (auto ok = validate_share_count(shares_outstanding); !ok) {
        return std::unexpected(ok.error());
    }
    if (auto ok = validate_net_debt(net_debt); !ok) {
        return std::unexpected(ok.error());
    }

    const size_t rows = discount_rate_axis.size();
    const size_t cols = terminal_growth_axis.size();

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_SENSITIVITY, rows, cols, projection.horizon());

    const std::vector<double> flows = projection.free_cash_flows();
    const std::span<const double> flow_span{flows};
    std::vector<SensitivityCell> cells(rows * cols);

    [[maybe_unused]] const bool use_parallel = config_.parallel && cells.size() >= config_.min_parallel_cells;

    // Each cell writes only its own slot; flows and axes are read-only
    FAIRVALUE_PRAGMA_PARALLEL_IF(use_parallel)
    {
        FAIRVALUE_PRAGMA_FOR_COLLAPSE2
        for (size_t i = 0; i < rows; ++i) {
            for (size_t j = 0; j < cols; ++j) {
                const double r = discount_rate_axis[i];
                const double g = terminal_growth_axis[j];
                SensitivityCell cell = evaluate_cell(flow_span, r, g, net_debt, shares_outstanding);
                if (!cell) {
                    FAIRVALUE_TRACE_SWEEP_CELL_INVALID(i, j, r, g,
                        static_cast<int>(cell.error().code));
                    cell.error().index = i * cols + j;
                }
                cells[i * cols + j] = std::move(cell);
            }
        }
    }

    auto grid = SensitivityGrid::create(
        std::vector<double>(discount_rate_axis.begin(), discount_rate_axis.end()),
        std::vector<double>(terminal_growth_axis.begin(), terminal_growth_axis.end()),
        std::move(cells));
    if (grid) {
        FAIRVALUE_TRACE_SWEEP_COMPLETE(rows, cols, grid->failed_count());
    }
    return grid;
}

} // namespace fairvalue
