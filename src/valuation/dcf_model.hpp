// SPDX-License-Identifier: MIT
/**
 * @file dcf_model.hpp
 * @brief One-call DCF pipeline: project, discount, aggregate
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/discounting_engine.hpp"
#include "src/valuation/projection_engine.hpp"
#include "src/valuation/valuation_aggregator.hpp"
#include "src/valuation/valuation_inputs.hpp"
#include <expected>
#include <optional>

namespace fairvalue {

/// Every intermediate of a single DCF run, for reporting
struct DcfReport {
    Projection projection;
    DiscountResult discounting;
    ValuationResult valuation;
    std::optional<double> upside_percent;  ///< Present when inputs carry a current price
};

/**
 * @brief Value a company from its inputs
 *
 * Runs GrowthSchedule -> project() -> discount() -> aggregate(), then the
 * upside against inputs.current_price when one is supplied. The first
 * failing stage's error is returned unchanged.
 *
 * Example:
 * ```cpp
 * ValuationInputs in;
 * in.base_revenue = 60.9;
 * in.schedule = GrowthSchedule::linear_taper(0.70, 0.30, 0.70, 5);
 * in.discount_rate = 0.121;
 * in.terminal_growth_rate = 0.035;
 * in.net_debt = -11.0;
 * in.shares_outstanding = 2.46;
 * in.current_price = 121.0;
 *
 * auto report = value_company(in);
 * if (report) {
 *     double per_share = report->valuation.implied_per_share_value;
 * }
 * ```
 */
[[nodiscard]] std::expected<DcfReport, ValuationError>
value_company(const ValuationInputs& inputs);

} // namespace fairvalue
