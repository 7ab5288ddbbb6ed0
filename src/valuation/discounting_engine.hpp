// SPDX-License-Identifier: MIT
/**
 * @file discounting_engine.hpp
 * @brief Present value of projected flows plus a Gordon growth terminal value
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/projection_engine.hpp"
#include <cmath>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace fairvalue {

/// Cash flow of one period with its present value
struct DiscountedFlow {
    size_t period = 0;           ///< 1-indexed period
    double nominal = 0.0;        ///< Undiscounted cash flow
    double present_value = 0.0;  ///< nominal / (1 + r)^period
};

/// Output of discount(): discounted flows and terminal value for one rate pair
struct DiscountResult {
    std::vector<DiscountedFlow> flows;
    double terminal_value = 0.0;             ///< Gordon growth value at the horizon
    double discounted_terminal_value = 0.0;  ///< terminal_value / (1 + r)^horizon
    double discount_rate = 0.0;
    double terminal_growth_rate = 0.0;

    size_t horizon() const noexcept { return flows.size(); }

    /// Sum of the present values of the explicit-horizon flows
    double sum_present_values() const noexcept;
};

/// Discount factor 1 / (1 + rate)^period
[[nodiscard]] inline double discount_factor(double rate, size_t period) {
    return 1.0 / std::pow(1.0 + rate, static_cast<double>(period));
}

/// Gordon growth terminal value: flow * (1 + g) / (r - g)
///
/// No precondition check; discount() guards r > g before calling this.
[[nodiscard]] inline double gordon_terminal_value(double final_flow,
                                                  double discount_rate,
                                                  double terminal_growth_rate) noexcept {
    return final_flow * (1.0 + terminal_growth_rate) / (discount_rate - terminal_growth_rate);
}

/// Check the rate pair: finite, both rates > -1, discount_rate > terminal_growth_rate
[[nodiscard]] std::expected<void, ValuationError>
validate_rate_pair(double discount_rate, double terminal_growth_rate);

/**
 * @brief Discount a cash flow sequence and compute its terminal value
 *
 * PV[t] = flow[t] / (1 + r)^t for t = 1..n
 * TV    = flow[n] * (1 + g) / (r - g), discounted by (1 + r)^n
 *
 * The terminal value is realized at the end of the explicit horizon, so it
 * is discounted at the same power as the final period.
 *
 * @param cash_flows Flows for periods 1..n (non-empty)
 * @param discount_rate Cost of capital r
 * @param terminal_growth_rate Perpetual growth g (must be < r)
 * @return DiscountResult, or InvalidSchedule / InvalidRate / InvalidRateRelationship
 */
[[nodiscard]] std::expected<DiscountResult, ValuationError>
discount(std::span<const double> cash_flows,
         double discount_rate,
         double terminal_growth_rate);

/// Discount the free cash flows of a projection
[[nodiscard]] std::expected<DiscountResult, ValuationError>
discount(const Projection& projection,
         double discount_rate,
         double terminal_growth_rate);

} // namespace fairvalue
