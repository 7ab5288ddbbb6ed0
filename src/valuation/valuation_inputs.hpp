// SPDX-License-Identifier: MIT
/**
 * @file valuation_inputs.hpp
 * @brief Caller-supplied constants for one valuation run
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/growth_schedule.hpp"
#include <cstddef>
#include <expected>
#include <optional>

namespace fairvalue {

/**
 * @brief Everything a DCF run needs, fixed for the duration of the run
 *
 * Units are the caller's choice but must be consistent: revenue, net debt
 * and share count in matching scale (e.g. billions of USD and billions of
 * shares) so that equity / shares is a per-share price.
 *
 * The projection horizon is the schedule length. A constant free cash flow
 * margin is a schedule whose margins are all equal.
 */
struct ValuationInputs {
    double base_revenue = 0.0;           ///< Period-0 revenue
    GrowthSchedule schedule;             ///< One (growth, margin) per projected period
    double discount_rate = 0.0;          ///< Cost of capital (WACC)
    double terminal_growth_rate = 0.0;   ///< Perpetual growth after the horizon (< discount_rate)
    double net_debt = 0.0;               ///< Debt minus cash; negative = net cash
    double shares_outstanding = 0.0;     ///< Share count (> 0)
    std::optional<double> current_price; ///< Market price for upside reporting

    size_t horizon() const noexcept { return schedule.horizon(); }
};

/**
 * @brief Validate everything except the rate pair
 *
 * These are the checks whose failure is fatal to a whole sensitivity sweep:
 * base revenue, schedule, net debt, share count and current price.
 */
[[nodiscard]] std::expected<void, ValuationError>
validate_fixed_inputs(const ValuationInputs& inputs);

/// Full validation, including discount_rate > terminal_growth_rate
[[nodiscard]] std::expected<void, ValuationError>
validate_valuation_inputs(const ValuationInputs& inputs);

} // namespace fairvalue
