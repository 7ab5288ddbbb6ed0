// SPDX-License-Identifier: MIT
/**
 * @file valuation_aggregator.hpp
 * @brief Enterprise value, equity value and implied per-share value
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/discounting_engine.hpp"
#include <expected>
#include <span>

namespace fairvalue {

/// Valuation for one (discount rate, terminal growth) pair
struct ValuationResult {
    double enterprise_value = 0.0;         ///< sum(PV) + discounted terminal value
    double equity_value = 0.0;             ///< enterprise_value - net_debt
    double implied_per_share_value = 0.0;  ///< equity_value / shares_outstanding
    double discount_rate = 0.0;
    double terminal_growth_rate = 0.0;
};

/// Rate pair recorded on a ValuationResult
struct RatePair {
    double discount_rate = 0.0;
    double terminal_growth_rate = 0.0;
};

/// Share count must be finite and > 0
[[nodiscard]] std::expected<void, ValuationError>
validate_share_count(double shares_outstanding);

/// Net debt may be negative (net cash) but must be finite
[[nodiscard]] std::expected<void, ValuationError>
validate_net_debt(double net_debt);

/**
 * @brief Combine discounted flows into enterprise, equity and per-share value
 *
 * A negative net_debt is a net cash position and increases equity value.
 *
 * @param flows Discounted explicit-horizon flows
 * @param discounted_terminal_value Terminal value already discounted to today
 * @param net_debt Debt minus cash
 * @param shares_outstanding Share count (> 0)
 * @param rates Rate pair recorded on the result
 * @return ValuationResult, or InvalidShareCount / InvalidNetDebt
 */
[[nodiscard]] std::expected<ValuationResult, ValuationError>
aggregate(std::span<const DiscountedFlow> flows,
          double discounted_terminal_value,
          double net_debt,
          double shares_outstanding,
          RatePair rates = {});

/// Aggregate a DiscountResult, carrying its rate pair onto the result
[[nodiscard]] std::expected<ValuationResult, ValuationError>
aggregate(const DiscountResult& discounted,
          double net_debt,
          double shares_outstanding);

/**
 * @brief Upside (or downside, if negative) of the implied value versus market
 *
 * (implied / current - 1) * 100
 *
 * @return Percentage, or InvalidMarketPrice for a non-positive or non-finite price
 */
[[nodiscard]] std::expected<double, ValuationError>
upside_percent(const ValuationResult& result, double current_price);

} // namespace fairvalue
