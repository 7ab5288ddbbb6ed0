// SPDX-License-Identifier: MIT
/**
 * @file historical_growth.hpp
 * @brief Growth rates derived from historical financial figures
 *
 * Used to turn reported statements (two fiscal years of revenue, a run of
 * annual growth rates) into the assumptions a GrowthSchedule is built from.
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>

namespace fairvalue {

/// Growth from one period to the next: current / prior - 1
///
/// @return Growth rate, or InvalidHistory when prior <= 0 or either value is non-finite
[[nodiscard]] std::expected<double, ValuationError>
period_growth(double prior, double current);

/**
 * @brief Compound annual growth rate between two observations
 *
 * (last / first)^(1 / periods) - 1
 *
 * @param first Earliest observation (> 0)
 * @param last Latest observation (> 0)
 * @param periods Number of compounding periods between them (> 0)
 */
[[nodiscard]] std::expected<double, ValuationError>
compound_annual_growth(double first, double last, size_t periods);

/// Geometric mean of per-period growth rates: (prod(1 + g))^(1/n) - 1
///
/// Rates must be non-empty, finite and > -1; index reports the offending rate.
[[nodiscard]] std::expected<double, ValuationError>
geometric_mean_growth(std::span<const double> rates);

/// Metric after compounding base at rate for the given number of periods
[[nodiscard]] double project_metric(double base, double rate, size_t periods);

} // namespace fairvalue
