// SPDX-License-Identifier: MIT
/**
 * @file growth_schedule.hpp
 * @brief Per-period growth and free cash flow margin assumptions
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace fairvalue {

/// Assumptions for one projected period
struct GrowthPeriod {
    double growth_rate = 0.0;  ///< Revenue growth over the prior period (0.25 = 25%)
    double margin = 0.0;       ///< Free cash flow as a fraction of revenue
};

/**
 * @brief Ordered growth/margin assumptions, one entry per projected period
 *
 * The schedule length is the projection horizon. Entries may follow any
 * pattern (constant growth, deceleration, per-period margins).
 *
 * The schedule is plain data; validate() (also run by project()) enforces
 * a non-empty sequence with finite values and growth rates above -1.
 */
struct GrowthSchedule {
    std::vector<GrowthPeriod> periods;

    GrowthSchedule() = default;

    explicit GrowthSchedule(std::vector<GrowthPeriod> periods_)
        : periods(std::move(periods_))
    {}

    /// Same growth rate and margin for every period
    static GrowthSchedule constant(double growth_rate, double margin, size_t horizon);

    /// Per-period growth rates with a single margin
    static GrowthSchedule with_constant_margin(std::span<const double> growth_rates,
                                               double margin);

    /// Growth decelerating linearly from first_rate to last_rate over horizon periods
    static GrowthSchedule linear_taper(double first_rate, double last_rate,
                                       double margin, size_t horizon);

    /// Zip per-period growth rates and margins (sizes must match)
    static std::expected<GrowthSchedule, ValuationError>
    from_rates(std::span<const double> growth_rates, std::span<const double> margins);

    /// Number of projected periods
    [[nodiscard]] size_t horizon() const noexcept { return periods.size(); }

    [[nodiscard]] bool empty() const noexcept { return periods.empty(); }

    [[nodiscard]] const GrowthPeriod& operator[](size_t i) const { return periods[i]; }

    /// Empty schedule, growth <= -1 or non-finite entries yield InvalidSchedule
    [[nodiscard]] std::expected<void, ValuationError> validate() const;
};

} // namespace fairvalue
