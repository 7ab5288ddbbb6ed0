// SPDX-License-Identifier: MIT
/**
 * @file segment_forecast.hpp
 * @brief Per-segment revenue forecast with a shifting business mix
 *
 * Each segment grows at its own rate, scaled every period by a mix
 * multiplier that shifts revenue between segments (e.g. diversification
 * away from a dominant segment). The adjusted revenue is the next
 * period's base, so multipliers compound.
 *
 * The total-revenue path feeds the DCF pipeline via to_growth_schedule().
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/growth_schedule.hpp"
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

namespace fairvalue {

/// One reporting segment
struct Segment {
    std::string name;
    double base_revenue = 0.0;            ///< Period-0 revenue (>= 0)
    double growth_rate = 0.0;             ///< Per-period growth before the mix adjustment (> -1)
    std::vector<double> mix_multipliers;  ///< One per period (>= 0), at least horizon entries
};

/// Forecast configuration
struct SegmentForecastConfig {
    size_t horizon = 3;                  ///< Periods to forecast
    double base_gross_margin = 0.0;      ///< Gross margin of the base period
    double gross_margin_step = 0.0;      ///< Decline per period
    double gross_margin_floor = 0.0;     ///< Gross margin never drops below this
    double net_income_margin = 0.0;      ///< Net income as a fraction of total revenue
};

/// Forecast of one period (1-indexed)
struct SegmentPeriodForecast {
    size_t period = 0;
    std::vector<double> segment_revenues;  ///< Same order as the input segments
    std::vector<double> segment_shares;    ///< Percent of total revenue, sums to 100
    double total_revenue = 0.0;
    double gross_margin = 0.0;
    double net_income = 0.0;
};

/// Result of forecast_segments()
class SegmentForecast {
public:
    SegmentForecast(std::vector<std::string> segment_names,
                    double base_total_revenue,
                    std::vector<SegmentPeriodForecast> periods)
        : segment_names_(std::move(segment_names))
        , base_total_revenue_(base_total_revenue)
        , periods_(std::move(periods))
    {}

    const std::vector<std::string>& segment_names() const noexcept { return segment_names_; }
    size_t segment_count() const noexcept { return segment_names_.size(); }

    /// Sum of segment base revenues
    double base_total_revenue() const noexcept { return base_total_revenue_; }

    size_t horizon() const noexcept { return periods_.size(); }
    const std::vector<SegmentPeriodForecast>& periods() const noexcept { return periods_; }
    const SegmentPeriodForecast& operator[](size_t i) const { return periods_[i]; }

    /**
     * @brief Total-revenue path as a GrowthSchedule
     *
     * g[t] = total[t] / total[t-1] - 1 with total[0] = base_total_revenue(),
     * every period carrying fcf_margin. Projecting the schedule from
     * base_total_revenue() reproduces the forecast totals.
     *
     * @return Schedule, or InvalidSchedule if a total is not positive
     */
    [[nodiscard]] std::expected<GrowthSchedule, ValuationError>
    to_growth_schedule(double fcf_margin) const;

private:
    std::vector<std::string> segment_names_;
    double base_total_revenue_;
    std::vector<SegmentPeriodForecast> periods_;
};

/**
 * @brief Forecast segment revenues, gross margin and net income
 *
 * rev[s][t]    = rev[s][t-1] * (1 + growth[s]) * mix[s][t-1]
 * total[t]     = sum over s of rev[s][t]
 * gross_margin = max(base_gross_margin - t * step, floor)
 * net_income   = total[t] * net_income_margin
 *
 * @return Forecast, or InvalidSchedule (no segments, horizon 0, short or
 *         negative multipliers, growth <= -1, non-finite config) /
 *         InvalidBaseRevenue (negative or non-finite segment base); the
 *         error index is the segment index
 */
[[nodiscard]] std::expected<SegmentForecast, ValuationError>
forecast_segments(std::span<const Segment> segments, const SegmentForecastConfig& config);

} // namespace fairvalue
