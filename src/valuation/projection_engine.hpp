// SPDX-License-Identifier: MIT
/**
 * @file projection_engine.hpp
 * @brief Revenue and free cash flow projection under a growth schedule
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/growth_schedule.hpp"
#include <cstddef>
#include <expected>
#include <vector>

namespace fairvalue {

/// One projected period (1-indexed)
struct ProjectedPeriod {
    size_t period = 0;
    double revenue = 0.0;
    double free_cash_flow = 0.0;
};

/**
 * @brief Immutable projection produced by project()
 *
 * Each call to project() returns a fresh Projection, so the same schedule
 * can be re-projected under different assumptions without aliasing.
 */
class Projection {
public:
    explicit Projection(double base_revenue, std::vector<ProjectedPeriod> periods)
        : base_revenue_(base_revenue)
        , periods_(std::move(periods))
    {}

    double base_revenue() const noexcept { return base_revenue_; }
    size_t horizon() const noexcept { return periods_.size(); }

    const std::vector<ProjectedPeriod>& periods() const noexcept { return periods_; }
    const ProjectedPeriod& operator[](size_t i) const { return periods_[i]; }
    const ProjectedPeriod& final_period() const { return periods_.back(); }

    /// Projected revenues in period order
    std::vector<double> revenues() const;

    /// Projected free cash flows in period order (input to discount())
    std::vector<double> free_cash_flows() const;

private:
    double base_revenue_;
    std::vector<ProjectedPeriod> periods_;
};

/**
 * @brief Project revenue and free cash flow period by period
 *
 * revenue[t] = revenue[t-1] * (1 + growth[t]), revenue[0] = base_revenue
 * fcf[t]     = revenue[t] * margin[t]
 *
 * @param base_revenue Period-0 revenue (finite, >= 0)
 * @param schedule Growth/margin assumptions, one per period
 * @return Projection, or InvalidSchedule / InvalidBaseRevenue
 */
[[nodiscard]] std::expected<Projection, ValuationError>
project(double base_revenue, const GrowthSchedule& schedule);

} // namespace fairvalue
