// SPDX-License-Identifier: MIT
#include "src/valuation/projection_engine.hpp"
#include "src/support/valuation_trace.h"
#include <cmath>

namespace fairvalue {

std::vector<double> Projection::revenues() const {
    std::vector<double> out;
    out.reserve(periods_.size());
    for (const auto& p : periods_) {
        out.push_back(p.revenue);
    }
    return out;
}

std::vector<double> Projection::free_cash_flows() const {
    std::vector<double> out;
    out.reserve(periods_.size());
    for (const auto& p : periods_) {
        out.push_back(p.free_cash_flow);
    }
    return out;
}

std::expected<Projection, ValuationError>
project(double base_revenue, const GrowthSchedule& schedule) {
    if (!std::isfinite(base_revenue) || base_revenue < 0.0) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_PROJECTION,
            static_cast<int>(ValuationErrorCode::InvalidBaseRevenue), base_revenue, 0);
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidBaseRevenue, base_revenue));
    }

    auto valid = schedule.validate();
    if (!valid) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_PROJECTION,
            static_cast<int>(valid.error().code), valid.error().value, valid.error().index);
        return std::unexpected(valid.error());
    }

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_PROJECTION, schedule.horizon(), base_revenue, 0);

    std::vector<ProjectedPeriod> periods;
    periods.reserve(schedule.horizon());

    double revenue = base_revenue;
    for (size_t t = 0; t < schedule.horizon(); ++t) {
        const auto& assumption = schedule[t];
        revenue *= 1.0 + assumption.growth_rate;
        periods.push_back({t + 1, revenue, revenue * assumption.margin});
    }

    FAIRVALUE_TRACE_ALGO_COMPLETE(FAIRVALUE_MODULE_PROJECTION, periods.size(), revenue);
    return Projection(base_revenue, std::move(periods));
}

} // namespace fairvalue
