// SPDX-License-Identifier: MIT
#include "src/valuation/growth_schedule.hpp"
#include <cmath>

namespace fairvalue {

GrowthSchedule GrowthSchedule::constant(double growth_rate, double margin, size_t horizon) {
    return GrowthSchedule(std::vector<GrowthPeriod>(horizon, GrowthPeriod{growth_rate, margin}));
}

GrowthSchedule GrowthSchedule::with_constant_margin(std::span<const double> growth_rates,
                                                    double margin) {
    std::vector<GrowthPeriod> periods;
    periods.reserve(growth_rates.size());
    for (double g : growth_rates) {
        periods.push_back({g, margin});
    }
    return GrowthSchedule(std::move(periods));
}

GrowthSchedule GrowthSchedule::linear_taper(double first_rate, double last_rate,
                                            double margin, size_t horizon) {
    if (horizon < 2) {
        return constant(first_rate, margin, horizon);
    }

    std::vector<GrowthPeriod> periods;
    periods.reserve(horizon);
    const double step = (last_rate - first_rate) / static_cast<double>(horizon - 1);
    for (size_t t = 0; t < horizon; ++t) {
        periods.push_back({first_rate + step * static_cast<double>(t), margin});
    }
    periods.back().growth_rate = last_rate;
    return GrowthSchedule(std::move(periods));
}

std::expected<GrowthSchedule, ValuationError>
GrowthSchedule::from_rates(std::span<const double> growth_rates, std::span<const double> margins) {
    if (growth_rates.size() != margins.size()) {
        return std::unexpected(ValuationError(
            ValuationErrorCode::InvalidSchedule,
            static_cast<double>(margins.size()),
            growth_rates.size()));
    }

    std::vector<GrowthPeriod> periods;
    periods.reserve(growth_rates.size());
    for (size_t i = 0; i < growth_rates.size(); ++i) {
        periods.push_back({growth_rates[i], margins[i]});
    }
    return GrowthSchedule(std::move(periods));
}

std::expected<void, ValuationError> GrowthSchedule::validate() const {
    if (periods.empty()) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidSchedule, 0.0));
    }

    for (size_t i = 0; i < periods.size(); ++i) {
        const auto& p = periods[i];
        // (1 + g) must stay positive for revenue to remain positive
        if (!std::isfinite(p.growth_rate) || p.growth_rate <= -1.0) {
            return std::unexpected(ValuationError(
                ValuationErrorCode::InvalidSchedule, p.growth_rate, i));
        }
        if (!std::isfinite(p.margin)) {
            return std::unexpected(ValuationError(
                ValuationErrorCode::InvalidSchedule, p.margin, i));
        }
    }
    return {};
}

} // namespace fairvalue
