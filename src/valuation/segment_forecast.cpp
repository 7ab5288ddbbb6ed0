// SPDX-License-Identifier: MIT
#include "src/valuation/segment_forecast.hpp"
#include "src/support/valuation_trace.h"
#include <algorithm>
#include <cmath>

namespace fairvalue {

namespace {

ValuationError reject(ValuationErrorCode code, double value, size_t index) {
    FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_SEGMENTS,
        static_cast<int>(code), value, index);
    return ValuationError(code, value, index);
}

std::expected<void, ValuationError>
validate_config(const SegmentForecastConfig& config) {
    if (config.horizon == 0) {
        return std::unexpected(reject(ValuationErrorCode::InvalidSchedule, 0.0, 0));
    }
    const double values[] = {
        config.base_gross_margin, config.gross_margin_step,
        config.gross_margin_floor, config.net_income_margin
    };
    for (double v : values) {
        if (!std::isfinite(v)) {
            return std::unexpected(reject(ValuationErrorCode::InvalidSchedule, v, 0));
        }
    }
    return {};
}

std::expected<void, ValuationError>
validate_segment(const Segment& segment, size_t index, size_t horizon) {
    if (!std::isfinite(segment.base_revenue) || segment.base_revenue < 0.0) {
        return std::unexpected(reject(ValuationErrorCode::InvalidBaseRevenue,
                                      segment.base_revenue, index));
    }
    if (!std::isfinite(segment.growth_rate) || segment.growth_rate <= -1.0) {
        return std::unexpected(reject(ValuationErrorCode::InvalidSchedule,
                                      segment.growth_rate, index));
    }
    if (segment.mix_multipliers.size() < horizon) {
        return std::unexpected(reject(ValuationErrorCode::InvalidSchedule,
            static_cast<double>(segment.mix_multipliers.size()), index));
    }
    for (size_t t = 0; t < horizon; ++t) {
        const double m = segment.mix_multipliers[t];
        if (!std::isfinite(m) || m < 0.0) {
            return std::unexpected(reject(ValuationErrorCode::InvalidSchedule, m, index));
        }
    }
    return {};
}

}  // anonymous namespace

std::expected<GrowthSchedule, ValuationError>
SegmentForecast::to_growth_schedule(double fcf_margin) const {
    if (!std::isfinite(fcf_margin)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidSchedule, fcf_margin));
    }

    std::vector<GrowthPeriod> schedule;
    schedule.reserve(periods_.size());

    double prior = base_total_revenue_;
    for (size_t t = 0; t < periods_.size(); ++t) {
        if (prior <= 0.0) {
            return std::unexpected(ValuationError(ValuationErrorCode::InvalidSchedule, prior, t));
        }
        const double total = periods_[t].total_revenue;
        schedule.push_back({total / prior - 1.0, fcf_margin});
        prior = total;
    }
    return GrowthSchedule(std::move(schedule));
}

std::expected<SegmentForecast, ValuationError>
forecast_segments(std::span<const Segment> segments, const SegmentForecastConfig& config) {
    if (segments.empty()) {
        return std::unexpected(reject(ValuationErrorCode::InvalidSchedule, 0.0, 0));
    }
    if (auto ok = validate_config(config); !ok) {
        return std::unexpected(ok.error());
    }
    for (size_t s = 0; s < segments.size(); ++s) {
        if (auto ok = validate_segment(segments[s], s, config.horizon); !ok) {
            return std::unexpected(ok.error());
        }
    }

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_SEGMENTS,
        segments.size(), config.horizon, config.base_gross_margin);

    const size_t n = segments.size();
    std::vector<std::string> names;
    std::vector<double> current(n);
    names.reserve(n);
    double base_total = 0.0;
    for (size_t s = 0; s < n; ++s) {
        names.push_back(segments[s].name);
        current[s] = segments[s].base_revenue;
        base_total += current[s];
    }

    std::vector<SegmentPeriodForecast> periods;
    periods.reserve(config.horizon);

    for (size_t t = 1; t <= config.horizon; ++t) {
        SegmentPeriodForecast out;
        out.period = t;
        out.segment_revenues.resize(n);
        out.segment_shares.resize(n);

        for (size_t s = 0; s < n; ++s) {
            const Segment& seg = segments[s];
            current[s] = current[s] * (1.0 + seg.growth_rate) * seg.mix_multipliers[t - 1];
            out.segment_revenues[s] = current[s];
            out.total_revenue += current[s];
        }

        // All-zero period: shares stay 0 rather than 0/0
        if (out.total_revenue > 0.0) {
            for (size_t s = 0; s < n; ++s) {
                out.segment_shares[s] = out.segment_revenues[s] / out.total_revenue * 100.0;
            }
        }

        out.gross_margin = std::max(
            config.base_gross_margin - static_cast<double>(t) * config.gross_margin_step,
            config.gross_margin_floor);
        out.net_income = out.total_revenue * config.net_income_margin;

        periods.push_back(std::move(out));
    }

    FAIRVALUE_TRACE_ALGO_COMPLETE(FAIRVALUE_MODULE_SEGMENTS,
        periods.size(), periods.back().total_revenue);

    return SegmentForecast(std::move(names), base_total, std::move(periods));
}

} // namespace fairvalue
