// SPDX-License-Identifier: MIT
#include "src/valuation/discounting_engine.hpp"
#include "src/support/valuation_trace.h"

namespace fairvalue {

double DiscountResult::sum_present_values() const noexcept {
    double sum = 0.0;
    for (const auto& f : flows) {
        sum += f.present_value;
    }
    return sum;
}

std::expected<void, ValuationError>
validate_rate_pair(double discount_rate, double terminal_growth_rate) {
    // (1 + r)^t must be positive and finite
    if (!std::isfinite(discount_rate) || discount_rate <= -1.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidRate, discount_rate));
    }
    // g <= -1 turns the Gordon terminal value negative for positive flows
    if (!std::isfinite(terminal_growth_rate) || terminal_growth_rate <= -1.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidRate, terminal_growth_rate));
    }

    // r <= g makes the Gordon denominator zero or negative
    if (discount_rate <= terminal_growth_rate) {
        return std::unexpected(ValuationError(
            ValuationErrorCode::InvalidRateRelationship,
            discount_rate - terminal_growth_rate));
    }
    return {};
}

std::expected<DiscountResult, ValuationError>
discount(std::span<const double> cash_flows,
         double discount_rate,
         double terminal_growth_rate) {
    if (cash_flows.empty()) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_DISCOUNTING,
            static_cast<int>(ValuationErrorCode::InvalidSchedule), 0.0, 0);
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidSchedule, 0.0));
    }

    auto rates_ok = validate_rate_pair(discount_rate, terminal_growth_rate);
    if (!rates_ok) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_DISCOUNTING,
            static_cast<int>(rates_ok.error().code), rates_ok.error().value, 0);
        return std::unexpected(rates_ok.error());
    }

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_DISCOUNTING,
        cash_flows.size(), discount_rate, terminal_growth_rate);

    DiscountResult result;
    result.discount_rate = discount_rate;
    result.terminal_growth_rate = terminal_growth_rate;
    result.flows.reserve(cash_flows.size());

    // compound == (1 + r)^t, accumulated instead of one pow() per period
    const double growth = 1.0 + discount_rate;
    double compound = 1.0;
    for (size_t t = 0; t < cash_flows.size(); ++t) {
        compound *= growth;
        result.flows.push_back({t + 1, cash_flows[t], cash_flows[t] / compound});
    }

    const size_t horizon = cash_flows.size();
    result.terminal_value = gordon_terminal_value(
        cash_flows[horizon - 1], discount_rate, terminal_growth_rate);
    result.discounted_terminal_value = result.terminal_value / compound;

    FAIRVALUE_TRACE_ALGO_COMPLETE(FAIRVALUE_MODULE_DISCOUNTING, horizon,
        result.discounted_terminal_value);
    return result;
}

std::expected<DiscountResult, ValuationError>
discount(const Projection& projection,
         double discount_rate,
         double terminal_growth_rate) {
    auto flows = projection.free_cash_flows();
    return discount(std::span<const double>{flows}, discount_rate, terminal_growth_rate);
}

} // namespace fairvalue
