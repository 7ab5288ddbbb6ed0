// SPDX-License-Identifier: MIT
#include "src/valuation/valuation_aggregator.hpp"
#include "src/support/valuation_trace.h"
#include <cmath>

namespace fairvalue {

std::expected<void, ValuationError> validate_share_count(double shares_outstanding) {
    if (!std::isfinite(shares_outstanding) || shares_outstanding <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidShareCount, shares_outstanding));
    }
    return {};
}

std::expected<void, ValuationError> validate_net_debt(double net_debt) {
    if (!std::isfinite(net_debt)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidNetDebt, net_debt));
    }
    return {};
}

std::expected<ValuationResult, ValuationError>
aggregate(std::span<const DiscountedFlow> flows,
          double discounted_terminal_value,
          double net_debt,
          double shares_outstanding,
          RatePair rates) {
    auto shares_ok = validate_share_count(shares_outstanding);
    if (!shares_ok) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_AGGREGATION,
            static_cast<int>(ValuationErrorCode::InvalidShareCount), shares_outstanding, 0);
        return std::unexpected(shares_ok.error());
    }
    auto debt_ok = validate_net_debt(net_debt);
    if (!debt_ok) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_AGGREGATION,
            static_cast<int>(ValuationErrorCode::InvalidNetDebt), net_debt, 0);
        return std::unexpected(debt_ok.error());
    }

    double enterprise_value = discounted_terminal_value;
    for (const auto& f : flows) {
        enterprise_value += f.present_value;
    }

    ValuationResult result;
    result.enterprise_value = enterprise_value;
    result.equity_value = enterprise_value - net_debt;
    result.implied_per_share_value = result.equity_value / shares_outstanding;
    result.discount_rate = rates.discount_rate;
    result.terminal_growth_rate = rates.terminal_growth_rate;
    return result;
}

std::expected<ValuationResult, ValuationError>
aggregate(const DiscountResult& discounted,
          double net_debt,
          double shares_outstanding) {
    return aggregate(discounted.flows,
                     discounted.discounted_terminal_value,
                     net_debt,
                     shares_outstanding,
                     RatePair{discounted.discount_rate, discounted.terminal_growth_rate});
}

std::expected<double, ValuationError>
upside_percent(const ValuationResult& result, double current_price) {
    if (!std::isfinite(current_price) || current_price <= 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidMarketPrice, current_price));
    }
    return (result.implied_per_share_value / current_price - 1.0) * 100.0;
}

} // namespace fairvalue
