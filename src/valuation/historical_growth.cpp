// SPDX-License-Identifier: MIT
#include "src/valuation/historical_growth.hpp"
#include "src/support/valuation_trace.h"
#include <cmath>

namespace fairvalue {

namespace {

ValuationError invalid_history(double value, size_t index = 0) {
    FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_GROWTH,
        static_cast<int>(ValuationErrorCode::InvalidHistory), value, index);
    return ValuationError(ValuationErrorCode::InvalidHistory, value, index);
}

}  // anonymous namespace

std::expected<double, ValuationError>
period_growth(double prior, double current) {
    if (!std::isfinite(prior) || prior <= 0.0) {
        return std::unexpected(invalid_history(prior, 0));
    }
    if (!std::isfinite(current)) {
        return std::unexpected(invalid_history(current, 1));
    }
    return current / prior - 1.0;
}

std::expected<double, ValuationError>
compound_annual_growth(double first, double last, size_t periods) {
    if (!std::isfinite(first) || first <= 0.0) {
        return std::unexpected(invalid_history(first, 0));
    }
    if (!std::isfinite(last) || last <= 0.0) {
        return std::unexpected(invalid_history(last, 1));
    }
    if (periods == 0) {
        return std::unexpected(invalid_history(0.0, 2));
    }
    return std::pow(last / first, 1.0 / static_cast<double>(periods)) - 1.0;
}

std::expected<double, ValuationError>
geometric_mean_growth(std::span<const double> rates) {
    if (rates.empty()) {
        return std::unexpected(invalid_history(0.0));
    }

    // Sum of logs avoids overflow of the running product for long histories
    double log_sum = 0.0;
    for (size_t i = 0; i < rates.size(); ++i) {
        if (!std::isfinite(rates[i]) || rates[i] <= -1.0) {
            return std::unexpected(invalid_history(rates[i], i));
        }
        log_sum += std::log1p(rates[i]);
    }
    return std::expm1(log_sum / static_cast<double>(rates.size()));
}

double project_metric(double base, double rate, size_t periods) {
    return base * std::pow(1.0 + rate, static_cast<double>(periods));
}

} // namespace fairvalue
