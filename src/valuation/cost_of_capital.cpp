// SPDX-License-Identifier: MIT
#include "src/valuation/cost_of_capital.hpp"
#include "src/support/valuation_trace.h"
#include <cmath>
#include <iterator>

namespace fairvalue {

namespace {

constexpr double kWeightSumTolerance = 1e-9;

ValuationError reject(double value, size_t field) {
    FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_COST_OF_CAPITAL,
        static_cast<int>(ValuationErrorCode::InvalidCapitalStructure), value, field);
    return ValuationError(ValuationErrorCode::InvalidCapitalStructure, value, field);
}

bool in_unit_interval(double x) {
    return std::isfinite(x) && x >= 0.0 && x <= 1.0;
}

}  // anonymous namespace

std::expected<double, ValuationError>
cost_of_equity(double risk_free_rate, double equity_beta, double market_risk_premium) {
    if (!std::isfinite(risk_free_rate)) {
        return std::unexpected(reject(risk_free_rate, 0));
    }
    if (!std::isfinite(equity_beta)) {
        return std::unexpected(reject(equity_beta, 1));
    }
    if (!std::isfinite(market_risk_premium)) {
        return std::unexpected(reject(market_risk_premium, 2));
    }
    return risk_free_rate + equity_beta * market_risk_premium;
}

std::expected<void, ValuationError>
validate_capital_structure(const CapitalStructure& cs) {
    // Index identifies the offending field in declaration order
    const double fields[] = {
        cs.risk_free_rate, cs.equity_beta, cs.market_risk_premium,
        cs.cost_of_debt, cs.tax_rate, cs.debt_weight, cs.equity_weight
    };
    for (size_t i = 0; i < std::size(fields); ++i) {
        if (!std::isfinite(fields[i])) {
            return std::unexpected(reject(fields[i], i));
        }
    }

    if (!in_unit_interval(cs.tax_rate)) {
        return std::unexpected(reject(cs.tax_rate, 4));
    }
    if (!in_unit_interval(cs.debt_weight)) {
        return std::unexpected(reject(cs.debt_weight, 5));
    }
    if (!in_unit_interval(cs.equity_weight)) {
        return std::unexpected(reject(cs.equity_weight, 6));
    }

    const double weight_sum = cs.debt_weight + cs.equity_weight;
    if (std::abs(weight_sum - 1.0) > kWeightSumTolerance) {
        return std::unexpected(reject(weight_sum, 5));
    }
    return {};
}

std::expected<double, ValuationError>
weighted_average_cost_of_capital(const CapitalStructure& cs) {
    if (auto ok = validate_capital_structure(cs); !ok) {
        return std::unexpected(ok.error());
    }

    auto ke = cost_of_equity(cs.risk_free_rate, cs.equity_beta, cs.market_risk_premium);
    if (!ke) {
        return std::unexpected(ke.error());
    }

    const double after_tax_debt = cs.cost_of_debt * (1.0 - cs.tax_rate);
    return *ke * cs.equity_weight + after_tax_debt * cs.debt_weight;
}

} // namespace fairvalue
