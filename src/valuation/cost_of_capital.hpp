// SPDX-License-Identifier: MIT
/**
 * @file cost_of_capital.hpp
 * @brief CAPM cost of equity and weighted average cost of capital
 */

#pragma once

#include "src/support/error_types.hpp"
#include <expected>

namespace fairvalue {

/**
 * @brief Inputs to the WACC calculation
 *
 * Rates as decimals (0.055 for 5.5%). Weights are the market-value shares
 * of debt and equity in the capital structure and must sum to 1.
 */
struct CapitalStructure {
    double risk_free_rate = 0.0;       ///< e.g. 10-year government zero yield
    double equity_beta = 1.0;          ///< Levered beta of the equity
    double market_risk_premium = 0.0;  ///< Expected market return over risk-free
    double cost_of_debt = 0.0;         ///< Pre-tax cost of debt
    double tax_rate = 0.0;             ///< Effective tax rate in [0, 1]
    double debt_weight = 0.0;          ///< D / (D + E)
    double equity_weight = 1.0;        ///< E / (D + E)
};

/// CAPM: risk_free_rate + beta * market_risk_premium
[[nodiscard]] std::expected<double, ValuationError>
cost_of_equity(double risk_free_rate, double equity_beta, double market_risk_premium);

/// Rejects non-finite fields, weights or tax rate outside [0, 1], weights not summing to 1
[[nodiscard]] std::expected<void, ValuationError>
validate_capital_structure(const CapitalStructure& cs);

/// WACC = Ke * We + Kd * (1 - t) * Wd
[[nodiscard]] std::expected<double, ValuationError>
weighted_average_cost_of_capital(const CapitalStructure& cs);

} // namespace fairvalue
