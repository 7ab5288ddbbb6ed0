// SPDX-License-Identifier: MIT
/**
 * @file example_dcf_valuation.cc
 * @brief Decelerating-growth DCF valuation with a WACC x terminal growth sensitivity table
 *
 * Demonstrates:
 * - WACC from a CAPM capital structure
 * - Per-period growth deceleration with a constant free cash flow margin
 * - One-call valuation with upside against the market price
 * - A 6 x 6 sensitivity surface over evenly spaced rate axes
 */

#include "src/math/rate_axis.hpp"
#include "src/valuation/cost_of_capital.hpp"
#include "src/valuation/dcf_model.hpp"
#include "src/valuation/sensitivity_analyzer.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

int main() {
    std::cout << "=== DCF Valuation Example ===\n\n";

    // 1. Cost of capital
    fairvalue::CapitalStructure cs;
    cs.risk_free_rate = 0.0347;      // 10-year zero yield
    cs.equity_beta = 1.84;
    cs.market_risk_premium = 0.055;
    cs.cost_of_debt = 0.024;
    cs.tax_rate = 0.02;
    cs.debt_weight = 0.13;
    cs.equity_weight = 0.87;

    auto wacc = fairvalue::weighted_average_cost_of_capital(cs);
    if (!wacc) {
        std::cerr << "WACC failed: " << wacc.error() << "\n";
        return 1;
    }

    // 2. Inputs (billions of USD, billions of shares)
    const std::vector<double> growth_rates = {0.70, 0.60, 0.50, 0.40, 0.30};

    fairvalue::ValuationInputs inputs;
    inputs.base_revenue = 60.9;
    inputs.schedule = fairvalue::GrowthSchedule::with_constant_margin(growth_rates, 0.70);
    inputs.discount_rate = *wacc;
    inputs.terminal_growth_rate = 0.035;
    inputs.net_debt = -11.0;  // Net cash
    inputs.shares_outstanding = 2.46;
    inputs.current_price = 121.0;

    // 3. Single valuation
    auto report = fairvalue::value_company(inputs);
    if (!report) {
        std::cerr << "Valuation failed: " << report.error() << "\n";
        return 1;
    }

    std::cout << std::fixed << std::setprecision(2);
    std::cout << "WACC: " << (*wacc * 100.0) << "%\n\n";

    std::cout << std::setw(6) << "Year"
              << std::setw(12) << "Revenue"
              << std::setw(12) << "FCF"
              << std::setw(12) << "PV(FCF)\n";
    std::cout << std::string(42, '-') << "\n";
    for (size_t t = 0; t < report->projection.horizon(); ++t) {
        const auto& p = report->projection[t];
        std::cout << std::setw(6) << p.period
                  << std::setw(12) << p.revenue
                  << std::setw(12) << p.free_cash_flow
                  << std::setw(12) << report->discounting.flows[t].present_value << "\n";
    }

    const auto& v = report->valuation;
    std::cout << "\nTerminal value:            $" << report->discounting.terminal_value << "B\n";
    std::cout << "Discounted terminal value: $" << report->discounting.discounted_terminal_value << "B\n";
    std::cout << "Enterprise value:          $" << v.enterprise_value << "B\n";
    std::cout << "Equity value:              $" << v.equity_value << "B\n";
    std::cout << "Implied value per share:   $" << v.implied_per_share_value << "\n";
    if (report->upside_percent) {
        std::cout << "Upside vs $" << *inputs.current_price << ":         "
                  << *report->upside_percent << "%\n";
    }

    // 4. Sensitivity: discount rate rows x terminal growth columns
    auto wacc_axis = fairvalue::linspace(0.10, 0.15, 6);
    auto growth_axis = fairvalue::linspace(0.03, 0.05, 6);
    if (!wacc_axis || !growth_axis) {
        std::cerr << "Axis construction failed\n";
        return 1;
    }

    fairvalue::SensitivityAnalyzer analyzer;
    auto grid = analyzer.sweep(inputs, *wacc_axis, *growth_axis);
    if (!grid) {
        std::cerr << "Sweep failed: " << grid.error() << "\n";
        return 1;
    }

    std::cout << "\nImplied value per share (rows: WACC, columns: terminal growth)\n";
    std::cout << std::setw(8) << "";
    for (double g : grid->terminal_growth_axis()) {
        std::cout << std::setw(10) << (g * 100.0);
    }
    std::cout << "\n";

    for (size_t i = 0; i < grid->rows(); ++i) {
        std::cout << std::setw(7) << (grid->discount_rate_axis()[i] * 100.0) << "%";
        for (size_t j = 0; j < grid->cols(); ++j) {
            if (auto value = grid->value(i, j)) {
                std::cout << std::setw(10) << *value;
            } else {
                std::cout << std::setw(10) << "n/a";
            }
        }
        std::cout << "\n";
    }

    return 0;
}
