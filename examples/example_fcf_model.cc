// SPDX-License-Identifier: MIT
/**
 * @file example_fcf_model.cc
 * @brief Free cash flow model driven by historical growth
 *
 * Demonstrates:
 * - Year-over-year growth and two-year CAGR from reported statements
 * - Projecting a metric at the smoothed rate
 * - Step-down growth schedule discounted at a fixed cost of capital
 */

#include "src/valuation/discounting_engine.hpp"
#include "src/valuation/historical_growth.hpp"
#include "src/valuation/projection_engine.hpp"
#include "src/valuation/valuation_aggregator.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

using namespace fairvalue;

int main() {
    // FY24 / FY25 reported figures, millions of USD
    struct Metric {
        const char* name;
        double fy24;
        double fy25;
    };
    const Metric metrics[] = {
        {"Revenue", 22103.0, 39331.0},
        {"EBIT", 13615.0, 24034.0},
        {"Free Cash Flow", 11499.0, 16628.0},
    };

    std::cout << "=== Free Cash Flow Model Example ===\n\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << std::left << std::setw(16) << "Metric" << std::right
              << std::setw(10) << "YoY %"
              << std::setw(12) << "CAGR(2y) %"
              << std::setw(12) << "FY26"
              << std::setw(12) << "FY27" << "\n";
    for (const auto& m : metrics) {
        auto yoy = period_growth(m.fy24, m.fy25);
        auto cagr = compound_annual_growth(m.fy24, m.fy25, 2);
        if (!yoy || !cagr) {
            std::cerr << "Bad history for " << m.name << "\n";
            return 1;
        }
        std::cout << std::left << std::setw(16) << m.name << std::right
                  << std::setw(10) << (*yoy * 100.0)
                  << std::setw(12) << (*cagr * 100.0)
                  << std::setw(12) << project_metric(m.fy25, *cagr, 1)
                  << std::setw(12) << project_metric(m.fy25, *cagr, 2) << "\n";
    }

    // Step-down growth from $60.92B at a 35% FCF margin
    const std::vector<double> growth = {0.25, 0.20, 0.15, 0.10};
    auto projection = project(60.92, GrowthSchedule::with_constant_margin(growth, 0.35));
    if (!projection) {
        std::cerr << "Projection failed: " << projection.error() << "\n";
        return 1;
    }

    auto discounted = discount(*projection, 0.10, 0.03);
    if (!discounted) {
        std::cerr << "Discounting failed: " << discounted.error() << "\n";
        return 1;
    }

    std::cout << "\n" << std::setw(6) << "Year"
              << std::setw(12) << "Revenue"
              << std::setw(12) << "FCF"
              << std::setw(12) << "PV(FCF)" << "\n";
    for (size_t t = 0; t < projection->horizon(); ++t) {
        std::cout << std::setw(6) << (*projection)[t].period
                  << std::setw(12) << (*projection)[t].revenue
                  << std::setw(12) << (*projection)[t].free_cash_flow
                  << std::setw(12) << discounted->flows[t].present_value << "\n";
    }
    std::cout << "Terminal value: " << discounted->terminal_value
              << " (PV " << discounted->discounted_terminal_value << ")\n";

    auto valuation = aggregate(*discounted, /*net_debt=*/0.0, /*shares_outstanding=*/2.46);
    if (!valuation) {
        std::cerr << "Aggregation failed: " << valuation.error() << "\n";
        return 1;
    }
    std::cout << "Enterprise value: $" << valuation->enterprise_value << " billion\n";
    return 0;
}
