// SPDX-License-Identifier: MIT
/**
 * @file example_segment_forecast.cc
 * @brief Three-year segment forecast feeding the DCF pipeline
 *
 * Demonstrates:
 * - Per-segment growth with diversification multipliers
 * - Declining gross margin with a floor
 * - Turning the total-revenue path into a GrowthSchedule and valuing it
 */

#include "src/valuation/dcf_model.hpp"
#include "src/valuation/segment_forecast.hpp"
#include <iomanip>
#include <iostream>
#include <vector>

int main() {
    std::cout << "=== Segment Revenue Forecast Example ===\n\n";

    // Q4 FY25 segment revenue, millions of USD
    const std::vector<fairvalue::Segment> segments = {
        {"Data Center", 35580.0, 0.93, {1.0, 0.85, 0.75}},
        {"Gaming", 2544.0, -0.11, {1.0, 1.2, 1.4}},
        {"Professional Visualization", 511.0, 0.10, {1.0, 1.15, 1.3}},
        {"Automotive", 570.0, 0.06, {1.0, 1.1, 1.2}},
        {"Software and AI Services", 126.0, 0.10, {1.0, 1.25, 1.5}},
    };

    fairvalue::SegmentForecastConfig config;
    config.horizon = 3;
    config.base_gross_margin = 0.735;
    config.gross_margin_step = 0.02;
    config.gross_margin_floor = 0.68;
    config.net_income_margin = 22091.0 / 39331.0;

    auto forecast = fairvalue::forecast_segments(segments, config);
    if (!forecast) {
        std::cerr << "Forecast failed: " << forecast.error() << "\n";
        return 1;
    }

    std::cout << std::fixed;
    for (const auto& period : forecast->periods()) {
        std::cout << "FY" << (25 + period.period) << " projection\n";
        std::cout << std::setprecision(0)
                  << "  Total revenue: $" << period.total_revenue << " million\n"
                  << std::setprecision(1)
                  << "  Gross margin:  " << (period.gross_margin * 100.0) << "%\n"
                  << std::setprecision(0)
                  << "  Net income:    $" << period.net_income << " million\n";
        for (size_t s = 0; s < forecast->segment_count(); ++s) {
            std::cout << "    " << std::left << std::setw(28) << forecast->segment_names()[s]
                      << std::right << std::setprecision(0) << std::setw(10)
                      << period.segment_revenues[s]
                      << std::setprecision(1) << std::setw(8)
                      << period.segment_shares[s] << "%\n";
        }
        std::cout << "\n";
    }

    // Value the forecast: totals in billions, 35% FCF margin
    auto schedule = forecast->to_growth_schedule(0.35);
    if (!schedule) {
        std::cerr << "Schedule failed: " << schedule.error() << "\n";
        return 1;
    }

    fairvalue::ValuationInputs inputs;
    inputs.base_revenue = forecast->base_total_revenue() / 1000.0;
    inputs.schedule = *schedule;
    inputs.discount_rate = 0.12;
    inputs.terminal_growth_rate = 0.035;
    inputs.net_debt = -11.0;
    inputs.shares_outstanding = 2.46;

    auto report = fairvalue::value_company(inputs);
    if (!report) {
        std::cerr << "Valuation failed: " << report.error() << "\n";
        return 1;
    }

    std::cout << std::setprecision(2)
              << "Enterprise value:        $" << report->valuation.enterprise_value << "B\n"
              << "Implied value per share: $" << report->valuation.implied_per_share_value << "\n";
    return 0;
}
