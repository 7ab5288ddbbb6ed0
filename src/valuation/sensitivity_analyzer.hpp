// SPDX-License-Identifier: MIT
/**
 * @file sensitivity_analyzer.hpp
 * @brief Discount-rate x terminal-growth sweep of the implied per-share value
 */

#pragma once

#include "src/support/error_types.hpp"
#include "src/valuation/projection_engine.hpp"
#include "src/valuation/sensitivity_grid.hpp"
#include "src/valuation/valuation_inputs.hpp"
#include <expected>
#include <span>
#include <vector>

namespace fairvalue {

/// Sweep configuration
struct SweepConfig {
    bool parallel = true;            ///< Spread cells over OpenMP threads when available
    size_t min_parallel_cells = 64;  ///< Below this many cells the sweep stays serial
};

/// Sensitivity Analyzer
///
/// Projects the inputs once, then re-runs discount() + aggregate() for every
/// (discount rate, terminal growth) pair of the two axes. Only the two swept
/// rates vary between cells; inputs.discount_rate and
/// inputs.terminal_growth_rate are ignored.
///
/// A cell whose rate pair fails (discount rate <= terminal growth, or a rate
/// <= -1) is recorded as invalid with its ValuationError and the sweep
/// continues. Failures of the fixed inputs (schedule, base revenue, net debt,
/// share count) abort the sweep before any cell is computed.
///
/// **Basic usage:**
/// ```cpp
/// auto wacc = linspace(0.10, 0.15, 6).value();
/// auto growth = linspace(0.03, 0.05, 6).value();
///
/// SensitivityAnalyzer analyzer;
/// auto grid = analyzer.sweep(inputs, wacc, growth);
/// if (grid) {
///     for (size_t i = 0; i < grid->rows(); ++i)
///         for (size_t j = 0; j < grid->cols(); ++j)
///             if (auto v = grid->value(i, j)) { ... }
/// }
/// ```
///
/// Cells are independent, so the sweep parallelizes with OpenMP; serial and
/// parallel sweeps produce identical grids.
class SensitivityAnalyzer {
public:
    SensitivityAnalyzer() = default;

    explicit SensitivityAnalyzer(const SweepConfig& config)
        : config_(config)
    {}

    /// Enable or disable OpenMP for the sweep
    /// @return Reference to this analyzer for method chaining
    SensitivityAnalyzer& set_parallel(bool enable) {
        config_.parallel = enable;
        return *this;
    }

    const SweepConfig& config() const { return config_; }

    /// Sweep both axes over inputs
    ///
    /// @param inputs Base inputs (rate pair ignored)
    /// @param discount_rate_axis Row axis, in display order
    /// @param terminal_growth_axis Column axis, in display order
    /// @return rows x cols grid, or the fixed-input / InvalidAxis error
    [[nodiscard]] std::expected<SensitivityGrid, ValuationError>
    sweep(const ValuationInputs& inputs,
          std::span<const double> discount_rate_axis,
          std::span<const double> terminal_growth_axis) const;

    /// Sweep over an existing projection's free cash flows
    [[nodiscard]] std::expected<SensitivityGrid, ValuationError>
    sweep(const Projection& projection,
          double net_debt,
          double shares_outstanding,
          std::span<const double> discount_rate_axis,
          std::span<const double> terminal_growth_axis) const;

private:
    SweepConfig config_;
};

} // namespace fairvalue
