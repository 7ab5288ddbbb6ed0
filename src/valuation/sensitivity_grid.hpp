// SPDX-License-Identifier: MIT
/**
 * @file sensitivity_grid.hpp
 * @brief Implied per-share values over a discount-rate x terminal-growth grid
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <vector>

namespace fairvalue {

/// Per-cell outcome: implied per-share value, or the error that invalidated the cell
using SensitivityCell = std::expected<double, ValuationError>;

/**
 * @brief Immutable sensitivity surface
 *
 * Rows follow the discount-rate axis, columns the terminal-growth axis, both
 * in the order supplied to the sweep. Cells are stored row-major and are
 * never modified after construction; an invalid cell keeps its error
 * instead of being dropped, so rows() * cols() == size() always holds.
 */
class SensitivityGrid {
public:
    /// Build a grid from axes and row-major cells
    ///
    /// @return InvalidAxis if an axis is empty or cells.size() != rows * cols
    static std::expected<SensitivityGrid, ValuationError>
    create(std::vector<double> discount_rates,
           std::vector<double> terminal_growth_rates,
           std::vector<SensitivityCell> cells);

    size_t rows() const noexcept { return discount_rates_.size(); }
    size_t cols() const noexcept { return terminal_growth_rates_.size(); }
    size_t size() const noexcept { return cells_.size(); }

    std::span<const double> discount_rate_axis() const noexcept { return discount_rates_; }
    std::span<const double> terminal_growth_axis() const noexcept { return terminal_growth_rates_; }

    /// Cell (i, j); throws std::out_of_range outside the grid
    const SensitivityCell& at(size_t i, size_t j) const;

    /// Implied per-share value of cell (i, j), or nullopt when invalid
    std::optional<double> value(size_t i, size_t j) const;

    bool is_valid(size_t i, size_t j) const { return at(i, j).has_value(); }

    /// All cells, row-major
    std::span<const SensitivityCell> cells() const noexcept { return cells_; }

    /// Number of invalid cells
    size_t failed_count() const noexcept { return failed_count_; }

    bool all_valid() const noexcept { return failed_count_ == 0; }

    /// Row-major index of cell (i, j)
    size_t flat_index(size_t i, size_t j) const noexcept { return i * cols() + j; }

private:
    SensitivityGrid(std::vector<double> discount_rates,
                    std::vector<double> terminal_growth_rates,
                    std::vector<SensitivityCell> cells,
                    size_t failed_count)
        : discount_rates_(std::move(discount_rates))
        , terminal_growth_rates_(std::move(terminal_growth_rates))
        , cells_(std::move(cells))
        , failed_count_(failed_count)
    {}

    std::vector<double> discount_rates_;
    std::vector<double> terminal_growth_rates_;
    std::vector<SensitivityCell> cells_;
    size_t failed_count_;
};

} // namespace fairvalue
