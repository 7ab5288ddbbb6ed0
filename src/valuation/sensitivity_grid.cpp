// SPDX-License-Identifier: MIT
#include "src/valuation/sensitivity_grid.hpp"
#include <stdexcept>
#include <string>

namespace fairvalue {

std::expected<SensitivityGrid, ValuationError>
SensitivityGrid::create(std::vector<double> discount_rates,
                        std::vector<double> terminal_growth_rates,
                        std::vector<SensitivityCell> cells) {
    if (discount_rates.empty()) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, 0.0, 0));
    }
    if (terminal_growth_rates.empty()) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, 0.0, 1));
    }

    const size_t expected_cells = discount_rates.size() * terminal_growth_rates.size();
    if (cells.size() != expected_cells) {
        return std::unexpected(ValuationError(
            ValuationErrorCode::InvalidAxis,
            static_cast<double>(cells.size()),
            expected_cells));
    }

    size_t failed = 0;
    for (const auto& c : cells) {
        if (!c.has_value()) {
            ++failed;
        }
    }

    return SensitivityGrid(std::move(discount_rates),
                           std::move(terminal_growth_rates),
                           std::move(cells),
                           failed);
}

const SensitivityCell& SensitivityGrid::at(size_t i, size_t j) const {
    if (i >= rows() || j >= cols()) {
        throw std::out_of_range("SensitivityGrid::at(" + std::to_string(i) + ", " +
                                std::to_string(j) + ") outside " +
                                std::to_string(rows()) + "x" + std::to_string(cols()));
    }
    return cells_[flat_index(i, j)];
}

std::optional<double> SensitivityGrid::value(size_t i, size_t j) const {
    const auto& cell = at(i, j);
    if (!cell) {
        return std::nullopt;
    }
    return *cell;
}

} // namespace fairvalue
