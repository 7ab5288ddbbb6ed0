// SPDX-License-Identifier: MIT
/**
 * @file rate_axis.hpp
 * @brief Evenly spaced and validated rate axes for sensitivity sweeps
 */

#pragma once

#include "src/support/error_types.hpp"
#include <cmath>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace fairvalue {

/// Evenly spaced values on [start, stop], endpoints included
///
/// count == 1 yields {start}. The last point is set to stop exactly so
/// axis labels do not pick up accumulated rounding.
[[nodiscard]] inline std::expected<std::vector<double>, ValuationError>
linspace(double start, double stop, size_t count) {
    if (count == 0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, 0.0));
    }
    if (!std::isfinite(start)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, start));
    }
    if (!std::isfinite(stop)) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, stop));
    }

    std::vector<double> axis(count);
    if (count == 1) {
        axis[0] = start;
        return axis;
    }

    const double step = (stop - start) / static_cast<double>(count - 1);
    for (size_t i = 0; i < count; ++i) {
        axis[i] = start + step * static_cast<double>(i);
    }
    axis.back() = stop;
    return axis;
}

/// Axis must be non-empty with finite values; ordering is left to the caller
[[nodiscard]] inline std::expected<void, ValuationError>
validate_axis(std::span<const double> axis) {
    if (axis.empty()) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, 0.0));
    }
    for (size_t i = 0; i < axis.size(); ++i) {
        if (!std::isfinite(axis[i])) {
            return std::unexpected(ValuationError(ValuationErrorCode::InvalidAxis, axis[i], i));
        }
    }
    return {};
}

} // namespace fairvalue
