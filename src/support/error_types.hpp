// SPDX-License-Identifier: MIT
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace fairvalue {

/// Error codes for valuation input and precondition failures
enum class ValuationErrorCode {
    InvalidSchedule,          ///< Empty schedule, growth <= -1, non-finite entry
    InvalidRateRelationship,  ///< discount_rate <= terminal_growth_rate
    InvalidShareCount,        ///< shares_outstanding <= 0
    InvalidBaseRevenue,       ///< Negative or non-finite base revenue
    InvalidRate,              ///< Non-finite rate or discount rate <= -1
    InvalidNetDebt,           ///< Non-finite net debt
    InvalidMarketPrice,       ///< Current price <= 0 or non-finite
    InvalidAxis,              ///< Empty or non-finite sensitivity axis
    InvalidCapitalStructure,  ///< Weights/tax rate out of range
    InvalidHistory            ///< Unusable historical figures
};

/// Detailed valuation error passed through the expected failure path
struct ValuationError {
    ValuationErrorCode code;
    double value;  // The offending value
    size_t index;  // Period or cell index (0 if not applicable)

    ValuationError(ValuationErrorCode code,
                   double value = 0.0,
                   size_t index = 0)
        : code(code), value(value), index(index) {}

    bool operator==(const ValuationError&) const = default;
};

/// Error codes for grid export/import failures
enum class ExportErrorCode {
    WriteFailed,
    ReadFailed,
    SchemaMismatch
};

/// Export error with a human-readable detail (Arrow status message, column name)
struct ExportError {
    ExportErrorCode code;
    std::string detail;
};

constexpr std::string_view to_string(ValuationErrorCode code) noexcept {
    switch (code) {
        case ValuationErrorCode::InvalidSchedule:         return "InvalidSchedule";
        case ValuationErrorCode::InvalidRateRelationship: return "InvalidRateRelationship";
        case ValuationErrorCode::InvalidShareCount:       return "InvalidShareCount";
        case ValuationErrorCode::InvalidBaseRevenue:      return "InvalidBaseRevenue";
        case ValuationErrorCode::InvalidRate:             return "InvalidRate";
        case ValuationErrorCode::InvalidNetDebt:          return "InvalidNetDebt";
        case ValuationErrorCode::InvalidMarketPrice:      return "InvalidMarketPrice";
        case ValuationErrorCode::InvalidAxis:             return "InvalidAxis";
        case ValuationErrorCode::InvalidCapitalStructure: return "InvalidCapitalStructure";
        case ValuationErrorCode::InvalidHistory:          return "InvalidHistory";
    }
    return "Unknown";
}

constexpr std::string_view to_string(ExportErrorCode code) noexcept {
    switch (code) {
        case ExportErrorCode::WriteFailed:    return "WriteFailed";
        case ExportErrorCode::ReadFailed:     return "ReadFailed";
        case ExportErrorCode::SchemaMismatch: return "SchemaMismatch";
    }
    return "Unknown";
}

/// Output stream operator for ValuationError
inline std::ostream& operator<<(std::ostream& os, const ValuationError& err) {
    os << "ValuationError{code=" << to_string(err.code)
       << ", value=" << err.value
       << ", index=" << err.index << "}";
    return os;
}

/// Output stream operator for ExportError
inline std::ostream& operator<<(std::ostream& os, const ExportError& err) {
    os << "ExportError{code=" << to_string(err.code)
       << ", detail=" << err.detail << "}";
    return os;
}

} // namespace fairvalue
