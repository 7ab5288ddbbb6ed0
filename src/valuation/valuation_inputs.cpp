// SPDX-License-Identifier: MIT
#include "src/valuation/valuation_inputs.hpp"
#include "src/valuation/discounting_engine.hpp"
#include "src/valuation/valuation_aggregator.hpp"
#include <cmath>

namespace fairvalue {

std::expected<void, ValuationError>
validate_fixed_inputs(const ValuationInputs& inputs) {
    if (!std::isfinite(inputs.base_revenue) || inputs.base_revenue < 0.0) {
        return std::unexpected(ValuationError(ValuationErrorCode::InvalidBaseRevenue, inputs.base_revenue));
    }

    if (auto ok = inputs.schedule.validate(); !ok) {
        return ok;
    }
    if (auto ok = validate_net_debt(inputs.net_debt); !ok) {
        return ok;
    }
    if (auto ok = validate_share_count(inputs.shares_outstanding); !ok) {
        return ok;
    }

    if (inputs.current_price) {
        const double price = *inputs.current_price;
        if (!std::isfinite(price) || price <= 0.0) {
            return std::unexpected(ValuationError(ValuationErrorCode::InvalidMarketPrice, price));
        }
    }
    return {};
}

std::expected<void, ValuationError>
validate_valuation_inputs(const ValuationInputs& inputs) {
    if (auto ok = validate_fixed_inputs(inputs); !ok) {
        return ok;
    }
    return validate_rate_pair(inputs.discount_rate, inputs.terminal_growth_rate);
}

} // namespace fairvalue
