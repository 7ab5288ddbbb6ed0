// SPDX-License-Identifier: MIT
#include "src/valuation/dcf_model.hpp"
#include "src/support/valuation_trace.h"

namespace fairvalue {

std::expected<DcfReport, ValuationError>
value_company(const ValuationInputs& inputs) {
    auto valid = validate_valuation_inputs(inputs);
    if (!valid) {
        FAIRVALUE_TRACE_VALIDATION_ERROR(FAIRVALUE_MODULE_DCF_MODEL,
            static_cast<int>(valid.error().code), valid.error().value, valid.error().index);
        return std::unexpected(valid.error());
    }

    FAIRVALUE_TRACE_ALGO_START(FAIRVALUE_MODULE_DCF_MODEL,
        inputs.horizon(), inputs.discount_rate, inputs.terminal_growth_rate);

    auto projection = project(inputs.base_revenue, inputs.schedule);
    if (!projection) {
        return std::unexpected(projection.error());
    }

    auto discounted = discount(*projection, inputs.discount_rate, inputs.terminal_growth_rate);
    if (!discounted) {
        return std::unexpected(discounted.error());
    }

    auto valuation = aggregate(*discounted, inputs.net_debt, inputs.shares_outstanding);
    if (!valuation) {
        return std::unexpected(valuation.error());
    }

    std::optional<double> upside;
    if (inputs.current_price) {
        auto pct = upside_percent(*valuation, *inputs.current_price);
        if (!pct) {
            return std::unexpected(pct.error());
        }
        upside = *pct;
    }

    FAIRVALUE_TRACE_ALGO_COMPLETE(FAIRVALUE_MODULE_DCF_MODEL,
        inputs.horizon(), valuation->implied_per_share_value);

    return DcfReport{
        std::move(*projection),
        std::move(*discounted),
        *valuation,
        upside
    };
}

} // namespace fairvalue
