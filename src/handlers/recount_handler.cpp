#include "stockledger/handlers/recount_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_recount(
    const v1::RecountStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "recount stock");

    // Validate
    validation::require_not_empty(cmd.reason(), "Reason for recount");
    Decimal counted = from_proto(cmd.counted_quantity());
    validation::require_non_negative(counted, "Counted quantity");

    std::string location = stamp.location_or_default(cmd.location_id());
    Decimal delta = counted - state.location_quantity(location);
    if (delta.is_zero()) {
        throw BusinessRuleViolation("Counted quantity matches recorded stock at " + location);
    }

    // Compute
    auto m = movement::begin(state, v1::MovementType::RECOUNT, stamp);
    movement::set_quantity(m, delta);
    m.set_location_id(location);
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), delta.abs() * state.average_cost);
    m.mutable_context()->set_reference_type("recount");
    m.set_reason(helpers::trim(cmd.reason()));

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
