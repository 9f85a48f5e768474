#include "stockledger/handlers/adjust_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_adjust(
    const v1::AdjustStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "adjust stock");

    // Validate
    validation::require_not_empty(cmd.reason(), "Reason for adjustment");
    Decimal change = from_proto(cmd.quantity_change());
    if (change.is_zero()) throw BusinessRuleViolation("Quantity change cannot be zero");

    // Compute
    auto m = movement::begin(state, v1::MovementType::ADJUSTMENT, stamp);
    movement::set_quantity(m, change);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), change.abs() * state.average_cost);
    m.mutable_context()->set_reference_type("adjustment");
    m.mutable_context()->set_reference_number(cmd.reference_number());
    m.set_reason(helpers::trim(cmd.reason()));
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
