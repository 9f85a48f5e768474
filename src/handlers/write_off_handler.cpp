#include "stockledger/handlers/write_off_handler.hpp"
#include "stockledger/enums.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_write_off(
    const v1::WriteOffStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "write off stock");

    // Validate
    if (cmd.movement_type() != v1::MovementType::DAMAGE &&
        cmd.movement_type() != v1::MovementType::SHRINKAGE) {
        throw ValidationError("Write-off type must be Damage or Shrinkage, got " +
                              display_name(cmd.movement_type()));
    }
    validation::require_not_empty(cmd.reason(), "Reason for write-off");
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Write-off quantity");
    if (quantity > state.quantity_on_hand) {
        throw BusinessRuleViolation("Cannot write off " + quantity.to_string() +
                                    " units. On hand: " + state.quantity_on_hand.to_string());
    }

    // Compute
    auto m = movement::begin(state, cmd.movement_type(), stamp);
    movement::set_quantity(m, -quantity);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), quantity * state.average_cost);
    m.mutable_context()->set_reference_type("write_off");
    m.set_reason(helpers::trim(cmd.reason()));
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
