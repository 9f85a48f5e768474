#include "stockledger/handlers/reserve_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;

v1::StockMovement handle_reserve(
    const v1::ReserveStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "reserve stock");

    // Validate
    validation::require_not_empty(cmd.reference_id(), "reference_id");
    validation::require_not_empty(cmd.reference_type(), "reference_type");
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Reservation quantity");

    auto key = helpers::reservation_key(cmd.reference_type(), cmd.reference_id());
    Decimal held = state.reserved_for(key);
    if (held.is_positive()) {
        throw BusinessRuleViolation("Reservation " + key + " already holds " + held.to_string());
    }
    if (state.quantity_available() < quantity) {
        throw BusinessRuleViolation("Insufficient available stock. Available: " +
                                    state.quantity_available().to_string() +
                                    ", Requested: " + quantity.to_string());
    }

    // Compute
    auto m = movement::begin(state, v1::MovementType::RESERVATION, stamp);
    movement::set_reserved(m, quantity);
    m.mutable_context()->set_reference_type(cmd.reference_type());
    m.mutable_context()->set_reference_id(cmd.reference_id());
    m.set_reason("Stock reserved");
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
