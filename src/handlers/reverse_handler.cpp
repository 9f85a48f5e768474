#include "stockledger/handlers/reverse_handler.hpp"
#include "stockledger/enums.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_reverse(
    const v1::ReverseMovement& cmd,
    const v1::StockMovement& original,
    bool already_reversed,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "reverse movements");
    if (original.business_id() != state.business_id || original.product_id() != state.product_id) {
        throw NotFoundError("Movement " + original.movement_id() + " not found for product " +
                            state.product_id);
    }

    // Validate
    validation::require_not_empty(cmd.reason(), "Reason for reversal");
    if (!original.reverses_movement_id().empty()) {
        throw BusinessRuleViolation("Movement " + original.movement_id() + " is itself a reversal");
    }
    if (!is_reversible(original.movement_type())) {
        throw BusinessRuleViolation(display_name(original.movement_type()) +
                                    " movements cannot be reversed");
    }
    if (already_reversed) {
        throw BusinessRuleViolation("Movement " + original.movement_id() + " has already been reversed");
    }

    // Compute
    Decimal quantity = -from_proto(original.quantity());
    Decimal unit_cost = from_proto(original.unit_cost());

    auto m = movement::begin(state, original.movement_type(), stamp);
    movement::set_quantity(m, quantity);
    m.set_location_id(stamp.location_or_default(original.location_id()));
    set_decimal(m.mutable_unit_cost(), unit_cost);
    set_decimal(m.mutable_total_cost(), quantity.abs() * unit_cost);
    auto* context = m.mutable_context();
    context->set_reference_type("stock_movement_reversal");
    context->set_reference_id(original.movement_id());
    context->set_reference_number(original.context().reference_number());
    m.set_supplier_id(original.supplier_id());
    m.set_customer_id(original.customer_id());
    m.set_reverses_movement_id(original.movement_id());
    m.set_reason(helpers::trim(cmd.reason()));

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
