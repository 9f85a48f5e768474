#include "stockledger/handlers/sale_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_sale(
    const v1::RecordSale& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "record sales");

    // Validate
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Sale quantity");
    if (!cmd.reference_id().empty()) {
        validation::require_not_empty(cmd.reference_type(), "reference_type");
    }

    Decimal consumed;
    if (!cmd.reference_id().empty()) {
        auto key = helpers::reservation_key(cmd.reference_type(), cmd.reference_id());
        consumed = min(state.reserved_for(key), quantity);
    }
    if (state.quantity_available() + consumed < quantity) {
        throw BusinessRuleViolation("Insufficient available stock. Available: " +
                                    state.quantity_available().to_string() +
                                    ", Requested: " + quantity.to_string());
    }

    // Compute
    auto m = movement::begin(state, v1::MovementType::SALE, stamp);
    movement::set_quantity(m, -quantity);
    movement::set_reserved(m, -consumed);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), quantity * state.average_cost);
    m.mutable_context()->set_reference_type(cmd.reference_type());
    m.mutable_context()->set_reference_id(cmd.reference_id());
    m.set_customer_id(cmd.customer_id());
    m.set_reason("Sale");
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
