#include "stockledger/handlers/transfer_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_transfer(
    const v1::TransferStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "transfer stock");

    // Validate
    validation::require_not_empty(cmd.from_location_id(), "from_location_id");
    validation::require_not_empty(cmd.to_location_id(), "to_location_id");
    if (cmd.from_location_id() == cmd.to_location_id()) {
        throw ValidationError("Source and destination locations must differ");
    }
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Transfer quantity");

    // Compute
    auto m = movement::begin(state, v1::MovementType::TRANSFER, stamp);
    set_decimal(m.mutable_transfer_quantity(), quantity);
    m.set_from_location_id(cmd.from_location_id());
    m.set_to_location_id(cmd.to_location_id());
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), quantity * state.average_cost);
    m.mutable_context()->set_reference_type("transfer");
    m.set_reason(cmd.reason().empty()
                     ? "Transfer from " + cmd.from_location_id() + " to " + cmd.to_location_id()
                     : cmd.reason());
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
