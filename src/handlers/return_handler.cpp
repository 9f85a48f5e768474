#include "stockledger/handlers/return_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_return(
    const v1::RecordReturn& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "record returns");

    // Validate
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Return quantity");

    // Compute
    auto m = movement::begin(state, v1::MovementType::RETURN, stamp);
    movement::set_quantity(m, quantity);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), state.average_cost);
    set_decimal(m.mutable_total_cost(), quantity * state.average_cost);
    m.mutable_context()->set_reference_type(cmd.reference_type());
    m.mutable_context()->set_reference_id(cmd.reference_id());
    m.set_customer_id(cmd.customer_id());
    m.set_reason(cmd.reason().empty() ? "Customer return" : cmd.reason());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
