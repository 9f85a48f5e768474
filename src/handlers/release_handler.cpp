#include "stockledger/handlers/release_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;

v1::StockMovement handle_release(
    const v1::ReleaseReservation& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "release reservations");

    // Validate
    validation::require_not_empty(cmd.reference_id(), "reference_id");
    validation::require_not_empty(cmd.reference_type(), "reference_type");
    Decimal quantity = from_proto(cmd.quantity());
    validation::require_positive(quantity, "Release quantity");

    // Compute
    auto m = movement::begin(state, v1::MovementType::RELEASE, stamp);
    movement::set_reserved(m, -quantity);
    m.mutable_context()->set_reference_type(cmd.reference_type());
    m.mutable_context()->set_reference_id(cmd.reference_id());
    m.set_reason(cmd.reason().empty() ? "Reservation released" : cmd.reason());
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
