#include "stockledger/handlers/receive_handler.hpp"
#include "stockledger/costing.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement handle_receive(
    const v1::ReceivePurchase& cmd,
    const ProductState& state,
    const MovementStamp& stamp) {

    // Guard
    require_stock_operation(state, "receive stock");

    // Validate
    Decimal quantity = from_proto(cmd.quantity());
    Decimal unit_cost = from_proto(cmd.unit_cost());
    auto extras = costing::AdditionalCosts::from_proto(cmd.additional_costs());
    validation::require_positive(quantity, "Quantity");
    validation::require_non_negative(unit_cost, "Unit cost");
    validation::require_non_negative(extras.shipping, "Shipping cost");
    validation::require_non_negative(extras.duty, "Duty cost");
    validation::require_non_negative(extras.other, "Other costs");

    // Compute
    const auto& policy = costing::policy_for(state.costing_method);
    Decimal new_average = policy.average_after_receipt(state.quantity_on_hand, state.average_cost,
                                                       quantity, unit_cost, extras.total());
    Decimal landed = costing::landed_cost(quantity, unit_cost, extras);

    auto m = movement::begin(state, v1::MovementType::PURCHASE, stamp);
    movement::set_quantity(m, quantity);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), unit_cost);
    set_decimal(m.mutable_total_cost(), landed);
    set_decimal(m.mutable_landed_cost(), landed);
    set_decimal(m.mutable_shipping_cost(), extras.shipping);
    set_decimal(m.mutable_duty_cost(), extras.duty);
    set_decimal(m.mutable_other_costs(), extras.other);
    set_decimal(m.mutable_cost_after(), new_average);

    auto* context = m.mutable_context();
    if (!cmd.purchase_order_id().empty()) {
        context->set_reference_type("purchase_order");
        context->set_reference_id(cmd.purchase_order_id());
    } else {
        context->set_reference_type("invoice");
        context->set_reference_id(cmd.invoice_number());
    }
    context->set_reference_number(cmd.invoice_number());
    m.set_supplier_id(cmd.supplier_id());
    m.set_supplier_invoice_number(cmd.invoice_number());
    m.set_reason("Purchase receipt");
    m.set_notes(cmd.notes());

    verify_applicable(state, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
