#include "stockledger/handlers/register_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/helpers.hpp"
#include <cctype>

namespace stockledger {
namespace handlers {

using helpers::from_proto;
using helpers::set_decimal;

std::string normalize_sku(const std::string& sku) {
    std::string out = helpers::trim(sku);
    if (out.empty()) throw ValidationError("sku is required");
    for (auto& c : out) {
        auto uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_') {
            throw ValidationError("SKU can only contain letters, numbers, hyphens, and underscores");
        }
        c = static_cast<char>(std::toupper(uc));
    }
    return out;
}

ProductState new_product(const v1::RegisterProduct& cmd) {
    validation::require_not_empty(cmd.business_id(), "business_id");
    validation::require_not_empty(cmd.product_id(), "product_id");
    validation::require_not_empty(cmd.name(), "name");
    if (cmd.lead_time_days() < 0) throw ValidationError("lead_time_days cannot be negative");

    ProductState product;
    product.business_id = cmd.business_id();
    product.product_id = cmd.product_id();
    product.sku = normalize_sku(cmd.sku());
    product.name = helpers::trim(cmd.name());
    product.category_id = cmd.category_id();
    product.primary_supplier_id = cmd.primary_supplier_id();
    product.primary_supplier_name = cmd.primary_supplier_name();
    product.lead_time_days = cmd.lead_time_days();
    product.track_inventory = cmd.has_track_inventory() ? cmd.track_inventory() : true;
    product.costing_method = cmd.costing_method() == v1::CostingMethod::COSTING_METHOD_UNSPECIFIED
                                 ? v1::CostingMethod::WEIGHTED_AVERAGE
                                 : cmd.costing_method();

    const auto& reorder = cmd.reorder();
    if (reorder.has_reorder_point()) product.reorder_point = from_proto(reorder.reorder_point());
    if (reorder.has_reorder_quantity()) product.reorder_quantity = from_proto(reorder.reorder_quantity());
    if (reorder.has_minimum_quantity()) product.minimum_quantity = from_proto(reorder.minimum_quantity());
    if (reorder.has_maximum_quantity()) product.maximum_quantity = from_proto(reorder.maximum_quantity());
    product.validate_reorder_parameters();

    return product;
}

v1::StockMovement handle_register(
    const v1::RegisterProduct& cmd,
    const ProductState& product,
    const MovementStamp& stamp) {

    // Validate
    Decimal quantity = from_proto(cmd.initial_quantity());
    Decimal unit_cost = from_proto(cmd.initial_unit_cost());
    validation::require_non_negative(quantity, "Initial quantity");
    validation::require_non_negative(unit_cost, "Initial unit cost");
    if (quantity.is_positive()) {
        validation::require_tracked(product.track_inventory, "set initial stock");
    }

    // Compute
    auto m = movement::begin(product, v1::MovementType::INITIAL, stamp);
    movement::set_quantity(m, quantity);
    m.set_location_id(stamp.location_or_default(cmd.location_id()));
    set_decimal(m.mutable_unit_cost(), unit_cost);
    set_decimal(m.mutable_total_cost(), quantity * unit_cost);
    set_decimal(m.mutable_cost_after(), unit_cost);
    m.mutable_context()->set_reference_type("product");
    m.mutable_context()->set_reference_id(product.product_id);
    m.set_reason("Initial stock");

    verify_applicable(product, m);
    return m;
}

} // namespace handlers
} // namespace stockledger
