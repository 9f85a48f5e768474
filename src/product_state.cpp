#include "stockledger/product_state.hpp"
#include "stockledger/errors.hpp"

namespace stockledger {

using helpers::from_proto;
using helpers::set_decimal;

Decimal ProductState::location_quantity(const std::string& location_id) const {
    auto it = location_quantities.find(location_id);
    return it != location_quantities.end() ? it->second : Decimal::zero();
}

Decimal ProductState::reserved_for(const std::string& reservation_key) const {
    auto it = reservations.find(reservation_key);
    return it != reservations.end() ? it->second : Decimal::zero();
}

v1::StockStatus ProductState::stock_status() const {
    if (!track_inventory) return v1::StockStatus::NOT_TRACKED;
    if (is_out_of_stock()) return v1::StockStatus::OUT_OF_STOCK;
    if (is_low_stock()) return v1::StockStatus::LOW_STOCK;
    return v1::StockStatus::IN_STOCK;
}

bool ProductState::is_low_stock() const {
    if (!reorder_point || !track_inventory) return false;
    return quantity_available() <= *reorder_point;
}

bool ProductState::is_out_of_stock() const {
    if (!track_inventory) return false;
    return quantity_available() <= Decimal::zero();
}

std::optional<Decimal> ProductState::suggest_reorder_quantity() const {
    if (!needs_reorder()) return std::nullopt;

    if (reorder_quantity && reorder_quantity->is_positive()) return reorder_quantity;
    if (maximum_quantity && *maximum_quantity > quantity_available()) {
        return *maximum_quantity - quantity_available();
    }
    if (reorder_point && reorder_point->is_positive()) {
        return *reorder_point * Decimal::from_units(2);
    }
    return std::nullopt;
}

void ProductState::apply_quantity_delta(const Decimal& delta, const std::string& location_id) {
    if (location_id.empty()) throw ValidationError("location is required");

    Decimal new_on_hand = quantity_on_hand + delta;
    Decimal new_bucket = location_quantity(location_id) + delta;

    if (new_on_hand.is_negative()) {
        throw BusinessRuleViolation("Adjustment would result in negative stock. Current: " +
                                    quantity_on_hand.to_string() + ", Change: " + delta.to_string());
    }
    if (new_bucket.is_negative()) {
        throw BusinessRuleViolation("Insufficient stock at location " + location_id +
                                    ". Available: " + location_quantity(location_id).to_string() +
                                    ", Change: " + delta.to_string());
    }
    if (new_on_hand < quantity_reserved) {
        throw BusinessRuleViolation("Change would leave reserved stock uncovered. Reserved: " +
                                    quantity_reserved.to_string() + ", On hand after: " +
                                    new_on_hand.to_string());
    }

    quantity_on_hand = new_on_hand;
    if (new_bucket.is_zero()) {
        location_quantities.erase(location_id);
    } else {
        location_quantities[location_id] = new_bucket;
    }
}

void ProductState::apply_cost(const Decimal& new_unit_cost, const Decimal& new_average_cost) {
    if (new_unit_cost.is_negative() || new_average_cost.is_negative()) {
        throw BusinessRuleViolation("Unit cost cannot be negative");
    }
    unit_cost = new_unit_cost;
    average_cost = new_average_cost;
}

void ProductState::apply_reservation(const std::string& reservation_key, const Decimal& quantity) {
    if (!quantity.is_positive()) throw BusinessRuleViolation("Reservation quantity must be positive");
    if (quantity_available() < quantity) {
        throw BusinessRuleViolation("Insufficient available stock. Available: " +
                                    quantity_available().to_string() + ", Requested: " +
                                    quantity.to_string());
    }
    reservations[reservation_key] = reserved_for(reservation_key) + quantity;
    quantity_reserved += quantity;
}

void ProductState::apply_release(const std::string& reservation_key, const Decimal& quantity) {
    if (!quantity.is_positive()) throw BusinessRuleViolation("Release quantity must be positive");
    if (quantity_reserved < quantity) {
        throw BusinessRuleViolation("Cannot release more than reserved. Reserved: " +
                                    quantity_reserved.to_string() + ", Requested: " +
                                    quantity.to_string());
    }
    Decimal held = reserved_for(reservation_key);
    if (held < quantity) {
        throw BusinessRuleViolation("Reservation " + reservation_key + " holds " + held.to_string() +
                                    ", cannot release " + quantity.to_string());
    }

    Decimal remaining = held - quantity;
    if (remaining.is_zero()) {
        reservations.erase(reservation_key);
    } else {
        reservations[reservation_key] = remaining;
    }
    quantity_reserved -= quantity;
}

void ProductState::apply_transfer(const std::string& from_location_id,
                                  const std::string& to_location_id, const Decimal& quantity) {
    if (from_location_id.empty() || to_location_id.empty()) {
        throw ValidationError("Transfer requires source and destination locations");
    }
    if (from_location_id == to_location_id) {
        throw ValidationError("Source and destination locations must differ");
    }
    if (!quantity.is_positive()) throw BusinessRuleViolation("Transfer quantity must be positive");

    Decimal source = location_quantity(from_location_id);
    if (source < quantity) {
        throw BusinessRuleViolation("Insufficient stock at source location " + from_location_id +
                                    ". Available: " + source.to_string() + ", Requested: " +
                                    quantity.to_string());
    }

    Decimal remaining = source - quantity;
    if (remaining.is_zero()) {
        location_quantities.erase(from_location_id);
    } else {
        location_quantities[from_location_id] = remaining;
    }
    location_quantities[to_location_id] = location_quantity(to_location_id) + quantity;
}

void ProductState::validate_reorder_parameters() const {
    bool any_set = reorder_point || reorder_quantity || minimum_quantity || maximum_quantity;
    if (any_set && !track_inventory) {
        throw BusinessRuleViolation(
            "Cannot set reorder thresholds for products with inventory tracking disabled");
    }
    if (reorder_point && reorder_point->is_negative()) {
        throw BusinessRuleViolation("Reorder point cannot be negative");
    }
    if (reorder_quantity && !reorder_quantity->is_positive()) {
        throw BusinessRuleViolation("Reorder quantity must be positive");
    }
    if (minimum_quantity && minimum_quantity->is_negative()) {
        throw BusinessRuleViolation("Minimum quantity cannot be negative");
    }
    if (maximum_quantity && !maximum_quantity->is_positive()) {
        throw BusinessRuleViolation("Maximum quantity must be positive");
    }
    if (minimum_quantity && maximum_quantity && *minimum_quantity > *maximum_quantity) {
        throw BusinessRuleViolation("Minimum quantity cannot be greater than maximum quantity");
    }
    if (reorder_point && minimum_quantity && *reorder_point < *minimum_quantity) {
        throw BusinessRuleViolation("Reorder point should be at least the minimum quantity");
    }
}

v1::ProductSnapshot ProductState::to_snapshot() const {
    v1::ProductSnapshot out;
    out.set_business_id(business_id);
    out.set_product_id(product_id);
    out.set_sku(sku);
    out.set_name(name);
    out.set_category_id(category_id);
    out.set_primary_supplier_id(primary_supplier_id);
    out.set_primary_supplier_name(primary_supplier_name);
    out.set_lead_time_days(lead_time_days);
    out.set_track_inventory(track_inventory);
    out.set_costing_method(costing_method);
    set_decimal(out.mutable_quantity_on_hand(), quantity_on_hand);
    set_decimal(out.mutable_quantity_reserved(), quantity_reserved);
    set_decimal(out.mutable_quantity_available(), quantity_available());
    set_decimal(out.mutable_unit_cost(), unit_cost);
    set_decimal(out.mutable_average_cost(), average_cost);
    set_decimal(out.mutable_inventory_value(), inventory_value());

    auto* reorder = out.mutable_reorder();
    if (reorder_point) set_decimal(reorder->mutable_reorder_point(), *reorder_point);
    if (reorder_quantity) set_decimal(reorder->mutable_reorder_quantity(), *reorder_quantity);
    if (minimum_quantity) set_decimal(reorder->mutable_minimum_quantity(), *minimum_quantity);
    if (maximum_quantity) set_decimal(reorder->mutable_maximum_quantity(), *maximum_quantity);

    out.set_stock_status(stock_status());
    for (const auto& [location, quantity] : location_quantities) {
        set_decimal(&(*out.mutable_location_quantities())[location], quantity);
    }
    for (const auto& [key, quantity] : reservations) {
        set_decimal(&(*out.mutable_reservations())[key], quantity);
    }
    out.set_times_sold(times_sold);
    out.set_version(version);
    out.set_archived(archived);
    return out;
}

void ProductState::apply_movement(ProductState& state, const v1::StockMovement& movement) {
    const Decimal quantity = from_proto(movement.quantity());
    const Decimal reserved_delta = from_proto(movement.reserved_delta());
    const auto& context = movement.context();
    const std::string key = helpers::reservation_key(context.reference_type(), context.reference_id());

    // Consumed reservations go first so a sale never sees its own hold as uncovered stock.
    if (reserved_delta.is_negative()) state.apply_release(key, -reserved_delta);

    if (movement.movement_type() == v1::MovementType::TRANSFER) {
        state.apply_transfer(movement.from_location_id(), movement.to_location_id(),
                             from_proto(movement.transfer_quantity()));
    } else if (!quantity.is_zero()) {
        state.apply_quantity_delta(quantity, movement.location_id());
    }

    if (reserved_delta.is_positive()) state.apply_reservation(key, reserved_delta);

    switch (movement.movement_type()) {
        case v1::MovementType::INITIAL:
            state.apply_cost(from_proto(movement.unit_cost()), from_proto(movement.cost_after()));
            break;
        case v1::MovementType::PURCHASE:
            if (quantity.is_positive()) {
                state.apply_cost(from_proto(movement.unit_cost()), from_proto(movement.cost_after()));
            }
            break;
        case v1::MovementType::SALE:
            state.times_sold += quantity.is_negative() ? 1 : -1;
            if (state.times_sold < 0) state.times_sold = 0;
            break;
        default:
            break;
    }
}

ProductState ProductState::from_ledger(const ProductKey& key,
                                       const std::vector<v1::StockMovement>& movements) {
    ProductState state;
    state.business_id = key.business_id;
    state.product_id = key.product_id;
    for (const auto& movement : movements) {
        apply_movement(state, movement);
    }
    return state;
}

} // namespace stockledger
