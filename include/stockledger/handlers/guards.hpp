#pragma once

#include <string>
#include "stockledger/errors.hpp"
#include "stockledger/product_state.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {
namespace handlers {

/// Product must exist, be active and keep inventory.
inline void require_stock_operation(const ProductState& state, const std::string& operation) {
    if (!state.exists()) throw NotFoundError("Product not found");
    validation::require_active(state.archived, state.product_id);
    validation::require_tracked(state.track_inventory, operation);
}

/// Dry-run the movement against a copy of the state; throws what the real apply would.
inline void verify_applicable(const ProductState& state, const v1::StockMovement& movement) {
    ProductState trial = state;
    ProductState::apply_movement(trial, movement);
}

} // namespace handlers
} // namespace stockledger
