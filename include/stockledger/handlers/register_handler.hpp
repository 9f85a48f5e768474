#pragma once

#include <string>
#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Upper-case the SKU; only letters, digits, '-' and '_' are accepted.
std::string normalize_sku(const std::string& sku);

/// Zero-quantity product row described by the command.
ProductState new_product(const v1::RegisterProduct& cmd);

/// Handle RegisterProduct: the INITIAL movement for a freshly created row.
v1::StockMovement handle_register(
    const v1::RegisterProduct& cmd,
    const ProductState& product,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
