#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Handle RecountStock: set a location bucket to the counted quantity.
v1::StockMovement handle_recount(
    const v1::RecountStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
