#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Handle ReserveStock.
v1::StockMovement handle_reserve(
    const v1::ReserveStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
