#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Handle ReceivePurchase: add stock and recompute the average cost.
v1::StockMovement handle_receive(
    const v1::ReceivePurchase& cmd,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
