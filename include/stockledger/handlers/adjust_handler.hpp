#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Handle AdjustStock: signed manual correction.
v1::StockMovement handle_adjust(
    const v1::AdjustStock& cmd,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
