#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/// Handle ReleaseReservation.
v1::StockMovement handle_release(
    const v1::ReleaseReservation& cmd,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
