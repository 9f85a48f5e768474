#pragma once

#include "stockledger/ledger.pb.h"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"

namespace stockledger {
namespace handlers {

/**
 * Handle ReverseMovement: a compensating entry of the same type with the
 * negated quantity. already_reversed tells whether a reversal of the
 * original exists in the ledger.
 */
v1::StockMovement handle_reverse(
    const v1::ReverseMovement& cmd,
    const v1::StockMovement& original,
    bool already_reversed,
    const ProductState& state,
    const MovementStamp& stamp);

} // namespace handlers
} // namespace stockledger
