#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <google/protobuf/timestamp.pb.h>
#include "stockledger/decimal.hpp"
#include "stockledger/ledger.pb.h"
#include "stockledger/product_state.hpp"

namespace stockledger {

/**
 * Identity and bookkeeping the engine assigns to a movement before a
 * handler fills in the quantities.
 */
struct MovementStamp {
    std::string movement_id;
    int64_t sequence = 0;
    google::protobuf::Timestamp at;
    std::string created_by;
    std::string default_location;

    /// Location named by a command, or the default when it names none.
    std::string location_or_default(const std::string& location_id) const {
        return location_id.empty() ? default_location : location_id;
    }
};

namespace movement {

/**
 * Start a movement for the product: identity, sequence, and "before"
 * snapshots of quantity, reservation and average cost, with the "after"
 * values equal to the "before" values until a delta is set.
 */
v1::StockMovement begin(const ProductState& state, v1::MovementType type,
                        const MovementStamp& stamp);

/// Set the on-hand delta; quantity_after follows.
void set_quantity(v1::StockMovement& movement, const Decimal& delta);

/// Set the reservation delta; reserved_after follows.
void set_reserved(v1::StockMovement& movement, const Decimal& delta);

Decimal quantity(const v1::StockMovement& movement);
Decimal quantity_before(const v1::StockMovement& movement);
Decimal quantity_after(const v1::StockMovement& movement);
Decimal reserved_delta(const v1::StockMovement& movement);
Decimal reserved_after(const v1::StockMovement& movement);

/// "Sale of 3 units (order:SO-1)"
std::string describe(const v1::StockMovement& movement);

/**
 * Arithmetic identities a single entry must satisfy. Returns one message per
 * broken identity; empty when the entry is consistent.
 */
std::vector<std::string> check_consistency(const v1::StockMovement& movement);

/**
 * Rebuild the product from its ledger and compare it with the stored row.
 * Reports sequence gaps, broken per-entry identities, before/after chain
 * breaks, entries that cannot be replayed, and field mismatches.
 */
v1::AuditReport audit(const ProductState& stored, const std::vector<v1::StockMovement>& movements);

} // namespace movement
} // namespace stockledger
