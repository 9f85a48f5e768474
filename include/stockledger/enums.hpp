#pragma once

#include <string>
#include "stockledger/ledger.pb.h"

namespace stockledger {

/// Human-readable names, kept apart from the domain logic.
std::string display_name(v1::MovementType type);
std::string display_name(v1::CostingMethod method);
std::string display_name(v1::StockStatus status);
std::string display_name(v1::ReorderPriority priority);

/// Movement types whose quantity changes on-hand stock and may be reversed.
bool is_reversible(v1::MovementType type);

} // namespace stockledger
