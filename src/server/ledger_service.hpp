#pragma once

#include <memory>
#include "stockledger/inventory_engine.hpp"
#include "stockledger/reorder_planner.hpp"
#include "stockledger/ledger_service.grpc.pb.h"

namespace stockledger {

std::unique_ptr<v1::InventoryLedger::Service> create_ledger_service(
    std::shared_ptr<InventoryEngine> engine,
    std::shared_ptr<ReorderPlanner> planner);

} // namespace stockledger
