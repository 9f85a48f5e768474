#pragma once

/**
 * Main include file for the stockledger library.
 *
 * Includes all public headers for convenient access.
 */

#include "stockledger/config.hpp"
#include "stockledger/costing.hpp"
#include "stockledger/decimal.hpp"
#include "stockledger/enums.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/inventory_engine.hpp"
#include "stockledger/lock_table.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/memory_store.hpp"
#include "stockledger/movement.hpp"
#include "stockledger/product_state.hpp"
#include "stockledger/reorder_planner.hpp"
#include "stockledger/repository.hpp"
#include "stockledger/unit_of_work.hpp"
#include "stockledger/validation.hpp"
