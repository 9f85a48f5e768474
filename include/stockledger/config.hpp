#pragma once

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>
#include "stockledger/decimal.hpp"

namespace stockledger {

/**
 * Planning constants for reorder suggestions and EOQ.
 */
struct ReorderPolicy {
    Decimal ordering_cost = Decimal::from_units(50);
    Decimal holding_cost_rate = Decimal::parse("0.20");
    int observation_window_days = 90;
    Decimal default_annual_demand = Decimal::from_units(100);
    Decimal default_reorder_quantity = Decimal::from_units(10);
    Decimal fallback_unit_cost = Decimal::from_units(10);
};

struct LedgerConfig {
    LedgerConfig();

    int port = 50461;
    std::string default_location = "main";
    int max_commit_retries = 3;
    size_t lock_stripes = 64;
    ReorderPolicy reorder;

    /**
     * Overlay values from a JSON object; absent keys keep their defaults.
     * Throws ValidationError on wrong types or out-of-range values.
     */
    static LedgerConfig from_json(const nlohmann::json& doc, LedgerConfig base = {});

    /**
     * Load a JSON config file. Throws ValidationError if unreadable or invalid.
     */
    static LedgerConfig from_file(const std::string& path, LedgerConfig base = {});

    /**
     * Defaults, then the file named by STOCKLEDGER_CONFIG, then PORT.
     */
    static LedgerConfig from_env();

    void validate() const;
};

} // namespace stockledger
