#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include <cstdlib>
#include <fstream>

namespace stockledger {

namespace {

// Money and rates are accepted as JSON strings ("0.20") or numbers.
Decimal read_decimal(const nlohmann::json& value, const std::string& key) {
    if (value.is_string()) return Decimal::parse(value.get<std::string>());
    if (value.is_number()) return Decimal::from_double(value.get<double>());
    throw ValidationError("config key '" + key + "' must be a decimal");
}

int read_int(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ValidationError("config key '" + key + "' must be an integer");
    }
    return value.get<int>();
}

} // anonymous namespace

LedgerConfig::LedgerConfig() = default;

LedgerConfig LedgerConfig::from_json(const nlohmann::json& doc, LedgerConfig base) {
    if (!doc.is_object()) throw ValidationError("config root must be an object");

    LedgerConfig config = std::move(base);
    if (doc.contains("port")) config.port = read_int(doc["port"], "port");
    if (doc.contains("default_location")) {
        if (!doc["default_location"].is_string()) {
            throw ValidationError("config key 'default_location' must be a string");
        }
        config.default_location = doc["default_location"].get<std::string>();
    }
    if (doc.contains("max_commit_retries")) {
        config.max_commit_retries = read_int(doc["max_commit_retries"], "max_commit_retries");
    }
    if (doc.contains("lock_stripes")) {
        int stripes = read_int(doc["lock_stripes"], "lock_stripes");
        if (stripes <= 0) throw ValidationError("lock_stripes must be positive");
        config.lock_stripes = static_cast<size_t>(stripes);
    }

    if (doc.contains("reorder")) {
        const auto& reorder = doc["reorder"];
        if (!reorder.is_object()) throw ValidationError("config key 'reorder' must be an object");
        auto& policy = config.reorder;
        if (reorder.contains("ordering_cost")) {
            policy.ordering_cost = read_decimal(reorder["ordering_cost"], "reorder.ordering_cost");
        }
        if (reorder.contains("holding_cost_rate")) {
            policy.holding_cost_rate =
                read_decimal(reorder["holding_cost_rate"], "reorder.holding_cost_rate");
        }
        if (reorder.contains("observation_window_days")) {
            policy.observation_window_days =
                read_int(reorder["observation_window_days"], "reorder.observation_window_days");
        }
        if (reorder.contains("default_annual_demand")) {
            policy.default_annual_demand =
                read_decimal(reorder["default_annual_demand"], "reorder.default_annual_demand");
        }
        if (reorder.contains("default_reorder_quantity")) {
            policy.default_reorder_quantity =
                read_decimal(reorder["default_reorder_quantity"], "reorder.default_reorder_quantity");
        }
        if (reorder.contains("fallback_unit_cost")) {
            policy.fallback_unit_cost =
                read_decimal(reorder["fallback_unit_cost"], "reorder.fallback_unit_cost");
        }
    }

    config.validate();
    return config;
}

LedgerConfig LedgerConfig::from_file(const std::string& path, LedgerConfig base) {
    std::ifstream in(path);
    if (!in) throw ValidationError("cannot open config file: " + path);

    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::parse_error& e) {
        throw ValidationError("invalid config file " + path + ": " + e.what());
    }
    return from_json(doc, std::move(base));
}

LedgerConfig LedgerConfig::from_env() {
    LedgerConfig config;

    const char* path = std::getenv("STOCKLEDGER_CONFIG");
    if (path && *path) {
        config = from_file(path, config);
        log_info("config", "config_file_loaded", {{"path", path}});
    }

    const char* port_env = std::getenv("PORT");
    if (port_env && *port_env) {
        try {
            config.port = std::stoi(port_env);
        } catch (const std::exception&) {
            throw ValidationError(std::string("PORT is not a number: ") + port_env);
        }
    }

    config.validate();
    return config;
}

void LedgerConfig::validate() const {
    if (port <= 0 || port > 65535) throw ValidationError("port out of range");
    if (default_location.empty()) throw ValidationError("default_location must not be empty");
    if (max_commit_retries < 0) throw ValidationError("max_commit_retries cannot be negative");
    if (lock_stripes == 0) throw ValidationError("lock_stripes must be positive");
    if (reorder.ordering_cost.is_negative()) throw ValidationError("ordering_cost cannot be negative");
    if (reorder.holding_cost_rate.is_negative()) {
        throw ValidationError("holding_cost_rate cannot be negative");
    }
    if (reorder.observation_window_days <= 0) {
        throw ValidationError("observation_window_days must be positive");
    }
    if (!reorder.default_annual_demand.is_positive()) {
        throw ValidationError("default_annual_demand must be positive");
    }
    if (!reorder.default_reorder_quantity.is_positive()) {
        throw ValidationError("default_reorder_quantity must be positive");
    }
    if (reorder.fallback_unit_cost.is_negative()) {
        throw ValidationError("fallback_unit_cost cannot be negative");
    }
}

} // namespace stockledger
