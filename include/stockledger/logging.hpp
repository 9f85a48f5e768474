#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace stockledger {

std::string now_iso8601();

/**
 * Write one structured JSON log line to stdout:
 *   {"level":"info","message":"stock_adjusted","domain":"inventory","timestamp":"...",...}
 * Fields are merged into the top-level object.
 */
void log(const std::string& level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_info(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log("info", domain, message, fields);
}

inline void log_warn(const std::string& domain, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log("warn", domain, message, fields);
}

inline void log_error(const std::string& domain, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log("error", domain, message, fields);
}

} // namespace stockledger
