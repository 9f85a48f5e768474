#include "stockledger/logging.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace stockledger {

namespace {
std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}
} // anonymous namespace

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time_t, &tm);
    std::stringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

void log(const std::string& level, const std::string& domain, const std::string& message,
         const nlohmann::json& fields) {
    nlohmann::json log_entry = {
        {"level", level},
        {"message", message},
        {"domain", domain},
        {"timestamp", now_iso8601()}
    };
    if (fields.is_object()) {
        for (auto& [key, value] : fields.items()) {
            log_entry[key] = value;
        }
    }
    auto line = log_entry.dump();

    std::lock_guard<std::mutex> lock(log_mutex());
    std::cout << line << std::endl;
}

} // namespace stockledger
