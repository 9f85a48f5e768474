#include "stockledger/helpers.hpp"
#include <chrono>
#include <random>

namespace stockledger {
namespace helpers {

std::string new_uuid() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    uint64_t high = dist(engine);
    uint64_t low = dist(engine);
    high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
    low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 15; i >= 0; --i) {
        out.push_back(hex_chars[(high >> (i * 4)) & 0x0f]);
        if (i == 8 || i == 4) out.push_back('-');
    }
    out.push_back('-');
    for (int i = 15; i >= 0; --i) {
        out.push_back(hex_chars[(low >> (i * 4)) & 0x0f]);
        if (i == 12) out.push_back('-');
    }
    return out;
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

std::string trim(const std::string& value) {
    const char* whitespace = " \t\r\n";
    auto begin = value.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    auto end = value.find_last_not_of(whitespace);
    return value.substr(begin, end - begin + 1);
}

} // namespace helpers
} // namespace stockledger
