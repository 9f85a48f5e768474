#pragma once

#include <cstddef>
#include <mutex>
#include <vector>
#include "stockledger/helpers.hpp"

namespace stockledger {

/**
 * Fixed set of mutexes; a product always maps to the same stripe, so all
 * writers of one product are serialised while most other products proceed.
 */
class LockTable {
public:
    explicit LockTable(size_t stripes);

    LockTable(const LockTable&) = delete;
    LockTable& operator=(const LockTable&) = delete;

    std::unique_lock<std::mutex> acquire(const ProductKey& key);

    size_t stripe_for(const ProductKey& key) const;
    size_t size() const { return stripes_.size(); }

private:
    std::vector<std::mutex> stripes_;
};

} // namespace stockledger
