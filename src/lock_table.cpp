#include "stockledger/lock_table.hpp"
#include "stockledger/errors.hpp"
#include <functional>

namespace stockledger {

LockTable::LockTable(size_t stripes) : stripes_(stripes) {
    if (stripes == 0) throw ValidationError("lock table needs at least one stripe");
}

size_t LockTable::stripe_for(const ProductKey& key) const {
    return std::hash<std::string>{}(key.to_string()) % stripes_.size();
}

std::unique_lock<std::mutex> LockTable::acquire(const ProductKey& key) {
    return std::unique_lock<std::mutex>(stripes_[stripe_for(key)]);
}

} // namespace stockledger
