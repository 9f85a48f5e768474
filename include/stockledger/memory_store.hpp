#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "stockledger/lock_table.hpp"
#include "stockledger/unit_of_work.hpp"

namespace stockledger {

namespace test {
class StoreTamper;
} // namespace test

/**
 * In-process InventoryStore.
 *
 * A unit of work holds the product's stripe in the lock table for its whole
 * lifetime and stages writes privately. Commit re-checks the product version
 * and ledger length under the exclusive table lock, then publishes the row
 * and the new ledger entries together; readers take the shared lock.
 */
class MemoryStore final : public InventoryStore {
public:
    explicit MemoryStore(size_t lock_stripes = 64);
    ~MemoryStore() override;

    MemoryStore(const MemoryStore&) = delete;
    MemoryStore& operator=(const MemoryStore&) = delete;

    std::unique_ptr<UnitOfWork> begin(const ProductKey& key) override;

    const ProductReader& products() const override;
    const StockMovementReader& movements() const override;

private:
    friend class test::StoreTamper;

    class Transaction;
    class CommittedProducts;
    class CommittedMovements;

    struct Tables {
        std::map<ProductKey, ProductState> products;
        std::map<ProductKey, std::vector<v1::StockMovement>> ledgers;
        // movement_id -> (product, index into its ledger)
        std::map<std::string, std::pair<ProductKey, size_t>> movement_index;
    };

    mutable std::shared_mutex mutex_;
    Tables tables_;
    LockTable locks_;
    std::unique_ptr<CommittedProducts> committed_products_;
    std::unique_ptr<CommittedMovements> committed_movements_;
};

} // namespace stockledger
