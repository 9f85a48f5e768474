#pragma once

#include <memory>
#include <utility>
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/repository.hpp"

namespace stockledger {

/**
 * Staged writes against one product. Reads see the staged state; commit()
 * publishes the product row and its new ledger entries together.
 * Destroying an uncommitted unit of work discards everything it staged.
 */
class UnitOfWork {
public:
    virtual ~UnitOfWork() = default;

    virtual ProductRepository& products() = 0;
    virtual StockMovementRepository& movements() = 0;

    /// Throws ConcurrencyConflict if the product changed since it was read.
    virtual void commit() = 0;
};

/**
 * Transactional storage for products and their ledgers.
 */
class InventoryStore {
public:
    virtual ~InventoryStore() = default;

    /// Open a unit of work; holds the product's lock until it is destroyed.
    virtual std::unique_ptr<UnitOfWork> begin(const ProductKey& key) = 0;

    /// Committed state only.
    virtual const ProductReader& products() const = 0;
    virtual const StockMovementReader& movements() const = 0;
};

/**
 * Run fn inside a fresh unit of work and commit it, retrying the whole
 * unit on ConcurrencyConflict up to max_retries times.
 */
template <typename Fn>
auto run_in_transaction(InventoryStore& store, const ProductKey& key, int max_retries, Fn&& fn)
    -> decltype(fn(std::declval<UnitOfWork&>())) {
    for (int attempt = 0;; ++attempt) {
        auto uow = store.begin(key);
        try {
            auto result = fn(*uow);
            uow->commit();
            return result;
        } catch (const ConcurrencyConflict& e) {
            if (attempt >= max_retries) throw;
            log_warn("store", "commit_conflict_retrying",
                     {{"product", key.to_string()}, {"attempt", attempt + 1}, {"error", e.what()}});
        }
    }
}

} // namespace stockledger
