#include "stockledger/memory_store.hpp"
#include "stockledger/errors.hpp"
#include <algorithm>
#include <mutex>

namespace stockledger {

namespace {

using ProductTable = std::map<ProductKey, ProductState>;
using LedgerTable = std::map<ProductKey, std::vector<v1::StockMovement>>;

bool needs_reorder(const ProductState& product) {
    return !product.archived && product.is_low_stock();
}

std::vector<ProductState> products_of(const ProductTable& products, const std::string& business_id) {
    std::vector<ProductState> out;
    for (auto it = products.lower_bound(ProductKey{business_id, ""});
         it != products.end() && it->first.business_id == business_id; ++it) {
        out.push_back(it->second);
    }
    return out;
}

std::vector<v1::StockMovement> ledger_of(const LedgerTable& ledgers, const ProductKey& key) {
    auto it = ledgers.find(key);
    return it != ledgers.end() ? it->second : std::vector<v1::StockMovement>{};
}

bool matches_reference(const v1::StockMovement& movement, const std::string& reference_type,
                       const std::string& reference_id) {
    return movement.context().reference_type() == reference_type &&
           movement.context().reference_id() == reference_id;
}

} // anonymous namespace

// ============================================================================
// Committed views
// ============================================================================

class MemoryStore::CommittedProducts final : public ProductReader {
public:
    explicit CommittedProducts(const MemoryStore& store) : store_(store) {}

    std::optional<ProductState> get_by_id(const ProductKey& key) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        auto it = store_.tables_.products.find(key);
        if (it == store_.tables_.products.end()) return std::nullopt;
        return it->second;
    }

    std::optional<ProductState> get_by_sku(const std::string& business_id,
                                           const std::string& sku) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        for (auto& product : products_of(store_.tables_.products, business_id)) {
            if (product.sku == sku) return product;
        }
        return std::nullopt;
    }

    std::vector<ProductState> list_by_business(const std::string& business_id) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        return products_of(store_.tables_.products, business_id);
    }

    std::vector<ProductState> get_products_needing_reorder(
        const std::string& business_id) const override {
        auto products = list_by_business(business_id);
        products.erase(std::remove_if(products.begin(), products.end(),
                                      [](const ProductState& p) { return !needs_reorder(p); }),
                       products.end());
        return products;
    }

private:
    const MemoryStore& store_;
};

class MemoryStore::CommittedMovements final : public StockMovementReader {
public:
    explicit CommittedMovements(const MemoryStore& store) : store_(store) {}

    std::optional<v1::StockMovement> get_by_id(const std::string& movement_id) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        auto it = store_.tables_.movement_index.find(movement_id);
        if (it == store_.tables_.movement_index.end()) return std::nullopt;
        const auto& [key, index] = it->second;
        return store_.tables_.ledgers.at(key).at(index);
    }

    std::vector<v1::StockMovement> get_movements_for_product(const ProductKey& key) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        return ledger_of(store_.tables_.ledgers, key);
    }

    std::vector<v1::StockMovement> get_movements_by_reference(
        const ProductKey& key, const std::string& reference_type,
        const std::string& reference_id) const override {
        std::vector<v1::StockMovement> out;
        for (auto& movement : get_movements_for_product(key)) {
            if (matches_reference(movement, reference_type, reference_id)) {
                out.push_back(std::move(movement));
            }
        }
        return out;
    }

    int64_t next_sequence(const ProductKey& key) const override {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        auto it = store_.tables_.ledgers.find(key);
        return it != store_.tables_.ledgers.end() ? static_cast<int64_t>(it->second.size()) : 0;
    }

private:
    const MemoryStore& store_;
};

// ============================================================================
// Unit of work
// ============================================================================

class MemoryStore::Transaction final : public UnitOfWork {
public:
    Transaction(MemoryStore& store, const ProductKey& key)
        : store_(store), key_(key), guard_(store.locks_.acquire(key)),
          products_(*this), movements_(*this) {
        std::shared_lock<std::shared_mutex> lock(store_.mutex_);
        auto it = store_.tables_.products.find(key_);
        if (it != store_.tables_.products.end()) {
            staged_ = it->second;
            base_version_ = it->second.version;
        }
        auto ledger = store_.tables_.ledgers.find(key_);
        if (ledger != store_.tables_.ledgers.end()) base_ledger_size_ = ledger->second.size();
    }

    ProductRepository& products() override { return products_; }
    StockMovementRepository& movements() override { return movements_; }

    void commit() override {
        if (committed_) throw ApplicationError("unit of work already committed");
        if (!dirty_ && staged_movements_.empty()) {
            committed_ = true;
            return;
        }
        if (!staged_) throw ApplicationError("ledger entries staged for missing product " + key_.to_string());

        std::unique_lock<std::shared_mutex> lock(store_.mutex_);
        auto& tables = store_.tables_;

        auto row = tables.products.find(key_);
        bool exists = row != tables.products.end();
        if (created_ && exists) {
            throw ConcurrencyConflict("Product " + key_.to_string() + " was created concurrently");
        }
        int64_t current_version = exists ? row->second.version : 0;
        if (current_version != base_version_) {
            throw ConcurrencyConflict("Product " + key_.to_string() + " changed: expected version " +
                                      std::to_string(base_version_) + ", found " +
                                      std::to_string(current_version));
        }
        auto ledger = tables.ledgers.find(key_);
        size_t current_ledger_size = ledger != tables.ledgers.end() ? ledger->second.size() : 0;
        if (current_ledger_size != base_ledger_size_) {
            throw ConcurrencyConflict("Ledger of " + key_.to_string() + " grew concurrently");
        }
        if (created_) {
            for (const auto& other : products_of(tables.products, key_.business_id)) {
                if (other.sku == staged_->sku) {
                    throw BusinessRuleViolation("SKU " + staged_->sku + " already exists");
                }
            }
        }

        tables.products[key_] = *staged_;
        auto& entries = tables.ledgers[key_];
        for (auto& movement : staged_movements_) {
            tables.movement_index[movement.movement_id()] = {key_, entries.size()};
            entries.push_back(std::move(movement));
        }
        staged_movements_.clear();
        committed_ = true;
    }

private:
    class StagedProducts final : public ProductRepository {
    public:
        explicit StagedProducts(Transaction& tx) : tx_(tx) {}

        std::optional<ProductState> get_by_id(const ProductKey& key) const override {
            if (key == tx_.key_) return tx_.staged_;
            return tx_.store_.committed_products_->get_by_id(key);
        }

        std::optional<ProductState> get_by_sku(const std::string& business_id,
                                               const std::string& sku) const override {
            for (auto& product : list_by_business(business_id)) {
                if (product.sku == sku) return product;
            }
            return std::nullopt;
        }

        std::vector<ProductState> list_by_business(const std::string& business_id) const override {
            auto products = tx_.store_.committed_products_->list_by_business(business_id);
            if (business_id != tx_.key_.business_id) return products;

            products.erase(std::remove_if(products.begin(), products.end(),
                                          [this](const ProductState& p) { return p.key() == tx_.key_; }),
                           products.end());
            if (tx_.staged_) {
                auto pos = std::lower_bound(products.begin(), products.end(), *tx_.staged_,
                                            [](const ProductState& a, const ProductState& b) {
                                                return a.key() < b.key();
                                            });
                products.insert(pos, *tx_.staged_);
            }
            return products;
        }

        std::vector<ProductState> get_products_needing_reorder(
            const std::string& business_id) const override {
            auto products = list_by_business(business_id);
            products.erase(std::remove_if(products.begin(), products.end(),
                                          [](const ProductState& p) { return !needs_reorder(p); }),
                           products.end());
            return products;
        }

        void create(const ProductState& product) override {
            tx_.require_scope(product.key());
            if (tx_.staged_) {
                throw BusinessRuleViolation("Product " + product.key().to_string() + " already exists");
            }
            tx_.staged_ = product;
            tx_.created_ = true;
            tx_.mark_dirty();
        }

        ProductState update_quantity(const ProductKey& key, const Decimal& delta,
                                     const std::string& location_id) override {
            return tx_.mutate(key, [&](ProductState& p) { p.apply_quantity_delta(delta, location_id); });
        }

        ProductState update_cost(const ProductKey& key, const Decimal& unit_cost,
                                 const Decimal& average_cost) override {
            return tx_.mutate(key, [&](ProductState& p) { p.apply_cost(unit_cost, average_cost); });
        }

        ProductState reserve_quantity(const ProductKey& key, const std::string& reservation_key,
                                      const Decimal& quantity) override {
            return tx_.mutate(key, [&](ProductState& p) { p.apply_reservation(reservation_key, quantity); });
        }

        ProductState release_reservation(const ProductKey& key, const std::string& reservation_key,
                                         const Decimal& quantity) override {
            return tx_.mutate(key, [&](ProductState& p) { p.apply_release(reservation_key, quantity); });
        }

        ProductState transfer_between_locations(const ProductKey& key,
                                                const std::string& from_location_id,
                                                const std::string& to_location_id,
                                                const Decimal& quantity) override {
            return tx_.mutate(key, [&](ProductState& p) {
                p.apply_transfer(from_location_id, to_location_id, quantity);
            });
        }

        ProductState record_sale(const ProductKey& key, int count_delta) override {
            return tx_.mutate(key, [&](ProductState& p) {
                p.times_sold = std::max<int64_t>(0, p.times_sold + count_delta);
            });
        }

        ProductState update(const ProductState& product) override {
            return tx_.mutate(product.key(), [&](ProductState& p) {
                p.sku = product.sku;
                p.name = product.name;
                p.category_id = product.category_id;
                p.primary_supplier_id = product.primary_supplier_id;
                p.primary_supplier_name = product.primary_supplier_name;
                p.lead_time_days = product.lead_time_days;
                p.costing_method = product.costing_method;
                p.reorder_point = product.reorder_point;
                p.reorder_quantity = product.reorder_quantity;
                p.minimum_quantity = product.minimum_quantity;
                p.maximum_quantity = product.maximum_quantity;
            });
        }

        ProductState archive(const ProductKey& key) override {
            return tx_.mutate(key, [](ProductState& p) { p.archived = true; });
        }

    private:
        Transaction& tx_;
    };

    class StagedMovements final : public StockMovementRepository {
    public:
        explicit StagedMovements(Transaction& tx) : tx_(tx) {}

        std::optional<v1::StockMovement> get_by_id(const std::string& movement_id) const override {
            for (const auto& movement : tx_.staged_movements_) {
                if (movement.movement_id() == movement_id) return movement;
            }
            return tx_.store_.committed_movements_->get_by_id(movement_id);
        }

        std::vector<v1::StockMovement> get_movements_for_product(const ProductKey& key) const override {
            auto out = tx_.store_.committed_movements_->get_movements_for_product(key);
            if (key == tx_.key_) {
                // Committed part is pinned by the product lock; cut to what this unit saw.
                out.resize(std::min(out.size(), tx_.base_ledger_size_));
                out.insert(out.end(), tx_.staged_movements_.begin(), tx_.staged_movements_.end());
            }
            return out;
        }

        std::vector<v1::StockMovement> get_movements_by_reference(
            const ProductKey& key, const std::string& reference_type,
            const std::string& reference_id) const override {
            std::vector<v1::StockMovement> out;
            for (auto& movement : get_movements_for_product(key)) {
                if (matches_reference(movement, reference_type, reference_id)) {
                    out.push_back(std::move(movement));
                }
            }
            return out;
        }

        int64_t next_sequence(const ProductKey& key) const override {
            if (key == tx_.key_) {
                return static_cast<int64_t>(tx_.base_ledger_size_ + tx_.staged_movements_.size());
            }
            return tx_.store_.committed_movements_->next_sequence(key);
        }

        void create(const v1::StockMovement& movement) override {
            tx_.require_scope({movement.business_id(), movement.product_id()});
            if (movement.movement_id().empty()) throw ValidationError("movement_id is required");
            if (movement.sequence() != next_sequence(tx_.key_)) {
                throw ApplicationError("Movement sequence " + std::to_string(movement.sequence()) +
                                       " is not next for " + tx_.key_.to_string());
            }
            if (get_by_id(movement.movement_id())) {
                throw ApplicationError("Duplicate movement id " + movement.movement_id());
            }
            tx_.staged_movements_.push_back(movement);
        }

    private:
        Transaction& tx_;
    };

    void require_scope(const ProductKey& key) const {
        if (!(key == key_)) {
            throw ApplicationError("Unit of work for " + key_.to_string() + " cannot write " +
                                   key.to_string());
        }
    }

    void mark_dirty() {
        if (dirty_) return;
        dirty_ = true;
        staged_->version = base_version_ + 1;
    }

    // Apply fn to a copy so a throwing mutator leaves the staged row intact.
    template <typename Fn>
    ProductState mutate(const ProductKey& key, Fn&& fn) {
        require_scope(key);
        if (!staged_) throw NotFoundError("Product not found: " + key.to_string());
        ProductState next = *staged_;
        fn(next);
        *staged_ = std::move(next);
        mark_dirty();
        return *staged_;
    }

    MemoryStore& store_;
    ProductKey key_;
    std::unique_lock<std::mutex> guard_;

    std::optional<ProductState> staged_;
    int64_t base_version_ = 0;
    size_t base_ledger_size_ = 0;
    bool created_ = false;
    bool dirty_ = false;
    bool committed_ = false;
    std::vector<v1::StockMovement> staged_movements_;

    StagedProducts products_;
    StagedMovements movements_;
};

// ============================================================================
// MemoryStore
// ============================================================================

MemoryStore::MemoryStore(size_t lock_stripes)
    : locks_(lock_stripes),
      committed_products_(std::make_unique<CommittedProducts>(*this)),
      committed_movements_(std::make_unique<CommittedMovements>(*this)) {}

MemoryStore::~MemoryStore() = default;

std::unique_ptr<UnitOfWork> MemoryStore::begin(const ProductKey& key) {
    return std::make_unique<Transaction>(*this, key);
}

const ProductReader& MemoryStore::products() const { return *committed_products_; }

const StockMovementReader& MemoryStore::movements() const { return *committed_movements_; }

} // namespace stockledger
