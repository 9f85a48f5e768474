#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "stockledger/decimal.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/ledger.pb.h"
#include "stockledger/product_state.hpp"

namespace stockledger {

/**
 * Read side of the product table.
 */
class ProductReader {
public:
    virtual ~ProductReader() = default;

    virtual std::optional<ProductState> get_by_id(const ProductKey& key) const = 0;

    /// SKU lookup within one business; the SKU is compared as stored (upper case).
    virtual std::optional<ProductState> get_by_sku(const std::string& business_id,
                                                   const std::string& sku) const = 0;

    /// All products of a business, archived ones included, ordered by product id.
    virtual std::vector<ProductState> list_by_business(const std::string& business_id) const = 0;

    /**
     * Tracked, active products with a reorder point whose available quantity
     * is at or below it.
     */
    virtual std::vector<ProductState> get_products_needing_reorder(
        const std::string& business_id) const = 0;
};

/**
 * Product table inside a unit of work. Every mutator returns the updated row
 * and throws BusinessRuleViolation, leaving the row unchanged, when the change
 * would break a quantity invariant.
 */
class ProductRepository : public ProductReader {
public:
    /// Throws BusinessRuleViolation if the product already exists.
    virtual void create(const ProductState& product) = 0;

    virtual ProductState update_quantity(const ProductKey& key, const Decimal& delta,
                                         const std::string& location_id) = 0;

    virtual ProductState update_cost(const ProductKey& key, const Decimal& unit_cost,
                                     const Decimal& average_cost) = 0;

    virtual ProductState reserve_quantity(const ProductKey& key, const std::string& reservation_key,
                                          const Decimal& quantity) = 0;

    virtual ProductState release_reservation(const ProductKey& key,
                                             const std::string& reservation_key,
                                             const Decimal& quantity) = 0;

    virtual ProductState transfer_between_locations(const ProductKey& key,
                                                    const std::string& from_location_id,
                                                    const std::string& to_location_id,
                                                    const Decimal& quantity) = 0;

    /// Adjust the sales counter by +1 for a sale or -1 for a reversed sale.
    virtual ProductState record_sale(const ProductKey& key, int count_delta) = 0;

    /// Descriptive and threshold columns only; quantities and costs are ignored.
    virtual ProductState update(const ProductState& product) = 0;

    virtual ProductState archive(const ProductKey& key) = 0;
};

/**
 * Read side of the movement ledger.
 */
class StockMovementReader {
public:
    virtual ~StockMovementReader() = default;

    virtual std::optional<v1::StockMovement> get_by_id(const std::string& movement_id) const = 0;

    /// Ledger of one product in sequence order.
    virtual std::vector<v1::StockMovement> get_movements_for_product(
        const ProductKey& key) const = 0;

    virtual std::vector<v1::StockMovement> get_movements_by_reference(
        const ProductKey& key, const std::string& reference_type,
        const std::string& reference_id) const = 0;

    /// Sequence number the next movement of the product will carry.
    virtual int64_t next_sequence(const ProductKey& key) const = 0;
};

/**
 * Append-only movement ledger inside a unit of work.
 */
class StockMovementRepository : public StockMovementReader {
public:
    /// Throws ApplicationError if the sequence is not the next one.
    virtual void create(const v1::StockMovement& movement) = 0;
};

} // namespace stockledger
