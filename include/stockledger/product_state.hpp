#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "stockledger/decimal.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/ledger.pb.h"

namespace stockledger {

/// Product aggregate state.
struct ProductState {
    std::string business_id;
    std::string product_id;
    std::string sku;
    std::string name;
    std::string category_id;
    std::string primary_supplier_id;
    std::string primary_supplier_name;
    int32_t lead_time_days = 0;
    bool track_inventory = true;
    v1::CostingMethod costing_method = v1::CostingMethod::WEIGHTED_AVERAGE;

    Decimal quantity_on_hand;
    Decimal quantity_reserved;
    Decimal unit_cost;
    Decimal average_cost;

    std::optional<Decimal> reorder_point;
    std::optional<Decimal> reorder_quantity;
    std::optional<Decimal> minimum_quantity;
    std::optional<Decimal> maximum_quantity;

    // Every on-hand unit sits in exactly one location; empty buckets are dropped.
    std::map<std::string, Decimal> location_quantities;
    // Open reservations keyed by helpers::reservation_key().
    std::map<std::string, Decimal> reservations;

    int64_t times_sold = 0;
    int64_t version = 0;
    bool archived = false;

    bool exists() const { return !product_id.empty(); }
    ProductKey key() const { return {business_id, product_id}; }

    Decimal quantity_available() const { return quantity_on_hand - quantity_reserved; }
    Decimal inventory_value() const { return quantity_on_hand * average_cost; }
    Decimal location_quantity(const std::string& location_id) const;
    Decimal reserved_for(const std::string& reservation_key) const;

    /// Derived view; never stored.
    v1::StockStatus stock_status() const;
    bool is_low_stock() const;
    bool is_out_of_stock() const;
    bool needs_reorder() const { return is_low_stock(); }

    /**
     * Reorder quantity implied by the thresholds: the configured reorder
     * quantity, else top-up to the maximum, else twice the reorder point.
     */
    std::optional<Decimal> suggest_reorder_quantity() const;

    // Ledger primitives. Each throws BusinessRuleViolation instead of
    // leaving a negative bucket, negative availability or an orphaned
    // reservation behind; the state is untouched when it throws.
    void apply_quantity_delta(const Decimal& delta, const std::string& location_id);
    void apply_cost(const Decimal& new_unit_cost, const Decimal& new_average_cost);
    void apply_reservation(const std::string& reservation_key, const Decimal& quantity);
    void apply_release(const std::string& reservation_key, const Decimal& quantity);
    void apply_transfer(const std::string& from_location_id, const std::string& to_location_id,
                        const Decimal& quantity);

    /// Threshold ordering rules; throws BusinessRuleViolation.
    void validate_reorder_parameters() const;

    v1::ProductSnapshot to_snapshot() const;

    /// Apply a single ledger entry to the state.
    static void apply_movement(ProductState& state, const v1::StockMovement& movement);

    /// Replay a product's full ledger from the zero state.
    static ProductState from_ledger(const ProductKey& key,
                                    const std::vector<v1::StockMovement>& movements);
};

} // namespace stockledger
