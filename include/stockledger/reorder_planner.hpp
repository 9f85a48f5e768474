#pragma once

#include <memory>
#include "stockledger/config.hpp"
#include "stockledger/ledger.pb.h"
#include "stockledger/product_state.hpp"
#include "stockledger/unit_of_work.hpp"

namespace stockledger {

/**
 * Reorder suggestions, EOQ optimisation and purchase recommendations,
 * derived from committed product state. Scans are read-only; only
 * update_reorder_parameters writes, through a unit of work.
 */
class ReorderPlanner {
public:
    explicit ReorderPlanner(std::shared_ptr<InventoryStore> store, LedgerConfig config = {});

    v1::ReorderSuggestions get_reorder_suggestions(const v1::ReorderSuggestionsRequest& request) const;

    /**
     * EOQ per product. Ids that do not resolve to a product are listed in
     * missing_product_ids. Throws ValidationError unless forecast_days > 0.
     */
    v1::OrderQuantityOptimizations calculate_optimal_order_quantities(
        const v1::OrderQuantityRequest& request) const;

    v1::PurchaseRecommendations generate_purchase_recommendations(
        const v1::PurchaseRecommendationsRequest& request) const;

    /// Present thresholds replace the stored ones; absent ones are kept.
    v1::ProductSnapshot update_reorder_parameters(const v1::UpdateReorderParameters& cmd);

    /// Suggestion row for a product at or below its reorder point.
    v1::ReorderSuggestion suggestion_for(const ProductState& product) const;

    /// HIGH when out of stock or below the minimum quantity.
    static v1::ReorderPriority priority_for(const ProductState& product);

private:
    std::shared_ptr<InventoryStore> store_;
    LedgerConfig config_;
};

} // namespace stockledger
