#include "stockledger/reorder_planner.hpp"
#include "stockledger/costing.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/validation.hpp"
#include <algorithm>
#include <map>

namespace stockledger {

using helpers::from_proto;
using helpers::set_decimal;

ReorderPlanner::ReorderPlanner(std::shared_ptr<InventoryStore> store, LedgerConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
    if (!store_) throw ValidationError("inventory store is required");
    config_.validate();
}

v1::ReorderPriority ReorderPlanner::priority_for(const ProductState& product) {
    if (product.is_out_of_stock()) return v1::ReorderPriority::PRIORITY_HIGH;
    if (product.minimum_quantity && product.quantity_available() < *product.minimum_quantity) {
        return v1::ReorderPriority::PRIORITY_HIGH;
    }
    return v1::ReorderPriority::PRIORITY_NORMAL;
}

v1::ReorderSuggestion ReorderPlanner::suggestion_for(const ProductState& product) const {
    Decimal quantity = product.suggest_reorder_quantity().value_or(
        config_.reorder.default_reorder_quantity);

    v1::ReorderSuggestion s;
    s.set_product_id(product.product_id);
    s.set_sku(product.sku);
    s.set_name(product.name);
    set_decimal(s.mutable_current_stock(), product.quantity_on_hand);
    set_decimal(s.mutable_quantity_available(), product.quantity_available());
    set_decimal(s.mutable_suggested_quantity(), quantity);
    set_decimal(s.mutable_unit_cost(), product.unit_cost);
    set_decimal(s.mutable_suggested_cost(), quantity * product.unit_cost);
    s.set_supplier_id(product.primary_supplier_id);
    s.set_supplier_name(product.primary_supplier_name);
    s.set_lead_time_days(product.lead_time_days);
    s.set_priority(priority_for(product));
    s.set_stock_status(product.stock_status());
    return s;
}

v1::ReorderSuggestions ReorderPlanner::get_reorder_suggestions(
    const v1::ReorderSuggestionsRequest& request) const {
    validation::require_not_empty(request.business_id(), "business_id");

    auto products = store_->products().get_products_needing_reorder(request.business_id());

    std::vector<v1::ReorderSuggestion> rows;
    for (const auto& product : products) {
        if (!request.category_id().empty() && product.category_id != request.category_id()) continue;
        if (!request.supplier_id().empty() && product.primary_supplier_id != request.supplier_id()) {
            continue;
        }
        rows.push_back(suggestion_for(product));
    }
    std::stable_sort(rows.begin(), rows.end(),
                     [](const v1::ReorderSuggestion& a, const v1::ReorderSuggestion& b) {
                         return a.priority() > b.priority();
                     });

    v1::ReorderSuggestions result;
    Decimal total;
    for (auto& row : rows) {
        total += from_proto(row.suggested_cost());
        *result.add_suggestions() = std::move(row);
    }
    result.set_total_items(result.suggestions_size());
    set_decimal(result.mutable_total_suggested_value(), total);
    *result.mutable_generated_at() = helpers::now();

    log_info("planning", "reorder_suggestions_generated",
             {{"business_id", request.business_id()},
              {"items", result.total_items()},
              {"total_value", total.to_string()}});
    return result;
}

v1::OrderQuantityOptimizations ReorderPlanner::calculate_optimal_order_quantities(
    const v1::OrderQuantityRequest& request) const {
    validation::require_not_empty(request.business_id(), "business_id");
    if (request.forecast_days() <= 0) throw ValidationError("forecast_days must be positive");

    const auto& policy = config_.reorder;
    const Decimal days_per_year = Decimal::from_units(365);

    v1::OrderQuantityOptimizations result;
    result.set_forecast_period_days(request.forecast_days());
    Decimal total_savings;

    for (const auto& product_id : request.product_ids()) {
        std::optional<ProductState> product;
        if (!product_id.empty()) product = store_->products().get_by_id({request.business_id(), product_id});
        if (!product) {
            result.add_missing_product_ids(product_id);
            continue;
        }

        Decimal annual_demand = policy.default_annual_demand;
        if (product->times_sold > 0) {
            annual_demand = Decimal::from_units(product->times_sold * 365) /
                            Decimal::from_units(policy.observation_window_days);
        }
        Decimal unit_cost = product->unit_cost.is_zero() ? policy.fallback_unit_cost : product->unit_cost;
        Decimal holding = unit_cost * policy.holding_cost_rate;

        Decimal optimal = costing::economic_order_quantity(annual_demand, policy.ordering_cost, holding);
        Decimal current = product->reorder_quantity.value_or(policy.default_reorder_quantity);
        Decimal current_cost =
            costing::annual_inventory_cost(annual_demand, current, policy.ordering_cost, holding);
        Decimal optimal_cost =
            costing::annual_inventory_cost(annual_demand, optimal, policy.ordering_cost, holding);
        Decimal savings = max(Decimal::zero(), current_cost - optimal_cost);

        auto* row = result.add_optimizations();
        row->set_product_id(product->product_id);
        row->set_sku(product->sku);
        row->set_name(product->name);
        set_decimal(row->mutable_current_reorder_quantity(), current);
        set_decimal(row->mutable_optimal_order_quantity(), optimal);
        set_decimal(row->mutable_estimated_annual_demand(), annual_demand);
        set_decimal(row->mutable_forecast_period_demand(),
                    annual_demand * Decimal::from_units(request.forecast_days()) / days_per_year);
        set_decimal(row->mutable_ordering_cost(), policy.ordering_cost);
        set_decimal(row->mutable_holding_cost_per_unit(), holding);
        set_decimal(row->mutable_current_annual_cost(), current_cost);
        set_decimal(row->mutable_optimal_annual_cost(), optimal_cost);
        set_decimal(row->mutable_potential_savings(), savings);
        total_savings += savings;
    }

    result.set_total_items(result.optimizations_size());
    set_decimal(result.mutable_total_potential_savings(), total_savings);
    *result.mutable_calculated_at() = helpers::now();

    if (result.missing_product_ids_size() > 0) {
        log_warn("planning", "order_quantity_products_missing",
                 {{"business_id", request.business_id()},
                  {"missing", result.missing_product_ids_size()}});
    }
    log_info("planning", "order_quantities_calculated",
             {{"business_id", request.business_id()},
              {"items", result.total_items()},
              {"total_savings", total_savings.to_string()}});
    return result;
}

v1::PurchaseRecommendations ReorderPlanner::generate_purchase_recommendations(
    const v1::PurchaseRecommendationsRequest& request) const {
    v1::ReorderSuggestionsRequest scan;
    scan.set_business_id(request.business_id());
    auto suggestions = get_reorder_suggestions(scan);

    v1::PurchaseRecommendations result;

    if (!request.group_by_supplier()) {
        Decimal total;
        for (const auto& s : suggestions.suggestions()) {
            total += from_proto(s.suggested_cost());
            *result.add_ungrouped() = s;
        }
        result.set_total_items(result.ungrouped_size());
        set_decimal(result.mutable_total_value(), total);
        return result;
    }

    std::map<std::string, v1::SupplierRecommendation> by_supplier;
    for (const auto& s : suggestions.suggestions()) {
        if (s.supplier_id().empty()) continue;

        auto& group = by_supplier[s.supplier_id()];
        if (group.supplier_id().empty()) {
            group.set_supplier_id(s.supplier_id());
            group.set_supplier_name(s.supplier_name());
        }
        *group.add_items() = s;
        set_decimal(group.mutable_total_value(),
                    from_proto(group.total_value()) + from_proto(s.suggested_cost()));
        group.set_item_count(group.item_count() + 1);
        group.set_lead_time_days(std::max(group.lead_time_days(), s.lead_time_days()));
        if (s.priority() == v1::ReorderPriority::PRIORITY_HIGH) {
            group.set_priority_items(group.priority_items() + 1);
        }
    }

    std::vector<v1::SupplierRecommendation> groups;
    for (auto& [supplier_id, group] : by_supplier) {
        if (request.has_min_order_value() &&
            from_proto(group.total_value()) < from_proto(request.min_order_value())) {
            continue;
        }
        groups.push_back(std::move(group));
    }
    std::sort(groups.begin(), groups.end(),
              [](const v1::SupplierRecommendation& a, const v1::SupplierRecommendation& b) {
                  if (a.priority_items() != b.priority_items()) {
                      return a.priority_items() > b.priority_items();
                  }
                  return from_proto(a.total_value()) > from_proto(b.total_value());
              });

    Decimal total;
    int32_t total_items = 0;
    int32_t high_priority = 0;
    for (auto& group : groups) {
        total += from_proto(group.total_value());
        total_items += group.item_count();
        if (group.priority_items() > 0) ++high_priority;
        *result.add_supplier_recommendations() = std::move(group);
    }
    result.set_total_suppliers(result.supplier_recommendations_size());
    result.set_total_items(total_items);
    set_decimal(result.mutable_total_value(), total);
    result.set_high_priority_suppliers(high_priority);

    log_info("planning", "purchase_recommendations_generated",
             {{"business_id", request.business_id()},
              {"suppliers", result.total_suppliers()},
              {"items", total_items}});
    return result;
}

v1::ProductSnapshot ReorderPlanner::update_reorder_parameters(const v1::UpdateReorderParameters& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    validation::require_not_empty(key.business_id, "business_id");
    validation::require_not_empty(key.product_id, "product_id");

    try {
        auto snapshot = run_in_transaction(
            *store_, key, config_.max_commit_retries, [&](UnitOfWork& uow) {
                auto product = uow.products().get_by_id(key);
                if (!product) throw NotFoundError("Product not found: " + key.to_string());
                validation::require_active(product->archived, key.product_id);

                const auto& p = cmd.parameters();
                if (p.has_reorder_point()) product->reorder_point = from_proto(p.reorder_point());
                if (p.has_reorder_quantity()) product->reorder_quantity = from_proto(p.reorder_quantity());
                if (p.has_minimum_quantity()) product->minimum_quantity = from_proto(p.minimum_quantity());
                if (p.has_maximum_quantity()) product->maximum_quantity = from_proto(p.maximum_quantity());
                product->validate_reorder_parameters();

                return uow.products().update(*product).to_snapshot();
            });

        log_info("planning", "reorder_parameters_updated",
                 {{"product", key.to_string()}, {"reason", cmd.reason()},
                  {"updated_by", cmd.updated_by()}});
        return snapshot;
    } catch (const ApplicationError& e) {
        log_error("planning", "reorder_parameters_failed",
                  {{"product", key.to_string()}, {"error", e.what()}});
        throw;
    } catch (const LedgerError& e) {
        log_warn("planning", "reorder_parameters_rejected",
                 {{"product", key.to_string()}, {"error", e.what()}});
        throw;
    } catch (const std::exception& e) {
        log_error("planning", "reorder_parameters_failed",
                  {{"product", key.to_string()}, {"error", e.what()}});
        throw ApplicationError("Failed to update reorder parameters for " + key.to_string() +
                               ": " + e.what());
    }
}

} // namespace stockledger
