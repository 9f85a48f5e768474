#include "stockledger/costing.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include <cmath>

namespace stockledger {
namespace costing {

namespace {

void require_not_negative(const Decimal& value, const char* name) {
    if (value.is_negative()) {
        throw ValidationError(std::string(name) + " cannot be negative");
    }
}

// Cost of one incoming unit once the add-ons are spread over the receipt.
Decimal landed_unit_cost(const Decimal& quantity_incoming, const Decimal& unit_cost_incoming,
                         const Decimal& extra_costs) {
    if (quantity_incoming.is_zero()) return unit_cost_incoming;
    return (quantity_incoming * unit_cost_incoming + extra_costs) / quantity_incoming;
}

class WeightedAveragePolicy final : public CostingPolicy {
public:
    v1::CostingMethod method() const override { return v1::CostingMethod::WEIGHTED_AVERAGE; }

    Decimal average_after_receipt(const Decimal& quantity_before, const Decimal& average_before,
                                  const Decimal& quantity_incoming,
                                  const Decimal& unit_cost_incoming,
                                  const Decimal& extra_costs) const override {
        return weighted_average(quantity_before, average_before, quantity_incoming,
                                unit_cost_incoming, extra_costs);
    }
};

// FIFO, LIFO and specific identification carry no layer data here; the
// average follows the most recent purchase price. Add-on costs stay on the
// receipt's landed cost.
class LastPurchasePricePolicy final : public CostingPolicy {
public:
    explicit LastPurchasePricePolicy(v1::CostingMethod method) : method_(method) {}

    v1::CostingMethod method() const override { return method_; }

    Decimal average_after_receipt(const Decimal& quantity_before, const Decimal& average_before,
                                  const Decimal& quantity_incoming,
                                  const Decimal& unit_cost_incoming,
                                  const Decimal& extra_costs) const override {
        require_not_negative(quantity_before, "quantity_before");
        require_not_negative(average_before, "cost_before");
        require_not_negative(quantity_incoming, "quantity_incoming");
        require_not_negative(unit_cost_incoming, "unit_cost_incoming");
        require_not_negative(extra_costs, "extra_costs");
        return unit_cost_incoming;
    }

private:
    v1::CostingMethod method_;
};

class StandardCostPolicy final : public CostingPolicy {
public:
    v1::CostingMethod method() const override { return v1::CostingMethod::STANDARD_COST; }

    Decimal average_after_receipt(const Decimal& quantity_before, const Decimal& average_before,
                                  const Decimal& quantity_incoming,
                                  const Decimal& unit_cost_incoming,
                                  const Decimal& extra_costs) const override {
        require_not_negative(quantity_before, "quantity_before");
        require_not_negative(average_before, "cost_before");
        require_not_negative(quantity_incoming, "quantity_incoming");
        require_not_negative(unit_cost_incoming, "unit_cost_incoming");
        require_not_negative(extra_costs, "extra_costs");
        if (average_before.is_positive()) return average_before;
        return landed_unit_cost(quantity_incoming, unit_cost_incoming, extra_costs);
    }
};

} // anonymous namespace

AdditionalCosts AdditionalCosts::from_proto(const v1::AdditionalCosts& costs) {
    return {helpers::from_proto(costs.shipping()), helpers::from_proto(costs.duty()),
            helpers::from_proto(costs.other())};
}

Decimal weighted_average(const Decimal& quantity_before, const Decimal& cost_before,
                         const Decimal& quantity_incoming, const Decimal& unit_cost_incoming,
                         const Decimal& extra_costs) {
    require_not_negative(quantity_before, "quantity_before");
    require_not_negative(cost_before, "cost_before");
    require_not_negative(quantity_incoming, "quantity_incoming");
    require_not_negative(unit_cost_incoming, "unit_cost_incoming");
    require_not_negative(extra_costs, "extra_costs");

    Decimal total_quantity = quantity_before + quantity_incoming;
    if (total_quantity.is_zero()) return cost_before;

    Decimal total_value =
        quantity_before * cost_before + quantity_incoming * unit_cost_incoming + extra_costs;
    return total_value / total_quantity;
}

Decimal landed_cost(const Decimal& quantity, const Decimal& unit_cost,
                    const AdditionalCosts& additional_costs) {
    return quantity * unit_cost + additional_costs.total();
}

const CostingPolicy& policy_for(v1::CostingMethod method) {
    static const WeightedAveragePolicy weighted_average_policy;
    static const LastPurchasePricePolicy fifo_policy(v1::CostingMethod::FIFO);
    static const LastPurchasePricePolicy lifo_policy(v1::CostingMethod::LIFO);
    static const LastPurchasePricePolicy specific_policy(v1::CostingMethod::SPECIFIC_IDENTIFICATION);
    static const StandardCostPolicy standard_policy;

    switch (method) {
        case v1::CostingMethod::FIFO: return fifo_policy;
        case v1::CostingMethod::LIFO: return lifo_policy;
        case v1::CostingMethod::SPECIFIC_IDENTIFICATION: return specific_policy;
        case v1::CostingMethod::STANDARD_COST: return standard_policy;
        default: return weighted_average_policy;
    }
}

Decimal economic_order_quantity(const Decimal& annual_demand, const Decimal& ordering_cost,
                                const Decimal& holding_cost_per_unit) {
    require_not_negative(annual_demand, "annual_demand");
    require_not_negative(ordering_cost, "ordering_cost");
    if (!holding_cost_per_unit.is_positive()) {
        throw ValidationError("holding_cost_per_unit must be positive");
    }

    double eoq = std::sqrt(2.0 * annual_demand.to_double() * ordering_cost.to_double() /
                           holding_cost_per_unit.to_double());
    auto units = static_cast<int64_t>(std::llround(eoq));
    return Decimal::from_units(units < 1 ? 1 : units);
}

Decimal annual_inventory_cost(const Decimal& annual_demand, const Decimal& order_quantity,
                              const Decimal& ordering_cost, const Decimal& holding_cost_per_unit) {
    if (!order_quantity.is_positive()) throw ValidationError("order_quantity must be positive");
    require_not_negative(annual_demand, "annual_demand");

    Decimal ordering = annual_demand / order_quantity * ordering_cost;
    Decimal holding = order_quantity / Decimal::from_units(2) * holding_cost_per_unit;
    return ordering + holding;
}

} // namespace costing
} // namespace stockledger
