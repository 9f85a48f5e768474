#pragma once

#include "stockledger/decimal.hpp"
#include "stockledger/ledger.pb.h"

namespace stockledger {
namespace costing {

/**
 * Landed-cost add-ons charged on a purchase receipt.
 */
struct AdditionalCosts {
    Decimal shipping;
    Decimal duty;
    Decimal other;

    Decimal total() const { return shipping + duty + other; }

    static AdditionalCosts from_proto(const v1::AdditionalCosts& costs);
};

/**
 * Weighted average unit cost after receiving stock:
 *   (qb * cb + qi * ui + extra) / (qb + qi)
 * With nothing on hand the result is the incoming unit cost with the extra
 * costs spread over the incoming quantity. Throws ValidationError on
 * negative inputs; returns cost_before when both quantities are zero.
 */
Decimal weighted_average(const Decimal& quantity_before, const Decimal& cost_before,
                         const Decimal& quantity_incoming, const Decimal& unit_cost_incoming,
                         const Decimal& extra_costs = Decimal::zero());

/// quantity * unit_cost plus all add-ons.
Decimal landed_cost(const Decimal& quantity, const Decimal& unit_cost,
                    const AdditionalCosts& additional_costs);

/**
 * Strategy that decides the running average cost after a purchase receipt.
 */
class CostingPolicy {
public:
    virtual ~CostingPolicy() = default;

    virtual v1::CostingMethod method() const = 0;

    virtual Decimal average_after_receipt(const Decimal& quantity_before,
                                          const Decimal& average_before,
                                          const Decimal& quantity_incoming,
                                          const Decimal& unit_cost_incoming,
                                          const Decimal& extra_costs) const = 0;
};

/**
 * Policy for a costing method. Unspecified falls back to weighted average.
 */
const CostingPolicy& policy_for(v1::CostingMethod method);

/**
 * Economic order quantity sqrt(2 * D * S / H), rounded to whole units and
 * never below one. Throws ValidationError when the holding cost is not
 * positive or an input is negative.
 */
Decimal economic_order_quantity(const Decimal& annual_demand, const Decimal& ordering_cost,
                                const Decimal& holding_cost_per_unit);

/// Yearly ordering plus holding cost: D / Q * S + Q / 2 * H.
Decimal annual_inventory_cost(const Decimal& annual_demand, const Decimal& order_quantity,
                              const Decimal& ordering_cost, const Decimal& holding_cost_per_unit);

} // namespace costing
} // namespace stockledger
