#include <gtest/gtest.h>
#include "stockledger/costing.hpp"
#include "stockledger/errors.hpp"

using namespace stockledger;
using namespace stockledger::costing;

namespace {

Decimal D(const char* text) { return Decimal::parse(text); }

} // anonymous namespace

// =============================================================================
// Weighted average
// =============================================================================

class WeightedAverageTest : public ::testing::Test {};

TEST_F(WeightedAverageTest, TenAtFivePlusTenAtSeven_ShouldAverageToSix) {
    EXPECT_EQ(weighted_average(D("10"), D("5"), D("10"), D("7")), D("6"));
}

TEST_F(WeightedAverageTest, EmptyStockWithShipping_ShouldSpreadExtrasOverReceipt) {
    // 20 units at 3 plus 10 shipping on an empty shelf
    EXPECT_EQ(weighted_average(D("0"), D("0"), D("20"), D("3"), D("10")), D("3.5"));
}

TEST_F(WeightedAverageTest, NothingOnHandOrIncoming_ShouldKeepPreviousCost) {
    EXPECT_EQ(weighted_average(D("0"), D("4"), D("0"), D("9")), D("4"));
}

TEST_F(WeightedAverageTest, NegativeInput_ShouldThrowValidationError) {
    EXPECT_THROW(weighted_average(D("-1"), D("5"), D("10"), D("7")), ValidationError);
    EXPECT_THROW(weighted_average(D("1"), D("5"), D("10"), D("-7")), ValidationError);
    EXPECT_THROW(weighted_average(D("1"), D("5"), D("10"), D("7"), D("-1")), ValidationError);
}

TEST_F(WeightedAverageTest, LandedCost_ShouldIncludeAllAddOns) {
    AdditionalCosts extras{D("10"), D("2"), D("1")};
    EXPECT_EQ(extras.total(), D("13"));
    EXPECT_EQ(landed_cost(D("20"), D("3"), extras), D("73"));
}

// =============================================================================
// Costing policies
// =============================================================================

class CostingPolicyTest : public ::testing::Test {};

TEST_F(CostingPolicyTest, Fifo_ShouldFollowLastPurchasePrice) {
    const auto& policy = policy_for(v1::CostingMethod::FIFO);
    EXPECT_EQ(policy.method(), v1::CostingMethod::FIFO);
    EXPECT_EQ(policy.average_after_receipt(D("10"), D("5"), D("10"), D("7"), D("0")), D("7"));
    // Shipping is not spread into the unit cost
    EXPECT_EQ(policy.average_after_receipt(D("10"), D("5"), D("10"), D("7"), D("10")), D("7"));
}

TEST_F(CostingPolicyTest, LifoAndSpecificIdentification_ShouldFollowLastPurchasePrice) {
    EXPECT_EQ(policy_for(v1::CostingMethod::LIFO)
                  .average_after_receipt(D("4"), D("9"), D("2"), D("3"), D("6")),
              D("3"));
    EXPECT_EQ(policy_for(v1::CostingMethod::SPECIFIC_IDENTIFICATION)
                  .average_after_receipt(D("0"), D("0"), D("5"), D("11"), D("1")),
              D("11"));
}

TEST_F(CostingPolicyTest, StandardCost_ShouldKeepExistingAverage) {
    const auto& policy = policy_for(v1::CostingMethod::STANDARD_COST);
    EXPECT_EQ(policy.average_after_receipt(D("10"), D("5"), D("10"), D("7"), D("0")), D("5"));
    // First receipt establishes the standard
    EXPECT_EQ(policy.average_after_receipt(D("0"), D("0"), D("10"), D("7"), D("0")), D("7"));
}

TEST_F(CostingPolicyTest, Unspecified_ShouldFallBackToWeightedAverage) {
    const auto& policy = policy_for(v1::CostingMethod::COSTING_METHOD_UNSPECIFIED);
    EXPECT_EQ(policy.method(), v1::CostingMethod::WEIGHTED_AVERAGE);
    EXPECT_EQ(policy.average_after_receipt(D("10"), D("5"), D("10"), D("7"), D("0")), D("6"));
}

// =============================================================================
// Economic order quantity
// =============================================================================

class EconomicOrderQuantityTest : public ::testing::Test {};

TEST_F(EconomicOrderQuantityTest, DefaultPolicyInputs_ShouldRoundToWholeUnits) {
    // sqrt(2 * 100 * 50 / 2) = 70.71
    EXPECT_EQ(economic_order_quantity(D("100"), D("50"), D("2")), D("71"));
}

TEST_F(EconomicOrderQuantityTest, RisingOrderingCost_ShouldRaiseQuantity) {
    Decimal previous = Decimal::zero();
    for (const char* ordering : {"10", "25", "50", "100", "200"}) {
        Decimal eoq = economic_order_quantity(D("100"), D(ordering), D("2"));
        EXPECT_GT(eoq, previous) << "ordering cost " << ordering;
        previous = eoq;
    }
}

TEST_F(EconomicOrderQuantityTest, ZeroDemand_ShouldNeverGoBelowOne) {
    EXPECT_EQ(economic_order_quantity(D("0"), D("50"), D("2")), D("1"));
}

TEST_F(EconomicOrderQuantityTest, ZeroHoldingCost_ShouldThrowValidationError) {
    EXPECT_THROW(economic_order_quantity(D("100"), D("50"), D("0")), ValidationError);
}

TEST_F(EconomicOrderQuantityTest, AnnualCost_ShouldSumOrderingAndHolding) {
    // 100 / 10 * 50 + 10 / 2 * 2
    EXPECT_EQ(annual_inventory_cost(D("100"), D("10"), D("50"), D("2")), D("510"));
}

TEST_F(EconomicOrderQuantityTest, AnnualCost_ZeroOrderQuantity_ShouldThrowValidationError) {
    EXPECT_THROW(annual_inventory_cost(D("100"), D("0"), D("50"), D("2")), ValidationError);
}
