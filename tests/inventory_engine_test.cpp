#include <gtest/gtest.h>
#include "test_support.hpp"

using namespace stockledger;
using namespace stockledger::test;

// =============================================================================
// Registration
// =============================================================================

class RegisterProductTest : public LedgerTest {};

TEST_F(RegisterProductTest, Register_WithInitialStock_ShouldWriteInitialMovement) {
    auto result = register_product("p-1", "10", "2.5");

    EXPECT_EQ(result.movement().movement_type(), v1::MovementType::INITIAL);
    EXPECT_EQ(result.movement().sequence(), 0);
    EXPECT_FALSE(result.replayed());

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("10"));
    EXPECT_EQ(p.unit_cost, D("2.5"));
    EXPECT_EQ(p.average_cost, D("2.5"));
    EXPECT_EQ(p.location_quantity("main"), D("10"));
    EXPECT_EQ(p.version, 1);
    EXPECT_EQ(ledger_size("p-1"), 1u);
}

TEST_F(RegisterProductTest, Register_WithoutStock_ShouldStillStartTheLedger) {
    register_product("p-1");

    auto p = product("p-1");
    EXPECT_TRUE(p.quantity_on_hand.is_zero());
    EXPECT_TRUE(p.location_quantities.empty());
    EXPECT_EQ(ledger_size("p-1"), 1u);
}

TEST_F(RegisterProductTest, Register_DuplicateProductId_ShouldThrowBusinessRuleViolation) {
    register_product("p-1");

    EXPECT_THROW(register_product("p-1"), BusinessRuleViolation);
    EXPECT_EQ(ledger_size("p-1"), 1u);
}

TEST_F(RegisterProductTest, Register_SkuDifferingOnlyInCase_ShouldThrowBusinessRuleViolation) {
    register_product("p-1");
    auto cmd = register_cmd("p-2");
    cmd.set_sku("SKU-P-1");

    EXPECT_THROW(engine.register_product(cmd), BusinessRuleViolation);
    EXPECT_FALSE(store->products().get_by_id(key("p-2")).has_value());
}

TEST_F(RegisterProductTest, Register_MissingBusiness_ShouldThrowValidationError) {
    auto cmd = register_cmd("p-1");
    cmd.clear_business_id();

    EXPECT_THROW(engine.register_product(cmd), ValidationError);
}

TEST_F(RegisterProductTest, GetProduct_Unknown_ShouldThrowNotFound) {
    EXPECT_THROW(engine.get_product(key("ghost")), NotFoundError);
    EXPECT_THROW(engine.get_movements(key("ghost")), NotFoundError);
}

// =============================================================================
// Adjustments
// =============================================================================

class AdjustStockTest : public LedgerTest {};

TEST_F(AdjustStockTest, Adjust_FiveMinusThree_ShouldLeaveTwo) {
    // Given a product with 5 on hand
    register_product("p-1", "5", "1");

    // When 3 units are adjusted out
    auto result = adjust("p-1", "-3");

    // Then the product and its single new entry agree
    EXPECT_EQ(product("p-1").quantity_on_hand, D("2"));
    EXPECT_EQ(dec(result.quantity_before()), D("5"));
    EXPECT_EQ(dec(result.quantity_after()), D("2"));
    EXPECT_EQ(dec(result.quantity_change()), D("-3"));

    auto ledger = engine.get_movements(key("p-1"));
    ASSERT_EQ(ledger.size(), 2u);
    EXPECT_EQ(ledger[1].movement_type(), v1::MovementType::ADJUSTMENT);
    EXPECT_EQ(ledger[1].sequence(), 1);
}

TEST_F(AdjustStockTest, Adjust_BelowZero_ShouldLeaveProductAndLedgerUntouched) {
    register_product("p-1", "5", "1");

    EXPECT_THROW(adjust("p-1", "-6"), BusinessRuleViolation);

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("5"));
    EXPECT_EQ(p.version, 1);
    EXPECT_EQ(ledger_size("p-1"), 1u);
}

TEST_F(AdjustStockTest, Adjust_UnknownProduct_ShouldThrowNotFound) {
    EXPECT_THROW(adjust("ghost", "1"), NotFoundError);
}

TEST_F(AdjustStockTest, Adjust_UntrackedProduct_ShouldThrowBusinessRuleViolation) {
    auto cmd = register_cmd("p-1");
    cmd.set_track_inventory(false);
    engine.register_product(cmd);

    EXPECT_THROW(adjust("p-1", "1"), BusinessRuleViolation);
    EXPECT_EQ(product("p-1").stock_status(), v1::StockStatus::NOT_TRACKED);
}

TEST_F(AdjustStockTest, Adjust_LocationWithoutStock_ShouldThrowBusinessRuleViolation) {
    register_product("p-1", "10", "1");

    EXPECT_THROW(adjust("p-1", "-1", "backroom"), BusinessRuleViolation);
    EXPECT_EQ(product("p-1").quantity_on_hand, D("10"));
}

// =============================================================================
// Reservations
// =============================================================================

class ReserveStockTest : public LedgerTest {};

TEST_F(ReserveStockTest, Reserve_MoreThanAvailable_ShouldLeaveStateUnchanged) {
    register_product("p-1", "4", "1");

    EXPECT_THROW(reserve("p-1", "5", "SO-1"), BusinessRuleViolation);

    auto p = product("p-1");
    EXPECT_TRUE(p.quantity_reserved.is_zero());
    EXPECT_EQ(p.quantity_on_hand, D("4"));
    EXPECT_EQ(ledger_size("p-1"), 1u);
}

TEST_F(ReserveStockTest, ReserveThenRelease_ShouldRestoreAvailability) {
    register_product("p-1", "10", "1");

    reserve("p-1", "4", "SO-1");
    EXPECT_EQ(product("p-1").quantity_available(), D("6"));

    release("p-1", "4", "SO-1");

    auto p = product("p-1");
    EXPECT_TRUE(p.quantity_reserved.is_zero());
    EXPECT_EQ(p.quantity_on_hand, D("10"));
    EXPECT_TRUE(p.reservations.empty());
    EXPECT_EQ(ledger_size("p-1"), 3u);
}

TEST_F(ReserveStockTest, Reserve_RetryWithSameKey_ShouldReplayOriginalEntry) {
    register_product("p-1", "10", "1");
    auto first = reserve("p-1", "4", "SO-1");

    auto retry = reserve("p-1", "4", "SO-1");

    EXPECT_TRUE(retry.replayed());
    EXPECT_EQ(retry.movement_id(), first.movement_id());
    EXPECT_EQ(product("p-1").quantity_reserved, D("4"));
    EXPECT_EQ(ledger_size("p-1"), 2u);
}

TEST_F(ReserveStockTest, Reserve_SameKeyDifferentQuantity_ShouldThrowBusinessRuleViolation) {
    register_product("p-1", "10", "1");
    reserve("p-1", "4", "SO-1");

    EXPECT_THROW(reserve("p-1", "5", "SO-1"), BusinessRuleViolation);
    EXPECT_EQ(product("p-1").quantity_reserved, D("4"));
}

TEST_F(ReserveStockTest, Release_UnknownKey_ShouldThrowBusinessRuleViolation) {
    register_product("p-1", "10", "1");
    reserve("p-1", "4", "SO-1");

    EXPECT_THROW(release("p-1", "1", "SO-2"), BusinessRuleViolation);
    EXPECT_EQ(product("p-1").quantity_reserved, D("4"));
}

TEST_F(ReserveStockTest, Adjust_EatingIntoReservedStock_ShouldThrowBusinessRuleViolation) {
    register_product("p-1", "10", "1");
    reserve("p-1", "8", "SO-1");

    EXPECT_THROW(adjust("p-1", "-3"), BusinessRuleViolation);
}

// =============================================================================
// Purchases, sales and returns
// =============================================================================

class StockFlowTest : public LedgerTest {};

TEST_F(StockFlowTest, Receive_OnEmptyShelf_ShouldFoldShippingIntoAverage) {
    register_product("p-1");

    auto result = receive("p-1", "20", "3", "10");

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("20"));
    EXPECT_EQ(p.average_cost, D("3.5"));
    EXPECT_EQ(p.unit_cost, D("3"));
    EXPECT_EQ(dec(result.movement().landed_cost()), D("70"));
}

TEST_F(StockFlowTest, Receive_OnExistingStock_ShouldWeightTheAverage) {
    register_product("p-1", "10", "5");

    receive("p-1", "10", "7");

    EXPECT_EQ(product("p-1").average_cost, D("6"));
}

TEST_F(StockFlowTest, Sale_AgainstReservation_ShouldConsumeIt) {
    register_product("p-1", "10", "1");
    reserve("p-1", "4", "SO-1");

    sell("p-1", "4", "SO-1");

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("6"));
    EXPECT_TRUE(p.quantity_reserved.is_zero());
    EXPECT_TRUE(p.reservations.empty());
    EXPECT_EQ(p.times_sold, 1);
}

TEST_F(StockFlowTest, Sale_MoreThanAvailable_ShouldThrowBusinessRuleViolation) {
    register_product("p-1", "3", "1");

    EXPECT_THROW(sell("p-1", "4"), BusinessRuleViolation);
    EXPECT_EQ(product("p-1").times_sold, 0);
}

TEST_F(StockFlowTest, Return_ShouldAddStockBack) {
    register_product("p-1", "3", "1");

    v1::RecordReturn cmd;
    cmd.set_business_id(kBusiness);
    cmd.set_product_id("p-1");
    *cmd.mutable_quantity() = dv("2");
    engine.record_return(cmd);

    EXPECT_EQ(product("p-1").quantity_on_hand, D("5"));
}

TEST_F(StockFlowTest, Transfer_ShouldMoveBetweenLocationsOnly) {
    register_product("p-1", "10", "1");

    v1::TransferStock cmd;
    cmd.set_business_id(kBusiness);
    cmd.set_product_id("p-1");
    cmd.set_from_location_id("main");
    cmd.set_to_location_id("backroom");
    *cmd.mutable_quantity() = dv("4");
    auto result = engine.transfer_stock(cmd);

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("10"));
    EXPECT_EQ(p.location_quantity("main"), D("6"));
    EXPECT_EQ(p.location_quantity("backroom"), D("4"));
    EXPECT_TRUE(dec(result.quantity_change()).is_zero());
}

TEST_F(StockFlowTest, WriteOff_Damage_ShouldRemoveStock) {
    register_product("p-1", "10", "1");

    v1::WriteOffStock cmd;
    cmd.set_business_id(kBusiness);
    cmd.set_product_id("p-1");
    cmd.set_movement_type(v1::MovementType::DAMAGE);
    *cmd.mutable_quantity() = dv("2");
    cmd.set_reason("water damage");
    auto result = engine.write_off_stock(cmd);

    EXPECT_EQ(result.movement().movement_type(), v1::MovementType::DAMAGE);
    EXPECT_EQ(product("p-1").quantity_on_hand, D("8"));
}

TEST_F(StockFlowTest, Recount_ShouldSetLocationToCountedQuantity) {
    register_product("p-1", "10", "1");

    v1::RecountStock cmd;
    cmd.set_business_id(kBusiness);
    cmd.set_product_id("p-1");
    *cmd.mutable_counted_quantity() = dv("7");
    cmd.set_reason("annual stocktake");
    auto result = engine.recount_stock(cmd);

    EXPECT_EQ(dec(result.quantity_change()), D("-3"));
    EXPECT_EQ(product("p-1").location_quantity("main"), D("7"));
}

// =============================================================================
// Reversals
// =============================================================================

class ReverseMovementTest : public LedgerTest {};

TEST_F(ReverseMovementTest, ReverseAdjustment_ShouldRestoreQuantityOnce) {
    register_product("p-1", "10", "1");
    auto adjustment = adjust("p-1", "-3");

    auto reversal = reverse("p-1", adjustment.movement_id());

    EXPECT_EQ(product("p-1").quantity_on_hand, D("10"));
    EXPECT_EQ(reversal.movement().reverses_movement_id(), adjustment.movement_id());

    // A second reversal of the same entry is refused
    EXPECT_THROW(reverse("p-1", adjustment.movement_id()), BusinessRuleViolation);
    EXPECT_EQ(ledger_size("p-1"), 3u);
}

TEST_F(ReverseMovementTest, ReverseInitial_ShouldThrowBusinessRuleViolation) {
    auto initial = register_product("p-1", "10", "1");

    EXPECT_THROW(reverse("p-1", initial.movement_id()), BusinessRuleViolation);
}

TEST_F(ReverseMovementTest, ReverseUnknownMovement_ShouldThrowNotFound) {
    register_product("p-1", "10", "1");

    EXPECT_THROW(reverse("p-1", "no-such-movement"), NotFoundError);
}

TEST_F(ReverseMovementTest, ReverseSale_ShouldRestoreStockAndSalesCount) {
    register_product("p-1", "10", "1");
    auto sale = sell("p-1", "2");
    ASSERT_EQ(product("p-1").times_sold, 1);

    reverse("p-1", sale.movement_id());

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("10"));
    EXPECT_EQ(p.times_sold, 0);
}

TEST_F(ReverseMovementTest, ReversePurchase_ShouldKeepAverageCost) {
    register_product("p-1", "10", "5");
    auto purchase = receive("p-1", "10", "7");
    ASSERT_EQ(product("p-1").average_cost, D("6"));

    reverse("p-1", purchase.movement_id());

    auto p = product("p-1");
    EXPECT_EQ(p.quantity_on_hand, D("10"));
    EXPECT_EQ(p.average_cost, D("6"));
    EXPECT_TRUE(engine.audit_product(key("p-1")).consistent());
}

// =============================================================================
// Archiving
// =============================================================================

class ArchiveProductTest : public LedgerTest {
protected:
    v1::ProductSnapshot archive(const std::string& product_id, const std::string& reason = "discontinued") {
        v1::ArchiveProduct cmd;
        cmd.set_business_id(kBusiness);
        cmd.set_product_id(product_id);
        cmd.set_reason(reason);
        cmd.set_archived_by("tester");
        return engine.archive_product(cmd);
    }
};

TEST_F(ArchiveProductTest, Archive_ShouldBlockFurtherMovementsButKeepHistory) {
    register_product("p-1", "10", "1");

    auto snapshot = archive("p-1");

    EXPECT_TRUE(snapshot.archived());
    EXPECT_THROW(adjust("p-1", "1"), BusinessRuleViolation);
    EXPECT_THROW(reserve("p-1", "1", "SO-1"), BusinessRuleViolation);
    EXPECT_EQ(engine.get_movements(key("p-1")).size(), 1u);
}

TEST_F(ArchiveProductTest, Archive_Twice_ShouldThrowBusinessRuleViolation) {
    register_product("p-1");
    archive("p-1");

    EXPECT_THROW(archive("p-1"), BusinessRuleViolation);
}

TEST_F(ArchiveProductTest, Archive_WithoutReason_ShouldThrowValidationError) {
    register_product("p-1");

    EXPECT_THROW(archive("p-1", ""), ValidationError);
    EXPECT_FALSE(product("p-1").archived);
}

// =============================================================================
// Ledger properties
// =============================================================================

class LedgerPropertyTest : public LedgerTest {};

TEST_F(LedgerPropertyTest, MixedOperations_ShouldNeverLeaveNegativeQuantities) {
    // Given a product and a run of operations, some of which must be refused
    register_product("p-1", "5", "2");
    const char* changes[] = {"-2", "-4", "3", "-6", "1", "-1", "-5"};

    for (const char* change : changes) {
        try {
            adjust("p-1", change);
        } catch (const BusinessRuleViolation&) {
            // refused operations leave no trace
        }
        try {
            reserve("p-1", "1", std::string("SO-") + change);
        } catch (const BusinessRuleViolation&) {
        }

        // Then every committed state keeps the quantity invariants
        auto p = product("p-1");
        EXPECT_FALSE(p.quantity_on_hand.is_negative());
        EXPECT_FALSE(p.quantity_reserved.is_negative());
        EXPECT_FALSE(p.quantity_available().is_negative());
    }

    // And every entry satisfies its own arithmetic
    for (const auto& m : engine.get_movements(key("p-1"))) {
        EXPECT_EQ(movement::quantity_before(m) + movement::quantity(m), movement::quantity_after(m));
        EXPECT_TRUE(movement::check_consistency(m).empty());
    }
    EXPECT_TRUE(engine.audit_product(key("p-1")).consistent());
}

TEST_F(LedgerPropertyTest, Replay_ShouldRebuildStoredQuantities) {
    register_product("p-1", "10", "2");
    receive("p-1", "5", "4");
    reserve("p-1", "3", "SO-1");
    sell("p-1", "2", "SO-1");
    adjust("p-1", "-1");

    auto stored = product("p-1");
    auto rebuilt = ProductState::from_ledger(key("p-1"), engine.get_movements(key("p-1")));

    EXPECT_EQ(rebuilt.quantity_on_hand, stored.quantity_on_hand);
    EXPECT_EQ(rebuilt.quantity_reserved, stored.quantity_reserved);
    EXPECT_EQ(rebuilt.average_cost, stored.average_cost);
    EXPECT_EQ(rebuilt.times_sold, stored.times_sold);
    EXPECT_EQ(rebuilt.reservations, stored.reservations);
}
