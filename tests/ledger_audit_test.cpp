#include <gtest/gtest.h>
#include <algorithm>
#include "test_support.hpp"

using namespace stockledger;
using namespace stockledger::test;

namespace {

bool mentions(const v1::AuditReport& report, const std::string& text) {
    return std::any_of(report.discrepancies().begin(), report.discrepancies().end(),
                       [&](const std::string& d) { return d.find(text) != std::string::npos; });
}

} // anonymous namespace

// =============================================================================
// Engine audit
// =============================================================================

class LedgerAuditTest : public LedgerTest {};

TEST_F(LedgerAuditTest, Audit_AfterOrdinaryTrading_ShouldBeConsistent) {
    register_product("p-1", "10", "2");
    receive("p-1", "10", "4");
    reserve("p-1", "5", "SO-1");
    sell("p-1", "3", "SO-1");
    release("p-1", "2", "SO-1");
    auto adjustment = adjust("p-1", "-1");
    reverse("p-1", adjustment.movement_id());

    auto report = engine.audit_product(key("p-1"));

    EXPECT_TRUE(report.consistent());
    EXPECT_EQ(report.discrepancies_size(), 0);
    EXPECT_EQ(report.movement_count(), 7);
    EXPECT_EQ(dec(report.rebuilt().quantity_on_hand()), D("17"));
    EXPECT_EQ(dec(report.stored().average_cost()), D("3"));
}

TEST_F(LedgerAuditTest, Audit_AfterRowEditedOutsideLedger_ShouldReportDrift) {
    // Given a product whose row was changed without a ledger entry
    register_product("p-1", "10", "2");
    auto row = product("p-1");
    row.quantity_on_hand = D("11");
    row.location_quantities["main"] = D("11");
    StoreTamper::overwrite_product(*store, row);

    // When it is audited
    auto report = engine.audit_product(key("p-1"));

    // Then both the total and the bucket drift are reported
    EXPECT_FALSE(report.consistent());
    EXPECT_TRUE(mentions(report, "quantity_on_hand: stored 11, ledger 10"));
    EXPECT_TRUE(mentions(report, "location[main]"));
}

TEST_F(LedgerAuditTest, Audit_UnknownProduct_ShouldThrowNotFound) {
    EXPECT_THROW(engine.audit_product(key("ghost")), NotFoundError);
}

// =============================================================================
// Entry-level checks
// =============================================================================

class MovementCheckTest : public ::testing::Test {
protected:
    ProductState state = stocked("10");

    v1::StockMovement adjustment(int64_t sequence, const std::string& change) {
        auto m = movement::begin(state, v1::MovementType::ADJUSTMENT, stamp(sequence));
        movement::set_quantity(m, D(change));
        m.set_location_id("main");
        return m;
    }
};

TEST_F(MovementCheckTest, CheckConsistency_BrokenArithmetic_ShouldBeReported) {
    auto m = adjustment(1, "-3");
    *m.mutable_quantity_after() = dv("8");

    auto problems = movement::check_consistency(m);

    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("quantity_before + quantity != quantity_after"), std::string::npos);
}

TEST_F(MovementCheckTest, CheckConsistency_TransferChangingOnHand_ShouldBeReported) {
    auto m = movement::begin(state, v1::MovementType::TRANSFER, stamp(1));
    movement::set_quantity(m, D("1"));

    EXPECT_FALSE(movement::check_consistency(m).empty());
}

TEST_F(MovementCheckTest, Audit_SequenceGapAndBrokenChain_ShouldBeReported) {
    // Given a ledger that skips sequence 1 and does not continue from the initial entry
    ProductState empty;
    empty.business_id = kBusiness;
    empty.product_id = "p-1";

    auto initial = movement::begin(empty, v1::MovementType::INITIAL, stamp(0));
    movement::set_quantity(initial, D("10"));
    initial.set_location_id("main");

    auto later = adjustment(2, "-1");
    *later.mutable_quantity_before() = dv("9");
    *later.mutable_quantity_after() = dv("8");

    ProductState stored = stocked("8");
    stored.unit_cost = Decimal::zero();
    stored.average_cost = Decimal::zero();

    auto report = movement::audit(stored, {initial, later});

    EXPECT_FALSE(report.consistent());
    EXPECT_TRUE(mentions(report, "sequence gap: expected 1, found 2"));
    EXPECT_TRUE(mentions(report, "does not continue from 10"));
}

TEST_F(MovementCheckTest, Describe_ShouldNameTypeQuantityAndReference) {
    auto m = movement::begin(state, v1::MovementType::SALE, stamp(1));
    movement::set_quantity(m, D("-3"));
    m.mutable_context()->set_reference_type("order");
    m.mutable_context()->set_reference_id("SO-1");

    EXPECT_EQ(movement::describe(m), "Sale of 3 units (order:SO-1)");
}
