#include <gtest/gtest.h>
#include <atomic>
#include <thread>
#include <vector>
#include "test_support.hpp"

using namespace stockledger;
using namespace stockledger::test;

// =============================================================================
// Concurrent writers
// =============================================================================

class ConcurrencyTest : public LedgerTest {};

TEST_F(ConcurrencyTest, ParallelAdjustments_ShouldSerialiseOnTheProduct) {
    // Given one product and eight writers adding one unit fifty times each
    register_product("p-1", "0", "1");
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < kPerThread; ++i) adjust("p-1", "1");
        });
    }
    for (auto& w : workers) w.join();

    // Then no update was lost and the ledger has no gaps
    EXPECT_EQ(product("p-1").quantity_on_hand, Decimal::from_units(kThreads * kPerThread));
    EXPECT_EQ(ledger_size("p-1"), static_cast<size_t>(kThreads * kPerThread + 1));
    EXPECT_TRUE(engine.audit_product(key("p-1")).consistent());
}

TEST_F(ConcurrencyTest, ParallelReservations_ShouldNeverOversell) {
    // Given 100 units and sixteen orders of 10 racing for them
    register_product("p-1", "100", "1");
    constexpr int kOrders = 16;
    std::atomic<int> accepted{0};
    std::atomic<int> refused{0};

    std::vector<std::thread> workers;
    for (int t = 0; t < kOrders; ++t) {
        workers.emplace_back([this, t, &accepted, &refused] {
            try {
                reserve("p-1", "10", "SO-" + std::to_string(t));
                ++accepted;
            } catch (const BusinessRuleViolation&) {
                ++refused;
            }
        });
    }
    for (auto& w : workers) w.join();

    // Then exactly the stock on hand was promised
    EXPECT_EQ(accepted.load(), 10);
    EXPECT_EQ(refused.load(), kOrders - 10);
    auto p = product("p-1");
    EXPECT_EQ(p.quantity_reserved, D("100"));
    EXPECT_TRUE(p.quantity_available().is_zero());
    EXPECT_EQ(p.reservations.size(), 10u);
}

TEST_F(ConcurrencyTest, IndependentProducts_ShouldProgressInParallel) {
    constexpr int kProducts = 6;
    for (int i = 0; i < kProducts; ++i) register_product("p-" + std::to_string(i), "20", "1");

    std::vector<std::thread> workers;
    for (int i = 0; i < kProducts; ++i) {
        workers.emplace_back([this, i] {
            const std::string id = "p-" + std::to_string(i);
            for (int n = 0; n < 10; ++n) {
                reserve(id, "1", "SO-" + std::to_string(n));
                sell(id, "1", "SO-" + std::to_string(n));
            }
        });
    }
    for (auto& w : workers) w.join();

    for (int i = 0; i < kProducts; ++i) {
        auto p = product("p-" + std::to_string(i));
        EXPECT_EQ(p.quantity_on_hand, D("10"));
        EXPECT_TRUE(p.quantity_reserved.is_zero());
        EXPECT_EQ(p.times_sold, 10);
    }
}
