#include <gtest/gtest.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>
#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"

using namespace stockledger;

// =============================================================================
// Defaults and JSON overlay
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv("PORT");
        unsetenv("STOCKLEDGER_CONFIG");
        if (!temp_path_.empty()) std::remove(temp_path_.c_str());
    }

    std::string write_temp(const std::string& contents) {
        temp_path_ = ::testing::TempDir() + "stockledger_config_test.json";
        std::ofstream out(temp_path_);
        out << contents;
        return temp_path_;
    }

private:
    std::string temp_path_;
};

TEST_F(ConfigTest, Defaults_ShouldMatchPlanningConstants) {
    LedgerConfig config;

    EXPECT_EQ(config.default_location, "main");
    EXPECT_EQ(config.reorder.ordering_cost, Decimal::from_units(50));
    EXPECT_EQ(config.reorder.holding_cost_rate, Decimal::parse("0.2"));
    EXPECT_EQ(config.reorder.observation_window_days, 90);
    EXPECT_EQ(config.reorder.default_annual_demand, Decimal::from_units(100));
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, FromJson_ShouldOverlayOnlyPresentKeys) {
    auto doc = nlohmann::json::parse(R"({
        "port": 6000,
        "default_location": "warehouse-a",
        "reorder": {"ordering_cost": "75.50", "holding_cost_rate": 0.25}
    })");

    auto config = LedgerConfig::from_json(doc);

    EXPECT_EQ(config.port, 6000);
    EXPECT_EQ(config.default_location, "warehouse-a");
    EXPECT_EQ(config.reorder.ordering_cost, Decimal::parse("75.5"));
    EXPECT_EQ(config.reorder.holding_cost_rate, Decimal::parse("0.25"));
    EXPECT_EQ(config.max_commit_retries, 3);
    EXPECT_EQ(config.reorder.fallback_unit_cost, Decimal::from_units(10));
}

TEST_F(ConfigTest, FromJson_WrongType_ShouldThrowValidationError) {
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse(R"({"port": "6000"})")),
                 ValidationError);
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse(R"({"reorder": []})")),
                 ValidationError);
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse("[]")), ValidationError);
}

TEST_F(ConfigTest, FromJson_OutOfRange_ShouldThrowValidationError) {
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse(R"({"lock_stripes": 0})")),
                 ValidationError);
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse(R"({"max_commit_retries": -1})")),
                 ValidationError);
    EXPECT_THROW(LedgerConfig::from_json(nlohmann::json::parse(R"({"port": 70000})")),
                 ValidationError);
    EXPECT_THROW(LedgerConfig::from_json(
                     nlohmann::json::parse(R"({"reorder": {"observation_window_days": 0}})")),
                 ValidationError);
}

// =============================================================================
// Files and environment
// =============================================================================

TEST_F(ConfigTest, FromFile_Missing_ShouldThrowValidationError) {
    EXPECT_THROW(LedgerConfig::from_file("/nonexistent/stockledger.json"), ValidationError);
}

TEST_F(ConfigTest, FromFile_Malformed_ShouldThrowValidationError) {
    auto path = write_temp("{ not json");
    EXPECT_THROW(LedgerConfig::from_file(path), ValidationError);
}

TEST_F(ConfigTest, FromEnv_ShouldApplyFileThenPort) {
    auto path = write_temp(R"({"port": 6000, "lock_stripes": 16})");
    setenv("STOCKLEDGER_CONFIG", path.c_str(), 1);
    setenv("PORT", "7001", 1);

    auto config = LedgerConfig::from_env();

    EXPECT_EQ(config.port, 7001);
    EXPECT_EQ(config.lock_stripes, 16u);
}

TEST_F(ConfigTest, FromEnv_NonNumericPort_ShouldThrowValidationError) {
    setenv("PORT", "http", 1);
    EXPECT_THROW(LedgerConfig::from_env(), ValidationError);
}
