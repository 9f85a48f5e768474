#include <gtest/gtest.h>
#include "stockledger/errors.hpp"

using namespace stockledger;

// =============================================================================
// Error predicates
// =============================================================================

TEST(ErrorIntrospectionTest, ValidationError_ShouldBeInvalidArgument) {
    ValidationError err("reason is required");

    EXPECT_TRUE(err.is_invalid_argument());
    EXPECT_FALSE(err.is_precondition_failed());
    EXPECT_FALSE(err.is_not_found());
    EXPECT_FALSE(err.is_retryable());
    EXPECT_EQ(err.status_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST(ErrorIntrospectionTest, BusinessRuleViolation_ShouldBeFailedPrecondition) {
    BusinessRuleViolation err("Insufficient available stock");

    EXPECT_TRUE(err.is_precondition_failed());
    EXPECT_FALSE(err.is_invalid_argument());
    EXPECT_EQ(err.status_code(), grpc::StatusCode::FAILED_PRECONDITION);
}

TEST(ErrorIntrospectionTest, NotFoundError_ShouldBeNotFound) {
    NotFoundError err("Product not found");

    EXPECT_TRUE(err.is_not_found());
    EXPECT_EQ(err.status_code(), grpc::StatusCode::NOT_FOUND);
}

TEST(ErrorIntrospectionTest, ConcurrencyConflict_ShouldBeRetryable) {
    ConcurrencyConflict err("version changed");

    EXPECT_TRUE(err.is_retryable());
    EXPECT_FALSE(err.is_precondition_failed());
    EXPECT_EQ(err.status_code(), grpc::StatusCode::ABORTED);
}

TEST(ErrorIntrospectionTest, ApplicationError_ShouldMapToInternal) {
    ApplicationError err("store failure");

    EXPECT_FALSE(err.is_retryable());
    EXPECT_FALSE(err.is_not_found());
    EXPECT_EQ(err.status_code(), grpc::StatusCode::INTERNAL);
}

// =============================================================================
// gRPC status mapping
// =============================================================================

TEST(ErrorIntrospectionTest, ToGrpcStatus_ShouldCarryCodeAndMessage) {
    BusinessRuleViolation err("Cannot release more than reserved");

    auto status = err.to_grpc_status();

    EXPECT_EQ(status.error_code(), grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(status.error_message(), "Cannot release more than reserved");
}

TEST(ErrorIntrospectionTest, CatchAsLedgerError_ShouldKeepDerivedBehaviour) {
    try {
        throw NotFoundError("Movement not found: m-9");
    } catch (const LedgerError& e) {
        EXPECT_TRUE(e.is_not_found());
        EXPECT_STREQ(e.what(), "Movement not found: m-9");
    }
}
