#pragma once

#include <stdexcept>
#include <string>
#include <grpcpp/grpcpp.h>

namespace stockledger {

/**
 * Base exception for all stock ledger errors.
 */
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& message)
        : std::runtime_error(message) {}

    /**
     * Returns true if a referenced product or movement does not exist.
     */
    virtual bool is_not_found() const { return false; }

    /**
     * Returns true if the operation would break a ledger invariant.
     */
    virtual bool is_precondition_failed() const { return false; }

    /**
     * Returns true if the request itself is malformed.
     */
    virtual bool is_invalid_argument() const { return false; }

    /**
     * Returns true if the caller may retry with the same idempotency key.
     */
    virtual bool is_retryable() const { return false; }

    /**
     * gRPC status code used when the error crosses the service boundary.
     */
    virtual grpc::StatusCode status_code() const { return grpc::StatusCode::UNKNOWN; }

    grpc::Status to_grpc_status() const {
        return grpc::Status(status_code(), what());
    }
};

/**
 * Malformed input: empty reason, missing identifiers, inconsistent request.
 * Maps to gRPC INVALID_ARGUMENT.
 */
class ValidationError : public LedgerError {
public:
    explicit ValidationError(const std::string& message)
        : LedgerError(message) {}

    bool is_invalid_argument() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::INVALID_ARGUMENT; }
};

/**
 * The operation would break an invariant (negative stock, insufficient
 * available or reserved quantity, tracking disabled, threshold ordering).
 * Maps to gRPC FAILED_PRECONDITION.
 */
class BusinessRuleViolation : public LedgerError {
public:
    explicit BusinessRuleViolation(const std::string& message)
        : LedgerError(message) {}

    bool is_precondition_failed() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::FAILED_PRECONDITION; }
};

/**
 * Referenced product or movement is missing.
 */
class NotFoundError : public LedgerError {
public:
    explicit NotFoundError(const std::string& message)
        : LedgerError(message) {}

    bool is_not_found() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::NOT_FOUND; }
};

/**
 * Thrown by a commit when the product row changed since it was read.
 */
class ConcurrencyConflict : public LedgerError {
public:
    explicit ConcurrencyConflict(const std::string& message)
        : LedgerError(message) {}

    bool is_retryable() const override { return true; }
    grpc::StatusCode status_code() const override { return grpc::StatusCode::ABORTED; }
};

/**
 * Unexpected or infrastructure failure wrapped with operation context.
 */
class ApplicationError : public LedgerError {
public:
    explicit ApplicationError(const std::string& message)
        : LedgerError(message) {}

    grpc::StatusCode status_code() const override { return grpc::StatusCode::INTERNAL; }
};

} // namespace stockledger
