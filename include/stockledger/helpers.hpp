#pragma once

#include <string>
#include <google/protobuf/timestamp.pb.h>
#include "stockledger/decimal.hpp"
#include "stockledger/ledger.pb.h"

namespace stockledger {

/**
 * Tenant-scoped identity of a product.
 */
struct ProductKey {
    std::string business_id;
    std::string product_id;

    bool operator==(const ProductKey& other) const {
        return business_id == other.business_id && product_id == other.product_id;
    }
    bool operator<(const ProductKey& other) const {
        return business_id < other.business_id ||
               (business_id == other.business_id && product_id < other.product_id);
    }

    std::string to_string() const { return business_id + "/" + product_id; }
};

/**
 * Helper functions shared by the engine, the planner and the service.
 */
namespace helpers {

/**
 * Convert between the fixed-point Decimal and its wire form.
 */
inline Decimal from_proto(const v1::DecimalValue& value) {
    return Decimal::from_scaled(value.scaled());
}

inline v1::DecimalValue to_proto(const Decimal& value) {
    v1::DecimalValue out;
    out.set_scaled(value.scaled());
    return out;
}

inline void set_decimal(v1::DecimalValue* target, const Decimal& value) {
    target->set_scaled(value.scaled());
}

/**
 * Random RFC 4122 version 4 identifier, lower-case hex with dashes.
 */
std::string new_uuid();

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Key under which an open reservation is tracked: "order:1234".
 */
inline std::string reservation_key(const std::string& reference_type,
                                   const std::string& reference_id) {
    return reference_type + ":" + reference_id;
}

/**
 * Trim ASCII whitespace from both ends.
 */
std::string trim(const std::string& value);

} // namespace helpers
} // namespace stockledger
