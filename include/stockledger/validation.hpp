#pragma once

#include <string>
#include "stockledger/decimal.hpp"
#include "stockledger/errors.hpp"

namespace stockledger {
namespace validation {

/**
 * Require that an identifier or free-text field is present.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError(field_name + " is required");
    }
}

/**
 * Require a strictly positive quantity or amount.
 */
inline void require_positive(const Decimal& value, const std::string& field_name = "quantity") {
    if (!value.is_positive()) {
        throw BusinessRuleViolation(field_name + " must be positive");
    }
}

/**
 * Require zero or greater.
 */
inline void require_non_negative(const Decimal& value, const std::string& field_name = "value") {
    if (value.is_negative()) {
        throw BusinessRuleViolation(field_name + " cannot be negative");
    }
}

/**
 * Require that the product keeps inventory.
 */
inline void require_tracked(bool track_inventory, const std::string& operation) {
    if (!track_inventory) {
        throw BusinessRuleViolation("Cannot " + operation +
                                    " for products with inventory tracking disabled");
    }
}

/**
 * Require that the product has not been archived.
 */
inline void require_active(bool archived, const std::string& product_id) {
    if (archived) {
        throw BusinessRuleViolation("Product " + product_id + " is archived");
    }
}

} // namespace validation
} // namespace stockledger
