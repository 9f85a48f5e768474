#include "stockledger/movement.hpp"
#include "stockledger/enums.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/helpers.hpp"
#include <sstream>

namespace stockledger {
namespace movement {

using helpers::from_proto;
using helpers::set_decimal;

v1::StockMovement begin(const ProductState& state, v1::MovementType type,
                        const MovementStamp& stamp) {
    v1::StockMovement m;
    m.set_movement_id(stamp.movement_id);
    m.set_business_id(state.business_id);
    m.set_product_id(state.product_id);
    m.set_sequence(stamp.sequence);
    m.set_movement_type(type);

    set_decimal(m.mutable_quantity(), Decimal::zero());
    set_decimal(m.mutable_quantity_before(), state.quantity_on_hand);
    set_decimal(m.mutable_quantity_after(), state.quantity_on_hand);
    set_decimal(m.mutable_reserved_delta(), Decimal::zero());
    set_decimal(m.mutable_reserved_before(), state.quantity_reserved);
    set_decimal(m.mutable_reserved_after(), state.quantity_reserved);

    set_decimal(m.mutable_cost_before(), state.average_cost);
    set_decimal(m.mutable_cost_after(), state.average_cost);

    m.set_created_by(stamp.created_by);
    *m.mutable_movement_date() = stamp.at;
    m.set_is_approved(true);
    return m;
}

void set_quantity(v1::StockMovement& m, const Decimal& delta) {
    set_decimal(m.mutable_quantity(), delta);
    set_decimal(m.mutable_quantity_after(), from_proto(m.quantity_before()) + delta);
}

void set_reserved(v1::StockMovement& m, const Decimal& delta) {
    set_decimal(m.mutable_reserved_delta(), delta);
    set_decimal(m.mutable_reserved_after(), from_proto(m.reserved_before()) + delta);
}

Decimal quantity(const v1::StockMovement& m) { return from_proto(m.quantity()); }
Decimal quantity_before(const v1::StockMovement& m) { return from_proto(m.quantity_before()); }
Decimal quantity_after(const v1::StockMovement& m) { return from_proto(m.quantity_after()); }
Decimal reserved_delta(const v1::StockMovement& m) { return from_proto(m.reserved_delta()); }
Decimal reserved_after(const v1::StockMovement& m) { return from_proto(m.reserved_after()); }

std::string describe(const v1::StockMovement& m) {
    std::ostringstream out;
    out << display_name(m.movement_type()) << " of ";
    if (m.movement_type() == v1::MovementType::TRANSFER) {
        out << from_proto(m.transfer_quantity()) << " units from " << m.from_location_id()
            << " to " << m.to_location_id();
    } else if (m.movement_type() == v1::MovementType::RESERVATION ||
               m.movement_type() == v1::MovementType::RELEASE) {
        out << reserved_delta(m).abs() << " units";
    } else {
        out << quantity(m).abs() << " units";
    }
    if (!m.context().reference_id().empty()) {
        out << " (" << helpers::reservation_key(m.context().reference_type(),
                                                 m.context().reference_id())
            << ")";
    }
    return out.str();
}

std::vector<std::string> check_consistency(const v1::StockMovement& m) {
    std::vector<std::string> problems;
    const std::string prefix = "movement " + std::to_string(m.sequence()) + ": ";

    if (quantity_before(m) + quantity(m) != quantity_after(m)) {
        problems.push_back(prefix + "quantity_before + quantity != quantity_after");
    }
    if (from_proto(m.reserved_before()) + reserved_delta(m) != reserved_after(m)) {
        problems.push_back(prefix + "reserved_before + reserved_delta != reserved_after");
    }
    if (quantity_after(m).is_negative()) {
        problems.push_back(prefix + "negative quantity_after");
    }
    if (reserved_after(m).is_negative()) {
        problems.push_back(prefix + "negative reserved_after");
    }
    if (reserved_after(m) > quantity_after(m)) {
        problems.push_back(prefix + "reserved exceeds on hand");
    }
    if (m.movement_type() == v1::MovementType::TRANSFER && !quantity(m).is_zero()) {
        problems.push_back(prefix + "transfer changes on-hand quantity");
    }
    return problems;
}

namespace {

// Keep descriptive columns, zero everything the ledger owns.
ProductState ledger_baseline(const ProductState& stored) {
    ProductState base = stored;
    base.quantity_on_hand = Decimal::zero();
    base.quantity_reserved = Decimal::zero();
    base.unit_cost = Decimal::zero();
    base.average_cost = Decimal::zero();
    base.location_quantities.clear();
    base.reservations.clear();
    base.times_sold = 0;
    return base;
}

void compare(std::vector<std::string>& out, const char* field, const Decimal& stored,
             const Decimal& rebuilt) {
    if (stored != rebuilt) {
        out.push_back(std::string(field) + ": stored " + stored.to_string() + ", ledger " +
                      rebuilt.to_string());
    }
}

void compare_buckets(std::vector<std::string>& out, const char* field,
                     const std::map<std::string, Decimal>& stored,
                     const std::map<std::string, Decimal>& rebuilt) {
    for (const auto& [key, value] : stored) {
        auto it = rebuilt.find(key);
        Decimal other = it != rebuilt.end() ? it->second : Decimal::zero();
        if (other != value) {
            out.push_back(std::string(field) + "[" + key + "]: stored " + value.to_string() +
                          ", ledger " + other.to_string());
        }
    }
    for (const auto& [key, value] : rebuilt) {
        if (stored.find(key) == stored.end()) {
            out.push_back(std::string(field) + "[" + key + "]: stored 0, ledger " +
                          value.to_string());
        }
    }
}

} // anonymous namespace

v1::AuditReport audit(const ProductState& stored, const std::vector<v1::StockMovement>& movements) {
    std::vector<std::string> discrepancies;
    ProductState rebuilt = ledger_baseline(stored);

    Decimal expected_quantity;
    Decimal expected_reserved;
    bool replay_failed = false;

    for (size_t i = 0; i < movements.size(); ++i) {
        const auto& m = movements[i];
        const std::string prefix = "movement " + std::to_string(m.sequence()) + ": ";

        if (m.sequence() != static_cast<int64_t>(i)) {
            discrepancies.push_back("sequence gap: expected " + std::to_string(i) + ", found " +
                                    std::to_string(m.sequence()));
        }
        if (m.business_id() != stored.business_id || m.product_id() != stored.product_id) {
            discrepancies.push_back(prefix + "belongs to another product");
        }
        for (auto& problem : check_consistency(m)) {
            discrepancies.push_back(std::move(problem));
        }
        if (quantity_before(m) != expected_quantity) {
            discrepancies.push_back(prefix + "quantity_before " + quantity_before(m).to_string() +
                                    " does not continue from " + expected_quantity.to_string());
        }
        if (from_proto(m.reserved_before()) != expected_reserved) {
            discrepancies.push_back(prefix + "reserved_before does not continue from " +
                                    expected_reserved.to_string());
        }
        expected_quantity = quantity_after(m);
        expected_reserved = reserved_after(m);

        if (!replay_failed) {
            try {
                ProductState::apply_movement(rebuilt, m);
            } catch (const LedgerError& e) {
                discrepancies.push_back(prefix + "cannot be replayed: " + e.what());
                replay_failed = true;
            }
        }
    }

    compare(discrepancies, "quantity_on_hand", stored.quantity_on_hand, rebuilt.quantity_on_hand);
    compare(discrepancies, "quantity_reserved", stored.quantity_reserved,
            rebuilt.quantity_reserved);
    compare(discrepancies, "unit_cost", stored.unit_cost, rebuilt.unit_cost);
    compare(discrepancies, "average_cost", stored.average_cost, rebuilt.average_cost);
    if (stored.times_sold != rebuilt.times_sold) {
        discrepancies.push_back("times_sold: stored " + std::to_string(stored.times_sold) +
                                ", ledger " + std::to_string(rebuilt.times_sold));
    }
    compare_buckets(discrepancies, "location", stored.location_quantities,
                    rebuilt.location_quantities);
    compare_buckets(discrepancies, "reservation", stored.reservations, rebuilt.reservations);

    v1::AuditReport report;
    report.set_business_id(stored.business_id);
    report.set_product_id(stored.product_id);
    report.set_consistent(discrepancies.empty());
    for (const auto& d : discrepancies) report.add_discrepancies(d);
    report.set_movement_count(static_cast<int64_t>(movements.size()));
    *report.mutable_stored() = stored.to_snapshot();
    *report.mutable_rebuilt() = rebuilt.to_snapshot();
    return report;
}

} // namespace movement
} // namespace stockledger
