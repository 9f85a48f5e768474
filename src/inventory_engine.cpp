#include "stockledger/inventory_engine.hpp"
#include "stockledger/enums.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/handlers/adjust_handler.hpp"
#include "stockledger/handlers/guards.hpp"
#include "stockledger/handlers/receive_handler.hpp"
#include "stockledger/handlers/recount_handler.hpp"
#include "stockledger/handlers/register_handler.hpp"
#include "stockledger/handlers/release_handler.hpp"
#include "stockledger/handlers/reserve_handler.hpp"
#include "stockledger/handlers/return_handler.hpp"
#include "stockledger/handlers/reverse_handler.hpp"
#include "stockledger/handlers/sale_handler.hpp"
#include "stockledger/handlers/transfer_handler.hpp"
#include "stockledger/handlers/write_off_handler.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/movement.hpp"
#include "stockledger/validation.hpp"

namespace stockledger {

namespace {

using helpers::from_proto;

constexpr const char* kReversalReference = "stock_movement_reversal";

ProductState load(UnitOfWork& uow, const ProductKey& key) {
    auto product = uow.products().get_by_id(key);
    if (!product) throw NotFoundError("Product not found: " + key.to_string());
    return *product;
}

MovementStamp stamp_for(UnitOfWork& uow, const ProductKey& key, const std::string& created_by,
                        const LedgerConfig& config) {
    return {helpers::new_uuid(), uow.movements().next_sequence(key), helpers::now(), created_by,
            config.default_location};
}

// Push one movement's deltas through the repository primitives, in the
// same order ProductState::apply_movement replays them.
ProductState apply_to_repository(ProductRepository& products, const ProductKey& key,
                                 const v1::StockMovement& m) {
    const Decimal quantity = movement::quantity(m);
    const Decimal reserved = movement::reserved_delta(m);
    const std::string reservation =
        helpers::reservation_key(m.context().reference_type(), m.context().reference_id());

    std::optional<ProductState> current;
    if (reserved.is_negative()) current = products.release_reservation(key, reservation, -reserved);

    if (m.movement_type() == v1::MovementType::TRANSFER) {
        current = products.transfer_between_locations(key, m.from_location_id(), m.to_location_id(),
                                                       from_proto(m.transfer_quantity()));
    } else if (!quantity.is_zero()) {
        current = products.update_quantity(key, quantity, m.location_id());
    }

    if (reserved.is_positive()) current = products.reserve_quantity(key, reservation, reserved);

    switch (m.movement_type()) {
        case v1::MovementType::INITIAL:
            current = products.update_cost(key, from_proto(m.unit_cost()), from_proto(m.cost_after()));
            break;
        case v1::MovementType::PURCHASE:
            if (quantity.is_positive()) {
                current = products.update_cost(key, from_proto(m.unit_cost()), from_proto(m.cost_after()));
            }
            break;
        case v1::MovementType::SALE:
            current = products.record_sale(key, quantity.is_negative() ? 1 : -1);
            break;
        default:
            break;
    }

    if (!current) current = products.get_by_id(key);
    if (!current) throw NotFoundError("Product not found: " + key.to_string());
    return *current;
}

v1::MovementResult make_result(const v1::StockMovement& m, const ProductState& product,
                               bool replayed) {
    v1::MovementResult result;
    result.set_movement_id(m.movement_id());
    *result.mutable_quantity_before() = m.quantity_before();
    *result.mutable_quantity_after() = m.quantity_after();
    *result.mutable_quantity_change() = m.quantity();
    *result.mutable_movement() = m;
    *result.mutable_product() = product.to_snapshot();
    result.set_replayed(replayed);
    return result;
}

v1::MovementResult append_and_apply(UnitOfWork& uow, const ProductKey& key,
                                    const v1::StockMovement& m) {
    uow.movements().create(m);
    ProductState after = apply_to_repository(uow.products(), key, m);

    if (after.quantity_on_hand != movement::quantity_after(m)) {
        throw ApplicationError("Product quantity " + after.quantity_on_hand.to_string() +
                               " does not match movement quantity_after " +
                               movement::quantity_after(m).to_string());
    }
    if (after.quantity_reserved != movement::reserved_after(m)) {
        throw ApplicationError("Product reserved quantity " + after.quantity_reserved.to_string() +
                               " does not match movement reserved_after " +
                               movement::reserved_after(m).to_string());
    }
    return make_result(m, after, false);
}

nlohmann::json movement_fields(const ProductKey& key, const v1::MovementResult& result) {
    return {
        {"product", key.to_string()},
        {"movement_id", result.movement_id()},
        {"movement_type", display_name(result.movement().movement_type())},
        {"quantity_before", from_proto(result.quantity_before()).to_string()},
        {"quantity_after", from_proto(result.quantity_after()).to_string()},
        {"reserved", from_proto(result.product().quantity_reserved()).to_string()}
    };
}

} // anonymous namespace

InventoryEngine::InventoryEngine(std::shared_ptr<InventoryStore> store, LedgerConfig config)
    : store_(std::move(store)), config_(std::move(config)) {
    if (!store_) throw ValidationError("inventory store is required");
    config_.validate();
}

template <typename Result, typename Fn>
Result InventoryEngine::execute(const std::string& operation, const ProductKey& key, Fn&& fn) {
    try {
        validation::require_not_empty(key.business_id, "business_id");
        validation::require_not_empty(key.product_id, "product_id");
        return run_in_transaction(*store_, key, config_.max_commit_retries, std::forward<Fn>(fn));
    } catch (const ApplicationError& e) {
        log_error("inventory", operation + "_failed",
                  {{"product", key.to_string()}, {"error", e.what()}});
        throw;
    } catch (const LedgerError& e) {
        log_warn("inventory", operation + "_rejected",
                 {{"product", key.to_string()}, {"error", e.what()}});
        throw;
    } catch (const std::exception& e) {
        log_error("inventory", operation + "_failed",
                  {{"product", key.to_string()}, {"error", e.what()}});
        throw ApplicationError("Failed to " + operation + " for " + key.to_string() + ": " + e.what());
    }
}

// ============================================================================
// Mutations
// ============================================================================

v1::MovementResult InventoryEngine::register_product(const v1::RegisterProduct& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("register_product", key, [&](UnitOfWork& uow) {
        auto product = handlers::new_product(cmd);
        if (uow.products().get_by_id(key)) {
            throw BusinessRuleViolation("Product " + key.to_string() + " already exists");
        }
        if (uow.products().get_by_sku(key.business_id, product.sku)) {
            throw BusinessRuleViolation("SKU " + product.sku + " already exists");
        }
        uow.products().create(product);

        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_register(cmd, product, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["sku"] = result.product().sku();
    log_info("inventory", "product_registered", fields);
    return result;
}

v1::MovementResult InventoryEngine::adjust_stock(const v1::AdjustStock& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("adjust_stock", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_adjust(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["reason"] = cmd.reason();
    log_info("inventory", "stock_adjusted", fields);
    return result;
}

v1::MovementResult InventoryEngine::transfer_stock(const v1::TransferStock& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("transfer_stock", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_transfer(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["from"] = cmd.from_location_id();
    fields["to"] = cmd.to_location_id();
    fields["quantity"] = from_proto(cmd.quantity()).to_string();
    log_info("inventory", "stock_transferred", fields);
    return result;
}

v1::MovementResult InventoryEngine::receive_purchase(const v1::ReceivePurchase& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("receive_purchase", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_receive(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["landed_cost"] = from_proto(result.movement().landed_cost()).to_string();
    fields["average_cost"] = from_proto(result.product().average_cost()).to_string();
    log_info("inventory", "purchase_received", fields);
    return result;
}

v1::MovementResult InventoryEngine::reserve_stock(const v1::ReserveStock& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("reserve_stock", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        handlers::require_stock_operation(state, "reserve stock");

        // Same key and quantity as an open reservation: hand back the original entry.
        auto reservation = helpers::reservation_key(cmd.reference_type(), cmd.reference_id());
        Decimal held = state.reserved_for(reservation);
        if (held.is_positive()) {
            Decimal requested = from_proto(cmd.quantity());
            if (held != requested) {
                throw BusinessRuleViolation("Reservation " + reservation + " already holds " +
                                            held.to_string() + ", requested " + requested.to_string());
            }
            auto previous = uow.movements().get_movements_by_reference(
                key, cmd.reference_type(), cmd.reference_id());
            for (auto it = previous.rbegin(); it != previous.rend(); ++it) {
                if (it->movement_type() == v1::MovementType::RESERVATION) {
                    return make_result(*it, state, true);
                }
            }
            throw ApplicationError("Reservation " + reservation + " has no ledger entry");
        }

        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_reserve(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["reference"] = helpers::reservation_key(cmd.reference_type(), cmd.reference_id());
    fields["replayed"] = result.replayed();
    log_info("inventory", "stock_reserved", fields);
    return result;
}

v1::MovementResult InventoryEngine::release_reservation(const v1::ReleaseReservation& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("release_reservation", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_release(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["reference"] = helpers::reservation_key(cmd.reference_type(), cmd.reference_id());
    log_info("inventory", "reservation_released", fields);
    return result;
}

v1::MovementResult InventoryEngine::record_sale(const v1::RecordSale& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("record_sale", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_sale(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["customer_id"] = cmd.customer_id();
    log_info("inventory", "sale_recorded", fields);
    return result;
}

v1::MovementResult InventoryEngine::record_return(const v1::RecordReturn& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("record_return", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_return(cmd, state, stamp));
    });

    log_info("inventory", "return_recorded", movement_fields(key, result));
    return result;
}

v1::MovementResult InventoryEngine::write_off_stock(const v1::WriteOffStock& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("write_off_stock", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_write_off(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["reason"] = cmd.reason();
    log_info("inventory", "stock_written_off", fields);
    return result;
}

v1::MovementResult InventoryEngine::recount_stock(const v1::RecountStock& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("recount_stock", key, [&](UnitOfWork& uow) {
        auto state = load(uow, key);
        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(uow, key, handlers::handle_recount(cmd, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["location"] = result.movement().location_id();
    log_info("inventory", "stock_recounted", fields);
    return result;
}

v1::MovementResult InventoryEngine::reverse_movement(const v1::ReverseMovement& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto result = execute<v1::MovementResult>("reverse_movement", key, [&](UnitOfWork& uow) {
        validation::require_not_empty(cmd.movement_id(), "movement_id");
        auto state = load(uow, key);
        auto original = uow.movements().get_by_id(cmd.movement_id());
        if (!original) throw NotFoundError("Movement not found: " + cmd.movement_id());

        bool already_reversed =
            !uow.movements().get_movements_by_reference(key, kReversalReference, cmd.movement_id()).empty();

        auto stamp = stamp_for(uow, key, cmd.created_by(), config_);
        return append_and_apply(
            uow, key, handlers::handle_reverse(cmd, *original, already_reversed, state, stamp));
    });

    auto fields = movement_fields(key, result);
    fields["reverses_movement_id"] = cmd.movement_id();
    log_info("inventory", "movement_reversed", fields);
    return result;
}

v1::ProductSnapshot InventoryEngine::archive_product(const v1::ArchiveProduct& cmd) {
    ProductKey key{cmd.business_id(), cmd.product_id()};
    auto snapshot = execute<v1::ProductSnapshot>("archive_product", key, [&](UnitOfWork& uow) {
        validation::require_not_empty(cmd.reason(), "Reason for archiving");
        auto state = load(uow, key);
        if (state.archived) {
            throw BusinessRuleViolation("Product " + key.to_string() + " is already archived");
        }
        return uow.products().archive(key).to_snapshot();
    });

    log_info("inventory", "product_archived",
             {{"product", key.to_string()}, {"reason", cmd.reason()},
              {"archived_by", cmd.archived_by()}});
    return snapshot;
}

// ============================================================================
// Queries
// ============================================================================

v1::ProductSnapshot InventoryEngine::get_product(const ProductKey& key) const {
    validation::require_not_empty(key.business_id, "business_id");
    validation::require_not_empty(key.product_id, "product_id");
    auto product = store_->products().get_by_id(key);
    if (!product) throw NotFoundError("Product not found: " + key.to_string());
    return product->to_snapshot();
}

std::vector<v1::StockMovement> InventoryEngine::get_movements(const ProductKey& key) const {
    validation::require_not_empty(key.business_id, "business_id");
    validation::require_not_empty(key.product_id, "product_id");
    if (!store_->products().get_by_id(key)) {
        throw NotFoundError("Product not found: " + key.to_string());
    }
    return store_->movements().get_movements_for_product(key);
}

v1::AuditReport InventoryEngine::audit_product(const ProductKey& key) const {
    validation::require_not_empty(key.business_id, "business_id");
    validation::require_not_empty(key.product_id, "product_id");

    // Hold the product lock so the row and the ledger are read at the same point.
    auto uow = store_->begin(key);
    auto stored = load(*uow, key);
    auto movements = uow->movements().get_movements_for_product(key);
    auto report = movement::audit(stored, movements);

    if (report.consistent()) {
        log_info("inventory", "ledger_audited",
                 {{"product", key.to_string()}, {"movements", report.movement_count()}});
    } else {
        log_warn("inventory", "ledger_discrepancies_found",
                 {{"product", key.to_string()},
                  {"movements", report.movement_count()},
                  {"discrepancies", report.discrepancies_size()}});
    }
    return report;
}

} // namespace stockledger
