#pragma once

#include <memory>
#include <string>
#include <vector>
#include "stockledger/config.hpp"
#include "stockledger/helpers.hpp"
#include "stockledger/ledger.pb.h"
#include "stockledger/unit_of_work.hpp"

namespace stockledger {

/**
 * Inventory operations engine.
 *
 * Each mutating operation runs as one unit of work against one product:
 * load, validate, build the movement, append it, apply the same delta to
 * the product row, check the row agrees with the movement, commit. Either
 * the movement and the row change are both published or neither is.
 *
 * Domain errors (LedgerError) propagate unchanged; anything else is
 * wrapped in ApplicationError.
 */
class InventoryEngine {
public:
    explicit InventoryEngine(std::shared_ptr<InventoryStore> store, LedgerConfig config = {});

    v1::MovementResult register_product(const v1::RegisterProduct& cmd);
    v1::MovementResult adjust_stock(const v1::AdjustStock& cmd);
    v1::MovementResult transfer_stock(const v1::TransferStock& cmd);
    v1::MovementResult receive_purchase(const v1::ReceivePurchase& cmd);

    /// Idempotent per (reference_type, reference_id): a retry with the same
    /// quantity returns the original movement with replayed set.
    v1::MovementResult reserve_stock(const v1::ReserveStock& cmd);

    v1::MovementResult release_reservation(const v1::ReleaseReservation& cmd);
    v1::MovementResult record_sale(const v1::RecordSale& cmd);
    v1::MovementResult record_return(const v1::RecordReturn& cmd);
    v1::MovementResult write_off_stock(const v1::WriteOffStock& cmd);
    v1::MovementResult recount_stock(const v1::RecountStock& cmd);
    v1::MovementResult reverse_movement(const v1::ReverseMovement& cmd);

    /// Soft delete; the ledger stays readable.
    v1::ProductSnapshot archive_product(const v1::ArchiveProduct& cmd);

    v1::ProductSnapshot get_product(const ProductKey& key) const;
    std::vector<v1::StockMovement> get_movements(const ProductKey& key) const;

    /// Replay the ledger and compare it with the stored row.
    v1::AuditReport audit_product(const ProductKey& key) const;

    const LedgerConfig& config() const { return config_; }

private:
    template <typename Result, typename Fn>
    Result execute(const std::string& operation, const ProductKey& key, Fn&& fn);

    std::shared_ptr<InventoryStore> store_;
    LedgerConfig config_;
};

} // namespace stockledger
