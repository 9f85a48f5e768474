#include "ledger_service.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include <grpcpp/grpcpp.h>

namespace stockledger {

namespace {

// Run fn and map its outcome onto a gRPC status.
template <typename Fn>
grpc::Status invoke(const char* rpc, Fn&& fn) {
    try {
        fn();
        return grpc::Status::OK;
    } catch (const LedgerError& e) {
        return e.to_grpc_status();
    } catch (const std::exception& e) {
        log_error("service", "rpc_failed", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

ProductKey key_of(const v1::ProductKey& key) {
    return {key.business_id(), key.product_id()};
}

} // anonymous namespace

class LedgerService final : public v1::InventoryLedger::Service {
public:
    LedgerService(std::shared_ptr<InventoryEngine> engine, std::shared_ptr<ReorderPlanner> planner)
        : engine_(std::move(engine)), planner_(std::move(planner)) {}

    grpc::Status RegisterProduct(grpc::ServerContext*, const v1::RegisterProduct* request,
                                 v1::MovementResult* response) override {
        return invoke("RegisterProduct", [&] { *response = engine_->register_product(*request); });
    }

    grpc::Status AdjustStock(grpc::ServerContext*, const v1::AdjustStock* request,
                             v1::MovementResult* response) override {
        return invoke("AdjustStock", [&] { *response = engine_->adjust_stock(*request); });
    }

    grpc::Status TransferStock(grpc::ServerContext*, const v1::TransferStock* request,
                               v1::MovementResult* response) override {
        return invoke("TransferStock", [&] { *response = engine_->transfer_stock(*request); });
    }

    grpc::Status ReceivePurchase(grpc::ServerContext*, const v1::ReceivePurchase* request,
                                 v1::MovementResult* response) override {
        return invoke("ReceivePurchase", [&] { *response = engine_->receive_purchase(*request); });
    }

    grpc::Status ReserveStock(grpc::ServerContext*, const v1::ReserveStock* request,
                              v1::MovementResult* response) override {
        return invoke("ReserveStock", [&] { *response = engine_->reserve_stock(*request); });
    }

    grpc::Status ReleaseReservation(grpc::ServerContext*, const v1::ReleaseReservation* request,
                                    v1::MovementResult* response) override {
        return invoke("ReleaseReservation",
                      [&] { *response = engine_->release_reservation(*request); });
    }

    grpc::Status RecordSale(grpc::ServerContext*, const v1::RecordSale* request,
                            v1::MovementResult* response) override {
        return invoke("RecordSale", [&] { *response = engine_->record_sale(*request); });
    }

    grpc::Status RecordReturn(grpc::ServerContext*, const v1::RecordReturn* request,
                              v1::MovementResult* response) override {
        return invoke("RecordReturn", [&] { *response = engine_->record_return(*request); });
    }

    grpc::Status WriteOffStock(grpc::ServerContext*, const v1::WriteOffStock* request,
                               v1::MovementResult* response) override {
        return invoke("WriteOffStock", [&] { *response = engine_->write_off_stock(*request); });
    }

    grpc::Status RecountStock(grpc::ServerContext*, const v1::RecountStock* request,
                              v1::MovementResult* response) override {
        return invoke("RecountStock", [&] { *response = engine_->recount_stock(*request); });
    }

    grpc::Status ReverseMovement(grpc::ServerContext*, const v1::ReverseMovement* request,
                                 v1::MovementResult* response) override {
        return invoke("ReverseMovement", [&] { *response = engine_->reverse_movement(*request); });
    }

    grpc::Status ArchiveProduct(grpc::ServerContext*, const v1::ArchiveProduct* request,
                                v1::ProductSnapshot* response) override {
        return invoke("ArchiveProduct", [&] { *response = engine_->archive_product(*request); });
    }

    grpc::Status GetProduct(grpc::ServerContext*, const v1::ProductKey* request,
                            v1::ProductSnapshot* response) override {
        return invoke("GetProduct", [&] { *response = engine_->get_product(key_of(*request)); });
    }

    grpc::Status GetMovements(grpc::ServerContext*, const v1::ProductKey* request,
                              v1::MovementHistory* response) override {
        return invoke("GetMovements", [&] {
            for (auto& movement : engine_->get_movements(key_of(*request))) {
                *response->add_movements() = std::move(movement);
            }
        });
    }

    grpc::Status AuditProduct(grpc::ServerContext*, const v1::ProductKey* request,
                              v1::AuditReport* response) override {
        return invoke("AuditProduct", [&] { *response = engine_->audit_product(key_of(*request)); });
    }

    grpc::Status GetReorderSuggestions(grpc::ServerContext*,
                                       const v1::ReorderSuggestionsRequest* request,
                                       v1::ReorderSuggestions* response) override {
        return invoke("GetReorderSuggestions",
                      [&] { *response = planner_->get_reorder_suggestions(*request); });
    }

    grpc::Status CalculateOptimalOrderQuantities(grpc::ServerContext*,
                                                 const v1::OrderQuantityRequest* request,
                                                 v1::OrderQuantityOptimizations* response) override {
        return invoke("CalculateOptimalOrderQuantities",
                      [&] { *response = planner_->calculate_optimal_order_quantities(*request); });
    }

    grpc::Status GeneratePurchaseRecommendations(grpc::ServerContext*,
                                                 const v1::PurchaseRecommendationsRequest* request,
                                                 v1::PurchaseRecommendations* response) override {
        return invoke("GeneratePurchaseRecommendations",
                      [&] { *response = planner_->generate_purchase_recommendations(*request); });
    }

    grpc::Status UpdateReorderParameters(grpc::ServerContext*,
                                         const v1::UpdateReorderParameters* request,
                                         v1::ProductSnapshot* response) override {
        return invoke("UpdateReorderParameters",
                      [&] { *response = planner_->update_reorder_parameters(*request); });
    }

private:
    std::shared_ptr<InventoryEngine> engine_;
    std::shared_ptr<ReorderPlanner> planner_;
};

std::unique_ptr<v1::InventoryLedger::Service> create_ledger_service(
    std::shared_ptr<InventoryEngine> engine,
    std::shared_ptr<ReorderPlanner> planner) {
    return std::make_unique<LedgerService>(std::move(engine), std::move(planner));
}

} // namespace stockledger
