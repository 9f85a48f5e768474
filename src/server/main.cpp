#include "ledger_service.hpp"
#include "stockledger/config.hpp"
#include "stockledger/errors.hpp"
#include "stockledger/logging.hpp"
#include "stockledger/memory_store.hpp"
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <memory>
#include <string>

int main(int argc, char** argv) {
    stockledger::LedgerConfig config;
    try {
        config = stockledger::LedgerConfig::from_env();
        if (argc > 1) {
            config.port = std::stoi(argv[1]);
            config.validate();
        }
    } catch (const std::exception& e) {
        stockledger::log_error("server", "invalid_configuration", {{"error", e.what()}});
        return 1;
    }

    std::string server_address = "0.0.0.0:" + std::to_string(config.port);

    grpc::EnableDefaultHealthCheckService(true);

    auto store = std::make_shared<stockledger::MemoryStore>(config.lock_stripes);
    auto engine = std::make_shared<stockledger::InventoryEngine>(store, config);
    auto planner = std::make_shared<stockledger::ReorderPlanner>(store, config);
    auto service = stockledger::create_ledger_service(engine, planner);

    grpc::ServerBuilder builder;
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
        stockledger::log_error("server", "server_start_failed", {{"address", server_address}});
        return 1;
    }

    stockledger::log_info("server", "stock_ledger_server_started",
                          {{"port", config.port}, {"default_location", config.default_location}});

    server->Wait();

    return 0;
}
