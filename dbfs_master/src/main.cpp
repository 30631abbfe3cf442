#include <iostream>
#include <memory>
#include <string>
#include <signal.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include "dbfs_master/config.hpp"
#include "dbfs_master/dbfs_service.hpp"
#include "dbfs_master/facade.hpp"
#include "dbfs_master/fs_context.hpp"

using grpc::Server;
using grpc::ServerBuilder;

static std::unique_ptr<Server> g_server;

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down server..." << std::endl;
        if (g_server) {
            g_server->Shutdown();
        }
    }
}

// ============================================================================
// Helper: Print server configuration and status
// ============================================================================
void PrintServerInfo(const dbfs_master::FsConfig& config) {
    std::cout << "========================================" << std::endl;
    std::cout << "  DBFS Master Server Starting" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Host: " << config.host << std::endl;
    std::cout << "Port: " << config.port << std::endl;
    std::cout << "Data Dir: " << config.data_dir << std::endl;
    std::cout << "Record Store: " << dbfs_master::RecordBackendName(config.records) << std::endl;
    std::cout << "Sync: " << (config.sync ? "true" : "false") << std::endl;
    std::cout << "Cache Enabled: " << (config.cache_enabled ? "true" : "false") << std::endl;
    std::cout << "Cache Bytes: " << config.cache_bytes << std::endl;
    std::cout << "Compact Threshold: " << config.compact_threshold << std::endl;
    std::cout << "System Owner: " << config.system_owner << std::endl;
    std::cout << "Admin RPCs: " << (config.admin_token.empty() ? "disabled" : "enabled")
              << std::endl;
    std::cout << "========================================" << std::endl;
}

// ============================================================================
// Main: gRPC Server Initialization and Startup
// ============================================================================
int main(int argc, char* argv[]) {
    dbfs_master::FsConfig config;
    dbfs_common::Status parsed = dbfs_master::ParseArgs(argc, argv, config);
    if (!parsed.ok()) {
        std::cerr << parsed.ToString() << std::endl;
        dbfs_master::PrintUsage(std::cerr);
        return 1;
    }
    if (config.show_help) {
        dbfs_master::PrintUsage(std::cout);
        return 0;
    }
    PrintServerInfo(config);

    // ========================================================================
    // 1. Open the filesystem (record store, content store, tree)
    // ========================================================================
    auto context = dbfs_master::FsContext::Create(config);
    if (!context.ok()) {
        std::cerr << "Failed to open filesystem: " << context.status().ToString() << std::endl;
        return 1;
    }

    // ========================================================================
    // 2. Create the facade and the DbfsService implementation
    // ========================================================================
    auto facade = std::make_shared<dbfs_master::FilesystemFacade>(context.value());
    auto service = std::make_unique<dbfs_master::DbfsServiceImpl>(facade, config.admin_token);

    // ========================================================================
    // 3. Setup gRPC Server with Health Check
    // ========================================================================
    grpc::EnableDefaultHealthCheckService(true);
    grpc::reflection::InitProtoReflectionServerBuilderPlugin();

    ServerBuilder builder;
    std::string server_address = config.host + ":" + std::to_string(config.port);
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    // ========================================================================
    // 4. Build and start the server
    // ========================================================================
    g_server = builder.BuildAndStart();
    if (!g_server) {
        std::cerr << "Failed to build and start gRPC server!" << std::endl;
        return 1;
    }

    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    std::cout << std::endl;
    std::cout << "✓ gRPC Server listening on " << server_address << std::endl;
    std::cout << "✓ Press Ctrl+C to shutdown..." << std::endl;
    std::cout << std::endl;

    // ========================================================================
    // 5. Wait for server shutdown (blocking call)
    // ========================================================================
    g_server->Wait();
    g_server.reset();

    std::cout << "gRPC Server shutdown gracefully." << std::endl;
    return 0;
}
