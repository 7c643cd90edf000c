#include <csignal>
#include <memory>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include "src/server/compile_service.h"
#include "src/server/compiler_service_impl.h"
#include "src/server/config.h"
#include "src/server/logger.h"

using grpc::Server;
using grpc::ServerBuilder;
using zxcompile::CompilerServiceImpl;
using zxcompile::CompileService;
using zxcompile::ConfigError;
using zxcompile::Logger;
using zxcompile::ServiceConfig;

namespace {

// Blocks SIGINT/SIGTERM in every thread; a dedicated thread picks them up with
// sigwait and shuts the server down.
sigset_t BlockShutdownSignals() {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

} // namespace

int RunServer(const ServiceConfig& config) {
    sigset_t signals = BlockShutdownSignals();

    CompileService compile_service(config);
    CompilerServiceImpl service(compile_service);
    compile_service.Start();

    ServerBuilder builder;
    int selected_port = 0;
    builder.AddListeningPort(config.listen_address, grpc::InsecureServerCredentials(), &selected_port);
    builder.RegisterService(&service);
    std::unique_ptr<Server> server(builder.BuildAndStart());
    if (!server || selected_port == 0) {
        Logger::Error("Failed to listen on ", config.listen_address);
        compile_service.Stop();
        return 1;
    }
    Logger::Info("Server listening on ", config.listen_address, " (compiler: ",
                 config.compiler.executable, ", job timeout ", config.compiler.job_timeout.count(),
                 "s, monitor kill age ", config.monitor.max_age.count(), "s)");

    std::thread signal_thread([&server, signals]() {
        int received = 0;
        sigwait(&signals, &received);
        Logger::Info("Received signal ", received, ", shutting down");
        server->Shutdown();
    });

    server->Wait();
    signal_thread.join();
    compile_service.Stop();
    return 0;
}

int main() {
    ServiceConfig config;
    try {
        config = ServiceConfig::FromEnvironment();
    } catch (const ConfigError& e) {
        Logger::Error("Invalid configuration: ", e.what());
        return 2;
    }
    if (!Logger::SetLevel(config.log_level)) {
        Logger::Warn("Unknown log level '", config.log_level, "', using info");
    }
    return RunServer(config);
}
