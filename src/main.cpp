/*
 * Confrun - Remote conformance test execution
 * Accepts a program over HTTP, runs the conformance tool on it under a
 * deadline and returns the tool's result as JSON.
 */

#include "config.h"
#include "http_server.h"
#include "invoker.h"
#include "run_service.h"
#include <iostream>
#include <thread>
#include <stdexcept>
#include <pthread.h>
#include <signal.h>

using namespace confrun;

int main(int argc, char* argv[]) {
    ServiceConfig config;
    try {
        config = ServiceConfig::from_environment();
        if (!config.apply_args(argc, argv)) {
            std::cout << ServiceConfig::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        std::cerr << ServiceConfig::usage(argv[0]);
        return 1;
    }

    // Writes to closed client sockets must not kill the daemon
    signal(SIGPIPE, SIG_IGN);

    // SIGINT/SIGTERM are delivered to a dedicated thread that stops the server
    sigset_t stop_signals;
    sigemptyset(&stop_signals);
    sigaddset(&stop_signals, SIGINT);
    sigaddset(&stop_signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

    std::cout << "🏃 Confrun - Remote Conformance Test Execution" << std::endl;
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "Runner:          " << config.runner.runner_path << std::endl;
    std::cout << "Plugin:          " << config.runner.plugin_path << std::endl;
    std::cout << "Include dir:     " << config.runner.include_dir << std::endl;
    std::cout << "CPU version:     " << config.runner.cpu_version << std::endl;
    std::cout << "Exclude regex:   " << config.runner.exclude_regex << std::endl;
    std::cout << "Staging dir:     " << config.resolved_staging_dir() << std::endl;
    std::cout << "Timeout:         " << config.default_timeout << "s default, ";
    if (config.max_timeout > 0) {
        std::cout << config.max_timeout << "s max" << std::endl;
    } else {
        std::cout << "no cap" << std::endl;
    }
    std::cout << "------------------------------------------------" << std::endl;
    std::cout << "API Endpoints:" << std::endl;
    std::cout << "  POST /run     - Run a conformance test program" << std::endl;
    std::cout << "  GET  /health  - Liveness check" << std::endl;
    std::cout << std::endl;

    ConformanceInvoker invoker(config.runner);
    RunService service(invoker, config.resolved_staging_dir(),
                       config.default_timeout, config.max_timeout);

    HttpServer server(config.host, config.port);
    service.register_routes(server);

    std::thread signal_thread([&server, stop_signals]() {
        int sig = 0;
        if (sigwait(&stop_signals, &sig) == 0) {
            std::cout << "Received signal " << sig << ", shutting down" << std::endl;
        }
        server.stop();
    });

    int exit_code = 0;
    try {
        // Blocks until stop()
        server.start();
    } catch (const std::exception& e) {
        std::cerr << "❌ " << e.what() << std::endl;
        exit_code = 1;
        // Release the signal thread
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }

    signal_thread.join();
    return exit_code;
}
