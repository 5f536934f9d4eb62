#include <csignal>
#include <iostream>
#include <memory>
#include <unistd.h>
#include "../include/config.hpp"
#include "../include/http_server.hpp"
#include "../include/log.hpp"
#include "../include/process.hpp"
#include "../include/result_store.hpp"
#include "../include/worker_manager.hpp"
#include "../include/worker_types.hpp"

static volatile std::sig_atomic_t g_stop = 0;

static void usage() {
    std::cerr << "usage: orchestrator [--port N] [--max-concurrent N] [--debug] [--debug-log PATH]\n"
                 "                    [--runtime docker|podman] [--image IMAGE]\n"
                 "                    [--store-url URL] [--store-db PATH] [--log-level LEVEL]\n";
}

int main(int argc, char** argv) {
    OrchestratorConfig config = load_config_from_env();
    try {
        apply_command_line(config, argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[orchestrator] " << e.what() << std::endl;
        usage();
        return 2;
    }
    set_log_level(parse_log_level(config.log_level));

    std::shared_ptr<ResultStore> store;
    try {
        store = make_result_store(config);
    } catch (const std::exception& e) {
        log_error("orchestrator", std::string("result store unavailable: ") + e.what());
        return 1;
    }

    auto runtime = std::make_shared<PosixProcessRuntime>();
    WorkerManager manager(make_manager_options(config, store));
    register_default_worker_types(manager, config, runtime, store);

    ApiServer server(manager);
    try {
        server.start((uint16_t)config.port);
    } catch (const std::exception& e) {
        log_error("orchestrator", e.what());
        return 1;
    }

    std::signal(SIGINT, [](int){ g_stop = 1; });
    std::signal(SIGTERM, [](int){ g_stop = 1; });
    while (!g_stop) pause();

    log_info("orchestrator", "shutting down");
    server.stop();
    manager.close_all();
    return 0;
}
