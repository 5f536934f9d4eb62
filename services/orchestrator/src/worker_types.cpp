#include "../include/worker_types.hpp"
#include "../include/container_worker.hpp"
#include "../include/debug_monitor.hpp"
#include "../include/log.hpp"
#include "../include/result_store.hpp"
#include "../include/terminal_worker.hpp"
#include "../include/util.hpp"

std::shared_ptr<ResultStore> make_result_store(const OrchestratorConfig& config) {
    if (!config.store_db.empty()) {
        log_info("orchestrator", "storing results in " + config.store_db);
        return std::make_shared<SqliteResultStore>(config.store_db);
    }
    if (!config.store_url.empty()) {
        log_info("orchestrator", "forwarding results to " + config.store_url);
        return std::make_shared<HttpResultStore>(config.store_url);
    }
    return nullptr;
}

static DebugMonitorConfig debug_monitor_config(const OrchestratorConfig& config) {
    DebugMonitorConfig dc;
    dc.log_path = config.debug_log;
    return dc;
}

ManagerOptions make_manager_options(const OrchestratorConfig& config,
                                    std::shared_ptr<ResultStore> store,
                                    std::shared_ptr<TerminalCapture> capture) {
    ManagerOptions opts;
    opts.max_concurrent = config.max_concurrent;
    opts.debug_mode = config.debug;
    auto dc = debug_monitor_config(config);
    opts.debug_monitor_factory = [dc, store, capture]() -> std::shared_ptr<Worker> {
        return std::make_shared<DebugMonitorWorker>(gen_id("debug-monitor-"), "debug-monitor", dc, capture, store);
    };
    return opts;
}

void register_default_worker_types(WorkerManager& manager,
                                   const OrchestratorConfig& config,
                                   std::shared_ptr<ProcessRuntime> runtime,
                                   std::shared_ptr<ResultStore> store,
                                   std::shared_ptr<TerminalCapture> capture) {
    auto grace = std::chrono::milliseconds(config.stop_grace_ms);

    auto terminal = [&](const std::string& type, TerminalAgentProfile profile) {
        manager.register_type(type, [type, profile, runtime, store, grace](const std::string& id) {
            return std::make_shared<TerminalAIWorker>(id, type, profile, runtime, store, grace);
        });
    };
    terminal("terminal-qwen", {"qwen", config.qwen_command});
    terminal("terminal-claude", {"claude", config.claude_command});

    ContainerConfig cc;
    cc.runtime = config.container_runtime;
    cc.image = config.container_image;
    auto container = [cc, runtime, store](const std::string& id) {
        return std::make_shared<ContainerWorker>(id, "container-executor", cc, runtime, store);
    };
    manager.register_type("container-executor", container);
    manager.register_type("container", container);

    auto dc = debug_monitor_config(config);
    manager.register_type("debug-monitor", [dc, store, capture](const std::string& id) {
        return std::make_shared<DebugMonitorWorker>(id, "debug-monitor", dc, capture, store);
    });
}
