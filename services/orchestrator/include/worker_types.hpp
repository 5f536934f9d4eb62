#pragma once
#include <memory>
#include "config.hpp"
#include "worker_manager.hpp"

class ProcessRuntime;
class ResultStore;
class TerminalCapture;

// SQLite when ORCH_STORE_DB is set, else HTTP when ORCH_STORE_URL is set, else none.
std::shared_ptr<ResultStore> make_result_store(const OrchestratorConfig& config);

ManagerOptions make_manager_options(const OrchestratorConfig& config,
                                    std::shared_ptr<ResultStore> store,
                                    std::shared_ptr<TerminalCapture> capture = nullptr);

// terminal-qwen, terminal-claude, container-executor (alias container), debug-monitor.
void register_default_worker_types(WorkerManager& manager,
                                   const OrchestratorConfig& config,
                                   std::shared_ptr<ProcessRuntime> runtime,
                                   std::shared_ptr<ResultStore> store,
                                   std::shared_ptr<TerminalCapture> capture = nullptr);
