#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "concurrency_gate.hpp"
#include "worker.hpp"

using WorkerFactory = std::function<std::shared_ptr<Worker>(const std::string& worker_id)>;

struct ManagerOptions {
    int max_concurrent{10};
    bool debug_mode{false};
    // Builds the monitor launched on first spawn when debug_mode is set.
    std::function<std::shared_ptr<Worker>()> debug_monitor_factory;
};

struct WorkerInfo {
    std::string worker_id;
    std::string worker_type;
    WorkerStatus status;
};

class WorkerManager;

// Endless status feed; next() blocks for the interval between snapshots.
class MonitorStream {
public:
    std::map<std::string, WorkerStatus> next();

private:
    friend class WorkerManager;
    MonitorStream(const WorkerManager& manager, std::vector<std::string> ids,
                  std::chrono::milliseconds interval);

    const WorkerManager& manager_;
    std::vector<std::string> ids_;
    std::chrono::milliseconds interval_;
    bool first_{true};
};

class WorkerManager {
public:
    explicit WorkerManager(ManagerOptions options = {});
    ~WorkerManager();

    WorkerManager(const WorkerManager&) = delete;
    WorkerManager& operator=(const WorkerManager&) = delete;

    void register_type(const std::string& name, WorkerFactory factory);
    std::vector<std::string> worker_types() const;

    std::vector<std::string> spawn(const std::string& worker_type, int count = 1);

    // Usage errors (including WorkerBusy) propagate before a gate slot is
    // awaited; every other failure comes back as a FAILED result.
    WorkerResult execute(const std::string& worker_id,
                         const std::string& task,
                         std::chrono::milliseconds timeout = std::chrono::seconds(300));

    // Results in input order; one element failing never aborts the rest.
    std::vector<WorkerResult> execute_batch(const std::vector<std::string>& worker_ids,
                                            const std::vector<std::string>& tasks,
                                            std::chrono::milliseconds timeout = std::chrono::seconds(300));

    MonitorStream monitor(std::vector<std::string> worker_ids = {},
                          std::chrono::milliseconds interval = std::chrono::seconds(1)) const;
    // Empty ids means every registered worker; unknown ids are omitted.
    std::map<std::string, WorkerStatus> snapshot(const std::vector<std::string>& worker_ids = {}) const;

    void close(const std::string& worker_id);
    std::size_t close_all();

    std::vector<WorkerInfo> list_workers() const;
    std::map<std::string, WorkerResult> collect_results(const std::vector<std::string>& worker_ids = {}) const;
    nlohmann::json health() const;

    std::shared_ptr<Worker> find(const std::string& worker_id) const;
    std::shared_ptr<Worker> debug_monitor() const;
    std::size_t capacity() const { return gate_.capacity(); }
    std::size_t active_count() const;

private:
    std::shared_ptr<Worker> require(const std::string& worker_id) const;
    std::vector<std::shared_ptr<Worker>> select(const std::vector<std::string>& worker_ids) const;
    WorkerResult run_on(const std::shared_ptr<Worker>& worker, const std::string& task,
                        std::chrono::milliseconds timeout);
    void ensure_debug_monitor();

    ManagerOptions options_;
    mutable ConcurrencyGate gate_;

    mutable std::mutex types_mutex_;
    std::map<std::string, WorkerFactory> factories_;

    mutable std::mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<Worker>> workers_;
    std::vector<std::string> order_; // spawn order for listings
    std::shared_ptr<Worker> debug_monitor_;
};

// FAILED result for a task that raised instead of producing an outcome.
WorkerResult failed_result(const std::string& worker_id, const std::string& error,
                           const std::string& exception_kind, TimePoint started_at,
                           std::chrono::steady_clock::time_point t0);
