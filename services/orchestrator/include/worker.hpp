#pragma once
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/orchestrator_sdk/include/worker_result.hpp"

class ResultStore;

// Contract shared by every worker flavor. A worker runs at most one task at a
// time; its status only moves forward and never leaves an end state.
class Worker {
public:
    Worker(std::string id, std::string type);
    virtual ~Worker() = default;

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    const std::string& id() const { return id_; }
    const std::string& type() const { return type_; }

    // Single-flight slot for one task. Taking it runs every structural check
    // (task validation, WorkerBusy, WorkerUnavailable) without touching the
    // underlying process or container.
    class TaskClaim {
    public:
        ~TaskClaim();
        TaskClaim(const TaskClaim&) = delete;
        TaskClaim& operator=(const TaskClaim&) = delete;
        const Worker& owner() const { return w_; }
    private:
        friend class Worker;
        explicit TaskClaim(Worker& w);
        Worker& w_;
    };

    TaskClaim claim(const std::string& task);

    virtual void start() = 0;
    WorkerResult execute(const std::string& task, std::chrono::milliseconds timeout);
    // Runs under a claim taken earlier from this worker.
    WorkerResult execute(const TaskClaim& claim, const std::string& task, std::chrono::milliseconds timeout);
    // Idempotent; safe before start() and after a previous stop().
    virtual void stop() = 0;
    virtual WorkerStatus get_status() const;

    virtual nlohmann::json progress() const;
    nlohmann::json health() const;
    bool busy() const { return in_flight_.load(); }
    std::optional<WorkerResult> last_result() const;

protected:
    // Throws a UsageError when the task can never run on this worker.
    virtual void validate_task(const std::string& task) const;
    // Called with the claim held.
    virtual WorkerResult run_task(const std::string& task, std::chrono::milliseconds timeout) = 0;

    // False when the move is not strictly forward (including out of an end state).
    bool transition_to(WorkerStatus next);

    // Throws WorkerUnavailable unless the worker can take a task, starting it if still pending.
    void ensure_started();

    // Applies the outcome to the worker status and records the result. If the
    // worker reached an end state meanwhile (stopped concurrently), that state wins.
    WorkerResult finish(WorkerStatus outcome,
                        std::string content,
                        std::optional<std::string> error,
                        TimePoint started_at,
                        std::chrono::steady_clock::time_point t0,
                        nlohmann::json metadata);

    // Best effort: failures are logged and swallowed.
    void persist(ResultStore* store, const WorkerResult& result, const nlohmann::json& metadata) const;

private:
    std::string id_;
    std::string type_;
    mutable std::mutex mutex_;
    WorkerStatus status_{WorkerStatus::Pending};
    std::atomic<bool> in_flight_{false};
    std::optional<WorkerResult> last_result_;
};
