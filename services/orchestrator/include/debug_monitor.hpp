#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "worker.hpp"

class ResultStore;

// Terminal-introspection collaborator: returns the last `lines` of a session's screen.
class TerminalCapture {
public:
    virtual ~TerminalCapture() = default;
    virtual std::string capture(const std::string& session_id, int lines) = 0;
};

struct DebugMonitorConfig {
    std::filesystem::path log_path{"./logs/orchestrator-debug.log"};
    std::string session_id;
    std::chrono::milliseconds interval{std::chrono::seconds(1)};
    int capture_lines{100};
    std::size_t max_local_captures{100};
};

struct DebugCapture {
    TimePoint captured_at;
    std::string digest; // sha1 of text
    std::string text;
};

// Passive observer. With both a capture and a store collaborator it forwards
// changed session screens to the store; otherwise it tails the debug log and
// keeps the recent captures in memory.
class DebugMonitorWorker : public Worker {
public:
    DebugMonitorWorker(std::string id,
                       std::string type,
                       DebugMonitorConfig config,
                       std::shared_ptr<TerminalCapture> capture = nullptr,
                       std::shared_ptr<ResultStore> store = nullptr);
    ~DebugMonitorWorker() override;

    void start() override;
    void stop() override;
    nlohmann::json progress() const override;

    bool forwarding() const { return capture_ && store_; }
    const std::string& session_id() const { return session_id_; }
    std::vector<DebugCapture> recent_captures() const;
    std::size_t forwarded_count() const;

protected:
    void validate_task(const std::string& task) const override;
    WorkerResult run_task(const std::string& task, std::chrono::milliseconds timeout) override;

private:
    void run();
    void capture_once();

    DebugMonitorConfig config_;
    std::shared_ptr<TerminalCapture> capture_;
    std::shared_ptr<ResultStore> store_;
    std::string session_id_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stopping_{false};
    std::deque<DebugCapture> captures_;
    std::string last_digest_;
    std::size_t forwarded_{0};

    std::mutex thread_mutex_;
    std::thread thread_;
};
