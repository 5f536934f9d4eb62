#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "process.hpp"
#include "worker.hpp"

class ResultStore;

struct TerminalAgentProfile {
    std::string name;    // ai_type reported in metadata
    std::string command; // argv template, split on whitespace
};

TerminalAgentProfile qwen_profile();
TerminalAgentProfile claude_profile();

// Drives an interactive agent CLI that reads tasks on stdin and streams JSON
// chunks on stdout.
class TerminalAIWorker : public Worker {
public:
    TerminalAIWorker(std::string id,
                     std::string type,
                     TerminalAgentProfile profile,
                     std::shared_ptr<ProcessRuntime> runtime,
                     std::shared_ptr<ResultStore> store = nullptr,
                     std::chrono::milliseconds stop_grace = std::chrono::seconds(5));

    void start() override;
    void stop() override;
    nlohmann::json progress() const override;

    const TerminalAgentProfile& profile() const { return profile_; }

protected:
    WorkerResult run_task(const std::string& task, std::chrono::milliseconds timeout) override;

private:
    std::shared_ptr<Process> process() const;
    void shutdown_process(Process& proc, std::chrono::milliseconds grace);

    TerminalAgentProfile profile_;
    std::shared_ptr<ProcessRuntime> runtime_;
    std::shared_ptr<ResultStore> store_;
    std::chrono::milliseconds stop_grace_;

    std::mutex start_mutex_;
    mutable std::mutex proc_mutex_;
    std::shared_ptr<Process> proc_;
    std::atomic<int> chunks_{0};
};
