#pragma once
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "process.hpp"
#include "worker.hpp"

class ResultStore;

std::vector<std::string> default_allowed_commands();
const std::vector<std::string>& dangerous_command_patterns();

struct ContainerConfig {
    std::string runtime{"docker"};
    std::string image{"python:3.13-slim"};
    // First word of every command must be listed; an empty list allows any.
    std::vector<std::string> allowed_commands = default_allowed_commands();
    std::size_t max_command_length{10000};
    std::chrono::milliseconds start_timeout{std::chrono::seconds(120)};
    std::chrono::milliseconds stop_timeout{std::chrono::seconds(30)};
};

// Throws InvalidArgument describing the first rule the command breaks.
void validate_container_command(const std::string& command, const ContainerConfig& config);

// One container per worker, started on first use. The task runs as a `sh -c`
// exec inside it; once the task ends the container is force-removed, and
// stop() before that stops it through the runtime CLI.
class ContainerWorker : public Worker {
public:
    ContainerWorker(std::string id,
                    std::string type,
                    ContainerConfig config,
                    std::shared_ptr<ProcessRuntime> runtime,
                    std::shared_ptr<ResultStore> store = nullptr);

    void start() override;
    void stop() override;
    nlohmann::json progress() const override;

    std::string container_id() const;
    const ContainerConfig& config() const { return config_; }

protected:
    void validate_task(const std::string& command) const override;
    WorkerResult run_task(const std::string& command, std::chrono::milliseconds timeout) override;

private:
    // Takes the container id so a concurrent stop() does not repeat the call.
    void release_container();
    void discard(const std::string& cid, bool force);

    ContainerConfig config_;
    std::shared_ptr<ProcessRuntime> runtime_;
    std::shared_ptr<ResultStore> store_;

    std::mutex start_mutex_;
    mutable std::mutex mtx_;
    std::string container_id_;
    std::shared_ptr<Process> exec_proc_;
};
