#include "../include/container_worker.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/result_store.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <future>
#include <sstream>

using json = nlohmann::json;
using namespace std::chrono;

std::vector<std::string> default_allowed_commands() {
    return {"python", "pip", "npm", "node", "ls", "cat", "echo",
            "grep", "find", "head", "tail", "wc", "pwd", "cd",
            "mkdir", "touch", "rm", "cp", "mv", "sort", "uniq",
            "cut", "awk", "sed", "git", "pytest", "black"};
}

const std::vector<std::string>& dangerous_command_patterns() {
    static const std::vector<std::string> patterns = {
        "rm -rf /", "mkfs", "dd if=", "> /dev/sd",
        "chmod 000", "chown root:", "curl | sh", "wget | sh",
        "&& rm", "; rm", "| rm", "nc -e", "ncat",
        "/dev/tcp", "/dev/udp", "bind shell", "reverse shell"
    };
    return patterns;
}

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

void validate_container_command(const std::string& command, const ContainerConfig& config) {
    auto trimmed = trim(command);
    if (trimmed.empty()) throw InvalidArgument("command must not be empty");
    if (command.size() > config.max_command_length) {
        throw InvalidArgument("command too long: " + std::to_string(command.size()) + " > " +
                              std::to_string(config.max_command_length) + " characters");
    }
    auto lower = to_lower(command);
    for (const auto& p : dangerous_command_patterns()) {
        if (lower.find(p) != std::string::npos) {
            throw InvalidArgument("command contains forbidden pattern '" + p + "'");
        }
    }
    std::string first;
    std::istringstream(trimmed) >> first;
    const auto& allowed = config.allowed_commands;
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), first) == allowed.end()) {
        throw InvalidArgument("command '" + first + "' is not in the allowed list");
    }
}

ContainerWorker::ContainerWorker(std::string id,
                                 std::string type,
                                 ContainerConfig config,
                                 std::shared_ptr<ProcessRuntime> runtime,
                                 std::shared_ptr<ResultStore> store)
    : Worker(std::move(id), std::move(type)),
      config_(std::move(config)),
      runtime_(std::move(runtime)),
      store_(std::move(store)) {}

std::string ContainerWorker::container_id() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return container_id_;
}

void ContainerWorker::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (!transition_to(WorkerStatus::Starting)) return;

    CommandOutput out;
    try {
        out = run_command(*runtime_,
                          {config_.runtime, "run", "-d", "--rm", config_.image, "sleep", "infinity"},
                          config_.start_timeout);
    } catch (const SpawnError& e) {
        transition_to(WorkerStatus::Failed);
        log_error(type(), id() + ": " + e.what());
        throw ContainerStartError(std::string("cannot launch container runtime: ") + e.what());
    }

    // `run -d` prints the id as its last stdout line
    auto text = trim(out.out);
    auto nl = text.find_last_of('\n');
    std::string cid = trim(nl == std::string::npos ? text : text.substr(nl + 1));
    if (out.timed_out || out.exit_code != 0 || cid.empty()) {
        transition_to(WorkerStatus::Failed);
        std::string msg = "failed to start container from " + config_.image;
        if (out.timed_out) msg += ": timed out";
        else if (out.exit_code != 0) msg += " (exit " + std::to_string(out.exit_code) + ")";
        else msg += ": runtime returned no container id";
        auto err = trim(out.err);
        if (!err.empty()) msg += ": " + err;
        log_error(type(), id() + ": " + msg);
        throw ContainerStartError(msg);
    }

    {
        std::lock_guard<std::mutex> clock(mtx_);
        container_id_ = cid;
    }
    if (!transition_to(WorkerStatus::Running)) {
        // stopped while the container was coming up
        stop();
        return;
    }
    log_info(type(), id() + " started container " + cid.substr(0, 12) + " (" + config_.image + ")");
}

void ContainerWorker::validate_task(const std::string& command) const {
    validate_container_command(command, config_);
}

WorkerResult ContainerWorker::run_task(const std::string& command, milliseconds timeout) {
    auto t0 = steady_clock::now();
    auto started_at = Clock::now();
    ensure_started();

    ContainerRef ref{config_.runtime, container_id()};
    auto proc = runtime_->exec_in_container(ref, command);
    proc->close_stdin();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        exec_proc_ = proc;
    }

    // The watcher's exit is the completion signal; output is only collected.
    auto watcher = std::async(std::launch::async, [proc]() {
        proc->drain();
        for (;;) {
            if (auto code = proc->wait_for(seconds(1))) return *code;
        }
    });

    json meta = {
        {"runtime", config_.runtime},
        {"image", config_.image},
        {"command", command},
        {"container_id", ref.id}
    };

    WorkerStatus outcome;
    std::optional<std::string> error;
    auto remaining = duration_cast<milliseconds>(t0 + timeout - steady_clock::now());
    if (watcher.wait_for(std::max(remaining, milliseconds(0))) == std::future_status::ready) {
        int code = watcher.get();
        meta["exit_code"] = code;
        if (code == 0) {
            outcome = WorkerStatus::Completed;
        } else {
            outcome = WorkerStatus::Failed;
            auto err = trim(proc->stderr_text());
            error = err.empty() ? "command exited with code " + std::to_string(code) : err;
        }
    } else {
        outcome = WorkerStatus::Timeout;
        error = "Execution timed out after " + std::to_string(timeout.count()) + "ms";
        log_warn(type(), id() + ": exec timed out; killing");
        runtime_->terminate(*proc, milliseconds(0));
        meta["exit_code"] = watcher.get();
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        exec_proc_.reset();
    }

    auto result = finish(outcome, proc->take_stdout(), std::move(error), started_at, t0, std::move(meta));
    release_container();
    persist(store_.get(), result, json{{"command", command}, {"container_id", ref.id}});
    return result;
}

void ContainerWorker::stop() {
    transition_to(WorkerStatus::Stopped);

    std::string cid;
    std::shared_ptr<Process> exec_proc;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cid.swap(container_id_);
        exec_proc = exec_proc_;
    }
    if (exec_proc) runtime_->terminate(*exec_proc, milliseconds(0));
    discard(cid, false);
}

void ContainerWorker::release_container() {
    std::string cid;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        cid.swap(container_id_);
    }
    discard(cid, true);
}

void ContainerWorker::discard(const std::string& cid, bool force) {
    if (cid.empty()) return;
    std::vector<std::string> argv = force ? std::vector<std::string>{config_.runtime, "rm", "-f", cid}
                                          : std::vector<std::string>{config_.runtime, "stop", cid};
    const char* verb = force ? "remove" : "stop";
    try {
        auto out = run_command(*runtime_, argv, config_.stop_timeout);
        if (out.timed_out || out.exit_code != 0) {
            log_warn(type(), id() + ": " + verb + " " + cid.substr(0, 12) + " failed: " + trim(out.err));
        } else {
            log_info(type(), id() + ": " + verb + " container " + cid.substr(0, 12) + " done");
        }
    } catch (const std::exception& e) {
        log_warn(type(), id() + ": " + verb + " " + cid.substr(0, 12) + " failed: " + e.what());
    }
}

json ContainerWorker::progress() const {
    json j = Worker::progress();
    auto cid = container_id();
    j["container_id"] = cid.empty() ? json(nullptr) : json(cid);
    j["runtime"] = config_.runtime;
    j["image"] = config_.image;
    return j;
}
