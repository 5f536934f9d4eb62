#include "../include/terminal_worker.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/result_store.hpp"
#include "../include/stream_protocol.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;
using namespace std::chrono;

TerminalAgentProfile qwen_profile() {
    return {"qwen", "qwen -o stream-json --approval-mode yolo"};
}

TerminalAgentProfile claude_profile() {
    return {"claude", "claude --output-format stream-json --permission-mode acceptEdits"};
}

static const milliseconds kCompletionGrace{500};

static std::string exit_message(int code) {
    if (code > 128) return "process terminated by signal " + std::to_string(code - 128);
    return "process exited with code " + std::to_string(code);
}

TerminalAIWorker::TerminalAIWorker(std::string id,
                                   std::string type,
                                   TerminalAgentProfile profile,
                                   std::shared_ptr<ProcessRuntime> runtime,
                                   std::shared_ptr<ResultStore> store,
                                   milliseconds stop_grace)
    : Worker(std::move(id), std::move(type)),
      profile_(std::move(profile)),
      runtime_(std::move(runtime)),
      store_(std::move(store)),
      stop_grace_(stop_grace) {}

std::shared_ptr<Process> TerminalAIWorker::process() const {
    std::lock_guard<std::mutex> lock(proc_mutex_);
    return proc_;
}

void TerminalAIWorker::start() {
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (!transition_to(WorkerStatus::Starting)) return;

    std::shared_ptr<Process> proc;
    try {
        proc = runtime_->spawn_process(split_command(profile_.command));
    } catch (const SpawnError& e) {
        transition_to(WorkerStatus::Failed);
        log_error(type(), id() + ": " + e.what());
        throw;
    }
    {
        std::lock_guard<std::mutex> plock(proc_mutex_);
        proc_ = proc;
    }
    if (!transition_to(WorkerStatus::Running)) {
        // stop() won the race while we were spawning
        runtime_->terminate(*proc, milliseconds(0));
        return;
    }
    log_info(type(), id() + " started pid " + std::to_string(proc->pid()) + ": " + profile_.command);
}

void TerminalAIWorker::shutdown_process(Process& proc, milliseconds grace) {
    proc.close_stdin();
    runtime_->terminate(proc, grace);
}

WorkerResult TerminalAIWorker::run_task(const std::string& task, milliseconds timeout) {
    auto t0 = steady_clock::now();
    auto started_at = Clock::now();
    ensure_started();

    auto proc = process();
    auto deadline = t0 + timeout;
    chunks_ = 0;

    std::string content;
    std::string last_output;
    int skipped = 0;
    const char* marker = nullptr;
    bool timed_out = false;

    auto written = proc->write_stdin(task + "\n", duration_cast<milliseconds>(deadline - steady_clock::now()));
    if (written == WriteStatus::Timeout) {
        timed_out = true;
        log_warn(type(), id() + ": agent did not accept the task before the deadline");
    } else if (written == WriteStatus::Closed) {
        log_warn(type(), id() + ": agent stdin closed before the task was written");
    }

    std::string line;
    while (!timed_out) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out = true;
            break;
        }
        ReadStatus rs = proc->read_line(line, remaining);
        if (rs == ReadStatus::Timeout) {
            timed_out = true;
            break;
        }
        if (rs == ReadStatus::Eof) break;

        auto text = trim(line);
        if (text.empty()) continue;
        json chunk = json::parse(text, nullptr, false);
        if (chunk.is_discarded() || !chunk.is_object()) {
            ++skipped;
            log_debug(type(), id() + ": skipping non-JSON output: " + text.substr(0, 120));
            continue;
        }
        ++chunks_;
        marker = completion_marker(chunk);
        if (marker) break;
        auto piece = extract_content(chunk);
        if (!piece.empty()) {
            content += piece;
            last_output = piece;
        }
    }

    json meta = {
        {"ai_type", profile_.name},
        {"chunks", chunks_.load()},
        {"skipped_chunks", skipped},
        {"last_output", last_output},
        {"completion_marker", marker ? json(marker) : json(nullptr)}
    };

    WorkerStatus outcome;
    std::optional<std::string> error;
    if (marker) {
        outcome = WorkerStatus::Completed;
        // agents normally exit on EOF; stragglers get the short grace, not stop_grace_
        proc->close_stdin();
        if (!proc->wait_for(kCompletionGrace)) runtime_->terminate(*proc, kCompletionGrace);
    } else if (timed_out) {
        outcome = WorkerStatus::Timeout;
        error = "Execution timed out after " + std::to_string(timeout.count()) + "ms";
        shutdown_process(*proc, milliseconds(0));
        log_warn(type(), id() + ": task timed out");
    } else {
        proc->drain(seconds(1));
        auto code = proc->wait_for(seconds(2));
        if (!code) {
            shutdown_process(*proc, milliseconds(0));
            code = proc->try_wait();
        }
        int exit_code = code.value_or(-1);
        meta["exit_code"] = exit_code;
        if (exit_code == 0) {
            outcome = WorkerStatus::Completed;
        } else {
            outcome = WorkerStatus::Failed;
            auto err = trim(proc->stderr_text());
            error = err.empty() ? exit_message(exit_code) : err;
            log_warn(type(), id() + ": " + exit_message(exit_code));
        }
    }
    if (auto code = proc->try_wait()) {
        if (!meta.contains("exit_code")) meta["exit_code"] = *code;
    }

    auto result = finish(outcome, std::move(content), std::move(error), started_at, t0, std::move(meta));
    persist(store_.get(), result, json{{"ai_type", profile_.name}, {"task", task}});
    return result;
}

void TerminalAIWorker::stop() {
    transition_to(WorkerStatus::Stopped);
    auto proc = process();
    if (!proc) return;
    if (!proc->try_wait()) log_info(type(), id() + " stopping pid " + std::to_string(proc->pid()));
    runtime_->terminate(*proc, stop_grace_);
}

json TerminalAIWorker::progress() const {
    json j = Worker::progress();
    j["ai_type"] = profile_.name;
    j["chunks"] = chunks_.load();
    if (auto proc = process()) j["pid"] = proc->pid();
    return j;
}
