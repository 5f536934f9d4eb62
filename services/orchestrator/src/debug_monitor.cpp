#include "../include/debug_monitor.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/result_store.hpp"
#include "../include/util.hpp"

using json = nlohmann::json;

DebugMonitorWorker::DebugMonitorWorker(std::string id,
                                       std::string type,
                                       DebugMonitorConfig config,
                                       std::shared_ptr<TerminalCapture> capture,
                                       std::shared_ptr<ResultStore> store)
    : Worker(std::move(id), std::move(type)),
      config_(std::move(config)),
      capture_(std::move(capture)),
      store_(std::move(store)) {
    session_id_ = config_.session_id.empty() ? gen_id("debug_") : config_.session_id;
}

DebugMonitorWorker::~DebugMonitorWorker() {
    stop();
}

void DebugMonitorWorker::start() {
    std::lock_guard<std::mutex> tlock(thread_mutex_);
    if (!transition_to(WorkerStatus::Starting)) return;
    transition_to(WorkerStatus::Running);
    thread_ = std::thread([this]{ run(); });
    log_info(type(), id() + " monitoring " + config_.log_path.string() + " (" +
             (forwarding() ? "forwarding session " + session_id_ : std::string("local only")) + ")");
}

static const char* kPassive = "debug monitor is passive and does not execute tasks";

void DebugMonitorWorker::validate_task(const std::string&) const {
    throw UnsupportedOperation(kPassive);
}

WorkerResult DebugMonitorWorker::run_task(const std::string&, std::chrono::milliseconds) {
    throw UnsupportedOperation(kPassive);
}

void DebugMonitorWorker::stop() {
    transition_to(WorkerStatus::Stopped);
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cv_.notify_all();
    std::lock_guard<std::mutex> tlock(thread_mutex_);
    if (thread_.joinable()) {
        thread_.join();
        log_info(type(), id() + " stopped");
    }
}

void DebugMonitorWorker::run() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        lock.unlock();
        try {
            capture_once();
        } catch (const std::exception& e) {
            log_warn(type(), id() + ": capture failed: " + e.what());
        }
        lock.lock();
        cv_.wait_for(lock, config_.interval, [&]{ return stopping_; });
    }
}

void DebugMonitorWorker::capture_once() {
    std::string text = forwarding() ? capture_->capture(session_id_, config_.capture_lines)
                                    : tail_lines(config_.log_path, config_.capture_lines);
    if (trim(text).empty()) return;

    auto digest = sha1_hex(text);
    std::size_t sequence = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (digest == last_digest_) return;
        last_digest_ = digest;
        sequence = forwarded_;
        if (!forwarding()) {
            captures_.push_back({Clock::now(), digest, text});
            while (captures_.size() > config_.max_local_captures) captures_.pop_front();
            return;
        }
    }

    json meta = {
        {"type", "debug_log"},
        {"source", "orchestrator_debug_monitor"},
        {"log_path", config_.log_path.string()},
        {"session_id", session_id_},
        {"sequence", sequence},
        {"digest", digest}
    };
    auto now = Clock::now();
    WorkerResult snapshot(id(), WorkerStatus::Running, text, std::nullopt, now, std::nullopt, 0.0, meta);
    store_->store(id(), snapshot, meta);

    std::lock_guard<std::mutex> lock(mtx_);
    if (++forwarded_ % 60 == 0) {
        log_debug(type(), "forwarded " + std::to_string(forwarded_) + " captures for " + session_id_);
    }
}

std::vector<DebugCapture> DebugMonitorWorker::recent_captures() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return {captures_.begin(), captures_.end()};
}

std::size_t DebugMonitorWorker::forwarded_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return forwarded_;
}

json DebugMonitorWorker::progress() const {
    json j = Worker::progress();
    j["session_id"] = session_id_;
    j["log_path"] = config_.log_path.string();
    j["mode"] = forwarding() ? "forwarding" : "local";
    std::lock_guard<std::mutex> lock(mtx_);
    j["captures"] = captures_.size();
    j["forwarded"] = forwarded_;
    return j;
}
