#include "../include/worker.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/result_store.hpp"

using json = nlohmann::json;

static int status_rank(WorkerStatus s) {
    switch (s) {
        case WorkerStatus::Pending: return 0;
        case WorkerStatus::Starting: return 1;
        case WorkerStatus::Running: return 2;
        default: return 3;
    }
}

Worker::Worker(std::string id, std::string type) : id_(std::move(id)), type_(std::move(type)) {}

WorkerStatus Worker::get_status() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return status_;
}

bool Worker::transition_to(WorkerStatus next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_terminal(status_) || status_rank(next) <= status_rank(status_)) return false;
    log_debug(type_, id_ + ": " + to_string(status_) + " -> " + to_string(next));
    status_ = next;
    return true;
}

json Worker::progress() const {
    json j = {
        {"worker_id", id_},
        {"worker_type", type_},
        {"status", to_string(get_status())},
        {"busy", busy()}
    };
    if (auto r = last_result()) j["duration_seconds"] = r->duration_seconds();
    return j;
}

json Worker::health() const {
    auto s = get_status();
    return json{
        {"healthy", s == WorkerStatus::Pending || s == WorkerStatus::Running},
        {"status", to_string(s)},
        {"worker_type", type_},
        {"details", json::object()}
    };
}

std::optional<WorkerResult> Worker::last_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_result_;
}

Worker::TaskClaim::TaskClaim(Worker& w) : w_(w) {
    bool expected = false;
    if (!w_.in_flight_.compare_exchange_strong(expected, true)) throw WorkerBusy(w_.id());
    auto s = w_.get_status();
    if (is_terminal(s)) {
        w_.in_flight_.store(false);
        throw WorkerUnavailable(w_.id(), to_string(s));
    }
}

Worker::TaskClaim::~TaskClaim() {
    w_.in_flight_.store(false);
}

void Worker::validate_task(const std::string&) const {}

Worker::TaskClaim Worker::claim(const std::string& task) {
    validate_task(task);
    return TaskClaim(*this);
}

WorkerResult Worker::execute(const std::string& task, std::chrono::milliseconds timeout) {
    auto c = claim(task);
    return run_task(task, timeout);
}

WorkerResult Worker::execute(const TaskClaim& claim, const std::string& task, std::chrono::milliseconds timeout) {
    if (&claim.owner() != this) throw InvalidArgument("claim belongs to worker " + claim.owner().id());
    return run_task(task, timeout);
}

void Worker::ensure_started() {
    if (get_status() == WorkerStatus::Pending) start();
    auto s = get_status();
    if (s != WorkerStatus::Running) throw WorkerUnavailable(id_, to_string(s));
}

WorkerResult Worker::finish(WorkerStatus outcome,
                            std::string content,
                            std::optional<std::string> error,
                            TimePoint started_at,
                            std::chrono::steady_clock::time_point t0,
                            json metadata) {
    if (!transition_to(outcome)) {
        auto current = get_status();
        if (current != outcome) {
            error = std::string("worker ") + to_string(current) + " during execution";
            outcome = current;
        }
    }
    if (outcome == WorkerStatus::Failed) metadata["error_kind"] = "ExecutionFailure";
    else if (outcome == WorkerStatus::Timeout) metadata["error_kind"] = "ExecutionTimeout";

    double duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    WorkerResult result(id_, outcome, std::move(content), std::move(error), started_at,
                        Clock::now(), duration, std::move(metadata));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_result_ = result;
    }
    return result;
}

void Worker::persist(ResultStore* store, const WorkerResult& result, const json& metadata) const {
    if (!store) return;
    try {
        store->store(id_, result, metadata);
        log_debug(type_, "stored result for " + id_);
    } catch (const std::exception& e) {
        log_warn(type_, "failed to store result for " + id_ + ": " + e.what());
    }
}
