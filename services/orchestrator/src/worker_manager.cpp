#include "../include/worker_manager.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <future>
#include <thread>

using json = nlohmann::json;
using namespace std::chrono;

WorkerResult failed_result(const std::string& worker_id, const std::string& error,
                           const std::string& exception_kind, TimePoint started_at,
                           steady_clock::time_point t0) {
    double elapsed = duration<double>(steady_clock::now() - t0).count();
    json meta = {{"exception", exception_kind}, {"error_kind", "ExecutionFailure"}};
    return WorkerResult(worker_id, WorkerStatus::Failed, "", error, started_at, Clock::now(), elapsed, meta);
}

MonitorStream::MonitorStream(const WorkerManager& manager, std::vector<std::string> ids,
                             milliseconds interval)
    : manager_(manager), ids_(std::move(ids)), interval_(interval) {}

std::map<std::string, WorkerStatus> MonitorStream::next() {
    if (!first_) std::this_thread::sleep_for(interval_);
    first_ = false;
    return manager_.snapshot(ids_);
}

WorkerManager::WorkerManager(ManagerOptions options)
    : options_(std::move(options)), gate_(options_.max_concurrent) {
    log_info("manager", "max concurrent executions: " + std::to_string(gate_.capacity()) +
             (options_.debug_mode ? " (debug mode)" : ""));
}

WorkerManager::~WorkerManager() {
    close_all();
}

void WorkerManager::register_type(const std::string& name, WorkerFactory factory) {
    if (name.empty() || !factory) throw InvalidArgument("worker type needs a name and a factory");
    std::lock_guard<std::mutex> lock(types_mutex_);
    factories_[name] = std::move(factory);
}

std::vector<std::string> WorkerManager::worker_types() const {
    std::lock_guard<std::mutex> lock(types_mutex_);
    std::vector<std::string> out;
    for (const auto& kv : factories_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> WorkerManager::spawn(const std::string& worker_type, int count) {
    if (count < 1) throw InvalidArgument("count must be at least 1");
    WorkerFactory factory;
    {
        std::lock_guard<std::mutex> lock(types_mutex_);
        auto it = factories_.find(worker_type);
        if (it == factories_.end()) throw UnknownWorkerType(worker_type);
        factory = it->second;
    }

    std::vector<std::shared_ptr<Worker>> created;
    created.reserve((size_t)count);
    for (int i = 0; i < count; ++i) {
        auto w = factory(gen_id(worker_type + "-"));
        if (!w) throw std::runtime_error("factory for " + worker_type + " returned no worker");
        created.push_back(std::move(w));
    }

    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& w : created) {
            if (workers_.count(w->id())) throw std::runtime_error("duplicate worker id " + w->id());
        }
        for (auto& w : created) {
            ids.push_back(w->id());
            order_.push_back(w->id());
            workers_.emplace(w->id(), std::move(w));
        }
    }
    log_info("manager", "spawned " + std::to_string(count) + " " + worker_type + " worker(s)");
    ensure_debug_monitor();
    return ids;
}

void WorkerManager::ensure_debug_monitor() {
    if (!options_.debug_mode || !options_.debug_monitor_factory) return;
    std::shared_ptr<Worker> monitor;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (debug_monitor_) return;
        monitor = options_.debug_monitor_factory();
        debug_monitor_ = monitor;
    }
    if (!monitor) return;
    try {
        monitor->start();
        log_info("manager", "debug monitor " + monitor->id() + " launched");
    } catch (const std::exception& e) {
        log_warn("manager", std::string("debug monitor failed to start: ") + e.what());
    }
}

std::shared_ptr<Worker> WorkerManager::find(const std::string& worker_id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = workers_.find(worker_id);
    return it == workers_.end() ? nullptr : it->second;
}

std::shared_ptr<Worker> WorkerManager::require(const std::string& worker_id) const {
    auto w = find(worker_id);
    if (!w) throw WorkerNotFound(worker_id);
    return w;
}

std::shared_ptr<Worker> WorkerManager::debug_monitor() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return debug_monitor_;
}

std::size_t WorkerManager::active_count() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return workers_.size();
}

WorkerResult WorkerManager::run_on(const std::shared_ptr<Worker>& worker, const std::string& task,
                                   milliseconds timeout) {
    auto t0 = steady_clock::now();
    auto started_at = Clock::now();
    try {
        // Busy, unavailable and invalid tasks fail here without waiting for a slot.
        auto claim = worker->claim(task);
        GatePermit permit(gate_);
        return worker->execute(claim, task, timeout);
    } catch (const UsageError&) {
        throw;
    } catch (const WorkerError& e) {
        log_error("manager", worker->id() + ": " + e.kind() + ": " + e.what());
        return failed_result(worker->id(), e.what(), e.kind(), started_at, t0);
    } catch (const std::exception& e) {
        log_error("manager", worker->id() + ": unexpected failure: " + e.what());
        return failed_result(worker->id(), e.what(), "std::exception", started_at, t0);
    }
}

WorkerResult WorkerManager::execute(const std::string& worker_id, const std::string& task,
                                    milliseconds timeout) {
    return run_on(require(worker_id), task, timeout);
}

std::vector<WorkerResult> WorkerManager::execute_batch(const std::vector<std::string>& worker_ids,
                                                       const std::vector<std::string>& tasks,
                                                       milliseconds timeout) {
    if (worker_ids.size() != tasks.size()) throw LengthMismatch(worker_ids.size(), tasks.size());
    std::vector<std::shared_ptr<Worker>> workers;
    workers.reserve(worker_ids.size());
    for (const auto& id : worker_ids) workers.push_back(require(id));

    auto t0 = steady_clock::now();
    auto started_at = Clock::now();
    std::vector<std::future<WorkerResult>> futures;
    futures.reserve(workers.size());
    for (size_t i = 0; i < workers.size(); ++i) {
        futures.push_back(std::async(std::launch::async, [this, w = workers[i], &task = tasks[i], timeout]() {
            return run_on(w, task, timeout);
        }));
    }

    std::vector<WorkerResult> results;
    results.reserve(futures.size());
    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            results.push_back(futures[i].get());
        } catch (const WorkerError& e) {
            results.push_back(failed_result(worker_ids[i], e.what(), e.kind(), started_at, t0));
        } catch (const std::exception& e) {
            results.push_back(failed_result(worker_ids[i], e.what(), "std::exception", started_at, t0));
        }
    }
    return results;
}

std::vector<std::shared_ptr<Worker>> WorkerManager::select(const std::vector<std::string>& worker_ids) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::shared_ptr<Worker>> out;
    if (worker_ids.empty()) {
        for (const auto& id : order_) {
            auto it = workers_.find(id);
            if (it != workers_.end()) out.push_back(it->second);
        }
        return out;
    }
    for (const auto& id : worker_ids) {
        auto it = workers_.find(id);
        if (it != workers_.end()) out.push_back(it->second);
    }
    return out;
}

MonitorStream WorkerManager::monitor(std::vector<std::string> worker_ids, milliseconds interval) const {
    return MonitorStream(*this, std::move(worker_ids), interval);
}

std::map<std::string, WorkerStatus> WorkerManager::snapshot(const std::vector<std::string>& worker_ids) const {
    std::map<std::string, WorkerStatus> out;
    for (const auto& w : select(worker_ids)) {
        try {
            out[w->id()] = w->get_status();
        } catch (const std::exception& e) {
            log_warn("manager", w->id() + ": status query failed: " + e.what());
            out[w->id()] = WorkerStatus::Failed;
        }
    }
    return out;
}

void WorkerManager::close(const std::string& worker_id) {
    std::shared_ptr<Worker> w;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = workers_.find(worker_id);
        if (it == workers_.end()) throw WorkerNotFound(worker_id);
        w = std::move(it->second);
        workers_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), worker_id), order_.end());
    }
    try {
        w->stop();
    } catch (const std::exception& e) {
        log_warn("manager", "stop " + worker_id + " failed: " + e.what());
    }
    log_info("manager", "closed " + worker_id);
}

std::size_t WorkerManager::close_all() {
    std::vector<std::shared_ptr<Worker>> victims;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        for (auto& kv : workers_) victims.push_back(std::move(kv.second));
        workers_.clear();
        order_.clear();
        if (debug_monitor_) victims.push_back(std::move(debug_monitor_));
        debug_monitor_.reset();
    }
    if (victims.empty()) return 0;

    std::vector<std::future<void>> stops;
    stops.reserve(victims.size());
    for (auto& w : victims) {
        stops.push_back(std::async(std::launch::async, [w]{ w->stop(); }));
    }
    for (size_t i = 0; i < stops.size(); ++i) {
        try {
            stops[i].get();
        } catch (const std::exception& e) {
            log_warn("manager", "stop " + victims[i]->id() + " failed: " + e.what());
        }
    }
    log_info("manager", "closed " + std::to_string(victims.size()) + " worker(s)");
    return victims.size();
}

std::vector<WorkerInfo> WorkerManager::list_workers() const {
    std::vector<WorkerInfo> out;
    for (const auto& w : select({})) {
        WorkerStatus s;
        try {
            s = w->get_status();
        } catch (const std::exception&) {
            s = WorkerStatus::Failed;
        }
        out.push_back({w->id(), w->type(), s});
    }
    return out;
}

std::map<std::string, WorkerResult> WorkerManager::collect_results(const std::vector<std::string>& worker_ids) const {
    std::map<std::string, WorkerResult> out;
    for (const auto& w : select(worker_ids)) {
        if (auto r = w->last_result()) out.emplace(w->id(), std::move(*r));
    }
    return out;
}

json WorkerManager::health() const {
    json counts = json::object();
    std::size_t active = 0;
    for (const auto& info : list_workers()) {
        std::string key = to_string(info.status);
        counts[key] = counts.value(key, 0) + 1;
        ++active;
    }
    json j = {
        {"healthy", true},
        {"active_workers", active},
        {"max_concurrent", gate_.capacity()},
        {"slots_in_use", gate_.in_use()},
        {"status_counts", counts},
        {"worker_types", worker_types()},
        {"debug_mode", options_.debug_mode}
    };
    if (auto dm = debug_monitor()) j["debug_monitor"] = dm->progress();
    else j["debug_monitor"] = nullptr;
    return j;
}
