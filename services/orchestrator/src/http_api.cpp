#include "../include/http_api.hpp"
#include "../include/errors.hpp"
#include "../include/log.hpp"
#include "../include/worker_manager.hpp"
#include <chrono>
#include <sstream>

using json = nlohmann::json;

static const int kMaxSpawnCount = 50;
static const int kDefaultTimeoutSeconds = 300;
static const int kMaxTimeoutSeconds = 3600;

int status_for_error_kind(const std::string& kind) {
    if (kind == "UnknownWorkerType" || kind == "InvalidArgument" || kind == "LengthMismatch" ||
        kind == "BadRequest") return 400;
    if (kind == "WorkerNotFound" || kind == "NotFound") return 404;
    if (kind == "WorkerBusy" || kind == "WorkerUnavailable") return 409;
    if (kind == "UnsupportedOperation") return 422;
    return 500;
}

static ApiResponse reply(int status, const json& j) {
    return {status, j.dump()};
}

static ApiResponse error_reply(const std::string& kind, const std::string& message) {
    return reply(status_for_error_kind(kind), json{{"error", message}, {"kind", kind}});
}

static std::vector<std::string> split_ids(const std::map<std::string, std::string>& query) {
    std::vector<std::string> ids;
    auto it = query.find("ids");
    if (it == query.end()) return ids;
    std::stringstream ss(it->second);
    std::string id;
    while (std::getline(ss, id, ',')) {
        if (!id.empty()) ids.push_back(id);
    }
    return ids;
}

static std::chrono::milliseconds timeout_from(const json& j) {
    int secs = j.value("timeout_seconds", kDefaultTimeoutSeconds);
    if (secs < 1 || secs > kMaxTimeoutSeconds) {
        throw InvalidArgument("timeout_seconds must be between 1 and " + std::to_string(kMaxTimeoutSeconds));
    }
    return std::chrono::seconds(secs);
}

static json parse_body(const std::string& body) {
    if (body.empty()) return json::object();
    json j = json::parse(body);
    if (!j.is_object()) throw InvalidArgument("request body must be a JSON object");
    return j;
}

static ApiResponse route(WorkerManager& manager, const std::string& method, const std::string& path,
                         const std::map<std::string, std::string>& query, const std::string& body) {
    if (method == "POST" && path == "/workers/spawn") {
        auto j = parse_body(body);
        auto type = j.at("worker_type").get<std::string>();
        int count = j.value("count", 1);
        if (count < 1 || count > kMaxSpawnCount) {
            throw InvalidArgument("count must be between 1 and " + std::to_string(kMaxSpawnCount));
        }
        return reply(200, json{{"worker_ids", manager.spawn(type, count)}});
    }
    if (method == "POST" && path == "/workers/execute") {
        auto j = parse_body(body);
        auto id = j.at("worker_id").get<std::string>();
        auto task = j.at("task").get<std::string>();
        auto timeout = timeout_from(j);
        return reply(200, manager.execute(id, task, timeout).to_json());
    }
    if (method == "POST" && path == "/workers/execute_batch") {
        auto j = parse_body(body);
        auto ids = j.at("worker_ids").get<std::vector<std::string>>();
        auto tasks = j.at("tasks").get<std::vector<std::string>>();
        auto timeout = timeout_from(j);
        json results = json::array();
        for (const auto& r : manager.execute_batch(ids, tasks, timeout)) results.push_back(r.to_json());
        return reply(200, json{{"results", results}});
    }
    if (method == "GET" && path == "/workers") {
        json workers = json::array();
        for (const auto& w : manager.list_workers()) {
            workers.push_back({{"worker_id", w.worker_id}, {"worker_type", w.worker_type}, {"status", to_string(w.status)}});
        }
        return reply(200, json{{"workers", workers}});
    }
    if (method == "GET" && path == "/workers/status") {
        json statuses = json::object();
        for (const auto& kv : manager.snapshot(split_ids(query))) statuses[kv.first] = to_string(kv.second);
        return reply(200, json{{"statuses", statuses}});
    }
    if (method == "GET" && path == "/workers/results") {
        json results = json::object();
        for (const auto& kv : manager.collect_results(split_ids(query))) results[kv.first] = kv.second.to_json();
        return reply(200, json{{"results", results}});
    }
    if (method == "POST" && path == "/workers/close_all") {
        return reply(200, json{{"closed", manager.close_all()}});
    }
    if (method == "DELETE" && path.rfind("/workers/", 0) == 0) {
        std::string id = path.substr(std::string("/workers/").size());
        if (id.empty() || id.find('/') != std::string::npos) return error_reply("NotFound", "not found");
        manager.close(id);
        return reply(200, json{{"success", true}, {"worker_id", id}});
    }
    if (method == "GET" && path == "/health") {
        return reply(200, manager.health());
    }
    return error_reply("NotFound", "not found");
}

ApiResponse handle_api_request(WorkerManager& manager,
                               const std::string& method,
                               const std::string& path,
                               const std::map<std::string, std::string>& query,
                               const std::string& body) {
    try {
        return route(manager, method, path, query, body);
    } catch (const WorkerError& e) {
        return error_reply(e.kind(), e.what());
    } catch (const json::exception& e) {
        return error_reply("BadRequest", e.what());
    } catch (const std::exception& e) {
        log_error("api", method + " " + path + ": " + e.what());
        return error_reply("InternalError", e.what());
    }
}
