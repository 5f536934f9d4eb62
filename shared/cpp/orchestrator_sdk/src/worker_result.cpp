#include "../include/worker_result.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

const char* to_string(WorkerStatus s) {
    switch (s) {
        case WorkerStatus::Pending: return "pending";
        case WorkerStatus::Starting: return "starting";
        case WorkerStatus::Running: return "running";
        case WorkerStatus::Completed: return "completed";
        case WorkerStatus::Failed: return "failed";
        case WorkerStatus::Timeout: return "timeout";
        case WorkerStatus::Stopped: return "stopped";
    }
    return "unknown";
}

WorkerStatus worker_status_from_string(const std::string& name) {
    if (name == "pending") return WorkerStatus::Pending;
    if (name == "starting") return WorkerStatus::Starting;
    if (name == "running") return WorkerStatus::Running;
    if (name == "completed") return WorkerStatus::Completed;
    if (name == "failed") return WorkerStatus::Failed;
    if (name == "timeout") return WorkerStatus::Timeout;
    if (name == "stopped") return WorkerStatus::Stopped;
    throw std::invalid_argument("unknown worker status: " + name);
}

bool is_terminal(WorkerStatus s) {
    return s == WorkerStatus::Completed || s == WorkerStatus::Failed ||
           s == WorkerStatus::Timeout || s == WorkerStatus::Stopped;
}

std::string format_timestamp(TimePoint t) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t - secs).count();
    if (ms < 0) ms = 0;
    std::time_t tt = Clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&tt, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    snprintf(out, sizeof(out), "%s.%03dZ", buf, (int)ms);
    return std::string(out);
}

TimePoint parse_timestamp(const std::string& iso) {
    std::tm tm{};
    std::istringstream ss(iso);
    ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) throw std::invalid_argument("bad timestamp: " + iso);
    int ms = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string digits;
        while (std::isdigit(ss.peek())) digits.push_back((char)ss.get());
        while (digits.size() < 3) digits.push_back('0');
        ms = std::stoi(digits.substr(0, 3));
    }
    auto t = Clock::from_time_t(timegm(&tm));
    return t + std::chrono::milliseconds(ms);
}

WorkerResult::WorkerResult(std::string worker_id,
                           WorkerStatus status,
                           std::string content,
                           std::optional<std::string> error,
                           TimePoint started_at,
                           std::optional<TimePoint> completed_at,
                           double duration_seconds,
                           json metadata)
    : worker_id_(std::move(worker_id)),
      status_(status),
      content_(std::move(content)),
      error_(std::move(error)),
      started_at_(started_at),
      completed_at_(completed_at),
      duration_seconds_(duration_seconds),
      metadata_(metadata.is_object() ? std::move(metadata) : json::object()) {}

std::string WorkerResult::summary() const {
    std::string s = worker_id_ + " [" + to_string(status_) + "]: ";
    if (is_success()) {
        if (content_.size() > 50) return s + content_.substr(0, 50) + "...";
        return s + content_;
    }
    return s + error_.value_or("Unknown error");
}

json WorkerResult::to_json() const {
    return json{
        {"worker_id", worker_id_},
        {"status", to_string(status_)},
        {"content", content_},
        {"error", error_ ? json(*error_) : json(nullptr)},
        {"started_at", format_timestamp(started_at_)},
        {"completed_at", completed_at_ ? json(format_timestamp(*completed_at_)) : json(nullptr)},
        {"duration_seconds", duration_seconds_},
        {"metadata", metadata_}
    };
}

WorkerResult WorkerResult::from_json(const json& j) {
    std::optional<std::string> error;
    if (j.contains("error") && !j["error"].is_null()) error = j["error"].get<std::string>();
    std::optional<TimePoint> completed;
    if (j.contains("completed_at") && !j["completed_at"].is_null()) {
        completed = parse_timestamp(j["completed_at"].get<std::string>());
    }
    return WorkerResult(
        j.at("worker_id").get<std::string>(),
        worker_status_from_string(j.at("status").get<std::string>()),
        j.value("content", std::string()),
        error,
        parse_timestamp(j.at("started_at").get<std::string>()),
        completed,
        j.value("duration_seconds", 0.0),
        j.value("metadata", json::object()));
}
