#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class WorkerStatus {
    Pending,
    Starting,
    Running,
    Completed,
    Failed,
    Timeout,
    Stopped
};

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

const char* to_string(WorkerStatus s);
// Throws std::invalid_argument for names outside the seven states.
WorkerStatus worker_status_from_string(const std::string& name);
bool is_terminal(WorkerStatus s);

std::string format_timestamp(TimePoint t);
TimePoint parse_timestamp(const std::string& iso);

// Outcome of one execution attempt. Built once, never modified.
class WorkerResult {
public:
    WorkerResult(std::string worker_id,
                 WorkerStatus status,
                 std::string content,
                 std::optional<std::string> error,
                 TimePoint started_at,
                 std::optional<TimePoint> completed_at,
                 double duration_seconds,
                 nlohmann::json metadata = nlohmann::json::object());

    const std::string& worker_id() const { return worker_id_; }
    WorkerStatus status() const { return status_; }
    const std::string& content() const { return content_; }
    const std::optional<std::string>& error() const { return error_; }
    TimePoint started_at() const { return started_at_; }
    const std::optional<TimePoint>& completed_at() const { return completed_at_; }
    double duration_seconds() const { return duration_seconds_; }
    const nlohmann::json& metadata() const { return metadata_; }

    bool is_success() const { return status_ == WorkerStatus::Completed; }
    bool has_content() const { return !content_.empty(); }
    std::string summary() const;

    nlohmann::json to_json() const;
    static WorkerResult from_json(const nlohmann::json& j);

private:
    std::string worker_id_;
    WorkerStatus status_;
    std::string content_;
    std::optional<std::string> error_;
    TimePoint started_at_;
    std::optional<TimePoint> completed_at_;
    double duration_seconds_{0.0};
    nlohmann::json metadata_;
};
