#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "worker_result.hpp"

// Thin HTTP client for the orchestrator service.
class OrchestratorClient {
public:
    explicit OrchestratorClient(std::string base_url);

    std::optional<std::vector<std::string>> spawn(const std::string& worker_type, int count = 1);
    std::optional<WorkerResult> execute(const std::string& worker_id, const std::string& task,
                                        int timeout_seconds = 300);
    std::optional<std::vector<WorkerResult>> execute_batch(const std::vector<std::string>& worker_ids,
                                                           const std::vector<std::string>& tasks,
                                                           int timeout_seconds = 300);
    std::optional<std::map<std::string, WorkerStatus>> statuses(const std::vector<std::string>& worker_ids = {});
    bool close(const std::string& worker_id);

    // Message from the last failed call: transport error or the service's "error" field.
    const std::string& last_error() const { return last_error_; }

private:
    bool request(const std::string& method, const std::string& path, const std::string& body,
                 std::string& response);

    std::string base_;
    std::string last_error_;
};
