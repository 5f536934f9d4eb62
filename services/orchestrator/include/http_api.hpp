#pragma once
#include <map>
#include <string>

class WorkerManager;

struct ApiResponse {
    int status{200};
    std::string body;
};

// Routes one request to the manager. Never throws: failures become
// {"error", "kind"} bodies with the matching status code.
ApiResponse handle_api_request(WorkerManager& manager,
                               const std::string& method,
                               const std::string& path,
                               const std::map<std::string, std::string>& query,
                               const std::string& body);

int status_for_error_kind(const std::string& kind);
