#include "../include/orchestrator_client.hpp"
#include <nlohmann/json.hpp>
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

static std::string join_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ",";
        out += id;
    }
    return out;
}
}

OrchestratorClient::OrchestratorClient(std::string base_url) : base_(std::move(base_url)) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

bool OrchestratorClient::request(const std::string& method, const std::string& path,
                                 const std::string& body, std::string& response) {
    CurlHandle c;
    std::string url = base_ + path;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method.c_str());
    if (method == "POST") {
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &response);
    CURLcode code = curl_easy_perform(c.h);
    curl_slist_free_all(headers);
    if (code != CURLE_OK) {
        last_error_ = std::string("curl_easy_perform failed: ") + curl_easy_strerror(code);
        return false;
    }
    long status = 0;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        last_error_ = "HTTP " + std::to_string(status);
        try {
            auto j = json::parse(response);
            if (j.contains("error")) last_error_ += ": " + j["error"].get<std::string>();
        } catch (const json::exception&) {
            // body was not JSON; keep the status line
        }
        return false;
    }
    last_error_.clear();
    return true;
}

std::optional<std::vector<std::string>> OrchestratorClient::spawn(const std::string& worker_type, int count) {
    json body = {{"worker_type", worker_type}, {"count", count}};
    std::string buf;
    if (!request("POST", "/workers/spawn", body.dump(), buf)) return std::nullopt;
    auto j = json::parse(buf);
    return j.at("worker_ids").get<std::vector<std::string>>();
}

std::optional<WorkerResult> OrchestratorClient::execute(const std::string& worker_id, const std::string& task,
                                                        int timeout_seconds) {
    json body = {{"worker_id", worker_id}, {"task", task}, {"timeout_seconds", timeout_seconds}};
    std::string buf;
    if (!request("POST", "/workers/execute", body.dump(), buf)) return std::nullopt;
    return WorkerResult::from_json(json::parse(buf));
}

std::optional<std::vector<WorkerResult>> OrchestratorClient::execute_batch(const std::vector<std::string>& worker_ids,
                                                                           const std::vector<std::string>& tasks,
                                                                           int timeout_seconds) {
    json body = {{"worker_ids", worker_ids}, {"tasks", tasks}, {"timeout_seconds", timeout_seconds}};
    std::string buf;
    if (!request("POST", "/workers/execute_batch", body.dump(), buf)) return std::nullopt;
    auto j = json::parse(buf);
    std::vector<WorkerResult> out;
    for (const auto& r : j.at("results")) out.push_back(WorkerResult::from_json(r));
    return out;
}

std::optional<std::map<std::string, WorkerStatus>> OrchestratorClient::statuses(const std::vector<std::string>& worker_ids) {
    std::string path = "/workers/status";
    if (!worker_ids.empty()) path += "?ids=" + join_ids(worker_ids); // ids are hex tokens; no encoding needed
    std::string buf;
    if (!request("GET", path, {}, buf)) return std::nullopt;
    auto j = json::parse(buf);
    std::map<std::string, WorkerStatus> out;
    for (auto& [id, status] : j.at("statuses").items()) {
        out[id] = worker_status_from_string(status.get<std::string>());
    }
    return out;
}

bool OrchestratorClient::close(const std::string& worker_id) {
    std::string buf;
    return request("DELETE", "/workers/" + worker_id, {}, buf);
}
