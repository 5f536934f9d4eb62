#include "../include/result_store.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

HttpResultStore::HttpResultStore(std::string base_url, long timeout_ms)
    : base_(std::move(base_url)), timeout_ms_(timeout_ms) {
    while (!base_.empty() && base_.back() == '/') base_.pop_back();
}

void HttpResultStore::store(const std::string& worker_id, const WorkerResult& result,
                            const json& metadata) {
    std::string url = base_ + "/store";
    std::string body = json{
        {"worker_id", worker_id},
        {"result", result.to_json()},
        {"metadata", metadata.is_null() ? json::object() : metadata}
    }.dump();

    CURL* curl = curl_easy_init();
    if (!curl) throw std::runtime_error("curl_easy_init failed");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string buf;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &buf);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode code = curl_easy_perform(curl);
    long status = 0;
    if (code == CURLE_OK) curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (code != CURLE_OK) {
        throw std::runtime_error(std::string("store request failed: ") + curl_easy_strerror(code));
    }
    if (status < 200 || status >= 300) {
        throw std::runtime_error("store returned HTTP " + std::to_string(status) + ": " + buf);
    }
}
