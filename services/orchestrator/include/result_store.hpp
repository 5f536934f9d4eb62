#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/orchestrator_sdk/include/worker_result.hpp"

// Result-persistence collaborator. Implementations throw on failure; callers
// treat persistence as best effort.
class ResultStore {
public:
    virtual ~ResultStore() = default;
    virtual void store(const std::string& worker_id, const WorkerResult& result,
                       const nlohmann::json& metadata) = 0;
};

// POSTs {worker_id, result, metadata} to <base_url>/store.
class HttpResultStore : public ResultStore {
public:
    explicit HttpResultStore(std::string base_url, long timeout_ms = 10000);
    void store(const std::string& worker_id, const WorkerResult& result,
               const nlohmann::json& metadata) override;

private:
    std::string base_;
    long timeout_ms_;
};

struct StoredResult {
    WorkerResult result;
    nlohmann::json metadata;
    std::string stored_at;
};

class SqliteResultStore : public ResultStore {
public:
    explicit SqliteResultStore(const std::string& db_path);
    ~SqliteResultStore() override;

    SqliteResultStore(const SqliteResultStore&) = delete;
    SqliteResultStore& operator=(const SqliteResultStore&) = delete;

    void store(const std::string& worker_id, const WorkerResult& result,
               const nlohmann::json& metadata) override;
    // Oldest first.
    std::vector<StoredResult> list(const std::string& worker_id);
    std::size_t count();

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();

    std::mutex mtx_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* by_worker_stmt_ {nullptr};
    struct sqlite3_stmt* count_stmt_ {nullptr};
};
