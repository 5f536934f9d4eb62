#include "../include/result_store.hpp"
#include <sqlite3.h>
#include <stdexcept>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int idx) {
    const unsigned char* t = sqlite3_column_text(st, idx);
    return t ? reinterpret_cast<const char*>(t) : std::string();
}

SqliteResultStore::SqliteResultStore(const std::string& db_path) {
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open SQLite DB: " + db_path + " (" + msg + ")");
    }
    try {
        init();
        prepare_statements();
    } catch (const std::exception&) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteResultStore::~SqliteResultStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void SqliteResultStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("CREATE TABLE IF NOT EXISTS worker_results (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  worker_id TEXT NOT NULL,\n"
         "  status TEXT NOT NULL,\n"
         "  result TEXT NOT NULL,\n"
         "  metadata TEXT,\n"
         "  stored_at TEXT NOT NULL\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_worker_results_worker ON worker_results(worker_id);");
}

void SqliteResultStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

void SqliteResultStore::prepare_statements() {
    const char* ins = "INSERT INTO worker_results (worker_id, status, result, metadata, stored_at) \n"
                      "VALUES (?, ?, ?, ?, ?);";
    if (sqlite3_prepare_v2(db_, ins, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare insert failed");
    }
    const char* by_worker = "SELECT result, metadata, stored_at FROM worker_results \n"
                            "WHERE worker_id = ? ORDER BY id;";
    if (sqlite3_prepare_v2(db_, by_worker, -1, &by_worker_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare select failed");
    }
    const char* cnt = "SELECT COUNT(*) FROM worker_results;";
    if (sqlite3_prepare_v2(db_, cnt, -1, &count_stmt_, nullptr) != SQLITE_OK) {
        throw std::runtime_error("prepare count failed");
    }
}

void SqliteResultStore::close_statements() {
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (by_worker_stmt_) { sqlite3_finalize(by_worker_stmt_); by_worker_stmt_ = nullptr; }
    if (count_stmt_) { sqlite3_finalize(count_stmt_); count_stmt_ = nullptr; }
}

void SqliteResultStore::store(const std::string& worker_id, const WorkerResult& result,
                              const json& metadata) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);
    bind_text(insert_stmt_, 1, worker_id);
    bind_text(insert_stmt_, 2, to_string(result.status()));
    bind_text(insert_stmt_, 3, result.to_json().dump());
    bind_text(insert_stmt_, 4, metadata.is_null() ? std::string("{}") : metadata.dump());
    bind_text(insert_stmt_, 5, format_timestamp(Clock::now()));
    int rc = sqlite3_step(insert_stmt_);
    sqlite3_reset(insert_stmt_);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("insert result failed: ") + sqlite3_errmsg(db_));
    }
}

std::vector<StoredResult> SqliteResultStore::list(const std::string& worker_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<StoredResult> out;
    sqlite3_reset(by_worker_stmt_);
    sqlite3_clear_bindings(by_worker_stmt_);
    bind_text(by_worker_stmt_, 1, worker_id);
    while (sqlite3_step(by_worker_stmt_) == SQLITE_ROW) {
        auto result = WorkerResult::from_json(json::parse(column_text(by_worker_stmt_, 0)));
        auto meta_text = column_text(by_worker_stmt_, 1);
        json meta = meta_text.empty() ? json::object() : json::parse(meta_text, nullptr, false);
        if (meta.is_discarded()) meta = json::object();
        out.push_back({std::move(result), std::move(meta), column_text(by_worker_stmt_, 2)});
    }
    sqlite3_reset(by_worker_stmt_);
    return out;
}

std::size_t SqliteResultStore::count() {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_reset(count_stmt_);
    std::size_t n = 0;
    if (sqlite3_step(count_stmt_) == SQLITE_ROW) n = (std::size_t)sqlite3_column_int64(count_stmt_, 0);
    sqlite3_reset(count_stmt_);
    return n;
}
