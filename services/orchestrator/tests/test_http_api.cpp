#include <gtest/gtest.h>
#include <future>
#include <thread>
#include "../include/http_api.hpp"
#include "../include/worker_manager.hpp"
#include "fake_worker.hpp"

using json = nlohmann::json;

namespace {

class HttpApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        ManagerOptions opts;
        opts.max_concurrent = 4;
        manager_ = std::make_unique<WorkerManager>(opts);
        auto s = stats_;
        manager_->register_type("fake", [s](const std::string& id) {
            return std::make_shared<FakeWorker>(id, "fake", s);
        });
    }

    ApiResponse call(const std::string& method, const std::string& path, const std::string& body = "",
                     const std::map<std::string, std::string>& query = {}) {
        return handle_api_request(*manager_, method, path, query, body);
    }

    std::vector<std::string> spawn(int count) {
        auto r = call("POST", "/workers/spawn", json{{"worker_type", "fake"}, {"count", count}}.dump());
        EXPECT_EQ(r.status, 200) << r.body;
        return json::parse(r.body)["worker_ids"].get<std::vector<std::string>>();
    }

    std::shared_ptr<FakeStats> stats_ = std::make_shared<FakeStats>();
    std::unique_ptr<WorkerManager> manager_;
};

TEST_F(HttpApiTest, SpawnReturnsIds) {
    auto ids = spawn(3);
    EXPECT_EQ(ids.size(), 3u);
    EXPECT_EQ(manager_->active_count(), 3u);
}

TEST_F(HttpApiTest, SpawnDefaultsToOneWorker) {
    auto r = call("POST", "/workers/spawn", R"({"worker_type":"fake"})");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body)["worker_ids"].size(), 1u);
}

TEST_F(HttpApiTest, SpawnRejectsBadCountAndType) {
    auto zero = call("POST", "/workers/spawn", R"({"worker_type":"fake","count":0})");
    EXPECT_EQ(zero.status, 400);
    EXPECT_EQ(json::parse(zero.body)["kind"], "InvalidArgument");
    EXPECT_EQ(call("POST", "/workers/spawn", R"({"worker_type":"fake","count":51})").status, 400);

    auto unknown = call("POST", "/workers/spawn", R"({"worker_type":"nope"})");
    EXPECT_EQ(unknown.status, 400);
    EXPECT_EQ(json::parse(unknown.body)["kind"], "UnknownWorkerType");
    EXPECT_EQ(manager_->active_count(), 0u);
}

TEST_F(HttpApiTest, MalformedBodiesAreBadRequests) {
    auto broken = call("POST", "/workers/spawn", "{not json");
    EXPECT_EQ(broken.status, 400);
    EXPECT_EQ(json::parse(broken.body)["kind"], "BadRequest");

    auto missing = call("POST", "/workers/execute", R"({"task":"hi"})");
    EXPECT_EQ(missing.status, 400);
    EXPECT_EQ(call("POST", "/workers/spawn", "[1,2]").status, 400);
}

TEST_F(HttpApiTest, ExecuteReturnsResult) {
    auto id = spawn(1).front();
    auto r = call("POST", "/workers/execute", json{{"worker_id", id}, {"task", "hello"}}.dump());
    ASSERT_EQ(r.status, 200) << r.body;
    auto j = json::parse(r.body);
    EXPECT_EQ(j["worker_id"], id);
    EXPECT_EQ(j["status"], "completed");
    EXPECT_EQ(j["content"], "hello");
}

TEST_F(HttpApiTest, ExecuteErrorsMapToStatusCodes) {
    auto ids = spawn(3);
    EXPECT_EQ(call("POST", "/workers/execute", R"({"worker_id":"ghost","task":"x"})").status, 404);

    auto running = std::async(std::launch::async, [&]{
        return call("POST", "/workers/execute", json{{"worker_id", ids[0]}, {"task", "sleep:400"}}.dump());
    });
    while (!manager_->find(ids[0])->busy()) std::this_thread::sleep_for(std::chrono::milliseconds(5));
    auto busy = call("POST", "/workers/execute", json{{"worker_id", ids[0]}, {"task", "again"}}.dump());
    EXPECT_EQ(busy.status, 409);
    EXPECT_EQ(json::parse(busy.body)["kind"], "WorkerBusy");
    EXPECT_EQ(running.get().status, 200);

    auto unsupported = call("POST", "/workers/execute", json{{"worker_id", ids[1]}, {"task", "unsupported"}}.dump());
    EXPECT_EQ(unsupported.status, 422);

    // Completed is an end state; a second execute finds the worker unavailable.
    EXPECT_EQ(call("POST", "/workers/execute", json{{"worker_id", ids[2]}, {"task", "once"}}.dump()).status, 200);
    auto again = call("POST", "/workers/execute", json{{"worker_id", ids[2]}, {"task", "twice"}}.dump());
    EXPECT_EQ(again.status, 409);
    EXPECT_EQ(json::parse(again.body)["kind"], "WorkerUnavailable");
}

TEST_F(HttpApiTest, TimeoutSecondsIsRangeChecked) {
    auto id = spawn(1).front();
    EXPECT_EQ(call("POST", "/workers/execute",
                   json{{"worker_id", id}, {"task", "x"}, {"timeout_seconds", 0}}.dump()).status, 400);
    EXPECT_EQ(call("POST", "/workers/execute",
                   json{{"worker_id", id}, {"task", "x"}, {"timeout_seconds", 3601}}.dump()).status, 400);
    EXPECT_EQ(manager_->snapshot({id}).at(id), WorkerStatus::Pending);
    EXPECT_EQ(call("POST", "/workers/execute",
                   json{{"worker_id", id}, {"task", "x"}, {"timeout_seconds", 3600}}.dump()).status, 200);
}

TEST_F(HttpApiTest, BatchKeepsOrderAndChecksLengths) {
    auto ids = spawn(2);
    auto mismatch = call("POST", "/workers/execute_batch", json{{"worker_ids", ids}, {"tasks", {"a"}}}.dump());
    EXPECT_EQ(mismatch.status, 400);
    EXPECT_EQ(json::parse(mismatch.body)["kind"], "LengthMismatch");

    auto r = call("POST", "/workers/execute_batch", json{{"worker_ids", ids}, {"tasks", {"a", "throw-std"}}}.dump());
    ASSERT_EQ(r.status, 200) << r.body;
    auto results = json::parse(r.body)["results"];
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0]["worker_id"], ids[0]);
    EXPECT_EQ(results[0]["content"], "a");
    EXPECT_EQ(results[1]["status"], "failed");
    EXPECT_EQ(results[1]["error"], "fake exploded");
}

TEST_F(HttpApiTest, ListingEndpoints) {
    auto ids = spawn(2);
    call("POST", "/workers/execute", json{{"worker_id", ids[0]}, {"task", "done"}}.dump());

    auto workers = json::parse(call("GET", "/workers").body)["workers"];
    ASSERT_EQ(workers.size(), 2u);
    EXPECT_EQ(workers[0]["worker_id"], ids[0]);
    EXPECT_EQ(workers[0]["worker_type"], "fake");
    EXPECT_EQ(workers[0]["status"], "completed");
    EXPECT_EQ(workers[1]["status"], "pending");

    auto statuses = json::parse(call("GET", "/workers/status", "", {{"ids", ids[1] + ",ghost"}}).body)["statuses"];
    ASSERT_EQ(statuses.size(), 1u);
    EXPECT_EQ(statuses[ids[1]], "pending");

    auto results = json::parse(call("GET", "/workers/results").body)["results"];
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[ids[0]]["content"], "done");
}

TEST_F(HttpApiTest, DeleteClosesWorker) {
    auto id = spawn(1).front();
    auto r = call("DELETE", "/workers/" + id);
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body)["success"], true);
    EXPECT_EQ(stats_->stops.load(), 1);

    auto again = call("DELETE", "/workers/" + id);
    EXPECT_EQ(again.status, 404);
    EXPECT_EQ(json::parse(again.body)["kind"], "WorkerNotFound");
}

TEST_F(HttpApiTest, CloseAllReportsCount) {
    spawn(3);
    auto r = call("POST", "/workers/close_all");
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(json::parse(r.body)["closed"], 3);
    EXPECT_EQ(manager_->active_count(), 0u);
}

TEST_F(HttpApiTest, HealthAndUnknownRoutes) {
    spawn(1);
    auto h = call("GET", "/health");
    ASSERT_EQ(h.status, 200);
    auto j = json::parse(h.body);
    EXPECT_EQ(j["healthy"], true);
    EXPECT_EQ(j["max_concurrent"], 4);
    EXPECT_EQ(j["active_workers"], 1);

    auto missing = call("GET", "/nowhere");
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(json::parse(missing.body)["kind"], "NotFound");
    EXPECT_EQ(call("PUT", "/workers/spawn").status, 404);
}

TEST(StatusForErrorKindTest, MapsKinds) {
    EXPECT_EQ(status_for_error_kind("LengthMismatch"), 400);
    EXPECT_EQ(status_for_error_kind("WorkerNotFound"), 404);
    EXPECT_EQ(status_for_error_kind("WorkerBusy"), 409);
    EXPECT_EQ(status_for_error_kind("UnsupportedOperation"), 422);
    EXPECT_EQ(status_for_error_kind("SpawnError"), 500);
}

}  // namespace
