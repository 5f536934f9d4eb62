#include <gtest/gtest.h>
#include "../include/http_server.hpp"
#include "../include/worker_manager.hpp"
#include "../../../shared/cpp/orchestrator_sdk/include/orchestrator_client.hpp"
#include "fake_worker.hpp"

namespace {

class OrchestratorClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        manager_ = std::make_unique<WorkerManager>(ManagerOptions{});
        auto s = stats_;
        manager_->register_type("fake", [s](const std::string& id) {
            return std::make_shared<FakeWorker>(id, "fake", s);
        });
        server_ = std::make_unique<ApiServer>(*manager_);
        server_->start(0);
        ASSERT_NE(server_->port(), 0);
    }

    void TearDown() override {
        server_->stop();
    }

    std::string base() const { return "http://127.0.0.1:" + std::to_string(server_->port()) + "/"; }

    std::shared_ptr<FakeStats> stats_ = std::make_shared<FakeStats>();
    std::unique_ptr<WorkerManager> manager_;
    std::unique_ptr<ApiServer> server_;
};

TEST_F(OrchestratorClientTest, SpawnExecuteClose) {
    OrchestratorClient client(base());
    auto ids = client.spawn("fake", 2);
    ASSERT_TRUE(ids.has_value()) << client.last_error();
    ASSERT_EQ(ids->size(), 2u);

    auto r = client.execute(ids->at(0), "ping", 5);
    ASSERT_TRUE(r.has_value()) << client.last_error();
    EXPECT_EQ(r->status(), WorkerStatus::Completed);
    EXPECT_EQ(r->content(), "ping");
    EXPECT_EQ(r->worker_id(), ids->at(0));

    auto statuses = client.statuses(*ids);
    ASSERT_TRUE(statuses.has_value());
    EXPECT_EQ(statuses->at(ids->at(0)), WorkerStatus::Completed);
    EXPECT_EQ(statuses->at(ids->at(1)), WorkerStatus::Pending);

    EXPECT_TRUE(client.close(ids->at(1)));
    EXPECT_EQ(manager_->find(ids->at(1)), nullptr);
}

TEST_F(OrchestratorClientTest, BatchReturnsResultsInOrder) {
    OrchestratorClient client(base());
    auto ids = client.spawn("fake", 3);
    ASSERT_TRUE(ids.has_value());
    auto results = client.execute_batch(*ids, {"one", "two", "throw-std"}, 5);
    ASSERT_TRUE(results.has_value()) << client.last_error();
    ASSERT_EQ(results->size(), 3u);
    EXPECT_EQ(results->at(0).content(), "one");
    EXPECT_EQ(results->at(1).content(), "two");
    EXPECT_EQ(results->at(2).status(), WorkerStatus::Failed);
    EXPECT_EQ(results->at(2).worker_id(), ids->at(2));
}

TEST_F(OrchestratorClientTest, ErrorsSurfaceThroughLastError) {
    OrchestratorClient client(base());
    EXPECT_FALSE(client.spawn("nope").has_value());
    EXPECT_NE(client.last_error().find("HTTP 400"), std::string::npos);
    EXPECT_NE(client.last_error().find("nope"), std::string::npos);

    EXPECT_FALSE(client.close("ghost"));
    EXPECT_NE(client.last_error().find("HTTP 404"), std::string::npos);

    auto ids = client.spawn("fake");
    ASSERT_TRUE(ids.has_value());
    EXPECT_TRUE(client.last_error().empty());
    EXPECT_FALSE(client.execute_batch(*ids, {}, 5).has_value());
    EXPECT_NE(client.last_error().find("HTTP 400"), std::string::npos);
}

TEST(OrchestratorClientOfflineTest, UnreachableServerReportsCurlError) {
    OrchestratorClient client("http://127.0.0.1:1");
    EXPECT_FALSE(client.spawn("fake").has_value());
    EXPECT_NE(client.last_error().find("curl_easy_perform failed"), std::string::npos);
}

}  // namespace
