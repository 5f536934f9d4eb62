#include <gtest/gtest.h>
#include <stdexcept>
#include "../../../shared/cpp/orchestrator_sdk/include/worker_result.hpp"

using json = nlohmann::json;
using namespace std::chrono;

namespace {

TimePoint at_noon() {
    return parse_timestamp("2025-01-01T12:00:00.123Z");
}

TEST(WorkerStatusTest, WireNamesAreLowercase) {
    EXPECT_STREQ(to_string(WorkerStatus::Pending), "pending");
    EXPECT_STREQ(to_string(WorkerStatus::Timeout), "timeout");
    EXPECT_EQ(worker_status_from_string("stopped"), WorkerStatus::Stopped);
    EXPECT_THROW(worker_status_from_string("RUNNING"), std::invalid_argument);
}

TEST(WorkerStatusTest, OnlyOutcomesAreTerminal) {
    EXPECT_FALSE(is_terminal(WorkerStatus::Pending));
    EXPECT_FALSE(is_terminal(WorkerStatus::Starting));
    EXPECT_FALSE(is_terminal(WorkerStatus::Running));
    EXPECT_TRUE(is_terminal(WorkerStatus::Completed));
    EXPECT_TRUE(is_terminal(WorkerStatus::Failed));
    EXPECT_TRUE(is_terminal(WorkerStatus::Timeout));
    EXPECT_TRUE(is_terminal(WorkerStatus::Stopped));
}

TEST(TimestampTest, FormatsUtcWithMilliseconds) {
    EXPECT_EQ(format_timestamp(at_noon()), "2025-01-01T12:00:00.123Z");
    EXPECT_EQ(format_timestamp(parse_timestamp("2024-02-29T23:59:59Z")), "2024-02-29T23:59:59.000Z");
    EXPECT_THROW(parse_timestamp("yesterday"), std::invalid_argument);
}

TEST(WorkerResultTest, SuccessMeansCompleted) {
    WorkerResult ok("w1", WorkerStatus::Completed, "done", std::nullopt, at_noon(), at_noon(), 0.5);
    WorkerResult timed_out("w1", WorkerStatus::Timeout, "partial", std::string("slow"), at_noon(), std::nullopt, 3.0);
    EXPECT_TRUE(ok.is_success());
    EXPECT_FALSE(timed_out.is_success());
    EXPECT_TRUE(timed_out.has_content());
}

TEST(WorkerResultTest, SerializesAbsentFieldsAsNull) {
    WorkerResult r("w2", WorkerStatus::Running, "", std::nullopt, at_noon(), std::nullopt, 0.0);
    auto j = r.to_json();
    EXPECT_EQ(j["status"], "running");
    EXPECT_TRUE(j["error"].is_null());
    EXPECT_TRUE(j["completed_at"].is_null());
    EXPECT_TRUE(j["metadata"].is_object());
    EXPECT_EQ(j["started_at"], "2025-01-01T12:00:00.123Z");
}

TEST(WorkerResultTest, RoundTripsThroughJson) {
    json meta = {{"ai_type", "qwen"}, {"chunks", 4}};
    WorkerResult r("w3", WorkerStatus::Failed, "partial", std::string("boom"), at_noon(),
                   at_noon() + milliseconds(1500), 1.5, meta);
    auto back = WorkerResult::from_json(r.to_json());
    EXPECT_EQ(back.worker_id(), "w3");
    EXPECT_EQ(back.status(), WorkerStatus::Failed);
    EXPECT_EQ(back.content(), "partial");
    ASSERT_TRUE(back.error().has_value());
    EXPECT_EQ(*back.error(), "boom");
    EXPECT_EQ(back.started_at(), r.started_at());
    ASSERT_TRUE(back.completed_at().has_value());
    EXPECT_EQ(*back.completed_at(), *r.completed_at());
    EXPECT_DOUBLE_EQ(back.duration_seconds(), 1.5);
    EXPECT_EQ(back.metadata(), meta);
}

TEST(WorkerResultTest, NonObjectMetadataBecomesEmpty) {
    WorkerResult r("w4", WorkerStatus::Completed, "x", std::nullopt, at_noon(), at_noon(), 0.0, json::array({1, 2}));
    EXPECT_TRUE(r.metadata().is_object());
    EXPECT_TRUE(r.metadata().empty());
}

TEST(WorkerResultTest, SummaryShowsPreviewOrError) {
    WorkerResult ok("w5", WorkerStatus::Completed, std::string(80, 'a'), std::nullopt, at_noon(), at_noon(), 0.0);
    EXPECT_EQ(ok.summary(), "w5 [completed]: " + std::string(50, 'a') + "...");
    WorkerResult bad("w5", WorkerStatus::Failed, "", std::string("exit 3"), at_noon(), at_noon(), 0.0);
    EXPECT_EQ(bad.summary(), "w5 [failed]: exit 3");
}

}  // namespace
