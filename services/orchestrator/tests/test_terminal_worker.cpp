#include <gtest/gtest.h>
#include <csignal>
#include <future>
#include <mutex>
#include <thread>
#include <vector>
#include "../include/errors.hpp"
#include "../include/process.hpp"
#include "../include/result_store.hpp"
#include "../include/terminal_worker.hpp"

#ifndef ECHO_AGENT_PATH
#error "ECHO_AGENT_PATH must point at the echo-agent binary"
#endif

using json = nlohmann::json;
using namespace std::chrono;

namespace {

class RecordingStore : public ResultStore {
public:
    explicit RecordingStore(bool fail = false) : fail_(fail) {}
    void store(const std::string& worker_id, const WorkerResult& result, const json& metadata) override {
        std::lock_guard<std::mutex> lock(mtx);
        calls.push_back({worker_id, to_string(result.status()), metadata});
        if (fail_) throw std::runtime_error("store offline");
    }
    struct Call {
        std::string worker_id;
        std::string status;
        json metadata;
    };
    std::mutex mtx;
    std::vector<Call> calls;

private:
    bool fail_;
};

class TerminalWorkerTest : public ::testing::Test {
protected:
    std::shared_ptr<TerminalAIWorker> make(const std::string& extra_args = "",
                                           std::shared_ptr<ResultStore> store = nullptr,
                                           milliseconds grace = seconds(5)) {
        TerminalAgentProfile profile{"echo", std::string("'") + ECHO_AGENT_PATH + "' " + extra_args};
        return std::make_shared<TerminalAIWorker>("term-1", "terminal-echo", profile, runtime_, store, grace);
    }

    std::shared_ptr<ProcessRuntime> runtime_ = std::make_shared<PosixProcessRuntime>();
};

TEST_F(TerminalWorkerTest, StartsPendingAndRunsAfterStart) {
    auto w = make();
    EXPECT_EQ(w->get_status(), WorkerStatus::Pending);
    w->start();
    EXPECT_EQ(w->get_status(), WorkerStatus::Running);
    w->stop();
    EXPECT_EQ(w->get_status(), WorkerStatus::Stopped);
}

TEST_F(TerminalWorkerTest, AccumulatesContentUntilTypeDone) {
    auto w = make();
    auto r = w->execute("hello", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_EQ(r.content(), "echo: hello!");
    EXPECT_FALSE(r.error().has_value());
    EXPECT_EQ(r.metadata()["completion_marker"], "type");
    EXPECT_EQ(r.metadata()["ai_type"], "echo");
    EXPECT_EQ(r.metadata()["chunks"], 4);
    EXPECT_EQ(r.metadata()["skipped_chunks"], 0);
    EXPECT_EQ(r.metadata()["last_output"], "!");
    EXPECT_EQ(w->get_status(), WorkerStatus::Completed);
    ASSERT_TRUE(w->last_result().has_value());
    EXPECT_EQ(w->last_result()->content(), "echo: hello!");
}

TEST_F(TerminalWorkerTest, CompletionChunkContentIsNotAppended) {
    auto w = make();
    auto r = w->execute("finish", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_EQ(r.content(), "hello");
    EXPECT_EQ(r.metadata()["completion_marker"], "finish_reason");
}

TEST_F(TerminalWorkerTest, RecognisesStatusAndCompletionMarkers) {
    auto a = make();
    EXPECT_EQ(a->execute("status", seconds(10)).metadata()["completion_marker"], "status");
    auto b = make();
    EXPECT_EQ(b->execute("completion", seconds(10)).metadata()["completion_marker"], "type");
}

TEST_F(TerminalWorkerTest, SkipsMalformedLines) {
    auto w = make();
    auto r = w->execute("garbage", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_EQ(r.content(), "after garbage");
    EXPECT_EQ(r.metadata()["skipped_chunks"], 2);
    EXPECT_EQ(r.metadata()["completion_marker"], "done");
}

TEST_F(TerminalWorkerTest, NonzeroExitFailsWithStderrAndPartialContent) {
    auto w = make();
    auto r = w->execute("crash", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Failed);
    EXPECT_EQ(r.content(), "partial");
    ASSERT_TRUE(r.error().has_value());
    EXPECT_NE(r.error()->find("agent crashed"), std::string::npos);
    EXPECT_EQ(r.metadata()["exit_code"], 3);
    EXPECT_EQ(r.metadata()["error_kind"], "ExecutionFailure");
    EXPECT_EQ(w->get_status(), WorkerStatus::Failed);
}

TEST_F(TerminalWorkerTest, CleanExitWithoutMarkerCompletes) {
    auto w = make();
    auto r = w->execute("exit0", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_EQ(r.content(), "bye");
    EXPECT_TRUE(r.metadata()["completion_marker"].is_null());
    EXPECT_EQ(r.metadata()["exit_code"], 0);
}

TEST_F(TerminalWorkerTest, TimeoutKillsProcessAndKeepsPartialContent) {
    auto w = make();
    auto t0 = steady_clock::now();
    auto r = w->execute("sleep", milliseconds(500));
    EXPECT_LT(steady_clock::now() - t0, seconds(5));
    EXPECT_EQ(r.status(), WorkerStatus::Timeout);
    EXPECT_EQ(r.content(), "working");
    EXPECT_EQ(r.metadata()["error_kind"], "ExecutionTimeout");
    EXPECT_GE(r.duration_seconds(), 0.4);
    EXPECT_EQ(w->get_status(), WorkerStatus::Timeout);
}

TEST_F(TerminalWorkerTest, MissingExecutableRaisesSpawnError) {
    TerminalAgentProfile profile{"ghost", "/nonexistent/agent-cli --flag"};
    TerminalAIWorker w("term-x", "terminal-ghost", profile, runtime_);
    EXPECT_THROW(w.start(), SpawnError);
    EXPECT_EQ(w.get_status(), WorkerStatus::Failed);
}

TEST_F(TerminalWorkerTest, SecondExecuteWhileBusyFailsFast) {
    auto w = make();
    w->start();
    auto first = std::async(std::launch::async, [&]{ return w->execute("sleep", seconds(30)); });
    while (!w->busy()) std::this_thread::sleep_for(milliseconds(5));
    std::this_thread::sleep_for(milliseconds(300));
    EXPECT_THROW(w->execute("hello", seconds(1)), WorkerBusy);
    w->stop();
    auto r = first.get();
    EXPECT_EQ(r.status(), WorkerStatus::Stopped);
    ASSERT_TRUE(r.error().has_value());
    EXPECT_EQ(*r.error(), "worker stopped during execution");
}

TEST_F(TerminalWorkerTest, StopIsIdempotentAndFinal) {
    auto w = make();
    w->stop();
    EXPECT_EQ(w->get_status(), WorkerStatus::Stopped);
    w->stop();
    EXPECT_EQ(w->get_status(), WorkerStatus::Stopped);
    EXPECT_THROW(w->execute("hello", seconds(1)), WorkerUnavailable);
    w->start();
    EXPECT_EQ(w->get_status(), WorkerStatus::Stopped);
}

TEST_F(TerminalWorkerTest, StopForceKillsAfterGrace) {
    auto w = make("--ignore-term", nullptr, milliseconds(200));
    w->start();
    pid_t pid = w->progress()["pid"].get<pid_t>();
    auto t0 = steady_clock::now();
    w->stop();
    EXPECT_LT(steady_clock::now() - t0, seconds(5));
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST_F(TerminalWorkerTest, CompletionDoesNotWaitOutStopGrace) {
    auto w = make("--ignore-term --linger", nullptr, seconds(5));
    w->start();
    pid_t pid = w->progress()["pid"].get<pid_t>();
    auto t0 = steady_clock::now();
    auto r = w->execute("hello", seconds(10));
    EXPECT_LT(steady_clock::now() - t0, milliseconds(2500));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_NE(::kill(pid, 0), 0);
}

TEST_F(TerminalWorkerTest, OversizedTaskToDeafAgentTimesOut) {
    TerminalAgentProfile profile{"deaf", "sleep 30"};
    TerminalAIWorker w("term-deaf", "terminal-deaf", profile, runtime_, nullptr, milliseconds(200));
    std::string task(300000, 'x');
    auto t0 = steady_clock::now();
    auto r = w.execute(task, milliseconds(300));
    auto elapsed = steady_clock::now() - t0;
    EXPECT_EQ(r.status(), WorkerStatus::Timeout);
    EXPECT_GE(elapsed, milliseconds(250));
    EXPECT_LT(elapsed, milliseconds(2500));
    ASSERT_TRUE(r.error().has_value());
    EXPECT_NE(r.error()->find("timed out"), std::string::npos);
    EXPECT_EQ(r.metadata()["error_kind"], "ExecutionTimeout");
}

TEST_F(TerminalWorkerTest, ForwardsResultToStore) {
    auto store = std::make_shared<RecordingStore>();
    auto w = make("", store);
    w->execute("hello", seconds(10));
    ASSERT_EQ(store->calls.size(), 1u);
    EXPECT_EQ(store->calls[0].worker_id, "term-1");
    EXPECT_EQ(store->calls[0].status, "completed");
    EXPECT_EQ(store->calls[0].metadata["task"], "hello");
}

TEST_F(TerminalWorkerTest, StoreFailureDoesNotFailTask) {
    auto store = std::make_shared<RecordingStore>(true);
    auto w = make("", store);
    auto r = w->execute("hello", seconds(10));
    EXPECT_EQ(r.status(), WorkerStatus::Completed);
    EXPECT_EQ(store->calls.size(), 1u);
}

}  // namespace
