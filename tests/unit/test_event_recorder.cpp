/**
 * @file test_event_recorder.cpp
 * @brief Unit tests for EventRecorder events and counters.
 */

#include "telemetry/event_recorder.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

using namespace task_orchestrator;

namespace {

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<std::string>& lines) : lines_(lines) {}

    void write(std::string_view json_line) override { lines_.emplace_back(json_line); }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
};

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

class EventRecorderTest : public ::testing::Test {
protected:
    std::vector<std::string> lines_;
    EventRecorder recorder_{std::make_unique<CaptureSink>(lines_)};
};

TEST_F(EventRecorderTest, AdmittedEvent) {
    TaskRecord record;
    record.name = "load";
    record.scheduled_time = 5000;
    record.depends_on = {"extract"};
    record.admission_id = 9;

    recorder_.record_admitted(record, 1200);
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_TRUE(contains(lines_[0], R"("event":"admitted")"));
    EXPECT_TRUE(contains(lines_[0], R"("task":"load")"));
    EXPECT_TRUE(contains(lines_[0], R"("admission_id":9)"));
    EXPECT_TRUE(contains(lines_[0], R"("wait_ms":1200)"));
    EXPECT_TRUE(contains(lines_[0], R"("depends_on":1)"));
    EXPECT_TRUE(contains(lines_[0], R"("state":"pending")"));
    EXPECT_EQ(recorder_.counters().admitted, 1u);
}

TEST_F(EventRecorderTest, RejectedEventEscapesReason) {
    recorder_.record_rejected("x", Error{ErrorCode::DuplicateTask, "name \"x\" taken"});
    ASSERT_EQ(lines_.size(), 1u);
    EXPECT_TRUE(contains(lines_[0], R"("code":"duplicate_task")"));
    EXPECT_TRUE(contains(lines_[0], R"(name \"x\" taken)"));
    EXPECT_EQ(recorder_.counters().rejected, 1u);
}

TEST_F(EventRecorderTest, FinishedCountsFailures) {
    ExecutionResult ok;
    ok.name = "a";
    ok.exit_code = 0;

    ExecutionResult bad_exit;
    bad_exit.name = "b";
    bad_exit.exit_code = 2;

    ExecutionResult no_launch;
    no_launch.name = "c";
    no_launch.error_message = "Failed to launch";

    recorder_.record_finished(ok);
    recorder_.record_finished(bad_exit);
    recorder_.record_finished(no_launch);

    auto counters = recorder_.counters();
    EXPECT_EQ(counters.finished, 3u);
    EXPECT_EQ(counters.failed, 2u);
    ASSERT_EQ(lines_.size(), 3u);
    EXPECT_TRUE(contains(lines_[1], R"("exit_code":2)"));
    EXPECT_TRUE(contains(lines_[2], R"("error":"Failed to launch")"));
}

TEST_F(EventRecorderTest, LifecycleCounters) {
    TaskRecord record;
    record.name = "t";
    record.dependents = {"u", "v"};

    recorder_.record_armed("t", Milliseconds{250});
    recorder_.record_dispatched("t");
    recorder_.record_cancelled(record, TaskState::Armed);

    auto counters = recorder_.counters();
    EXPECT_EQ(counters.armed, 1u);
    EXPECT_EQ(counters.dispatched, 1u);
    EXPECT_EQ(counters.cancelled, 1u);
    ASSERT_EQ(lines_.size(), 3u);
    EXPECT_TRUE(contains(lines_[0], R"("delay_ms":250)"));
    EXPECT_TRUE(contains(lines_[2], R"("prior_state":"armed")"));
    EXPECT_TRUE(contains(lines_[2], R"("freed_dependents":2)"));
}
