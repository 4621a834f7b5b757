#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "swfcoord/common/diagnostics.h"
#include "swfcoord/testing/fake_activity_service.h"

using namespace swfcoord::common;

TEST(DiagnosticsTest, LevelNames) {
    EXPECT_EQ(to_string(DiagnosticLevel::kTrace), "TRACE");
    EXPECT_EQ(to_string(DiagnosticLevel::kDebug), "DEBUG");
    EXPECT_EQ(to_string(DiagnosticLevel::kInfo), "INFO");
    EXPECT_EQ(to_string(DiagnosticLevel::kWarn), "WARN");
    EXPECT_EQ(to_string(DiagnosticLevel::kError), "ERROR");
}

TEST(DiagnosticsTest, EventKindNames) {
    EXPECT_EQ(to_string(DiagnosticEventKind::kHeartbeatError),
              "heartbeat-error");
    EXPECT_EQ(to_string(DiagnosticEventKind::kActivityGone),
              "activity-gone");
    EXPECT_EQ(to_string(DiagnosticEventKind::kCancelRequested),
              "activity-cancel-requested");
    EXPECT_EQ(to_string(DiagnosticEventKind::kCancelError),
              "activity-cancel-err");
    EXPECT_EQ(to_string(DiagnosticEventKind::kRespondError),
              "respond-error");
}

TEST(DiagnosticSinkTest, FillsCorrelationFieldsFromTask) {
    std::vector<DiagnosticEvent> events;
    DiagnosticSink sink(
        [&events](const DiagnosticEvent& e) { events.push_back(e); });
    auto task = swfcoord::testing::default_activity_task();

    sink.emit(DiagnosticLevel::kWarn, "heartbeat", task,
              DiagnosticEventKind::kHeartbeatError, std::string("timeout"));

    ASSERT_EQ(events.size(), 1u);
    const auto& e = events[0];
    EXPECT_EQ(e.level, DiagnosticLevel::kWarn);
    EXPECT_EQ(e.component, "heartbeat");
    EXPECT_EQ(e.workflow_id, "test-workflow-id");
    EXPECT_EQ(e.activity_type, "TestActivity");
    EXPECT_EQ(e.activity_id, "test-activity-id");
    EXPECT_EQ(e.kind, DiagnosticEventKind::kHeartbeatError);
    EXPECT_EQ(e.error.value_or(""), "timeout");
}

TEST(DiagnosticSinkTest, DropsEventsBelowMinimumLevel) {
    int received = 0;
    DiagnosticSink sink([&received](const DiagnosticEvent&) { ++received; },
                        DiagnosticLevel::kWarn);
    auto task = swfcoord::testing::default_activity_task();

    sink.emit(DiagnosticLevel::kDebug, "heartbeat", task,
              DiagnosticEventKind::kHeartbeatRecorded);
    sink.emit(DiagnosticLevel::kInfo, "coordinator", task,
              DiagnosticEventKind::kTaskCompleted);
    sink.emit(DiagnosticLevel::kError, "coordinator", task,
              DiagnosticEventKind::kTaskFailed);

    EXPECT_EQ(received, 1);
    EXPECT_EQ(sink.min_level(), DiagnosticLevel::kWarn);
}

TEST(DiagnosticSinkTest, DefaultSinkWritesToStderr) {
    DiagnosticSink sink;
    EXPECT_EQ(sink.min_level(), DiagnosticLevel::kInfo);

    DiagnosticEvent event;
    event.level = DiagnosticLevel::kError;
    event.component = "worker";
    event.activity_id = "a-1";
    event.kind = DiagnosticEventKind::kRespondError;
    event.error = "unavailable";

    ::testing::internal::CaptureStderr();
    sink.emit(event);
    auto output = ::testing::internal::GetCapturedStderr();

    EXPECT_NE(output.find("[ERROR]"), std::string::npos);
    EXPECT_NE(output.find("component=worker"), std::string::npos);
    EXPECT_NE(output.find("activity-id=a-1"), std::string::npos);
    EXPECT_NE(output.find("at=respond-error"), std::string::npos);
    EXPECT_NE(output.find("error=\"unavailable\""), std::string::npos);
}
