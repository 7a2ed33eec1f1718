#include <modgraph/core/diagnostics.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using modgraph::core::DiagnosticEmitter;
using modgraph::core::DiagnosticEvent;
using modgraph::core::format_diagnostic;
using modgraph::core::severity_name;
using modgraph::core::Severity;

TEST(DiagnosticsTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Info), "info");
    EXPECT_STREQ(severity_name(Severity::Warning), "warning");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(DiagnosticsTest, EmitRecordsAllFields) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Error, "resolve", "validate", "bad extension");

    ASSERT_EQ(emitter.size(), 1u);
    const auto& e = emitter.events()[0];
    EXPECT_EQ(e.severity, Severity::Error);
    EXPECT_EQ(e.module, "resolve");
    EXPECT_EQ(e.stage, "validate");
    EXPECT_EQ(e.message, "bad extension");
    EXPECT_NE(e.timestamp, std::chrono::steady_clock::time_point{});
}

TEST(DiagnosticsTest, FormatIncludesContext) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "resolve";
    event.stage = "validate";
    event.message = "no extensions";
    EXPECT_EQ(format_diagnostic(event), "[warning] resolve/validate: no extensions");

    event.stage.clear();
    EXPECT_EQ(format_diagnostic(event), "[warning] resolve: no extensions");
}

TEST(DiagnosticsTest, MinSeverityFilters) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Warning);
    emitter.emit(Severity::Info, "resolve", "validate", "summary");
    emitter.emit(Severity::Warning, "resolve", "validate", "careful");
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].message, "careful");
}

TEST(DiagnosticsTest, ObserversSeeEmittedEvents) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&](const DiagnosticEvent& e) { seen.push_back(format_diagnostic(e)); });
    emitter.emit(Severity::Info, "policy", "select", "commonjs");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "[info] policy/select: commonjs");
}

TEST(DiagnosticsTest, QueriesAndClear) {
    DiagnosticEmitter emitter;
    emitter.emit(Severity::Info, "resolve", "validate", "a");
    emitter.emit(Severity::Error, "policy", "select", "b");
    emitter.emit(Severity::Error, "resolve", "validate", "c");

    auto errors = emitter.events_by_severity(Severity::Error);
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_EQ(errors[0].message, "b");
    EXPECT_EQ(errors[1].message, "c");

    emitter.clear();
    EXPECT_EQ(emitter.size(), 0u);
    EXPECT_TRUE(emitter.events_by_severity(Severity::Error).empty());
}
