#include "sysprobe/reporters/json_reporter.hpp"
#include "fakes.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace sysprobe;
using nlohmann::json;
using sysprobe::reporters::JsonReporter;
using sysprobe::test::MakeEvent;
using sysprobe::test::MakeFailedEvent;

namespace fs = std::filesystem;

namespace {

core::TraceSession
SampleSession()
{
  core::TraceSession session;
  session.id = 3;
  session.process_id = 4242;
  session.state = core::SessionState::STOPPED;
  session.stop_reason = core::StopReason::BREAKPOINT;
  session.started_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
  session.stopped_at = session.started_at + std::chrono::seconds(2);
  session.triggered_by = 2;
  session.evicted_events = 7;

  session.filters.enabled = true;
  session.filters.syscall_names = {"openat", "read"};
  session.filters.excluded_syscalls = {"futex"};
  session.filters.thread_id = 4243;

  session.breakpoints.push_back(core::Breakpoint::FromSpec("write"));
  session.breakpoints.push_back(core::Breakpoint::FromSpec("openat:result < 0 && error == ENOENT"));
  session.breakpoints[0].id = 1;
  session.breakpoints[1].id = 2;
  session.breakpoints[1].hit_count = 1;

  auto open = MakeEvent("openat", 3, 2100, {std::string("/etc/hosts"), 0L});
  open.id = 8;
  auto read = MakeEvent("read", 4, 500, {3L, std::vector<uint8_t>{0xde, 0xad, 0x00}, 4096L});
  read.id = 9;
  auto failed = MakeFailedEvent("openat", "ENOENT");
  failed.id = 10;
  session.events = {open, read, failed};
  return session;
}

} // namespace

TEST(JsonReporter, EventJsonShape)
{
  JsonReporter reporter;
  auto event = MakeEvent("read", 4, 500, {3L, std::vector<uint8_t>{0x01, 0xff}, std::string("x")});
  event.raw_line = "raw";

  auto j = reporter.EventToJson(event);
  EXPECT_EQ(j["name"], "read");
  EXPECT_EQ(j["result"], 4);
  EXPECT_TRUE(j["error"].is_null());
  EXPECT_EQ(j["parameters"][0], 3);
  EXPECT_EQ(j["parameters"][1]["bytes"], "01ff");
  EXPECT_EQ(j["parameters"][2], "x");
  EXPECT_FALSE(j.contains("raw_line"));

  reporters::JsonReporterConfig config;
  config.include_raw_lines = true;
  EXPECT_EQ(JsonReporter(config).EventToJson(event)["raw_line"], "raw");
}

TEST(JsonReporter, FormatsTimestampsAsUtc)
{
  auto time = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123LL));
  EXPECT_EQ(JsonReporter::FormatTimestamp(time), "2023-11-14T22:13:20.123Z");
}

TEST(JsonReporter, ExportedTraceRoundTrips)
{
  JsonReporter reporter;
  auto original = SampleSession();

  auto document = reporter.ExportTrace(original);
  EXPECT_EQ(document["format"], JsonReporter::kTraceFormat);
  EXPECT_EQ(document["version"], JsonReporter::kTraceVersion);
  EXPECT_FALSE(document["session"].contains("events"));
  EXPECT_EQ(document["events"].size(), 3u);

  auto imported = JsonReporter::ImportTrace(document);
  ASSERT_TRUE(imported.has_value());

  EXPECT_EQ(imported->id, 3u);
  EXPECT_EQ(imported->process_id, 4242);
  EXPECT_EQ(imported->state, core::SessionState::STOPPED);
  EXPECT_EQ(imported->stop_reason, core::StopReason::BREAKPOINT);
  EXPECT_EQ(imported->started_at, original.started_at);
  EXPECT_EQ(imported->stopped_at, original.stopped_at);
  ASSERT_TRUE(imported->triggered_by.has_value());
  EXPECT_EQ(*imported->triggered_by, 2u);
  EXPECT_EQ(imported->evicted_events, 7u);

  EXPECT_TRUE(imported->filters.enabled);
  EXPECT_EQ(imported->filters.syscall_names, original.filters.syscall_names);
  EXPECT_EQ(imported->filters.excluded_syscalls, original.filters.excluded_syscalls);
  EXPECT_EQ(imported->filters.thread_id, original.filters.thread_id);

  ASSERT_EQ(imported->breakpoints.size(), 2u);
  EXPECT_FALSE(imported->breakpoints[0].condition.has_value());
  ASSERT_TRUE(imported->breakpoints[1].condition.has_value());
  EXPECT_EQ(imported->breakpoints[1].condition->ToString(), "result < 0 && error == ENOENT");
  EXPECT_EQ(imported->breakpoints[1].hit_count, 1u);

  ASSERT_EQ(imported->events.size(), 3u);
  for (std::size_t i = 0; i < 3; ++i) {
    const auto &a = original.events[i];
    const auto &b = imported->events[i];
    EXPECT_EQ(a.id, b.id);
    EXPECT_EQ(a.name, b.name);
    EXPECT_EQ(a.timestamp, b.timestamp);
    EXPECT_EQ(a.parameters, b.parameters);
    EXPECT_EQ(a.result, b.result);
    EXPECT_EQ(a.duration_ns, b.duration_ns);
    EXPECT_EQ(a.error, b.error);
    EXPECT_EQ(a.tid, b.tid);
  }

  // Imported conditions still evaluate
  EXPECT_TRUE(imported->breakpoints[1].Matches(imported->events[2]));
}

TEST(JsonReporter, ImportRejectsForeignDocuments)
{
  EXPECT_FALSE(JsonReporter::ImportTrace(json::object()).has_value());
  EXPECT_FALSE(JsonReporter::ImportTrace(json{{"format", "other"}, {"version", 1}}).has_value());
  EXPECT_FALSE(JsonReporter::ImportTrace(json{{"format", "sysprobe-trace"}, {"version", 99}}).has_value());

  JsonReporter reporter;
  auto document = reporter.ExportTrace(SampleSession());

  auto no_session = document;
  no_session.erase("session");
  EXPECT_FALSE(JsonReporter::ImportTrace(no_session).has_value());

  auto bad_condition = document;
  bad_condition["breakpoints"][0]["condition"] = "result <";
  EXPECT_FALSE(JsonReporter::ImportTrace(bad_condition).has_value());

  auto bad_argument = document;
  bad_argument["events"][0]["parameters"][0] = json::array({1, 2});
  EXPECT_FALSE(JsonReporter::ImportTrace(bad_argument).has_value());

  auto bad_event = document;
  bad_event["events"][0].erase("name");
  EXPECT_FALSE(JsonReporter::ImportTrace(bad_event).has_value());
}

TEST(JsonReporter, TraceFileRoundTrip)
{
  auto path = fs::temp_directory_path() / "sysprobe_json_reporter_test.json";
  JsonReporter reporter;
  ASSERT_TRUE(reporter.ExportTraceToFile(SampleSession(), path));

  auto imported = JsonReporter::ImportTraceFromFile(path);
  ASSERT_TRUE(imported.has_value());
  EXPECT_EQ(imported->events.size(), 3u);

  {
    std::ofstream out(path);
    out << "{ not json";
  }
  EXPECT_FALSE(JsonReporter::ImportTraceFromFile(path).has_value());
  fs::remove(path);

  EXPECT_FALSE(JsonReporter::ImportTraceFromFile("/nonexistent/trace.json").has_value());
  EXPECT_FALSE(reporter.ExportTraceToFile(SampleSession(), "/nonexistent/dir/trace.json"));
}

TEST(JsonReporter, SnapshotAndDiffShape)
{
  core::MemorySnapshot snapshot;
  snapshot.id = 5;
  snapshot.process_id = 10;
  snapshot.regions_by_view[monitors::MemoryView::HEAP] = {test::MakeRegion(0x1000, 0x2000)};
  snapshot.summary = core::SnapshotStore::Summarize(snapshot.regions_by_view);

  JsonReporter reporter;
  auto j = reporter.SnapshotToJson(snapshot);
  EXPECT_TRUE(j["session_id"].is_null());
  EXPECT_EQ(j["summary"]["used_size"], 0x2000);
  ASSERT_EQ(j["regions"]["heap"].size(), 1u);
  EXPECT_EQ(j["regions"]["heap"][0]["base_address"], "0x1000");
  EXPECT_EQ(j["regions"]["heap"][0]["end_address"], "0x3000");

  EXPECT_FALSE(reporter.SnapshotToJson(snapshot, false).contains("regions"));

  analyzers::SnapshotDiff diff;
  diff.snapshot_a = 1;
  diff.snapshot_b = 2;
  diff.views[monitors::MemoryView::HEAP].added.push_back(test::MakeRegion(0x4000, 0x1000));
  diff.analysis.net_size_change = -4096;
  auto d = reporter.DiffToJson(diff);
  EXPECT_EQ(d["analysis"]["net_size_change"], -4096);
  EXPECT_EQ(d["views"]["heap"]["added"].size(), 1u);
}
