/**
 * @file json_reporter.cpp
 * @brief Implementation of the client JSON schema and trace export/import
 *
 * **Exported Trace**:
 * ```json
 * {
 *   "format": "sysprobe-trace",
 *   "version": 1,
 *   "session": {"id": 3, "process_id": 1234, "stop_reason": "breakpoint", ...},
 *   "filters": {"enabled": true, "syscall_names": ["read"], ...},
 *   "breakpoints": [{"id": 1, "syscall_name": "open", "condition": "result < 0", ...}],
 *   "events": [{"id": 1, "name": "read", "timestamp_ns": 1738324800123456789, ...}]
 * }
 * ```
 *
 * @date 2025
 */

#include "sysprobe/reporters/json_reporter.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <iomanip>
#include <ctime>

using json = nlohmann::json;

namespace sysprobe {
namespace reporters {

using monitors::SyscallArg;
using monitors::SyscallEvent;

namespace {

std::string Hex(uint64_t value) {
    std::ostringstream oss;
    oss << "0x" << std::hex << value;
    return oss.str();
}

int64_t ToNanoseconds(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(time.time_since_epoch()).count();
}

std::chrono::system_clock::time_point FromNanoseconds(int64_t ns) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::nanoseconds(ns)));
}

std::optional<std::vector<uint8_t>> HexToBytes(const std::string& hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        unsigned int value = 0;
        std::istringstream iss(hex.substr(i, 2));
        if (!(iss >> std::hex >> value)) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<uint8_t>(value));
    }
    return bytes;
}

json ViewMap(const std::map<monitors::MemoryView, double>& values) {
    json j = json::object();
    for (const auto& [view, value] : values) {
        j[monitors::MemoryViewToString(view)] = value;
    }
    return j;
}

} // anonymous namespace

// Constructor
JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::FormatTimestamp(std::chrono::system_clock::time_point time) {
    auto t = std::chrono::system_clock::to_time_t(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      time.time_since_epoch()).count() % 1000;
    if (millis < 0) {
        millis += 1000;
    }

    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string JsonReporter::Dump(const json& j) const {
    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

/*******************************************************************************
 * Tracing
 ******************************************************************************/

json JsonReporter::ArgumentToJson(const SyscallArg& arg) {
    if (const auto* number = std::get_if<long>(&arg)) {
        return *number;
    }
    if (const auto* text = std::get_if<std::string>(&arg)) {
        return *text;
    }
    const auto& bytes = std::get<std::vector<uint8_t>>(arg);
    return json{{"bytes", utils::HashUtils::BinaryToHex(bytes.data(), bytes.size())}};
}

std::optional<SyscallArg> JsonReporter::ArgumentFromJson(const json& j) {
    if (j.is_number_integer()) {
        return SyscallArg{j.get<long>()};
    }
    if (j.is_string()) {
        return SyscallArg{j.get<std::string>()};
    }
    if (j.is_object() && j.contains("bytes") && j["bytes"].is_string()) {
        auto bytes = HexToBytes(j["bytes"].get<std::string>());
        if (bytes) {
            return SyscallArg{std::move(*bytes)};
        }
    }
    return std::nullopt;
}

json JsonReporter::EventToJson(const SyscallEvent& event) const {
    json parameters = json::array();
    for (const auto& arg : event.parameters) {
        parameters.push_back(ArgumentToJson(arg));
    }

    json j = {
        {"id", event.id},
        {"name", event.name},
        {"timestamp", FormatTimestamp(event.timestamp)},
        {"timestamp_ns", ToNanoseconds(event.timestamp)},
        {"parameters", parameters},
        {"result", event.result},
        {"duration_ns", event.duration_ns},
        {"error", event.error ? json(*event.error) : json(nullptr)},
        {"pid", event.pid},
        {"tid", event.tid}
    };

    if (config_.include_raw_lines && !event.raw_line.empty()) {
        j["raw_line"] = event.raw_line;
    }
    return j;
}

SyscallEvent JsonReporter::EventFromJson(const json& j) {
    SyscallEvent event;
    event.id = j.at("id").get<uint64_t>();
    event.name = j.at("name").get<std::string>();
    event.timestamp = FromNanoseconds(j.value("timestamp_ns", int64_t{0}));
    event.result = j.value("result", 0L);
    event.duration_ns = j.value("duration_ns", uint64_t{0});
    event.pid = j.value("pid", 0);
    event.tid = j.value("tid", 0);
    event.raw_line = j.value("raw_line", std::string());

    if (j.contains("error") && j["error"].is_string()) {
        event.error = j["error"].get<std::string>();
    }

    if (j.contains("parameters")) {
        for (const auto& param : j.at("parameters")) {
            auto arg = ArgumentFromJson(param);
            if (!arg) {
                throw core::InvalidArgumentError("Unsupported argument in event " +
                                                 std::to_string(event.id) + ": " + param.dump());
            }
            event.parameters.push_back(std::move(*arg));
        }
    }
    return event;
}

json JsonReporter::BreakpointToJson(const core::Breakpoint& breakpoint) const {
    return {
        {"id", breakpoint.id},
        {"syscall_name", breakpoint.syscall_name},
        {"condition", breakpoint.condition ? json(breakpoint.condition->ToString()) : json(nullptr)},
        {"hit_count", breakpoint.hit_count}
    };
}

json JsonReporter::FiltersToJson(const core::TraceFilters& filters) const {
    return {
        {"enabled", filters.enabled},
        {"syscall_names", filters.syscall_names},
        {"excluded_syscalls", filters.excluded_syscalls},
        {"thread_id", filters.thread_id ? json(*filters.thread_id) : json(nullptr)}
    };
}

json JsonReporter::SessionToJson(const core::TraceSession& session) const {
    json breakpoints = json::array();
    for (const auto& bp : session.breakpoints) {
        breakpoints.push_back(BreakpointToJson(bp));
    }

    json events = json::array();
    for (const auto& event : session.events) {
        events.push_back(EventToJson(event));
    }

    return {
        {"id", session.id},
        {"process_id", session.process_id},
        {"state", core::SessionStateToString(session.state)},
        {"stop_reason", core::StopReasonToString(session.stop_reason)},
        {"started_at", FormatTimestamp(session.started_at)},
        {"started_at_ns", ToNanoseconds(session.started_at)},
        {"stopped_at", session.stopped_at ? json(FormatTimestamp(*session.stopped_at)) : json(nullptr)},
        {"stopped_at_ns", session.stopped_at ? json(ToNanoseconds(*session.stopped_at)) : json(nullptr)},
        {"duration_ms", session.Duration().count()},
        {"error", session.error ? json(*session.error) : json(nullptr)},
        {"triggered_by", session.triggered_by ? json(*session.triggered_by) : json(nullptr)},
        {"evicted_events", session.evicted_events},
        {"filters", FiltersToJson(session.filters)},
        {"breakpoints", breakpoints},
        {"events", events}
    };
}

json JsonReporter::DescriptorToJson(const core::SessionDescriptor& descriptor) const {
    return {
        {"id", descriptor.id},
        {"process_id", descriptor.process_id},
        {"state", core::SessionStateToString(descriptor.state)},
        {"stop_reason", core::StopReasonToString(descriptor.stop_reason)},
        {"event_count", descriptor.event_count},
        {"evicted_events", descriptor.evicted_events},
        {"breakpoint_count", descriptor.breakpoint_count},
        {"started_at", FormatTimestamp(descriptor.started_at)},
        {"stopped_at", descriptor.stopped_at ? json(FormatTimestamp(*descriptor.stopped_at)) : json(nullptr)},
        {"error", descriptor.error ? json(*descriptor.error) : json(nullptr)}
    };
}

json JsonReporter::EventPageToJson(const core::EventPage& page) const {
    json events = json::array();
    for (const auto& event : page.events) {
        events.push_back(EventToJson(event));
    }
    return {
        {"session_id", page.session_id},
        {"total", page.total},
        {"offset", page.offset},
        {"limit", page.limit},
        {"events", events}
    };
}

/*******************************************************************************
 * Analysis
 ******************************************************************************/

json JsonReporter::StatisticsToJson(const analyzers::SyscallStatistics& statistics) const {
    json top_frequency = json::array();
    for (const auto& entry : statistics.top_by_frequency) {
        top_frequency.push_back({{"name", entry.name}, {"count", entry.count}});
    }

    json top_slowest = json::array();
    for (const auto& event : statistics.top_by_slowest) {
        top_slowest.push_back(EventToJson(event));
    }

    return {
        {"total_calls", statistics.total_calls},
        {"unique_calls", statistics.unique_calls},
        {"error_count", statistics.error_count},
        {"error_rate", statistics.error_rate},
        {"total_duration_ns", statistics.total_duration_ns},
        {"avg_duration_ns", statistics.avg_duration_ns},
        {"calls_per_second", statistics.calls_per_second},
        {"top_by_frequency", top_frequency},
        {"top_by_slowest", top_slowest},
        {"distribution", statistics.distribution},
        {"errors_by_code", statistics.errors_by_code}
    };
}

json JsonReporter::ReportToJson(const analyzers::AnalysisReport& report) const {
    json patterns = json::array();
    for (const auto& pattern : report.patterns) {
        json p = {
            {"type", analyzers::PatternTypeToString(pattern.type)},
            {"count", pattern.count},
            {"threshold", pattern.threshold},
            {"window", pattern.window},
            {"description", pattern.description}
        };
        if (!pattern.syscall_name.empty()) {
            p["syscall_name"] = pattern.syscall_name;
        }
        patterns.push_back(p);
    }

    json anomalies = json::array();
    for (const auto& anomaly : report.anomalies) {
        json a = {
            {"type", analyzers::AnomalyTypeToString(anomaly.type)},
            {"value", anomaly.value},
            {"threshold", anomaly.threshold},
            {"description", anomaly.description}
        };
        if (anomaly.event_id) {
            a["event_id"] = *anomaly.event_id;
            a["syscall_name"] = anomaly.syscall_name;
        }
        anomalies.push_back(a);
    }

    json suspicious = json::array();
    for (const auto& call : report.suspicious_calls) {
        suspicious.push_back({
            {"event_id", call.event_id},
            {"syscall_name", call.syscall_name},
            {"risk", analyzers::RiskLevelToString(call.risk)},
            {"reason", call.reason},
            {"timestamp", FormatTimestamp(call.timestamp)}
        });
    }

    return {
        {"generated_at", FormatTimestamp(report.generated_at)},
        {"statistics", StatisticsToJson(report.statistics)},
        {"patterns", patterns},
        {"anomalies", anomalies},
        {"suspicious_calls", suspicious},
        {"highest_risk", report.highest_risk ? json(analyzers::RiskLevelToString(*report.highest_risk))
                                             : json(nullptr)},
        {"recommendations", report.recommendations}
    };
}

/*******************************************************************************
 * Memory
 ******************************************************************************/

json JsonReporter::RegionToJson(const monitors::MemoryRegion& region) const {
    return {
        {"id", region.id},
        {"view", monitors::MemoryViewToString(region.view)},
        {"base_address", Hex(region.base_address)},
        {"end_address", Hex(region.EndAddress())},
        {"size", region.size},
        {"used", region.used},
        {"protection", region.protection},
        {"allocation_kind", monitors::AllocationKindToString(region.allocation_kind)},
        {"label", region.label}
    };
}

json JsonReporter::SnapshotToJson(const core::MemorySnapshot& snapshot, bool include_regions) const {
    json j = {
        {"id", snapshot.id},
        {"session_id", snapshot.session_id ? json(*snapshot.session_id) : json(nullptr)},
        {"process_id", snapshot.process_id},
        {"label", snapshot.label},
        {"taken_at", FormatTimestamp(snapshot.taken_at)},
        {"fingerprint", snapshot.fingerprint},
        {"summary", {
            {"total_size", snapshot.summary.total_size},
            {"used_size", snapshot.summary.used_size},
            {"free_size", snapshot.summary.free_size},
            {"used_percentage", snapshot.summary.used_percentage},
            {"region_count", snapshot.summary.region_count},
            {"used_region_count", snapshot.summary.used_region_count}
        }}
    };

    if (include_regions) {
        json views = json::object();
        for (const auto& [view, regions] : snapshot.regions_by_view) {
            json list = json::array();
            for (const auto& region : regions) {
                list.push_back(RegionToJson(region));
            }
            views[monitors::MemoryViewToString(view)] = list;
        }
        j["regions"] = views;
    }
    return j;
}

json JsonReporter::DiffToJson(const analyzers::SnapshotDiff& diff) const {
    json views = json::object();
    for (const auto& [view, view_diff] : diff.views) {
        json added = json::array();
        for (const auto& region : view_diff.added) {
            added.push_back(RegionToJson(region));
        }
        json removed = json::array();
        for (const auto& region : view_diff.removed) {
            removed.push_back(RegionToJson(region));
        }
        json changed = json::array();
        for (const auto& change : view_diff.changed) {
            changed.push_back({{"old", RegionToJson(change.old_region)},
                               {"new", RegionToJson(change.new_region)}});
        }
        views[monitors::MemoryViewToString(view)] = {
            {"added", added}, {"removed", removed}, {"changed", changed}
        };
    }

    return {
        {"snapshot_a", diff.snapshot_a},
        {"snapshot_b", diff.snapshot_b},
        {"identical", diff.identical},
        {"views", views},
        {"analysis", {
            {"net_size_change", diff.analysis.net_size_change},
            {"leak_suspected", diff.analysis.leak_suspected},
            {"fragmentation_change", ViewMap(diff.analysis.fragmentation_change)},
            {"overall_fragmentation_change", diff.analysis.overall_fragmentation_change}
        }}
    };
}

json JsonReporter::LeakAssessmentToJson(const analyzers::LeakAssessment& assessment) const {
    return {
        {"potential_leak", assessment.potential_leak},
        {"churn", assessment.churn},
        {"net_size_change", assessment.net_size_change},
        {"added_count", assessment.added_count},
        {"removed_count", assessment.removed_count},
        {"threshold", assessment.threshold},
        {"reason", assessment.reason}
    };
}

/*******************************************************************************
 * Trace Export / Import
 ******************************************************************************/

json JsonReporter::ExportTrace(const core::TraceSession& session) const {
    json j = SessionToJson(session);

    json document = {
        {"format", kTraceFormat},
        {"version", kTraceVersion},
        {"filters", j["filters"]},
        {"breakpoints", j["breakpoints"]},
        {"events", j["events"]}
    };

    j.erase("filters");
    j.erase("breakpoints");
    j.erase("events");
    document["session"] = j;

    return document;
}

bool JsonReporter::ExportTraceToFile(const core::TraceSession& session,
                                     const std::filesystem::path& path) const {
    std::ofstream out(path);
    if (!out) {
        spdlog::error("Cannot write trace file: {}", path.string());
        return false;
    }

    out << Dump(ExportTrace(session)) << std::endl;
    if (!out) {
        spdlog::error("Failed writing trace file: {}", path.string());
        return false;
    }

    spdlog::info("✓ Exported {} events to {}", session.events.size(), path.string());
    return true;
}

std::optional<core::TraceSession> JsonReporter::ImportTrace(const json& document) {
    try {
        if (document.value("format", std::string()) != kTraceFormat) {
            spdlog::error("Not a sysprobe trace (format: {})",
                          document.contains("format") ? document["format"].dump() : "missing");
            return std::nullopt;
        }
        int version = document.value("version", 0);
        if (version != kTraceVersion) {
            spdlog::error("Unsupported trace version: {}", version);
            return std::nullopt;
        }

        core::TraceSession session;
        const auto& meta = document.at("session");
        session.id = meta.value("id", uint64_t{0});
        session.process_id = meta.at("process_id").get<int>();
        session.state = core::SessionState::STOPPED;
        session.started_at = FromNanoseconds(meta.value("started_at_ns", int64_t{0}));
        if (meta.contains("stopped_at_ns") && meta["stopped_at_ns"].is_number_integer()) {
            session.stopped_at = FromNanoseconds(meta["stopped_at_ns"].get<int64_t>());
        }
        session.stop_reason = core::StopReasonFromString(meta.value("stop_reason", std::string("requested")))
                                  .value_or(core::StopReason::REQUESTED);
        if (meta.contains("error") && meta["error"].is_string()) {
            session.error = meta["error"].get<std::string>();
        }
        if (meta.contains("triggered_by") && meta["triggered_by"].is_number_unsigned()) {
            session.triggered_by = meta["triggered_by"].get<uint64_t>();
        }
        session.evicted_events = meta.value("evicted_events", uint64_t{0});

        if (document.contains("filters")) {
            const auto& f = document["filters"];
            session.filters.enabled = f.value("enabled", false);
            session.filters.syscall_names = f.value("syscall_names", std::set<std::string>{});
            session.filters.excluded_syscalls = f.value("excluded_syscalls", std::set<std::string>{});
            if (f.contains("thread_id") && f["thread_id"].is_number_integer()) {
                session.filters.thread_id = f["thread_id"].get<int>();
            }
        }

        for (const auto& b : document.value("breakpoints", json::array())) {
            core::Breakpoint bp;
            bp.id = b.value("id", uint64_t{0});
            bp.syscall_name = b.at("syscall_name").get<std::string>();
            bp.hit_count = b.value("hit_count", uint64_t{0});
            if (b.contains("condition") && b["condition"].is_string()) {
                bp.condition = core::BreakpointCondition::Parse(b["condition"].get<std::string>());
            }
            session.breakpoints.push_back(std::move(bp));
        }

        for (const auto& e : document.value("events", json::array())) {
            session.events.push_back(EventFromJson(e));
        }

        if (!session.stopped_at) {
            session.stopped_at = session.events.empty() ? session.started_at
                                                        : session.events.back().timestamp;
        }

        spdlog::debug("Imported trace of PID {}: {} events, {} breakpoints",
                      session.process_id, session.events.size(), session.breakpoints.size());
        return session;
    }
    catch (const json::exception& e) {
        spdlog::error("Malformed trace document: {}", e.what());
    }
    catch (const core::SysprobeError& e) {
        spdlog::error("Invalid trace document: {}", e.what());
    }
    return std::nullopt;
}

std::optional<core::TraceSession> JsonReporter::ImportTraceFromFile(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open trace file: {}", path.string());
        return std::nullopt;
    }

    json document;
    try {
        in >> document;
    }
    catch (const json::parse_error& e) {
        spdlog::error("Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    return ImportTrace(document);
}

} // namespace reporters
} // namespace sysprobe
