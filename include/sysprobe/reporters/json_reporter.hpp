/**
 * @file json_reporter.hpp
 * @brief Client-facing JSON schema for sessions, reports, snapshots and diffs
 *
 * Every object the service hands to a client goes through JsonReporter, so
 * field names and encodings live in one place:
 * - Timestamps are ISO 8601 UTC strings with milliseconds. Events and sessions
 *   also carry nanoseconds since the epoch (`*_ns`) for lossless import.
 * - Enums are lower-case names ("active", "end_of_stream", "heap", ...).
 * - Addresses are hex strings, sizes are integers.
 * - Syscall arguments are numbers, strings or `{"bytes": "<hex>"}`.
 *
 * ExportTrace()/ImportTrace() save a session (events, filters, breakpoints)
 * and load it back as a STOPPED session for offline analysis.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/trace_session.hpp"
#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/analyzers/syscall_analyzer.hpp"
#include "sysprobe/analyzers/snapshot_differ.hpp"
#include "sysprobe/analyzers/memory_heuristics.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <optional>
#include <filesystem>
#include <chrono>

namespace sysprobe {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output options
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Indent output
    int indent_size{2};               ///< Indentation spaces
    bool include_raw_lines{false};    ///< Include raw capture text of events
};

/**
 * @class JsonReporter
 * @brief Serialises service objects with nlohmann::json
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * auto session = manager.Stop(id);
 * std::cout << reporter.Dump(reporter.ReportToJson(analyzer.Analyze(session))) << std::endl;
 * reporter.ExportTraceToFile(session, "trace.json");
 * @endcode
 */
class JsonReporter {
public:
    /// Name written into every exported trace
    static constexpr const char* kTraceFormat = "sysprobe-trace";
    static constexpr int kTraceVersion = 1;

    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig{});

    // Tracing
    nlohmann::json EventToJson(const monitors::SyscallEvent& event) const;
    nlohmann::json BreakpointToJson(const core::Breakpoint& breakpoint) const;
    nlohmann::json FiltersToJson(const core::TraceFilters& filters) const;
    nlohmann::json SessionToJson(const core::TraceSession& session) const;
    nlohmann::json DescriptorToJson(const core::SessionDescriptor& descriptor) const;
    nlohmann::json EventPageToJson(const core::EventPage& page) const;

    // Analysis
    nlohmann::json StatisticsToJson(const analyzers::SyscallStatistics& statistics) const;
    nlohmann::json ReportToJson(const analyzers::AnalysisReport& report) const;

    // Memory
    nlohmann::json RegionToJson(const monitors::MemoryRegion& region) const;
    nlohmann::json SnapshotToJson(const core::MemorySnapshot& snapshot, bool include_regions = true) const;
    nlohmann::json DiffToJson(const analyzers::SnapshotDiff& diff) const;
    nlohmann::json LeakAssessmentToJson(const analyzers::LeakAssessment& assessment) const;

    /// Render according to pretty_print / indent_size
    std::string Dump(const nlohmann::json& j) const;

    /**
     * @brief Serialise a session for later offline analysis
     */
    nlohmann::json ExportTrace(const core::TraceSession& session) const;

    /**
     * @brief Write ExportTrace() output to a file
     * @return true on success; failures are logged
     */
    bool ExportTraceToFile(const core::TraceSession& session, const std::filesystem::path& path) const;

    /**
     * @brief Rebuild a session from ExportTrace() output
     *
     * The session comes back STOPPED with its events, filters and
     * breakpoints (conditions are re-parsed).
     *
     * @return Session, or std::nullopt if the document is malformed (logged)
     */
    static std::optional<core::TraceSession> ImportTrace(const nlohmann::json& document);

    /// Read and import an exported trace file
    static std::optional<core::TraceSession> ImportTraceFromFile(const std::filesystem::path& path);

    /// ISO 8601 UTC with milliseconds, e.g. 2025-01-31T12:00:00.123Z
    static std::string FormatTimestamp(std::chrono::system_clock::time_point time);

private:
    JsonReporterConfig config_;

    static nlohmann::json ArgumentToJson(const monitors::SyscallArg& arg);
    static std::optional<monitors::SyscallArg> ArgumentFromJson(const nlohmann::json& j);
    static monitors::SyscallEvent EventFromJson(const nlohmann::json& j);
};

} // namespace reporters
} // namespace sysprobe
