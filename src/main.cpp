/**
 * @file main.cpp
 * @brief sysprobe - Command-line interface
 *
 * Entry point for the sysprobe debugging backend. Traces syscalls of a live
 * process with breakpoints, takes and diffs memory snapshots, and analyzes
 * exported traces offline. Results are written to stdout as JSON; logs go to
 * stderr.
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "sysprobe/core/config.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/core/trace_session_manager.hpp"
#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/analyzers/syscall_analyzer.hpp"
#include "sysprobe/analyzers/snapshot_differ.hpp"
#include "sysprobe/analyzers/memory_heuristics.hpp"
#include "sysprobe/monitors/strace_capture_source.hpp"
#include "sysprobe/monitors/proc_maps_inspector.hpp"
#include "sysprobe/reporters/json_reporter.hpp"

#include <iostream>
#include <thread>
#include <chrono>

using json = nlohmann::json;

namespace {

/*******************************************************************************
 * Subcommand Options
 ******************************************************************************/

struct TraceOptions {
    int pid{0};
    std::vector<std::string> breakpoints;
    std::vector<std::string> only;
    std::vector<std::string> exclude;
    int tid{0};
    int duration_seconds{0};
    std::size_t max_events{0};
    std::string output;
};

struct SnapshotOptions {
    int pid{0};
    std::string label;
    int interval_seconds{1};
    int count{1};
    bool include_regions{false};
};

void PrintBanner() {
    std::cerr << "╔═══════════════════════════════════════════════╗\n"
              << "║   sysprobe - syscall & memory debugger v1.0   ║\n"
              << "╚═══════════════════════════════════════════════╝\n";
}

/*******************************************************************************
 * trace
 ******************************************************************************/

int RunTrace(const TraceOptions& options, sysprobe::core::ServiceConfig config) {
    using namespace sysprobe;

    if (options.max_events > 0) {
        config.sessions.max_buffered_events = options.max_events;
    }

    core::TraceFilters filters;
    filters.syscall_names.insert(options.only.begin(), options.only.end());
    filters.excluded_syscalls.insert(options.exclude.begin(), options.exclude.end());
    if (options.tid > 0) {
        filters.thread_id = options.tid;
    }
    filters.enabled = !filters.syscall_names.empty() || !filters.excluded_syscalls.empty() ||
                      filters.thread_id.has_value();

    std::vector<core::Breakpoint> breakpoints;
    for (const auto& spec : options.breakpoints) {
        breakpoints.push_back(core::Breakpoint::FromSpec(spec));
    }

    auto source = std::make_shared<monitors::StraceCaptureSource>(config.strace);
    core::TraceSessionManager manager(source, config.sessions);

    uint64_t session_id = manager.Start(options.pid, filters, std::move(breakpoints));

    // Wait for a breakpoint, process exit or the deadline
    bool stopped = false;
    if (options.duration_seconds > 0) {
        stopped = manager.WaitForStop(session_id, std::chrono::seconds(options.duration_seconds));
    } else {
        while (!stopped) {
            stopped = manager.WaitForStop(session_id, std::chrono::seconds(1));
        }
    }

    core::TraceSession session;
    if (stopped) {
        session = manager.GetSession(session_id);
    } else {
        try {
            session = manager.Stop(session_id);
        }
        catch (const core::NotFoundError&) {
            // Stopped on its own between the timeout and Stop()
            manager.WaitForStop(session_id, std::chrono::seconds(5));
            session = manager.GetSession(session_id);
        }
    }

    spdlog::info("━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━━");
    spdlog::info("[DONE] Session {} stopped ({}), {} events in {} ms",
                 session.id, core::StopReasonToString(session.stop_reason),
                 session.events.size(), session.Duration().count());
    if (session.triggered_by) {
        spdlog::info("[BREAK] Breakpoint {} fired on event {}", *session.triggered_by,
                     session.events.empty() ? 0 : session.events.back().id);
    }
    if (session.error) {
        spdlog::warn("[WARN] Capture failed: {}", *session.error);
    }

    analyzers::SyscallAnalyzer analyzer(config.analysis);
    reporters::JsonReporter reporter(config.output);

    json output = {
        {"session", reporter.DescriptorToJson(core::SessionDescriptor::FromSession(session))},
        {"report", reporter.ReportToJson(analyzer.Analyze(session))}
    };
    std::cout << reporter.Dump(output) << std::endl;

    if (!options.output.empty() && !reporter.ExportTraceToFile(session, options.output)) {
        return 1;
    }
    return session.stop_reason == core::StopReason::CAPTURE_FAILURE ? 2 : 0;
}

/*******************************************************************************
 * snapshot
 ******************************************************************************/

int RunSnapshot(const SnapshotOptions& options, const sysprobe::core::ServiceConfig& config) {
    using namespace sysprobe;

    auto inspector = std::make_shared<monitors::ProcMapsInspector>(config.proc_maps);
    core::SnapshotStore store(inspector, nullptr, config.snapshots);
    analyzers::SnapshotDiffer differ(config.diff);
    reporters::JsonReporter reporter(config.output);

    json snapshots = json::array();
    json diffs = json::array();
    std::shared_ptr<const core::MemorySnapshot> previous;

    for (int i = 0; i < options.count; ++i) {
        if (i > 0) {
            std::this_thread::sleep_for(std::chrono::seconds(options.interval_seconds));
        }

        std::string label = options.label.empty() ? config.snapshots.default_label : options.label;
        if (options.count > 1) {
            label += "-" + std::to_string(i + 1);
        }

        auto snapshot = store.TakeSnapshot(core::SnapshotRequest{std::nullopt, options.pid, label});
        snapshots.push_back(reporter.SnapshotToJson(*snapshot, options.include_regions));

        if (previous) {
            auto diff = differ.Diff(*previous, *snapshot);
            json entry = reporter.DiffToJson(diff);
            entry["leak_assessment"] = reporter.LeakAssessmentToJson(
                analyzers::MemoryHeuristics::AssessLeak(*previous, *snapshot, diff,
                                                        config.diff.leak_threshold_bytes));
            diffs.push_back(entry);
        }
        previous = snapshot;
    }

    json output = {{"snapshots", snapshots}};
    if (!diffs.empty()) {
        output["diffs"] = diffs;
    }
    std::cout << reporter.Dump(output) << std::endl;
    return 0;
}

/*******************************************************************************
 * analyze
 ******************************************************************************/

int RunAnalyze(const std::string& trace_file, const sysprobe::core::ServiceConfig& config) {
    using namespace sysprobe;

    auto session = reporters::JsonReporter::ImportTraceFromFile(trace_file);
    if (!session) {
        return 1;
    }

    spdlog::info("[START] Analyzing {} events of PID {}", session->events.size(), session->process_id);

    analyzers::SyscallAnalyzer analyzer(config.analysis);
    reporters::JsonReporter reporter(config.output);
    std::cout << reporter.Dump(reporter.ReportToJson(analyzer.Analyze(*session))) << std::endl;
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sysprobe - interactive syscall and memory debugger"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "JSON configuration file")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // trace
    TraceOptions trace;
    auto* trace_cmd = app.add_subcommand("trace", "Trace syscalls of a running process");
    trace_cmd->add_option("-p,--pid", trace.pid, "Process to attach to")->required();
    trace_cmd->add_option("-b,--break", trace.breakpoints,
                          "Breakpoint NAME[:CONDITION], e.g. 'openat:result < 0'");
    trace_cmd->add_option("--only", trace.only, "Capture only these syscalls");
    trace_cmd->add_option("--exclude", trace.exclude, "Never capture these syscalls");
    trace_cmd->add_option("--tid", trace.tid, "Capture only this thread");
    trace_cmd->add_option("-d,--duration", trace.duration_seconds, "Stop after this many seconds (0 = until stopped)")
        ->default_val(0);
    trace_cmd->add_option("--max-events", trace.max_events, "Events kept in the session window");
    trace_cmd->add_option("-o,--output", trace.output, "Export the trace to this file");

    // snapshot
    SnapshotOptions snapshot;
    auto* snapshot_cmd = app.add_subcommand("snapshot", "Take and diff memory snapshots of a process");
    snapshot_cmd->add_option("-p,--pid", snapshot.pid, "Process to inspect")->required();
    snapshot_cmd->add_option("-l,--label", snapshot.label, "Snapshot label");
    snapshot_cmd->add_option("-i,--interval", snapshot.interval_seconds, "Seconds between snapshots")
        ->default_val(1)
        ->check(CLI::NonNegativeNumber);
    snapshot_cmd->add_option("-n,--count", snapshot.count, "Number of snapshots")
        ->default_val(1)
        ->check(CLI::PositiveNumber);
    snapshot_cmd->add_flag("--regions", snapshot.include_regions, "Include every region in the output");

    // analyze
    std::string trace_file;
    auto* analyze_cmd = app.add_subcommand("analyze", "Analyze an exported trace");
    analyze_cmd->add_option("file", trace_file, "Trace file written by 'trace --output'")
        ->required()
        ->check(CLI::ExistingFile);

    CLI11_PARSE(app, argc, argv);

    // Logs go to stderr so stdout stays valid JSON
    spdlog::set_default_logger(spdlog::stderr_color_mt("sysprobe"));
    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    PrintBanner();

    sysprobe::core::ServiceConfig config;
    if (!config_path.empty()) {
        auto loaded = sysprobe::core::LoadConfig(config_path);
        if (!loaded) {
            return 1;
        }
        config = std::move(*loaded);
    }
    if (verbose) {
        config.sessions.verbose_logging = true;
        spdlog::debug("[DEBUG] Verbose logging enabled");
    }

    try {
        if (*trace_cmd) {
            return RunTrace(trace, config);
        }
        if (*snapshot_cmd) {
            return RunSnapshot(snapshot, config);
        }
        return RunAnalyze(trace_file, config);

    } catch (const sysprobe::core::SysprobeError& e) {
        spdlog::error("[ERROR] {}: {}", sysprobe::core::ErrorCodeToString(e.Code()), e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
