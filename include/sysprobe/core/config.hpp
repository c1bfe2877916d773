/**
 * @file config.hpp
 * @brief Service-wide configuration loaded from JSON
 *
 * **File Layout** (every key optional):
 * ```json
 * {
 *   "sessions":  {"max_buffered_events": 10000, "verbose_logging": false},
 *   "snapshots": {"max_snapshots": 0, "default_label": "snapshot"},
 *   "analysis":  {"top_n": 5, "frequency_window": 20, "frequency_threshold": 3,
 *                 "error_window": 50, "error_burst_threshold": 5,
 *                 "slow_threshold_ns": 1000000, "error_rate_threshold_percent": 10.0,
 *                 "suspicious_syscalls": {"bpf": {"risk": "high", "reason": "Loads BPF programs"}}},
 *   "diff":      {"leak_threshold_bytes": 1048576},
 *   "strace":    {"binary": "/usr/bin/strace", "args": ["-f", "-ttt", "-T"], "attach_timeout_ms": 3000},
 *   "proc_maps": {"proc_root": "/proc", "max_free_gap_bytes": 67108864},
 *   "output":    {"pretty_print": true, "indent_size": 2, "include_raw_lines": false}
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/trace_session_manager.hpp"
#include "sysprobe/core/snapshot_store.hpp"
#include "sysprobe/analyzers/syscall_analyzer.hpp"
#include "sysprobe/analyzers/snapshot_differ.hpp"
#include "sysprobe/monitors/strace_capture_source.hpp"
#include "sysprobe/monitors/proc_maps_inspector.hpp"
#include "sysprobe/reporters/json_reporter.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <filesystem>

namespace sysprobe {
namespace core {

/**
 * @struct ServiceConfig
 * @brief Settings of every component, each defaulted in its own Config
 */
struct ServiceConfig {
    TraceSessionManager::Config sessions;
    SnapshotStore::Config snapshots;
    analyzers::SyscallAnalyzer::Config analysis;
    analyzers::SnapshotDiffer::Config diff;
    monitors::StraceCaptureSource::Config strace;
    monitors::ProcMapsInspector::Config proc_maps;
    reporters::JsonReporterConfig output;
};

/**
 * @brief Overlay the keys present in a JSON document onto a configuration
 *
 * Suspicious syscall entries are merged by name into the existing table.
 *
 * @throws nlohmann::json::exception on type mismatches
 * @throws InvalidArgumentError on unknown risk names or zero-sized windows
 */
void ApplyConfig(const nlohmann::json& document, ServiceConfig& config);

/**
 * @brief Load a configuration file on top of the defaults
 * @return Configuration, or std::nullopt if the file is missing or invalid (logged)
 */
std::optional<ServiceConfig> LoadConfig(const std::filesystem::path& path);

} // namespace core
} // namespace sysprobe
