/**
 * @file syscall_analyzer.cpp
 * @brief Implementation of syscall statistics and anomaly detection
 *
 * **Analysis Pipeline**:
 * ```
 * history ─► ComputeStatistics ─┐
 *         ─► DetectPatterns ────┤
 *         ─► DetectAnomalies ◄──┤ (uses statistics.error_rate)
 *         ─► FindSuspicious ────┤
 *                               ▼
 *                         AnalysisReport ─► GenerateRecommendations
 * ```
 *
 * Recommendations read only the report, so every number they quote is the
 * number the report shows.
 *
 * @date 2025
 */

#include "sysprobe/analyzers/syscall_analyzer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <sstream>
#include <iomanip>
#include <set>

namespace sysprobe {
namespace analyzers {

using monitors::SyscallEvent;

namespace {

std::string FormatMillis(double nanoseconds) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3) << nanoseconds / 1e6 << " ms";
    return oss.str();
}

std::string FormatPercent(double percent) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << percent << "%";
    return oss.str();
}

// Name counts in order of first appearance
std::vector<SyscallCount> CountInOrder(std::vector<SyscallEvent>::const_iterator begin,
                                       std::vector<SyscallEvent>::const_iterator end) {
    std::vector<SyscallCount> counts;
    std::map<std::string, std::size_t> index;

    for (auto it = begin; it != end; ++it) {
        auto found = index.find(it->name);
        if (found == index.end()) {
            index[it->name] = counts.size();
            counts.push_back(SyscallCount{it->name, 1});
        } else {
            counts[found->second].count++;
        }
    }
    return counts;
}

// Hints for syscalls that commonly dominate a trace
std::string FrequencyHint(const std::string& name) {
    static const std::map<std::string, std::string> hints = {
        {"read", "use larger buffers or buffered I/O"},
        {"write", "batch small writes or use buffered I/O"},
        {"open", "cache file descriptors instead of reopening"},
        {"openat", "cache file descriptors instead of reopening"},
        {"stat", "cache file metadata"},
        {"newfstatat", "cache file metadata"},
        {"fstat", "cache file metadata"},
        {"futex", "check for lock contention between threads"},
        {"poll", "check for busy polling with short timeouts"},
        {"epoll_wait", "check for busy polling with short timeouts"},
        {"select", "check for busy polling with short timeouts"},
        {"mmap", "allocator churn; consider pooling allocations"},
        {"munmap", "allocator churn; consider pooling allocations"},
        {"brk", "heap growth in small steps; consider reserving capacity"},
        {"clock_gettime", "cache timestamps where precision allows"},
    };

    auto it = hints.find(name);
    return it == hints.end() ? "check whether the calls can be batched or cached" : it->second;
}

} // anonymous namespace

std::string RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::LOW:    return "low";
        case RiskLevel::MEDIUM: return "medium";
        case RiskLevel::HIGH:   return "high";
        default:                return "unknown";
    }
}

std::optional<RiskLevel> RiskLevelFromString(const std::string& name) {
    if (name == "low") return RiskLevel::LOW;
    if (name == "medium") return RiskLevel::MEDIUM;
    if (name == "high") return RiskLevel::HIGH;
    return std::nullopt;
}

std::string PatternTypeToString(PatternType type) {
    switch (type) {
        case PatternType::HIGH_FREQUENCY: return "high_frequency";
        case PatternType::ERROR_BURST:    return "error_burst";
        default:                          return "unknown";
    }
}

std::string AnomalyTypeToString(AnomalyType type) {
    switch (type) {
        case AnomalyType::SLOW_SYSCALL:    return "slow_syscall";
        case AnomalyType::HIGH_ERROR_RATE: return "high_error_rate";
        default:                           return "unknown";
    }
}

std::map<std::string, SuspiciousRule> DefaultSuspiciousSyscalls() {
    return {
        // Process introspection and injection
        {"ptrace", {RiskLevel::HIGH, "Process tracing or code injection"}},
        {"process_vm_writev", {RiskLevel::HIGH, "Writes another process's memory"}},
        {"process_vm_readv", {RiskLevel::MEDIUM, "Reads another process's memory"}},

        // Kernel
        {"init_module", {RiskLevel::HIGH, "Loads a kernel module"}},
        {"finit_module", {RiskLevel::HIGH, "Loads a kernel module"}},
        {"delete_module", {RiskLevel::HIGH, "Unloads a kernel module"}},
        {"kexec_load", {RiskLevel::HIGH, "Replaces the running kernel"}},

        // Privileges and isolation
        {"setuid", {RiskLevel::MEDIUM, "Changes user identity"}},
        {"setgid", {RiskLevel::MEDIUM, "Changes group identity"}},
        {"setresuid", {RiskLevel::MEDIUM, "Changes user identity"}},
        {"capset", {RiskLevel::MEDIUM, "Changes process capabilities"}},
        {"unshare", {RiskLevel::MEDIUM, "Enters new namespaces"}},
        {"mount", {RiskLevel::MEDIUM, "Mounts a filesystem"}},
        {"memfd_create", {RiskLevel::MEDIUM, "Creates anonymous in-memory files"}},

        // Process control
        {"execve", {RiskLevel::LOW, "Executes a program"}},
        {"execveat", {RiskLevel::LOW, "Executes a program"}},
        {"kill", {RiskLevel::LOW, "Signals another process"}},
        {"tgkill", {RiskLevel::LOW, "Signals a thread"}},
        {"prctl", {RiskLevel::LOW, "Changes process attributes"}},
    };
}

SyscallAnalyzer::SyscallAnalyzer() : SyscallAnalyzer(Config{}) {}

// Constructor
SyscallAnalyzer::SyscallAnalyzer(const Config& config)
    : config_(config) {
    spdlog::debug("Syscall analyzer initialized ({} suspicious syscalls)",
                  config_.suspicious_syscalls.size());
}

bool SyscallAnalyzer::IsError(const SyscallEvent& event) {
    return event.error.has_value() && !event.error->empty();
}

/*******************************************************************************
 * Statistics
 ******************************************************************************/

SyscallStatistics SyscallAnalyzer::ComputeStatistics(const std::vector<SyscallEvent>& history) const {
    SyscallStatistics stats;
    stats.total_calls = history.size();

    if (history.empty()) {
        return stats;
    }

    auto first_time = history.front().timestamp;
    auto last_time = history.front().timestamp;

    for (const auto& event : history) {
        stats.distribution[event.name]++;
        stats.total_duration_ns += event.duration_ns;

        if (IsError(event)) {
            stats.error_count++;
            stats.errors_by_code[*event.error]++;
        }

        first_time = std::min(first_time, event.timestamp);
        last_time = std::max(last_time, event.timestamp);
    }

    stats.unique_calls = stats.distribution.size();
    stats.error_rate = static_cast<double>(stats.error_count) * 100.0 /
                       static_cast<double>(stats.total_calls);
    stats.avg_duration_ns = static_cast<double>(stats.total_duration_ns) /
                            static_cast<double>(stats.total_calls);

    auto span = std::chrono::duration<double>(last_time - first_time).count();
    if (span > 0.0) {
        stats.calls_per_second = static_cast<double>(stats.total_calls) / span;
    }

    // Most frequent; stable sort keeps first-seen order for equal counts
    auto counts = CountInOrder(history.begin(), history.end());
    std::stable_sort(counts.begin(), counts.end(),
                     [](const SyscallCount& a, const SyscallCount& b) { return a.count > b.count; });
    if (counts.size() > config_.top_n) {
        counts.resize(config_.top_n);
    }
    stats.top_by_frequency = std::move(counts);

    // Slowest; delivery order breaks timestamp ties
    std::vector<const SyscallEvent*> by_duration;
    by_duration.reserve(history.size());
    for (const auto& event : history) {
        by_duration.push_back(&event);
    }
    std::stable_sort(by_duration.begin(), by_duration.end(),
                     [](const SyscallEvent* a, const SyscallEvent* b) {
                         if (a->duration_ns != b->duration_ns) {
                             return a->duration_ns > b->duration_ns;
                         }
                         return a->timestamp < b->timestamp;
                     });
    for (std::size_t i = 0; i < by_duration.size() && i < config_.top_n; ++i) {
        stats.top_by_slowest.push_back(*by_duration[i]);
    }

    return stats;
}

/*******************************************************************************
 * Pattern & Anomaly Detection
 ******************************************************************************/

std::vector<DetectedPattern> SyscallAnalyzer::DetectPatterns(const std::vector<SyscallEvent>& history) const {
    std::vector<DetectedPattern> patterns;

    // High frequency within the last frequency_window events
    std::size_t window = std::min(config_.frequency_window, history.size());
    auto window_begin = history.end() - static_cast<std::ptrdiff_t>(window);

    for (const auto& entry : CountInOrder(window_begin, history.end())) {
        if (entry.count > config_.frequency_threshold) {
            DetectedPattern pattern;
            pattern.type = PatternType::HIGH_FREQUENCY;
            pattern.syscall_name = entry.name;
            pattern.count = entry.count;
            pattern.threshold = config_.frequency_threshold;
            pattern.window = window;
            pattern.description = "High frequency of " + entry.name + " calls: " +
                                  std::to_string(entry.count) + " in the last " +
                                  std::to_string(window) + " calls";
            patterns.push_back(std::move(pattern));
        }
    }

    // Error burst within the last error_window events
    std::size_t error_window = std::min(config_.error_window, history.size());
    uint64_t errors = static_cast<uint64_t>(
        std::count_if(history.end() - static_cast<std::ptrdiff_t>(error_window), history.end(),
                      [](const SyscallEvent& e) { return IsError(e); }));

    if (errors > config_.error_burst_threshold) {
        DetectedPattern pattern;
        pattern.type = PatternType::ERROR_BURST;
        pattern.count = errors;
        pattern.threshold = config_.error_burst_threshold;
        pattern.window = error_window;
        pattern.description = std::to_string(errors) + " failed calls in the last " +
                              std::to_string(error_window) + " calls";
        patterns.push_back(std::move(pattern));
    }

    return patterns;
}

std::vector<Anomaly> SyscallAnalyzer::DetectAnomalies(const std::vector<SyscallEvent>& history,
                                                      const SyscallStatistics& statistics) const {
    std::vector<Anomaly> anomalies;

    for (const auto& event : history) {
        if (event.duration_ns > config_.slow_threshold_ns) {
            Anomaly anomaly;
            anomaly.type = AnomalyType::SLOW_SYSCALL;
            anomaly.event_id = event.id;
            anomaly.syscall_name = event.name;
            anomaly.value = static_cast<double>(event.duration_ns);
            anomaly.threshold = static_cast<double>(config_.slow_threshold_ns);
            anomaly.description = "System call " + event.name + " took " +
                                  FormatMillis(anomaly.value) + " (threshold " +
                                  FormatMillis(anomaly.threshold) + ")";
            anomalies.push_back(std::move(anomaly));
        }
    }

    if (statistics.total_calls > 0 &&
        statistics.error_rate > config_.error_rate_threshold_percent) {
        Anomaly anomaly;
        anomaly.type = AnomalyType::HIGH_ERROR_RATE;
        anomaly.value = statistics.error_rate;
        anomaly.threshold = config_.error_rate_threshold_percent;
        anomaly.description = "High error rate in system calls: " +
                              FormatPercent(statistics.error_rate) + " (threshold " +
                              FormatPercent(config_.error_rate_threshold_percent) + ")";
        anomalies.push_back(std::move(anomaly));
    }

    return anomalies;
}

std::vector<SuspiciousCall> SyscallAnalyzer::FindSuspicious(const std::vector<SyscallEvent>& history) const {
    std::vector<SuspiciousCall> suspicious;

    for (const auto& event : history) {
        auto it = config_.suspicious_syscalls.find(event.name);
        if (it == config_.suspicious_syscalls.end()) {
            continue;
        }
        SuspiciousCall call;
        call.event_id = event.id;
        call.syscall_name = event.name;
        call.risk = it->second.risk;
        call.reason = it->second.reason;
        call.timestamp = event.timestamp;
        suspicious.push_back(std::move(call));
    }

    return suspicious;
}

/*******************************************************************************
 * Recommendations
 ******************************************************************************/

std::vector<std::string> SyscallAnalyzer::GenerateRecommendations(const AnalysisReport& report) const {
    std::vector<std::string> recommendations;
    const auto& stats = report.statistics;

    if (stats.total_calls == 0) {
        recommendations.push_back("No syscalls captured; check the session filters and that the process is running");
        return recommendations;
    }

    // Error rate
    for (const auto& anomaly : report.anomalies) {
        if (anomaly.type != AnomalyType::HIGH_ERROR_RATE) {
            continue;
        }
        std::string text = "Error rate is " + FormatPercent(anomaly.value) +
                           "; inspect failing calls";
        auto top_error = std::max_element(
            stats.errors_by_code.begin(), stats.errors_by_code.end(),
            [](const auto& a, const auto& b) { return a.second < b.second; });
        if (top_error != stats.errors_by_code.end()) {
            text += " (most common: " + top_error->first + " x" + std::to_string(top_error->second) + ")";
        }
        recommendations.push_back(text);
    }

    // Slow calls
    std::size_t slow_count = std::count_if(report.anomalies.begin(), report.anomalies.end(),
        [](const Anomaly& a) { return a.type == AnomalyType::SLOW_SYSCALL; });
    if (slow_count > 0 && !stats.top_by_slowest.empty()) {
        const auto& slowest = stats.top_by_slowest.front();
        recommendations.push_back(std::to_string(slow_count) + " slow call(s); the slowest was " +
                                  slowest.name + " at " +
                                  FormatMillis(static_cast<double>(slowest.duration_ns)) +
                                  ". Consider moving blocking I/O off the hot path");
    }

    // Bursts
    for (const auto& pattern : report.patterns) {
        if (pattern.type == PatternType::HIGH_FREQUENCY) {
            recommendations.push_back(pattern.syscall_name + " was called " +
                                      std::to_string(pattern.count) + " times in the last " +
                                      std::to_string(pattern.window) + " calls: " +
                                      FrequencyHint(pattern.syscall_name));
        } else {
            recommendations.push_back("Error burst (" + std::to_string(pattern.count) +
                                      " failures in the last " + std::to_string(pattern.window) +
                                      " calls); the process may be retrying a failing operation");
        }
    }

    // Security-relevant calls, one line per tier
    std::map<RiskLevel, std::set<std::string>> by_risk;
    for (const auto& call : report.suspicious_calls) {
        by_risk[call.risk].insert(call.syscall_name);
    }
    auto names = [](const std::set<std::string>& set) {
        std::string joined;
        for (const auto& name : set) {
            joined += (joined.empty() ? "" : ", ") + name;
        }
        return joined;
    };
    if (by_risk.count(RiskLevel::HIGH)) {
        recommendations.push_back("⚠️ High-risk syscalls observed (" + names(by_risk[RiskLevel::HIGH]) +
                                  "); verify the process is expected to do this");
    }
    if (by_risk.count(RiskLevel::MEDIUM)) {
        recommendations.push_back("Audit privilege and isolation changes (" +
                                  names(by_risk[RiskLevel::MEDIUM]) + ")");
    }

    if (recommendations.empty()) {
        recommendations.push_back("No performance or security issues detected");
    }

    return recommendations;
}

/*******************************************************************************
 * Entry Points
 ******************************************************************************/

AnalysisReport SyscallAnalyzer::Analyze(const std::vector<SyscallEvent>& history) const {
    AnalysisReport report;
    report.generated_at = std::chrono::system_clock::now();

    report.statistics = ComputeStatistics(history);
    report.patterns = DetectPatterns(history);
    report.anomalies = DetectAnomalies(history, report.statistics);
    report.suspicious_calls = FindSuspicious(history);

    for (const auto& call : report.suspicious_calls) {
        if (!report.highest_risk || call.risk > *report.highest_risk) {
            report.highest_risk = call.risk;
        }
    }

    report.recommendations = GenerateRecommendations(report);

    spdlog::debug("Analyzed {} events: {} patterns, {} anomalies, {} suspicious",
                  report.statistics.total_calls, report.patterns.size(),
                  report.anomalies.size(), report.suspicious_calls.size());

    return report;
}

AnalysisReport SyscallAnalyzer::Analyze(const core::TraceSession& session) const {
    return Analyze(session.events);
}

} // namespace analyzers
} // namespace sysprobe
