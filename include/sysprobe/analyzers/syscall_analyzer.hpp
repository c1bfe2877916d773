/**
 * @file syscall_analyzer.hpp
 * @brief Statistics, burst patterns and anomalies over syscall history
 *
 * Turns an ordered list of SyscallEvents (a session window or a process
 * history) into an AnalysisReport: aggregate statistics, sliding-window burst
 * patterns, slow-call and error-rate anomalies, security-relevant calls and
 * recommendations derived from those findings.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/capture_source.hpp"
#include "sysprobe/core/trace_session.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <chrono>
#include <cstdint>

namespace sysprobe {
namespace analyzers {

/**
 * @enum RiskLevel
 * @brief Risk tier of a security-relevant syscall
 */
enum class RiskLevel {
    LOW,     ///< Routine but worth noting (execve, kill)
    MEDIUM,  ///< Credential or namespace changes
    HIGH     ///< Tracing other processes, kernel modules
};

/**
 * @enum PatternType
 * @brief Sliding-window burst patterns
 */
enum class PatternType {
    HIGH_FREQUENCY,  ///< One syscall dominates the recent window
    ERROR_BURST      ///< Many failures in the recent window
};

/**
 * @enum AnomalyType
 * @brief Outliers against configured thresholds
 */
enum class AnomalyType {
    SLOW_SYSCALL,     ///< A single call exceeded slow_threshold_ns
    HIGH_ERROR_RATE   ///< Overall error rate exceeded the threshold
};

std::string RiskLevelToString(RiskLevel level);
std::optional<RiskLevel> RiskLevelFromString(const std::string& name);
std::string PatternTypeToString(PatternType type);
std::string AnomalyTypeToString(AnomalyType type);

/**
 * @struct SyscallCount
 * @brief Call count of one syscall name
 */
struct SyscallCount {
    std::string name;
    uint64_t count{0};
};

/**
 * @struct SyscallStatistics
 * @brief Aggregates over an event history
 */
struct SyscallStatistics {
    uint64_t total_calls{0};
    uint64_t unique_calls{0};                        ///< Distinct syscall names
    uint64_t error_count{0};
    double error_rate{0.0};                          ///< Percent of calls that failed
    uint64_t total_duration_ns{0};
    double avg_duration_ns{0.0};
    double calls_per_second{0.0};                    ///< Over first..last timestamp

    std::vector<SyscallCount> top_by_frequency;      ///< Ties: name seen first wins
    std::vector<monitors::SyscallEvent> top_by_slowest;  ///< Ties: earlier timestamp wins

    std::map<std::string, uint64_t> distribution;    ///< Calls per syscall name
    std::map<std::string, uint64_t> errors_by_code;  ///< Failures per errno name
};

/**
 * @struct DetectedPattern
 * @brief Burst found in the most recent events
 */
struct DetectedPattern {
    PatternType type{PatternType::HIGH_FREQUENCY};
    std::string syscall_name;   ///< Empty for ERROR_BURST
    uint64_t count{0};          ///< Occurrences within the window
    uint64_t threshold{0};
    std::size_t window{0};      ///< Events examined
    std::string description;
};

/**
 * @struct Anomaly
 * @brief Single outlier finding
 */
struct Anomaly {
    AnomalyType type{AnomalyType::SLOW_SYSCALL};
    std::optional<uint64_t> event_id;   ///< SLOW_SYSCALL only
    std::string syscall_name;           ///< SLOW_SYSCALL only
    double value{0.0};                  ///< Duration (ns) or error rate (%)
    double threshold{0.0};
    std::string description;
};

/**
 * @struct SuspiciousRule
 * @brief Entry of the suspicious syscall table
 */
struct SuspiciousRule {
    RiskLevel risk{RiskLevel::LOW};
    std::string reason;
};

/**
 * @struct SuspiciousCall
 * @brief Event whose syscall is listed in the suspicious table
 */
struct SuspiciousCall {
    uint64_t event_id{0};
    std::string syscall_name;
    RiskLevel risk{RiskLevel::LOW};
    std::string reason;
    std::chrono::system_clock::time_point timestamp;
};

/**
 * @struct AnalysisReport
 * @brief Derived findings for one history; recomputed on demand, never stored
 */
struct AnalysisReport {
    SyscallStatistics statistics;
    std::vector<DetectedPattern> patterns;
    std::vector<Anomaly> anomalies;
    std::vector<SuspiciousCall> suspicious_calls;
    std::optional<RiskLevel> highest_risk;           ///< Highest tier among suspicious calls
    std::vector<std::string> recommendations;
    std::chrono::system_clock::time_point generated_at;
};

/**
 * @brief Built-in suspicious syscall table
 *
 * Process tracing and kernel module calls are HIGH, credential and namespace
 * changes MEDIUM, program execution and signalling LOW.
 */
std::map<std::string, SuspiciousRule> DefaultSuspiciousSyscalls();

/**
 * @class SyscallAnalyzer
 * @brief Pure analysis over syscall histories
 *
 * Every method is a function of its arguments and the configuration, so one
 * instance can be shared between threads.
 *
 * **Usage Example**:
 * @code
 * SyscallAnalyzer analyzer;
 * auto report = analyzer.Analyze(manager.GetSession(id));
 * for (const auto& line : report.recommendations) {
 *     spdlog::info("  • {}", line);
 * }
 * @endcode
 */
class SyscallAnalyzer {
public:
    /**
     * @struct Config
     * @brief Thresholds, windows and the suspicious syscall table
     */
    struct Config {
        std::size_t top_n{5};                          ///< Entries in top-N lists
        std::size_t frequency_window{20};              ///< Recent events checked for HIGH_FREQUENCY
        std::size_t frequency_threshold{3};            ///< Count that must be exceeded
        std::size_t error_window{50};                  ///< Recent events checked for ERROR_BURST
        std::size_t error_burst_threshold{5};          ///< Error count that must be exceeded
        uint64_t slow_threshold_ns{1000000};           ///< 1 ms
        double error_rate_threshold_percent{10.0};
        std::map<std::string, SuspiciousRule> suspicious_syscalls = DefaultSuspiciousSyscalls();
    };

    SyscallAnalyzer();
    explicit SyscallAnalyzer(const Config& config);

    SyscallStatistics ComputeStatistics(const std::vector<monitors::SyscallEvent>& history) const;

    /**
     * @brief Detect bursts in the most recent events
     *
     * HIGH_FREQUENCY: a name occurs more than frequency_threshold times in the
     * last frequency_window events (one pattern per name, in order of first
     * occurrence in the window). ERROR_BURST: more than error_burst_threshold
     * failures in the last error_window events.
     */
    std::vector<DetectedPattern> DetectPatterns(const std::vector<monitors::SyscallEvent>& history) const;

    /**
     * @brief Detect slow calls and an excessive error rate
     * @param statistics Statistics of the same history
     */
    std::vector<Anomaly> DetectAnomalies(const std::vector<monitors::SyscallEvent>& history,
                                         const SyscallStatistics& statistics) const;

    /// Every event whose name is in the suspicious table, in history order
    std::vector<SuspiciousCall> FindSuspicious(const std::vector<monitors::SyscallEvent>& history) const;

    /**
     * @brief Recommendations derived only from a finished report
     */
    std::vector<std::string> GenerateRecommendations(const AnalysisReport& report) const;

    AnalysisReport Analyze(const std::vector<monitors::SyscallEvent>& history) const;
    AnalysisReport Analyze(const core::TraceSession& session) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    static bool IsError(const monitors::SyscallEvent& event);
};

} // namespace analyzers
} // namespace sysprobe
