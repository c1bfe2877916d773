/**
 * @file config.cpp
 * @brief Implementation of configuration loading
 *
 * @date 2025
 */

#include "sysprobe/core/config.hpp"
#include "sysprobe/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

using json = nlohmann::json;

namespace sysprobe {
namespace core {

namespace {

template <typename T>
void Assign(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

void RequirePositive(std::size_t value, const char* key) {
    if (value == 0) {
        throw InvalidArgumentError(std::string(key) + " must be greater than zero");
    }
}

} // anonymous namespace

void ApplyConfig(const json& document, ServiceConfig& config) {
    if (!document.is_object()) {
        throw InvalidArgumentError("Configuration must be a JSON object");
    }

    if (document.contains("sessions")) {
        const auto& s = document["sessions"];
        Assign(s, "max_buffered_events", config.sessions.max_buffered_events);
        Assign(s, "verbose_logging", config.sessions.verbose_logging);
        RequirePositive(config.sessions.max_buffered_events, "sessions.max_buffered_events");
    }

    if (document.contains("snapshots")) {
        const auto& s = document["snapshots"];
        Assign(s, "max_snapshots", config.snapshots.max_snapshots);
        Assign(s, "default_label", config.snapshots.default_label);
    }

    if (document.contains("analysis")) {
        const auto& a = document["analysis"];
        Assign(a, "top_n", config.analysis.top_n);
        Assign(a, "frequency_window", config.analysis.frequency_window);
        Assign(a, "frequency_threshold", config.analysis.frequency_threshold);
        Assign(a, "error_window", config.analysis.error_window);
        Assign(a, "error_burst_threshold", config.analysis.error_burst_threshold);
        Assign(a, "slow_threshold_ns", config.analysis.slow_threshold_ns);
        Assign(a, "error_rate_threshold_percent", config.analysis.error_rate_threshold_percent);
        RequirePositive(config.analysis.frequency_window, "analysis.frequency_window");
        RequirePositive(config.analysis.error_window, "analysis.error_window");

        if (a.contains("suspicious_syscalls")) {
            for (const auto& [name, rule] : a["suspicious_syscalls"].items()) {
                std::string risk_name = rule.value("risk", std::string("low"));
                auto risk = analyzers::RiskLevelFromString(risk_name);
                if (!risk) {
                    throw InvalidArgumentError("Unknown risk level for " + name + ": " + risk_name);
                }
                config.analysis.suspicious_syscalls[name] =
                    analyzers::SuspiciousRule{*risk, rule.value("reason", std::string())};
            }
        }
    }

    if (document.contains("diff")) {
        Assign(document["diff"], "leak_threshold_bytes", config.diff.leak_threshold_bytes);
    }

    if (document.contains("strace")) {
        const auto& s = document["strace"];
        Assign(s, "binary", config.strace.strace_binary);
        Assign(s, "args", config.strace.strace_args);
        Assign(s, "attach_timeout_ms", config.strace.attach_timeout_ms);
        if (config.strace.attach_timeout_ms < 0) {
            throw InvalidArgumentError("strace.attach_timeout_ms must not be negative");
        }
    }

    if (document.contains("proc_maps")) {
        const auto& p = document["proc_maps"];
        if (p.contains("proc_root")) {
            config.proc_maps.proc_root = p["proc_root"].get<std::string>();
        }
        Assign(p, "max_free_gap_bytes", config.proc_maps.max_free_gap_bytes);
    }

    if (document.contains("output")) {
        const auto& o = document["output"];
        Assign(o, "pretty_print", config.output.pretty_print);
        Assign(o, "indent_size", config.output.indent_size);
        Assign(o, "include_raw_lines", config.output.include_raw_lines);
    }
}

std::optional<ServiceConfig> LoadConfig(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        spdlog::error("Cannot open config file: {}", path.string());
        return std::nullopt;
    }

    ServiceConfig config;
    try {
        json document;
        in >> document;
        ApplyConfig(document, config);
    }
    catch (const json::exception& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::nullopt;
    }
    catch (const SysprobeError& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    spdlog::debug("Loaded configuration from {}", path.string());
    return config;
}

} // namespace core
} // namespace sysprobe
