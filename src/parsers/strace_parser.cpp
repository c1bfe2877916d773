/**
 * @file strace_parser.cpp
 * @brief Implementation of strace output line parsing
 *
 * **strace Output Format** (`strace -f -ttt -T`):
 * ```
 * [pid N] <epoch.usec> name(arg1, arg2, ...) = ret [ERRNO (text)] <secs.usec>
 *
 * Example:
 * 1700000000.123456 open("/etc/passwd", O_RDONLY) = 3 <0.000021>
 * [pid 1235] 1700000000.124567 read(3, "root:x:0:0:"..., 4096) = 1024 <0.000008>
 * 1700000000.125678 stat("/nope", 0x7ffd3c) = -1 ENOENT (No such file or directory) <0.000006>
 * ```
 *
 * **Special Cases**:
 * - **Unfinished Calls**: `read(3, <unfinished ...>` - skipped, the resumed half carries the result
 * - **Resumed Calls**: `<... read resumed>"abc", 4096) = 3` - emitted with the resumed arguments
 * - **Signals**: `--- SIGCHLD {si_signo=SIGCHLD, ...} ---` - skipped
 * - **Process Exit**: `+++ exited with 0 +++` - skipped (see IsProcessExit)
 * - **Diagnostics**: `strace: attach: ptrace(PTRACE_SEIZE, 1): Operation not permitted`
 *
 * @date 2025
 */

#include "sysprobe/parsers/strace_parser.hpp"
#include "sysprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <regex>
#include <cctype>
#include <ctime>

namespace sysprobe {
namespace parsers {

using utils::StringUtils;
using monitors::SyscallArg;
using monitors::SyscallEvent;

namespace {

// [pid N] or bare "N " prefix followed by an optional timestamp
const std::regex& PrefixRegex() {
    static const std::regex prefix_regex(
        R"(^(?:\[pid\s+(\d+)\]\s*|(\d+)\s+)?(?:(\d+)\.(\d+)\s+|(\d{2}):(\d{2}):(\d{2})\.(\d+)\s+)?)");
    return prefix_regex;
}

const std::regex& ResumedRegex() {
    static const std::regex resumed_regex(R"(^<\.\.\.\s+(\w+)\s+resumed>\s*,?\s*)");
    return resumed_regex;
}

const std::regex& CallRegex() {
    static const std::regex call_regex(R"(^(\w+)\()");
    return call_regex;
}

std::chrono::system_clock::time_point EpochTimestamp(const std::string& secs,
                                                     const std::string& frac) {
    std::string micros = frac.substr(0, 6);
    while (micros.size() < 6) {
        micros += '0';
    }
    return std::chrono::system_clock::time_point(
        std::chrono::seconds(std::stoll(secs)) + std::chrono::microseconds(std::stoll(micros)));
}

std::chrono::system_clock::time_point WallClockTimestamp(int hour, int minute, int second,
                                                         const std::string& frac) {
    std::time_t now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;

    std::string micros = frac.substr(0, 6);
    while (micros.size() < 6) {
        micros += '0';
    }
    return std::chrono::system_clock::from_time_t(std::mktime(&tm)) +
           std::chrono::microseconds(std::stoll(micros));
}

bool IsErrnoName(const std::string& token) {
    if (token.size() < 2 || token[0] != 'E') {
        return false;
    }
    for (char c : token) {
        if (!(std::isupper(static_cast<unsigned char>(c)) ||
              std::isdigit(static_cast<unsigned char>(c)) || c == '_')) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

StraceParser::StraceParser() {
    spdlog::debug("Strace parser initialized");
}

std::optional<SyscallEvent> StraceParser::ParseLine(const std::string& line, int traced_pid) const {
    if (line.empty() || IsTracerDiagnostic(line)) {
        return std::nullopt;
    }

    SyscallEvent event;
    event.pid = traced_pid;
    event.tid = traced_pid;
    event.timestamp = std::chrono::system_clock::now();
    event.raw_line = line;

    // Thread prefix and timestamp
    std::smatch prefix_match;
    std::string rest = line;
    if (std::regex_search(line, prefix_match, PrefixRegex())) {
        if (prefix_match[1].matched) {
            event.tid = std::stoi(prefix_match[1].str());
        } else if (prefix_match[2].matched) {
            event.tid = std::stoi(prefix_match[2].str());
        }

        if (prefix_match[3].matched) {
            event.timestamp = EpochTimestamp(prefix_match[3].str(), prefix_match[4].str());
        } else if (prefix_match[5].matched) {
            event.timestamp = WallClockTimestamp(std::stoi(prefix_match[5].str()),
                                                 std::stoi(prefix_match[6].str()),
                                                 std::stoi(prefix_match[7].str()),
                                                 prefix_match[8].str());
        }
        rest = prefix_match.suffix().str();
    }

    if (StringUtils::StartsWith(rest, "---") || StringUtils::StartsWith(rest, "+++")) {
        return std::nullopt;  // Signal delivery or exit notice
    }
    if (StringUtils::Contains(rest, "<unfinished ...>")) {
        return std::nullopt;
    }

    // Locate "name(" or "<... name resumed>"
    std::string args_and_tail;
    std::smatch call_match;
    if (std::regex_search(rest, call_match, ResumedRegex())) {
        event.name = call_match[1].str();
        args_and_tail = call_match.suffix().str();
    } else if (std::regex_search(rest, call_match, CallRegex())) {
        event.name = call_match[1].str();
        args_and_tail = call_match.suffix().str();
    } else {
        return std::nullopt;
    }

    // The return value follows the last ") = "
    auto eq_pos = args_and_tail.rfind(") = ");
    if (eq_pos == std::string::npos) {
        spdlog::debug("strace line without return value: {}", line);
        return std::nullopt;
    }

    event.parameters = ParseArguments(args_and_tail.substr(0, eq_pos));
    std::string tail = StringUtils::Trim(args_and_tail.substr(eq_pos + 4));

    // Duration "<secs.usec>" at the end
    if (!tail.empty() && tail.back() == '>') {
        auto open_pos = tail.rfind('<');
        if (open_pos != std::string::npos) {
            auto duration = ParseDuration(tail.substr(open_pos + 1, tail.size() - open_pos - 2));
            if (duration) {
                event.duration_ns = *duration;
                tail = StringUtils::Trim(tail.substr(0, open_pos));
            }
        }
    }

    auto tokens = StringUtils::SplitWhitespace(tail);
    if (tokens.empty()) {
        return std::nullopt;
    }

    // "?" is reported for calls that never return (exit_group, execve in a dying thread)
    if (tokens[0] != "?") {
        auto value = StringUtils::ParseInteger(tokens[0]);
        if (!value) {
            spdlog::debug("Unparseable return value '{}' in: {}", tokens[0], line);
            return std::nullopt;
        }
        event.result = *value;
    }

    if (tokens.size() > 1 && IsErrnoName(tokens[1])) {
        event.error = tokens[1];
    }

    return event;
}

std::vector<SyscallEvent> StraceParser::Parse(const std::filesystem::path& strace_log,
                                              int traced_pid) const {
    std::vector<SyscallEvent> events;

    std::ifstream file(strace_log);
    if (!file.is_open()) {
        spdlog::error("Failed to open strace log: {}", strace_log.string());
        return events;
    }

    spdlog::info("Parsing strace log: {}", strace_log.string());

    std::string line;
    int line_num = 0;
    uint64_t next_id = 1;

    while (std::getline(file, line)) {
        line_num++;
        auto event = ParseLine(line, traced_pid);
        if (event) {
            event->id = next_id++;
            events.push_back(std::move(*event));
        }
    }

    spdlog::info("Parsed {} syscalls from {} lines", events.size(), line_num);

    return events;
}

std::vector<SyscallArg> StraceParser::ParseArguments(const std::string& args_str) {
    std::vector<SyscallArg> args;
    for (const auto& token : StringUtils::SplitTopLevel(args_str, ',')) {
        if (token.empty()) {
            continue;
        }
        args.push_back(ParseArgument(token));
    }
    return args;
}

SyscallArg StraceParser::ParseArgument(const std::string& token) {
    if (!token.empty() && token.front() == '"') {
        auto text = StringUtils::Unquote(token);
        if (text) {
            return *text;
        }
    }

    auto value = StringUtils::ParseInteger(token);
    if (value) {
        return *value;
    }

    return token;
}

std::optional<uint64_t> StraceParser::ParseDuration(const std::string& text) {
    auto dot = text.find('.');
    std::string secs = text.substr(0, dot);
    std::string frac = (dot == std::string::npos) ? "" : text.substr(dot + 1);

    if (secs.empty() || secs.find_first_not_of("0123456789") != std::string::npos ||
        frac.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }

    frac = frac.substr(0, 9);
    while (frac.size() < 9) {
        frac += '0';
    }

    return std::stoull(secs) * 1000000000ull + std::stoull(frac);
}

bool StraceParser::IsTracerDiagnostic(const std::string& line) {
    return StringUtils::StartsWith(line, "strace: ");
}

bool StraceParser::IsAttachNotice(const std::string& line) {
    static const std::regex notice_regex(R"(^strace: Process \d+ (?:attached|detached))");
    return std::regex_search(line, notice_regex);
}

bool StraceParser::IsProcessExit(const std::string& line, int traced_pid) {
    static const std::regex exit_regex(
        R"(^(?:\[pid\s+(\d+)\]\s*|(\d+)\s+)?(?:[\d.:]+\s+)?\+\+\+ (?:exited with -?\d+|killed by \w+.*) \+\+\+)");

    std::smatch match;
    if (!std::regex_search(line, match, exit_regex)) {
        return false;
    }

    if (match[1].matched) {
        return std::stoi(match[1].str()) == traced_pid;
    }
    if (match[2].matched) {
        return std::stoi(match[2].str()) == traced_pid;
    }
    return true;
}

} // namespace parsers
} // namespace sysprobe
