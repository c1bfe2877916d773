/**
 * @file strace_parser.hpp
 * @brief Parser for strace output lines
 *
 * Turns lines produced by `strace -f -ttt -T` into SyscallEvent records:
 * thread id, absolute timestamp, syscall name, typed arguments, return value,
 * errno name and time spent in the call. Used by StraceCaptureSource for live
 * capture and by the CLI for offline strace logs.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/capture_source.hpp"

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace sysprobe {
namespace parsers {

/**
 * @class StraceParser
 * @brief Line-oriented strace output parser
 *
 * **Accepted line shapes**:
 * @code
 * 1700000000.123456 openat(AT_FDCWD, "/etc/passwd", O_RDONLY) = 3 <0.000021>
 * [pid  4242] 1700000000.123500 read(3, "root:x:0:0"..., 4096) = 1024 <0.000010>
 * 12:34:56.789012 access("/etc/ld.so.preload", R_OK) = -1 ENOENT (No such file or directory) <0.000008>
 * <... read resumed>"", 4096) = 0 <0.000005>
 * @endcode
 *
 * Signal notices (`--- SIGCHLD ... ---`), exit notices (`+++ exited with 0 +++`)
 * and unfinished calls (`<unfinished ...>`) produce no event.
 *
 * **Usage Example**:
 * @code
 * StraceParser parser;
 * auto event = parser.ParseLine("1700000000.000001 close(3) = 0 <0.000004>", 1234);
 * if (event) {
 *     std::cout << event->name << " -> " << event->result << std::endl;
 * }
 * @endcode
 */
class StraceParser {
public:
    StraceParser();

    /**
     * @brief Parse a single strace output line
     * @param line Raw line without trailing newline
     * @param traced_pid Process being traced (used when the line has no pid prefix)
     * @return Event, or nullopt for non-syscall lines
     */
    std::optional<monitors::SyscallEvent> ParseLine(const std::string& line, int traced_pid) const;

    /**
     * @brief Parse an entire strace log file
     * @param strace_log Path to strace output
     * @param traced_pid Process the log belongs to
     * @return Events in file order
     */
    std::vector<monitors::SyscallEvent> Parse(const std::filesystem::path& strace_log,
                                              int traced_pid) const;

    /**
     * @brief Split an argument list into typed arguments
     * @param args_str Text between the call parentheses
     */
    static std::vector<monitors::SyscallArg> ParseArguments(const std::string& args_str);

    /**
     * @brief Type a single argument token
     *
     * Quoted strings become std::string (unescaped), integers become long,
     * anything else (flags, structs, arrays) is kept verbatim as std::string.
     */
    static monitors::SyscallArg ParseArgument(const std::string& token);

    /**
     * @brief Convert an strace "<seconds.fraction>" duration to nanoseconds
     * @param text Duration text without angle brackets, e.g. "0.000123"
     */
    static std::optional<uint64_t> ParseDuration(const std::string& text);

    /**
     * @brief Check for an strace diagnostic such as "strace: attach: ..."
     */
    static bool IsTracerDiagnostic(const std::string& line);

    /**
     * @brief Check for "strace: Process N attached" or "... detached"
     *
     * These are informational diagnostics; strace prints one per thread as
     * it is seized or released.
     */
    static bool IsAttachNotice(const std::string& line);

    /**
     * @brief Check for a process exit notice for the given pid
     *
     * Matches "+++ exited with N +++" and "+++ killed by SIG +++" lines that
     * either carry no pid prefix or carry the traced pid.
     */
    static bool IsProcessExit(const std::string& line, int traced_pid);
};

} // namespace parsers
} // namespace sysprobe
