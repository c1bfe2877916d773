/**
 * @file capture_source.hpp
 * @brief Syscall event model and the platform capture interface
 *
 * Defines the SyscallEvent record shared by every component and the two
 * interfaces through which the core pulls events from the host platform:
 * CaptureSource (attach to a process) and CaptureChannel (blocking pull of
 * the next event). Real implementations live in strace_capture_source.hpp;
 * tests inject deterministic fakes.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <memory>
#include <variant>
#include <cstdint>

namespace sysprobe {
namespace monitors {

/**
 * @brief Syscall argument value
 *
 * Arguments are opaque to the core; the variant keeps whatever typing the
 * capture source could recover.
 */
using SyscallArg = std::variant<
    long,                  ///< Integer value, flag word or pointer
    std::string,           ///< String, path or unparsed token
    std::vector<uint8_t>   ///< Binary buffer
>;

/**
 * @struct SyscallEvent
 * @brief One recorded syscall invocation
 *
 * Immutable once appended to a session. The order in which a CaptureChannel
 * delivers events is the authoritative order for all statistics.
 */
struct SyscallEvent {
    uint64_t id{0};                                   ///< Monotonic id within a session
    std::string name;                                 ///< Syscall name (e.g. "openat")
    std::chrono::system_clock::time_point timestamp;  ///< When the call was made
    std::vector<SyscallArg> parameters;               ///< Arguments in call order
    long result{0};                                   ///< Return value
    uint64_t duration_ns{0};                          ///< Time spent in the kernel
    std::optional<std::string> error;                 ///< errno name if the call failed

    int pid{0};                                       ///< Traced process id
    int tid{0};                                       ///< Calling thread id
    std::string raw_line;                             ///< Original capture text, if any
};

/**
 * @brief Render an argument for display and text matching
 * @param arg Argument value
 * @return Printable representation (strings quoted, buffers as hex)
 */
std::string FormatArgument(const SyscallArg& arg);

/**
 * @brief Render all parameters as a comma separated list
 */
std::string FormatParameters(const std::vector<SyscallArg>& parameters);

/**
 * @struct CaptureResult
 * @brief Outcome of one CaptureChannel::Next() call
 */
struct CaptureResult {
    enum class Kind {
        EVENT,          ///< `event` holds the next syscall
        END_OF_STREAM,  ///< Process exited or the channel was interrupted
        ERROR           ///< Capture failed; `error_message` explains why
    };

    Kind kind{Kind::END_OF_STREAM};
    std::optional<SyscallEvent> event;
    std::string error_message;

    static CaptureResult Event(SyscallEvent e) {
        CaptureResult r;
        r.kind = Kind::EVENT;
        r.event = std::move(e);
        return r;
    }

    static CaptureResult EndOfStream() {
        return CaptureResult{};
    }

    static CaptureResult Error(std::string message) {
        CaptureResult r;
        r.kind = Kind::ERROR;
        r.error_message = std::move(message);
        return r;
    }
};

/**
 * @class CaptureChannel
 * @brief Ordered stream of syscall events from one traced process
 *
 * Next() may block. Interrupt() may be called from any thread and must make a
 * pending or future Next() return END_OF_STREAM promptly.
 */
class CaptureChannel {
public:
    virtual ~CaptureChannel() = default;

    /**
     * @brief Pull the next syscall event
     * @return Event, end of stream, or capture error
     */
    virtual CaptureResult Next() = 0;

    /**
     * @brief Wake a blocked Next() and end the stream
     */
    virtual void Interrupt() = 0;
};

/**
 * @class CaptureSource
 * @brief Factory for capture channels
 */
class CaptureSource {
public:
    virtual ~CaptureSource() = default;

    /**
     * @brief Attach to a process and open an event stream
     * @param pid Process to trace
     * @return Channel delivering the process's syscalls
     *
     * @throws core::CaptureUnavailableError if the process cannot be traced
     */
    virtual std::unique_ptr<CaptureChannel> Attach(int pid) = 0;
};

} // namespace monitors
} // namespace sysprobe
