/**
 * @file trace_session_manager.hpp
 * @brief Lifecycle management for syscall trace sessions
 *
 * Owns every trace session in the service: starts capture threads, evaluates
 * breakpoints as events arrive, stops sessions on request, and keeps the
 * per-process event history that stopped sessions are flushed into.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/trace_session.hpp"
#include "sysprobe/core/breakpoint.hpp"
#include "sysprobe/monitors/capture_source.hpp"

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <chrono>
#include <cstdint>

namespace sysprobe {
namespace core {

/**
 * @class TraceSessionManager
 * @brief Thread-safe registry of trace sessions
 *
 * **Session Lifecycle**:
 * ```
 *            Start()                     Stop() / breakpoint /
 *   ──────────────────► ACTIVE ─────────────────────────────────► STOPPED
 *                                capture failure / end of stream
 * ```
 *
 * Each ACTIVE session has a dedicated capture thread that pulls events from
 * its CaptureChannel one at a time. For every event the thread applies the
 * session filters, appends the event to the window and evaluates breakpoints
 * in registration order before asking for the next one. The first matching
 * breakpoint stops the session.
 *
 * **Recent Window**: a session keeps at most `max_buffered_events` events.
 * When an append would exceed the limit, the oldest half of the window is
 * dropped and counted in `TraceSession::evicted_events`.
 *
 * **History**: when a session stops, its window is appended to the history of
 * its process exactly once. History outlives sessions but not the manager.
 *
 * **Thread Safety**: All public methods may be called concurrently. Each
 * session has its own lock; no lock is held while waiting on a capture
 * channel.
 *
 * **Usage Example**:
 * @code
 * auto source = std::make_shared<monitors::StraceCaptureSource>();
 * TraceSessionManager manager(source);
 *
 * auto id = manager.Start(1234, TraceFilters{}, {Breakpoint::FromSpec("openat:arg1 contains \"/etc\"")});
 * manager.WaitForStop(id, std::chrono::seconds(30));
 * auto session = manager.GetSession(id);
 * @endcode
 */
class TraceSessionManager {
public:
    /**
     * @struct Config
     * @brief Session manager settings
     */
    struct Config {
        std::size_t max_buffered_events{10000};  ///< Window size per session
        bool verbose_logging{false};             ///< Log every captured event at debug level
    };

    explicit TraceSessionManager(std::shared_ptr<monitors::CaptureSource> source);
    TraceSessionManager(std::shared_ptr<monitors::CaptureSource> source, const Config& config);

    ~TraceSessionManager();

    TraceSessionManager(const TraceSessionManager&) = delete;
    TraceSessionManager& operator=(const TraceSessionManager&) = delete;

    /**
     * @brief Start tracing a process
     *
     * @param process_id Process to trace
     * @param filters Ingestion filters
     * @param breakpoints Breakpoints in evaluation order (ids are assigned here)
     * @return New session id
     *
     * @throws InvalidArgumentError if process_id is missing or not positive,
     *         or a breakpoint has no syscall name
     * @throws CaptureUnavailableError if the capture source cannot attach;
     *         no session is created
     */
    uint64_t Start(std::optional<int> process_id,
                   const TraceFilters& filters = TraceFilters{},
                   std::vector<Breakpoint> breakpoints = {});

    /**
     * @brief Stop an active session
     *
     * Cancels the capture thread, waits for it to finish and flushes the
     * window into the process history.
     *
     * @return Final copy of the session
     * @throws NotFoundError if no ACTIVE session has this id (including a
     *         session that already stopped)
     */
    TraceSession Stop(uint64_t session_id);

    /**
     * @brief Copy of a session, active or stopped
     * @throws NotFoundError for unknown ids
     */
    TraceSession GetSession(uint64_t session_id) const;

    /**
     * @brief Descriptors of every session, ordered by id
     */
    std::vector<SessionDescriptor> ListSessions() const;

    /**
     * @brief Page through a session's event window
     * @param limit Maximum events to return (0 = all)
     * @param offset Events to skip from the oldest
     * @throws NotFoundError for unknown ids
     */
    EventPage GetEvents(uint64_t session_id, std::size_t limit = 0, std::size_t offset = 0) const;

    /**
     * @brief Case-insensitive search over name, parameters and result
     * @throws NotFoundError for unknown ids
     */
    std::vector<monitors::SyscallEvent> SearchEvents(uint64_t session_id,
                                                     const std::string& query) const;

    /**
     * @brief Events flushed for a process by all of its stopped sessions
     * @return Events in flush order (empty if none)
     */
    std::vector<monitors::SyscallEvent> GetProcessHistory(int process_id) const;

    /**
     * @brief Register a breakpoint on an active session
     * @return Assigned breakpoint id
     * @throws InvalidArgumentError if the breakpoint has no syscall name
     * @throws NotFoundError if no ACTIVE session has this id
     */
    uint64_t AddBreakpoint(uint64_t session_id, Breakpoint breakpoint);

    /**
     * @brief Remove a breakpoint from an active session
     * @throws NotFoundError if the session is not ACTIVE or the breakpoint is unknown
     */
    void RemoveBreakpoint(uint64_t session_id, uint64_t breakpoint_id);

    /**
     * @brief Block until a session leaves ACTIVE and its window is in the history
     * @return true if the session is STOPPED and flushed, false on timeout
     * @throws NotFoundError for unknown ids
     */
    bool WaitForStop(uint64_t session_id, std::chrono::milliseconds timeout) const;

    /**
     * @brief Stop every active session and join all capture threads
     */
    void Shutdown();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    class Impl;
    std::unique_ptr<Impl> impl_;  ///< Pimpl idiom for implementation hiding
};

} // namespace core
} // namespace sysprobe
