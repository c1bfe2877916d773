/**
 * @file trace_session.hpp
 * @brief Trace session data model
 *
 * A TraceSession is the record of one capture run against one process: its
 * filters, breakpoints, the recent window of captured events and how the run
 * ended. Sessions are owned by TraceSessionManager; callers only ever see
 * copies.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/core/breakpoint.hpp"
#include "sysprobe/monitors/capture_source.hpp"

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <chrono>
#include <cstdint>

namespace sysprobe {
namespace core {

/**
 * @enum SessionState
 * @brief Session lifecycle; STOPPED is terminal
 */
enum class SessionState {
    ACTIVE,
    STOPPED
};

/**
 * @enum StopReason
 * @brief Why a session left the ACTIVE state
 */
enum class StopReason {
    NONE,             ///< Still active
    REQUESTED,        ///< Stop() or Shutdown()
    BREAKPOINT,       ///< A breakpoint fired
    CAPTURE_FAILURE,  ///< Capture channel reported an error (see TraceSession::error)
    END_OF_STREAM     ///< Traced process exited
};

std::string SessionStateToString(SessionState state);
std::optional<SessionState> SessionStateFromString(const std::string& name);
std::string StopReasonToString(StopReason reason);
std::optional<StopReason> StopReasonFromString(const std::string& name);

/**
 * @struct TraceFilters
 * @brief Ingestion filters for a session
 *
 * When enabled, an event must pass every filter to be recorded. Rejected
 * events are dropped before breakpoint evaluation.
 */
struct TraceFilters {
    bool enabled{false};                       ///< Filters are ignored when false
    std::set<std::string> syscall_names;       ///< Only these names (empty = all)
    std::set<std::string> excluded_syscalls;   ///< Never these names
    std::optional<int> thread_id;              ///< Only this thread

    bool Accepts(const monitors::SyscallEvent& event) const;
};

/**
 * @struct TraceSession
 * @brief One capture run against one process
 */
struct TraceSession {
    uint64_t id{0};
    int process_id{0};
    SessionState state{SessionState::ACTIVE};
    TraceFilters filters;
    std::vector<Breakpoint> breakpoints;             ///< In registration order
    std::vector<monitors::SyscallEvent> events;      ///< Recent window, delivery order

    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> stopped_at;

    StopReason stop_reason{StopReason::NONE};
    std::optional<std::string> error;                ///< Capture failure message
    std::optional<uint64_t> triggered_by;            ///< Breakpoint that stopped the session
    uint64_t evicted_events{0};                      ///< Events dropped from the window

    /// Time between start and stop (or now, while active)
    std::chrono::milliseconds Duration() const;
};

/**
 * @struct SessionDescriptor
 * @brief Lightweight session summary for listings
 */
struct SessionDescriptor {
    uint64_t id{0};
    int process_id{0};
    SessionState state{SessionState::ACTIVE};
    StopReason stop_reason{StopReason::NONE};
    std::size_t event_count{0};
    uint64_t evicted_events{0};
    std::size_t breakpoint_count{0};
    std::chrono::system_clock::time_point started_at;
    std::optional<std::chrono::system_clock::time_point> stopped_at;
    std::optional<std::string> error;

    static SessionDescriptor FromSession(const TraceSession& session);
};

/**
 * @struct EventPage
 * @brief One page of a session's event window
 */
struct EventPage {
    uint64_t session_id{0};
    std::size_t total{0};    ///< Events in the window
    std::size_t offset{0};
    std::size_t limit{0};    ///< 0 = unlimited
    std::vector<monitors::SyscallEvent> events;
};

} // namespace core
} // namespace sysprobe
