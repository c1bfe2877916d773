/**
 * @file trace_session.cpp
 * @brief Trace session model helpers
 *
 * @date 2025
 */

#include "sysprobe/core/trace_session.hpp"

namespace sysprobe {
namespace core {

std::string SessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::ACTIVE:  return "active";
        case SessionState::STOPPED: return "stopped";
        default:                    return "unknown";
    }
}

std::optional<SessionState> SessionStateFromString(const std::string& name) {
    if (name == "active") return SessionState::ACTIVE;
    if (name == "stopped") return SessionState::STOPPED;
    return std::nullopt;
}

std::string StopReasonToString(StopReason reason) {
    switch (reason) {
        case StopReason::NONE:            return "none";
        case StopReason::REQUESTED:       return "requested";
        case StopReason::BREAKPOINT:      return "breakpoint";
        case StopReason::CAPTURE_FAILURE: return "capture_failure";
        case StopReason::END_OF_STREAM:   return "end_of_stream";
        default:                          return "unknown";
    }
}

std::optional<StopReason> StopReasonFromString(const std::string& name) {
    if (name == "none") return StopReason::NONE;
    if (name == "requested") return StopReason::REQUESTED;
    if (name == "breakpoint") return StopReason::BREAKPOINT;
    if (name == "capture_failure") return StopReason::CAPTURE_FAILURE;
    if (name == "end_of_stream") return StopReason::END_OF_STREAM;
    return std::nullopt;
}

bool TraceFilters::Accepts(const monitors::SyscallEvent& event) const {
    if (!enabled) {
        return true;
    }

    if (!syscall_names.empty() && syscall_names.count(event.name) == 0) {
        return false;
    }

    if (excluded_syscalls.count(event.name) > 0) {
        return false;
    }

    if (thread_id && event.tid != *thread_id) {
        return false;
    }

    return true;
}

std::chrono::milliseconds TraceSession::Duration() const {
    auto end = stopped_at.value_or(std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - started_at);
}

SessionDescriptor SessionDescriptor::FromSession(const TraceSession& session) {
    SessionDescriptor descriptor;
    descriptor.id = session.id;
    descriptor.process_id = session.process_id;
    descriptor.state = session.state;
    descriptor.stop_reason = session.stop_reason;
    descriptor.event_count = session.events.size();
    descriptor.evicted_events = session.evicted_events;
    descriptor.breakpoint_count = session.breakpoints.size();
    descriptor.started_at = session.started_at;
    descriptor.stopped_at = session.stopped_at;
    descriptor.error = session.error;
    return descriptor;
}

} // namespace core
} // namespace sysprobe
