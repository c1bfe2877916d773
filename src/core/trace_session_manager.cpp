/**
 * @file trace_session_manager.cpp
 * @brief Implementation of trace session lifecycle and capture threads
 *
 * **Capture Loop** (one thread per session):
 * ```
 * loop:
 *   result = channel.Next()            ← blocks, no lock held
 *   if cancelled: exit
 *   lock session (exclusive)
 *     EVENT         → filter → append (evict oldest half if full) → breakpoints
 *     END_OF_STREAM → STOPPED (end_of_stream)
 *     ERROR         → STOPPED (capture_failure, error message kept)
 *   unlock
 *   if STOPPED: flush window into process history, exit
 * ```
 *
 * **Locking Order**: table lock → session lock → history lock. A lock is never
 * taken while a lock later in the order is held, and none is held across
 * CaptureChannel::Next().
 *
 * @date 2025
 */

#include "sysprobe/core/trace_session_manager.hpp"
#include "sysprobe/core/errors.hpp"
#include "sysprobe/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <thread>
#include <system_error>
#include <atomic>
#include <algorithm>

namespace sysprobe {
namespace core {

using monitors::CaptureChannel;
using monitors::CaptureResult;
using monitors::SyscallEvent;
using utils::StringUtils;

// ============================================================================
// PRIVATE IMPLEMENTATION (PIMPL PATTERN)
// ============================================================================

namespace {

/// Per-session state shared between the capture thread and callers
struct SessionEntry {
    mutable std::shared_mutex mutex;
    mutable std::condition_variable_any state_changed;

    TraceSession session;                      ///< Guarded by mutex
    std::shared_ptr<CaptureChannel> channel;   ///< Guarded by mutex; reset when capture ends
    uint64_t next_event_id{1};                 ///< Guarded by mutex
    uint64_t next_breakpoint_id{1};            ///< Guarded by mutex
    bool flushed{false};                       ///< Guarded by mutex; window is in the history

    std::atomic<bool> cancel_requested{false};
    std::once_flag flush_once;

    std::mutex thread_mutex;
    std::thread capture_thread;
};

} // anonymous namespace

class TraceSessionManager::Impl {
public:
    Impl(std::shared_ptr<monitors::CaptureSource> capture_source, const Config& cfg)
        : source(std::move(capture_source))
        , config(cfg) {
    }

    std::shared_ptr<monitors::CaptureSource> source;
    Config config;

    std::map<uint64_t, std::shared_ptr<SessionEntry>> sessions;
    mutable std::shared_mutex sessions_mutex;

    std::map<int, std::vector<SyscallEvent>> history;
    mutable std::shared_mutex history_mutex;

    std::atomic<uint64_t> next_session_id{1};

    std::shared_ptr<SessionEntry> Find(uint64_t session_id) const {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) {
            throw NotFoundError("Session not found: " + std::to_string(session_id));
        }
        return it->second;
    }

    std::vector<std::shared_ptr<SessionEntry>> AllEntries() const {
        std::shared_lock<std::shared_mutex> lock(sessions_mutex);
        std::vector<std::shared_ptr<SessionEntry>> entries;
        entries.reserve(sessions.size());
        for (const auto& [id, entry] : sessions) {
            entries.push_back(entry);
        }
        return entries;
    }

    void CaptureLoop(std::shared_ptr<SessionEntry> entry, std::shared_ptr<CaptureChannel> channel);
    bool Ingest(SessionEntry& entry, SyscallEvent event);
    void MarkStopped(SessionEntry& entry, StopReason reason);
    bool RequestStop(SessionEntry& entry);
    void JoinCapture(SessionEntry& entry);
    void Flush(SessionEntry& entry);
};

// Capture thread body
void TraceSessionManager::Impl::CaptureLoop(std::shared_ptr<SessionEntry> entry,
                                            std::shared_ptr<CaptureChannel> channel) {
    const uint64_t session_id = entry->session.id;
    spdlog::debug("Capture thread started for session {}", session_id);

    bool stopped_here = false;

    while (!entry->cancel_requested) {
        CaptureResult result;
        try {
            result = channel->Next();
        }
        catch (const std::exception& e) {
            result = CaptureResult::Error(e.what());
        }

        if (entry->cancel_requested) {
            break;
        }

        {
            std::unique_lock<std::shared_mutex> lock(entry->mutex);
            if (entry->session.state != SessionState::ACTIVE) {
                break;
            }

            switch (result.kind) {
                case CaptureResult::Kind::EVENT:
                    if (result.event) {
                        stopped_here = Ingest(*entry, std::move(*result.event));
                    }
                    break;

                case CaptureResult::Kind::END_OF_STREAM:
                    MarkStopped(*entry, StopReason::END_OF_STREAM);
                    spdlog::info("Session {} reached end of stream", session_id);
                    stopped_here = true;
                    break;

                case CaptureResult::Kind::ERROR:
                    MarkStopped(*entry, StopReason::CAPTURE_FAILURE);
                    entry->session.error = result.error_message;
                    spdlog::error("Session {} capture failed: {}", session_id, result.error_message);
                    stopped_here = true;
                    break;
            }
        }

        if (stopped_here) {
            entry->state_changed.notify_all();
            break;
        }
    }

    if (stopped_here) {
        Flush(*entry);
    }

    {
        std::unique_lock<std::shared_mutex> lock(entry->mutex);
        entry->channel.reset();
    }

    spdlog::debug("Capture thread finished for session {}", session_id);
}

// Filter, append and evaluate breakpoints; caller holds the session lock
bool TraceSessionManager::Impl::Ingest(SessionEntry& entry, SyscallEvent event) {
    TraceSession& session = entry.session;

    if (!session.filters.Accepts(event)) {
        return false;
    }

    // Recent window: drop the oldest half before exceeding the limit
    if (config.max_buffered_events > 0 && session.events.size() >= config.max_buffered_events) {
        std::size_t drop = std::max<std::size_t>(1, session.events.size() / 2);
        session.events.erase(session.events.begin(),
                             session.events.begin() + static_cast<std::ptrdiff_t>(drop));
        session.evicted_events += drop;
        spdlog::warn("Session {}: event window full, evicted {} oldest events", session.id, drop);
    }

    event.id = entry.next_event_id++;
    if (config.verbose_logging) {
        spdlog::debug("[session {}] #{} {}({}) = {}", session.id, event.id, event.name,
                      monitors::FormatParameters(event.parameters), event.result);
    }
    session.events.push_back(std::move(event));

    const SyscallEvent& appended = session.events.back();
    for (auto& breakpoint : session.breakpoints) {
        if (breakpoint.Matches(appended)) {
            breakpoint.hit_count++;
            session.triggered_by = breakpoint.id;
            MarkStopped(entry, StopReason::BREAKPOINT);
            spdlog::info("Session {} hit breakpoint {} on {} (event #{})",
                         session.id, breakpoint.id, appended.name, appended.id);
            return true;
        }
    }

    return false;
}

// Caller holds the session lock
void TraceSessionManager::Impl::MarkStopped(SessionEntry& entry, StopReason reason) {
    entry.session.state = SessionState::STOPPED;
    entry.session.stop_reason = reason;
    entry.session.stopped_at = std::chrono::system_clock::now();
}

// ACTIVE → STOPPED(requested) and wake the capture thread
bool TraceSessionManager::Impl::RequestStop(SessionEntry& entry) {
    std::shared_ptr<CaptureChannel> channel;
    {
        std::unique_lock<std::shared_mutex> lock(entry.mutex);
        if (entry.session.state != SessionState::ACTIVE) {
            return false;
        }
        MarkStopped(entry, StopReason::REQUESTED);
        entry.cancel_requested = true;
        channel = entry.channel;
    }
    entry.state_changed.notify_all();

    if (channel) {
        channel->Interrupt();
    }
    return true;
}

void TraceSessionManager::Impl::JoinCapture(SessionEntry& entry) {
    std::lock_guard<std::mutex> lock(entry.thread_mutex);
    if (entry.capture_thread.joinable() &&
        entry.capture_thread.get_id() != std::this_thread::get_id()) {
        entry.capture_thread.join();
    }
}

// Append the window to the process history, once per session
void TraceSessionManager::Impl::Flush(SessionEntry& entry) {
    std::call_once(entry.flush_once, [this, &entry]() {
        std::vector<SyscallEvent> events;
        int process_id = 0;
        uint64_t session_id = 0;
        {
            std::shared_lock<std::shared_mutex> lock(entry.mutex);
            events = entry.session.events;
            process_id = entry.session.process_id;
            session_id = entry.session.id;
        }

        const std::size_t count = events.size();
        {
            std::unique_lock<std::shared_mutex> lock(history_mutex);
            auto& process_history = history[process_id];
            process_history.insert(process_history.end(),
                                   std::make_move_iterator(events.begin()),
                                   std::make_move_iterator(events.end()));
        }
        {
            std::unique_lock<std::shared_mutex> lock(entry.mutex);
            entry.flushed = true;
        }
        entry.state_changed.notify_all();

        spdlog::debug("Session {} flushed {} events into history of PID {}",
                      session_id, count, process_id);
    });
}

// ============================================================================
// PUBLIC INTERFACE
// ============================================================================

TraceSessionManager::TraceSessionManager(std::shared_ptr<monitors::CaptureSource> source)
    : TraceSessionManager(std::move(source), Config{}) {
}

// Constructor
TraceSessionManager::TraceSessionManager(std::shared_ptr<monitors::CaptureSource> source,
                                         const Config& config)
    : config_(config) {
    if (!source) {
        throw InvalidArgumentError("Capture source is required");
    }
    impl_ = std::make_unique<Impl>(std::move(source), config_);

    spdlog::debug("Trace session manager initialized (window: {} events)",
                  config_.max_buffered_events);
}

// Destructor
TraceSessionManager::~TraceSessionManager() {
    Shutdown();
}

uint64_t TraceSessionManager::Start(std::optional<int> process_id,
                                    const TraceFilters& filters,
                                    std::vector<Breakpoint> breakpoints) {
    if (!process_id) {
        throw InvalidArgumentError("processId is required");
    }
    if (*process_id <= 0) {
        throw InvalidArgumentError("Invalid processId: " + std::to_string(*process_id));
    }
    for (const auto& breakpoint : breakpoints) {
        if (breakpoint.syscall_name.empty()) {
            throw InvalidArgumentError("Breakpoint needs a syscall name");
        }
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("STARTING TRACE SESSION (PID {})", *process_id);
    spdlog::info("═══════════════════════════════════════════════════════════════");

    // Attach before anything is registered so a failure leaves no session
    std::shared_ptr<CaptureChannel> channel;
    try {
        channel = impl_->source->Attach(*process_id);
    }
    catch (const SysprobeError&) {
        throw;
    }
    catch (const std::exception& e) {
        throw CaptureUnavailableError(e.what());
    }
    if (!channel) {
        throw CaptureUnavailableError("Capture source returned no channel for PID " +
                                      std::to_string(*process_id));
    }

    auto entry = std::make_shared<SessionEntry>();
    TraceSession& session = entry->session;
    session.id = impl_->next_session_id++;
    session.process_id = *process_id;
    session.state = SessionState::ACTIVE;
    session.filters = filters;
    session.started_at = std::chrono::system_clock::now();

    for (auto& breakpoint : breakpoints) {
        breakpoint.id = entry->next_breakpoint_id++;
        breakpoint.hit_count = 0;
        session.breakpoints.push_back(std::move(breakpoint));
    }
    entry->channel = channel;

    const uint64_t session_id = session.id;
    const std::size_t breakpoint_count = session.breakpoints.size();

    {
        std::unique_lock<std::shared_mutex> lock(impl_->sessions_mutex);
        impl_->sessions[session_id] = entry;
    }

    // Logged before the capture thread can stop the session
    spdlog::info("✓ Session {} active", session_id);
    spdlog::info("  Breakpoints: {}", breakpoint_count);
    if (filters.enabled) {
        spdlog::info("  Filters: {} included, {} excluded{}",
                     filters.syscall_names.size(), filters.excluded_syscalls.size(),
                     filters.thread_id ? ", tid " + std::to_string(*filters.thread_id) : "");
    }

    try {
        std::lock_guard<std::mutex> lock(entry->thread_mutex);
        entry->capture_thread = std::thread(&Impl::CaptureLoop, impl_.get(), entry, channel);
    }
    catch (const std::system_error& e) {
        {
            std::unique_lock<std::shared_mutex> lock(impl_->sessions_mutex);
            impl_->sessions.erase(session_id);
        }
        throw InternalError(std::string("Failed to start capture thread: ") + e.what());
    }

    return session_id;
}

TraceSession TraceSessionManager::Stop(uint64_t session_id) {
    auto entry = impl_->Find(session_id);

    if (!impl_->RequestStop(*entry)) {
        throw NotFoundError("No active session with id " + std::to_string(session_id));
    }

    impl_->JoinCapture(*entry);
    impl_->Flush(*entry);

    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    spdlog::info("✓ Session {} stopped ({} events, {} evicted)",
                 session_id, entry->session.events.size(), entry->session.evicted_events);
    return entry->session;
}

TraceSession TraceSessionManager::GetSession(uint64_t session_id) const {
    auto entry = impl_->Find(session_id);
    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    return entry->session;
}

std::vector<SessionDescriptor> TraceSessionManager::ListSessions() const {
    std::vector<SessionDescriptor> descriptors;
    for (const auto& entry : impl_->AllEntries()) {
        std::shared_lock<std::shared_mutex> lock(entry->mutex);
        descriptors.push_back(SessionDescriptor::FromSession(entry->session));
    }
    return descriptors;
}

EventPage TraceSessionManager::GetEvents(uint64_t session_id, std::size_t limit,
                                         std::size_t offset) const {
    auto entry = impl_->Find(session_id);

    EventPage page;
    page.session_id = session_id;
    page.offset = offset;
    page.limit = limit;

    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    const auto& events = entry->session.events;
    page.total = events.size();

    if (offset >= events.size()) {
        return page;
    }

    const std::size_t remaining = events.size() - offset;
    std::size_t end = (limit == 0 || limit >= remaining) ? events.size() : offset + limit;
    page.events.assign(events.begin() + static_cast<std::ptrdiff_t>(offset),
                       events.begin() + static_cast<std::ptrdiff_t>(end));
    return page;
}

std::vector<SyscallEvent> TraceSessionManager::SearchEvents(uint64_t session_id,
                                                            const std::string& query) const {
    auto entry = impl_->Find(session_id);

    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    const auto& events = entry->session.events;

    if (StringUtils::Trim(query).empty()) {
        return events;
    }

    std::vector<SyscallEvent> matches;
    for (const auto& event : events) {
        if (StringUtils::ContainsIgnoreCase(event.name, query) ||
            StringUtils::ContainsIgnoreCase(monitors::FormatParameters(event.parameters), query) ||
            StringUtils::ContainsIgnoreCase(std::to_string(event.result), query)) {
            matches.push_back(event);
        }
    }
    return matches;
}

std::vector<SyscallEvent> TraceSessionManager::GetProcessHistory(int process_id) const {
    std::shared_lock<std::shared_mutex> lock(impl_->history_mutex);
    auto it = impl_->history.find(process_id);
    if (it == impl_->history.end()) {
        return {};
    }
    return it->second;
}

uint64_t TraceSessionManager::AddBreakpoint(uint64_t session_id, Breakpoint breakpoint) {
    if (breakpoint.syscall_name.empty()) {
        throw InvalidArgumentError("Breakpoint needs a syscall name");
    }

    auto entry = impl_->Find(session_id);

    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->session.state != SessionState::ACTIVE) {
        throw NotFoundError("No active session with id " + std::to_string(session_id));
    }

    breakpoint.id = entry->next_breakpoint_id++;
    breakpoint.hit_count = 0;
    entry->session.breakpoints.push_back(std::move(breakpoint));

    const auto& added = entry->session.breakpoints.back();
    spdlog::info("Session {}: breakpoint {} on {}{}", session_id, added.id, added.syscall_name,
                 added.condition ? " if " + added.condition->ToString() : "");
    return added.id;
}

void TraceSessionManager::RemoveBreakpoint(uint64_t session_id, uint64_t breakpoint_id) {
    auto entry = impl_->Find(session_id);

    std::unique_lock<std::shared_mutex> lock(entry->mutex);
    if (entry->session.state != SessionState::ACTIVE) {
        throw NotFoundError("No active session with id " + std::to_string(session_id));
    }

    auto& breakpoints = entry->session.breakpoints;
    auto it = std::find_if(breakpoints.begin(), breakpoints.end(),
                           [breakpoint_id](const Breakpoint& bp) { return bp.id == breakpoint_id; });
    if (it == breakpoints.end()) {
        throw NotFoundError("Breakpoint not found: " + std::to_string(breakpoint_id));
    }

    breakpoints.erase(it);
    spdlog::info("Session {}: breakpoint {} removed", session_id, breakpoint_id);
}

bool TraceSessionManager::WaitForStop(uint64_t session_id, std::chrono::milliseconds timeout) const {
    auto entry = impl_->Find(session_id);

    std::shared_lock<std::shared_mutex> lock(entry->mutex);
    return entry->state_changed.wait_for(lock, timeout, [&entry]() {
        return entry->session.state == SessionState::STOPPED && entry->flushed;
    });
}

void TraceSessionManager::Shutdown() {
    if (!impl_) {
        return;
    }

    auto entries = impl_->AllEntries();
    int stopped = 0;

    for (const auto& entry : entries) {
        if (impl_->RequestStop(*entry)) {
            stopped++;
        }
    }

    for (const auto& entry : entries) {
        impl_->JoinCapture(*entry);
        bool is_stopped = false;
        {
            std::shared_lock<std::shared_mutex> lock(entry->mutex);
            is_stopped = entry->session.state == SessionState::STOPPED;
        }
        if (is_stopped) {
            impl_->Flush(*entry);
        }
    }

    if (stopped > 0) {
        spdlog::info("Trace session manager shut down ({} active sessions stopped)", stopped);
    }
}

} // namespace core
} // namespace sysprobe
