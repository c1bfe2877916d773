/**
 * @file strace_capture_source.hpp
 * @brief CaptureSource that attaches strace to a running process
 *
 * Launches `strace -p <pid>` with its output redirected into a pipe and turns
 * each line into a SyscallEvent through StraceParser. A process can only have
 * one tracer, so every channel attached to the same PID shares one strace
 * child: a reader thread parses its output once and fans each result out to
 * all subscribed channels.
 *
 * @date 2025
 */

#pragma once

#include "sysprobe/monitors/capture_source.hpp"
#include "sysprobe/parsers/strace_parser.hpp"

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <atomic>
#include <optional>
#include <chrono>
#include <sys/types.h>

namespace sysprobe {
namespace monitors {

/**
 * @class StraceTracer
 * @brief One strace child and the channels reading from it
 *
 * The reader thread is the only consumer of the strace pipe. End of stream
 * and tracer errors are delivered to every current subscriber and to any that
 * subscribe afterwards. The destructor wakes the reader, terminates strace
 * (which detaches from the tracee) and reaps it.
 */
class StraceTracer {
public:
    /// Per-channel queue of results not yet pulled by Next()
    struct Subscription {
        std::mutex mutex;
        std::condition_variable ready;
        std::deque<CaptureResult> pending;   ///< Guarded by mutex
        bool interrupted{false};             ///< Guarded by mutex
    };

    StraceTracer(pid_t strace_pid, int output_fd, int traced_pid);
    ~StraceTracer();

    StraceTracer(const StraceTracer&) = delete;
    StraceTracer& operator=(const StraceTracer&) = delete;

    /**
     * @brief Block until strace confirms it has seized the process
     * @param timeout How long to wait for the first line of output
     *
     * Syscall output read here is kept for the reader thread. A silent tracer
     * is accepted once the timeout passes.
     *
     * @throws core::CaptureUnavailableError on an attach diagnostic or if
     *         strace exits first
     */
    void AwaitAttach(std::chrono::milliseconds timeout);

    /// Start the reader thread
    void Start();

    std::shared_ptr<Subscription> Subscribe();
    void Unsubscribe(const std::shared_ptr<Subscription>& subscription);

    /// True once end of stream or an error has been delivered
    bool Finished() const;

    int TracedPid() const { return traced_pid_; }

private:
    enum class ReadStatus { LINE, END, WOKEN, TIMEOUT };

    pid_t strace_pid_;
    int output_fd_;
    int wake_fds_[2];
    int traced_pid_;

    std::string line_buffer_;
    bool eof_{false};
    std::deque<std::string> early_lines_;   ///< Output consumed by AwaitAttach
    parsers::StraceParser parser_;

    std::atomic<bool> stopping_{false};
    std::thread reader_;

    mutable std::mutex subscribers_mutex_;
    std::vector<std::shared_ptr<Subscription>> subscribers_;   ///< Guarded by subscribers_mutex_
    std::optional<CaptureResult> terminal_;                    ///< Guarded by subscribers_mutex_

    // Pop one complete line from line_buffer_, reading more if needed
    ReadStatus ReadLine(std::string& line, int timeout_ms);
    void ReaderLoop();
    void Publish(const CaptureResult& result);
    void Finish(CaptureResult result);
    void StopStrace();
};

/**
 * @class StraceCaptureChannel
 * @brief One session's view of a shared StraceTracer
 *
 * Next() blocks on the channel's own queue; Interrupt() ends this channel
 * only. Destroying the last channel of a tracer stops strace.
 */
class StraceCaptureChannel : public CaptureChannel {
public:
    explicit StraceCaptureChannel(std::shared_ptr<StraceTracer> tracer);
    ~StraceCaptureChannel() override;

    StraceCaptureChannel(const StraceCaptureChannel&) = delete;
    StraceCaptureChannel& operator=(const StraceCaptureChannel&) = delete;

    CaptureResult Next() override;
    void Interrupt() override;

private:
    std::shared_ptr<StraceTracer> tracer_;
    std::shared_ptr<StraceTracer::Subscription> subscription_;
};

/**
 * @class StraceCaptureSource
 * @brief Linux strace-backed implementation of CaptureSource
 *
 * **Usage Example**:
 * @code
 * StraceCaptureSource source;
 * auto channel = source.Attach(1234);   // throws CaptureUnavailableError
 * auto result = channel->Next();
 * if (result.kind == CaptureResult::Kind::EVENT) {
 *     spdlog::info("{}() = {}", result.event->name, result.event->result);
 * }
 * @endcode
 */
class StraceCaptureSource : public CaptureSource {
public:
    /**
     * @struct Config
     * @brief strace invocation settings
     */
    struct Config {
        std::string strace_binary = "/usr/bin/strace";
        std::vector<std::string> strace_args = {
            "-f",     // Follow threads
            "-ttt",   // Epoch timestamps with microseconds
            "-T"      // Time spent in each syscall
        };
        int attach_timeout_ms = 3000;   ///< Wait for "Process N attached"
    };

    StraceCaptureSource();
    explicit StraceCaptureSource(const Config& config);

    /**
     * @brief Subscribe to the PID's tracer, launching strace if none is running
     */
    std::unique_ptr<CaptureChannel> Attach(int pid) override;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    std::mutex tracers_mutex_;
    std::map<int, std::weak_ptr<StraceTracer>> tracers_;   ///< Guarded by tracers_mutex_

    std::shared_ptr<StraceTracer> Launch(int pid);
};

} // namespace monitors
} // namespace sysprobe
