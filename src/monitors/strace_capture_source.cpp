/**
 * @file strace_capture_source.cpp
 * @brief Implementation of the strace-backed capture source
 *
 * **Process Layout**:
 * ```
 * sysprobe ──fork/exec──► strace -f -ttt -T -p <pid>
 *    ▲                        │ stdout+stderr
 *    └──────── pipe ◄─────────┘
 *
 * reader thread ──► Subscription (session 1)
 *               ──► Subscription (session 2)
 * ```
 *
 * Exec failures are reported back through a close-on-exec pipe: the child
 * writes errno into it only when execvp() returns, so an empty read in the
 * parent means strace is running.
 *
 * @date 2025
 */

#include "sysprobe/monitors/strace_capture_source.hpp"
#include "sysprobe/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <cerrno>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>

namespace sysprobe {
namespace monitors {

using core::CaptureUnavailableError;
using parsers::StraceParser;

/****************************************************************************
 * StraceTracer
 ****************************************************************************/

StraceTracer::StraceTracer(pid_t strace_pid, int output_fd, int traced_pid)
    : strace_pid_(strace_pid)
    , output_fd_(output_fd)
    , wake_fds_{-1, -1}
    , traced_pid_(traced_pid) {

    if (pipe2(wake_fds_, O_NONBLOCK | O_CLOEXEC) < 0) {
        std::string reason = strerror(errno);
        StopStrace();
        throw CaptureUnavailableError("Failed to create wake-up pipe: " + reason);
    }
}

StraceTracer::~StraceTracer() {
    stopping_ = true;

    if (wake_fds_[1] >= 0) {
        char byte = 'x';
        if (write(wake_fds_[1], &byte, 1) < 0 && errno != EAGAIN) {
            spdlog::debug("Failed to wake strace reader: {}", strerror(errno));
        }
    }
    if (reader_.joinable()) {
        reader_.join();
    }

    StopStrace();

    for (int& fd : wake_fds_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    spdlog::debug("strace tracer for PID {} released", traced_pid_);
}

void StraceTracer::AwaitAttach(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            break;
        }

        std::string line;
        ReadStatus status = ReadLine(line, static_cast<int>(remaining.count()));

        if (status == ReadStatus::TIMEOUT) {
            break;
        }
        if (status != ReadStatus::LINE) {
            throw CaptureUnavailableError("strace exited before attaching to PID " +
                                          std::to_string(traced_pid_));
        }

        if (StraceParser::IsAttachNotice(line)) {
            spdlog::debug("{}", line);
            return;
        }
        if (StraceParser::IsTracerDiagnostic(line)) {
            throw CaptureUnavailableError(line.substr(8));
        }

        // Syscall output means the tracer is already running
        early_lines_.push_back(std::move(line));
        return;
    }

    spdlog::warn("No attach confirmation from strace for PID {} after {} ms, continuing",
                 traced_pid_, timeout.count());
}

void StraceTracer::Start() {
    reader_ = std::thread(&StraceTracer::ReaderLoop, this);
}

std::shared_ptr<StraceTracer::Subscription> StraceTracer::Subscribe() {
    auto subscription = std::make_shared<Subscription>();

    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    if (terminal_) {
        subscription->pending.push_back(*terminal_);
    }
    subscribers_.push_back(subscription);
    return subscription;
}

void StraceTracer::Unsubscribe(const std::shared_ptr<Subscription>& subscription) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    subscribers_.erase(std::remove(subscribers_.begin(), subscribers_.end(), subscription),
                       subscribers_.end());
}

bool StraceTracer::Finished() const {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    return terminal_.has_value();
}

void StraceTracer::ReaderLoop() {
    spdlog::debug("strace reader started for PID {}", traced_pid_);

    while (!stopping_) {
        std::string line;
        if (!early_lines_.empty()) {
            line = std::move(early_lines_.front());
            early_lines_.pop_front();
        } else {
            ReadStatus status = ReadLine(line, -1);
            if (status == ReadStatus::WOKEN) {
                break;
            }
            if (status == ReadStatus::END) {
                spdlog::debug("strace output closed for PID {}", traced_pid_);
                Finish(CaptureResult::EndOfStream());
                return;
            }
        }

        if (StraceParser::IsAttachNotice(line)) {
            spdlog::debug("{}", line);
            continue;
        }

        if (StraceParser::IsTracerDiagnostic(line)) {
            spdlog::warn("strace reported: {}", line);
            Finish(CaptureResult::Error(line.substr(8)));
            return;
        }

        if (StraceParser::IsProcessExit(line, traced_pid_)) {
            spdlog::info("Traced process {} exited", traced_pid_);
            Finish(CaptureResult::EndOfStream());
            return;
        }

        auto event = parser_.ParseLine(line, traced_pid_);
        if (event) {
            Publish(CaptureResult::Event(std::move(*event)));
        }
    }

    Finish(CaptureResult::EndOfStream());
}

// Append to every subscriber queue
void StraceTracer::Publish(const CaptureResult& result) {
    std::lock_guard<std::mutex> lock(subscribers_mutex_);
    for (const auto& subscription : subscribers_) {
        {
            std::lock_guard<std::mutex> queue_lock(subscription->mutex);
            subscription->pending.push_back(result);
        }
        subscription->ready.notify_all();
    }
}

void StraceTracer::Finish(CaptureResult result) {
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        if (terminal_) {
            return;
        }
        terminal_ = result;
    }
    Publish(result);
}

StraceTracer::ReadStatus StraceTracer::ReadLine(std::string& line, int timeout_ms) {
    char buffer[4096];

    while (true) {
        size_t pos = line_buffer_.find('\n');
        if (pos != std::string::npos) {
            line = line_buffer_.substr(0, pos);
            line_buffer_.erase(0, pos + 1);
            return ReadStatus::LINE;
        }

        if (eof_ || output_fd_ < 0) {
            // Trailing output without a newline
            if (!line_buffer_.empty()) {
                line = std::move(line_buffer_);
                line_buffer_.clear();
                return ReadStatus::LINE;
            }
            return ReadStatus::END;
        }

        struct pollfd fds[2];
        fds[0].fd = output_fd_;
        fds[0].events = POLLIN;
        fds[1].fd = wake_fds_[0];
        fds[1].events = POLLIN;

        int ready = poll(fds, 2, timeout_ms);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll() on strace output failed: {}", strerror(errno));
            eof_ = true;
            continue;
        }
        if (ready == 0) {
            return ReadStatus::TIMEOUT;
        }

        if (fds[1].revents & POLLIN) {
            return ReadStatus::WOKEN;
        }

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            ssize_t bytes_read = read(output_fd_, buffer, sizeof(buffer));
            if (bytes_read < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                spdlog::error("Failed to read strace output: {}", strerror(errno));
                eof_ = true;
            } else if (bytes_read == 0) {
                eof_ = true;
            } else {
                line_buffer_.append(buffer, static_cast<size_t>(bytes_read));
            }
        }
    }
}

void StraceTracer::StopStrace() {
    if (strace_pid_ > 0) {
        // strace detaches from the tracee on SIGTERM
        kill(strace_pid_, SIGTERM);
        waitpid(strace_pid_, nullptr, 0);
        strace_pid_ = -1;
    }

    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

/****************************************************************************
 * StraceCaptureChannel
 ****************************************************************************/

StraceCaptureChannel::StraceCaptureChannel(std::shared_ptr<StraceTracer> tracer)
    : tracer_(std::move(tracer))
    , subscription_(tracer_->Subscribe()) {
}

StraceCaptureChannel::~StraceCaptureChannel() {
    tracer_->Unsubscribe(subscription_);
}

CaptureResult StraceCaptureChannel::Next() {
    std::unique_lock<std::mutex> lock(subscription_->mutex);
    subscription_->ready.wait(lock, [this]() {
        return subscription_->interrupted || !subscription_->pending.empty();
    });

    if (subscription_->interrupted) {
        return CaptureResult::EndOfStream();
    }

    // End of stream and errors stay queued so later calls repeat them
    if (subscription_->pending.front().kind != CaptureResult::Kind::EVENT) {
        return subscription_->pending.front();
    }

    CaptureResult result = std::move(subscription_->pending.front());
    subscription_->pending.pop_front();
    return result;
}

void StraceCaptureChannel::Interrupt() {
    {
        std::lock_guard<std::mutex> lock(subscription_->mutex);
        subscription_->interrupted = true;
    }
    subscription_->ready.notify_all();
}

/****************************************************************************
 * StraceCaptureSource
 ****************************************************************************/

StraceCaptureSource::StraceCaptureSource() : StraceCaptureSource(Config{}) {}

StraceCaptureSource::StraceCaptureSource(const Config& config)
    : config_(config) {
    spdlog::debug("strace capture source using {}", config_.strace_binary);
}

std::unique_ptr<CaptureChannel> StraceCaptureSource::Attach(int pid) {
    if (pid <= 0) {
        throw CaptureUnavailableError("Invalid process id: " + std::to_string(pid));
    }

    std::lock_guard<std::mutex> lock(tracers_mutex_);

    // Drop tracers whose channels are all gone
    for (auto it = tracers_.begin(); it != tracers_.end();) {
        if (it->second.expired()) {
            it = tracers_.erase(it);
        } else {
            ++it;
        }
    }

    auto existing = tracers_.find(pid);
    if (existing != tracers_.end()) {
        auto tracer = existing->second.lock();
        if (tracer && !tracer->Finished()) {
            spdlog::info("Sharing running strace for process {}", pid);
            return std::make_unique<StraceCaptureChannel>(tracer);
        }
    }

    auto tracer = Launch(pid);
    tracers_[pid] = tracer;
    return std::make_unique<StraceCaptureChannel>(tracer);
}

std::shared_ptr<StraceTracer> StraceCaptureSource::Launch(int pid) {
    if (kill(pid, 0) < 0) {
        if (errno == ESRCH) {
            throw CaptureUnavailableError("Process not found: " + std::to_string(pid));
        }
        if (errno == EPERM) {
            throw CaptureUnavailableError("Permission denied for process " + std::to_string(pid));
        }
        throw CaptureUnavailableError("Cannot signal process " + std::to_string(pid) +
                                      ": " + strerror(errno));
    }

    // Pipe for strace output
    int output_fds[2];
    if (pipe2(output_fds, O_CLOEXEC) < 0) {
        throw CaptureUnavailableError(std::string("Failed to create pipe: ") + strerror(errno));
    }

    // Pipe reporting exec failure
    int exec_fds[2];
    if (pipe2(exec_fds, O_CLOEXEC) < 0) {
        std::string reason = strerror(errno);
        close(output_fds[0]);
        close(output_fds[1]);
        throw CaptureUnavailableError("Failed to create pipe: " + reason);
    }

    // argv must be built before fork()
    std::string pid_str = std::to_string(pid);
    std::vector<const char*> strace_argv;
    strace_argv.push_back(config_.strace_binary.c_str());
    for (const auto& arg : config_.strace_args) {
        strace_argv.push_back(arg.c_str());
    }
    strace_argv.push_back("-p");
    strace_argv.push_back(pid_str.c_str());
    strace_argv.push_back(nullptr);

    pid_t strace_pid = fork();

    if (strace_pid < 0) {
        std::string reason = strerror(errno);
        close(output_fds[0]);
        close(output_fds[1]);
        close(exec_fds[0]);
        close(exec_fds[1]);
        throw CaptureUnavailableError("Failed to fork: " + reason);
    }

    if (strace_pid == 0) {
        // Child process - exec strace
        close(output_fds[0]);
        close(exec_fds[0]);

        dup2(output_fds[1], STDOUT_FILENO);
        dup2(output_fds[1], STDERR_FILENO);
        close(output_fds[1]);

        execvp(config_.strace_binary.c_str(),
               const_cast<char* const*>(strace_argv.data()));

        // If we get here, exec failed
        int exec_errno = errno;
        ssize_t written = write(exec_fds[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    // Parent process
    close(output_fds[1]);
    close(exec_fds[1]);

    int exec_errno = 0;
    ssize_t n;
    do {
        n = read(exec_fds[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_fds[0]);

    if (n > 0) {
        waitpid(strace_pid, nullptr, 0);
        close(output_fds[0]);
        throw CaptureUnavailableError("Failed to exec " + config_.strace_binary + ": " +
                                      strerror(exec_errno));
    }

    auto tracer = std::make_shared<StraceTracer>(strace_pid, output_fds[0], pid);
    tracer->AwaitAttach(std::chrono::milliseconds(config_.attach_timeout_ms));
    tracer->Start();

    spdlog::info("strace launched with PID {} for process {}", strace_pid, pid);
    return tracer;
}

} // namespace monitors
} // namespace sysprobe
