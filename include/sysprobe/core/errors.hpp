/**
 * @file errors.hpp
 * @brief Error taxonomy for the tracing and snapshot subsystems
 *
 * Every failure surfaced to a caller is thrown as a SysprobeError subclass
 * carrying an ErrorCode, so transports can map codes to status values without
 * parsing messages.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace sysprobe {
namespace core {

/**
 * @enum ErrorCode
 * @brief Classification of subsystem failures
 */
enum class ErrorCode {
    INVALID_ARGUMENT,     ///< Missing or malformed input (e.g. no process id)
    NOT_FOUND,            ///< Unknown session, snapshot or breakpoint id
    CAPTURE_UNAVAILABLE,  ///< Platform collaborator cannot attach or enumerate
    INTEGRITY_VIOLATION,  ///< Overlapping used regions in a snapshot view
    INTERNAL              ///< Unexpected failure
};

/**
 * @brief Convert error code to its canonical name
 * @param code Error code
 * @return Name such as "NotFound"
 */
std::string ErrorCodeToString(ErrorCode code);

/**
 * @class SysprobeError
 * @brief Base exception for all subsystem errors
 */
class SysprobeError : public std::runtime_error {
public:
    SysprobeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code) {
    }

    /// Error classification
    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

/// Missing or malformed input; never retried
class InvalidArgumentError : public SysprobeError {
public:
    explicit InvalidArgumentError(const std::string& message)
        : SysprobeError(ErrorCode::INVALID_ARGUMENT, message) {
    }
};

/// Unknown session, snapshot or breakpoint id; never retried
class NotFoundError : public SysprobeError {
public:
    explicit NotFoundError(const std::string& message)
        : SysprobeError(ErrorCode::NOT_FOUND, message) {
    }
};

/// Platform collaborator could not attach to or enumerate a process
class CaptureUnavailableError : public SysprobeError {
public:
    explicit CaptureUnavailableError(const std::string& message)
        : SysprobeError(ErrorCode::CAPTURE_UNAVAILABLE, message) {
    }
};

/// Snapshot data failed validation (overlapping used regions)
class IntegrityViolationError : public SysprobeError {
public:
    explicit IntegrityViolationError(const std::string& message)
        : SysprobeError(ErrorCode::INTEGRITY_VIOLATION, message) {
    }
};

/// Unexpected failure
class InternalError : public SysprobeError {
public:
    explicit InternalError(const std::string& message)
        : SysprobeError(ErrorCode::INTERNAL, message) {
    }
};

} // namespace core
} // namespace sysprobe
