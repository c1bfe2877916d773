/**
 * @file errors.cpp
 * @brief Error code names
 *
 * @date 2025
 */

#include "sysprobe/core/errors.hpp"

namespace sysprobe {
namespace core {

std::string ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::CAPTURE_UNAVAILABLE: return "CaptureUnavailable";
        case ErrorCode::INTEGRITY_VIOLATION: return "IntegrityViolation";
        case ErrorCode::INTERNAL: return "Internal";
        default: return "Unknown";
    }
}

} // namespace core
} // namespace sysprobe
