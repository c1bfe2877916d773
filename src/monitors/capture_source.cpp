/**
 * @file capture_source.cpp
 * @brief Argument formatting for syscall events
 *
 * @date 2025
 */

#include "sysprobe/monitors/capture_source.hpp"

#include <sstream>
#include <iomanip>

namespace sysprobe {
namespace monitors {

std::string FormatArgument(const SyscallArg& arg) {
    if (const auto* value = std::get_if<long>(&arg)) {
        return std::to_string(*value);
    }

    if (const auto* text = std::get_if<std::string>(&arg)) {
        return "\"" + *text + "\"";
    }

    const auto& buffer = std::get<std::vector<uint8_t>>(arg);
    std::ostringstream oss;
    oss << "0x";
    for (uint8_t byte : buffer) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

std::string FormatParameters(const std::vector<SyscallArg>& parameters) {
    std::string out;
    for (std::size_t i = 0; i < parameters.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += FormatArgument(parameters[i]);
    }
    return out;
}

} // namespace monitors
} // namespace sysprobe
