/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests for snapshot fingerprinting
 *
 * Snapshots are fingerprinted with SHA-256 over a canonical rendering of
 * their region layout, so two snapshots with identical layouts can be
 * recognised without a full diff.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <cstdint>

namespace sysprobe {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers (OpenSSL)
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256("heap:0x1000+0x1000:1;");
 * // 64 lowercase hex characters
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of a string
     * @return Lowercase hex digest
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Convert raw bytes to lowercase hex
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace sysprobe
