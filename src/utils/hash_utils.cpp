/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed SHA-256 helpers
 *
 * @date 2025
 */

#include "sysprobe/utils/hash_utils.hpp"

#include <openssl/sha.h>

#include <sstream>
#include <iomanip>

namespace sysprobe {
namespace utils {

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BinaryToHex(hash, SHA256_DIGEST_LENGTH);
}

} // namespace utils
} // namespace sysprobe
