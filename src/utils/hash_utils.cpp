/**
 * @file hash_utils.cpp
 * @brief Implementation of content digests and random identifiers
 *
 * @date 2025
 */

#include "cloister/utils/hash_utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace cloister {
namespace utils {

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), hash, &length, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return BinaryToHex(hash, length);
}

std::string HashUtils::RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("CSPRNG failure while generating random identifier");
    }
    return BinaryToHex(bytes.data(), bytes.size());
}

std::string HashUtils::BinaryToHex(const unsigned char* data, std::size_t length) {
    static const char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        hex.push_back(kDigits[(data[i] >> 4) & 0x0F]);
        hex.push_back(kDigits[data[i] & 0x0F]);
    }
    return hex;
}

} // namespace utils
} // namespace cloister
