/**
 * @file hash_utils.hpp
 * @brief Content digests and unpredictable identifiers
 *
 * SHA-256 digests record exactly what was staged into a sandbox so that file
 * injection is auditable after the fact. Random hex tokens name session
 * directories and containers; they come from the OpenSSL CSPRNG so that
 * scratch paths cannot be guessed by code running elsewhere on the host.
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>

namespace cloister {
namespace utils {

/**
 * @class HashUtils
 * @brief Stateless hashing and randomness helpers backed by OpenSSL
 *
 * **Usage Example**:
 * @code
 * auto digest = HashUtils::ComputeSHA256("print('ok')");
 * auto token  = HashUtils::RandomHex(8);   // 16 hex characters
 * @endcode
 */
class HashUtils {
public:
    /**
     * @brief Compute SHA-256 of in-memory data
     * @param data Bytes to hash
     * @return Lowercase hex digest (64 characters)
     * @throws std::runtime_error if OpenSSL fails to digest
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief Generate random bytes from the OpenSSL CSPRNG as hex
     * @param num_bytes Number of random bytes (output is twice as long)
     * @return Lowercase hex string
     * @throws std::runtime_error if the CSPRNG is not seeded
     */
    static std::string RandomHex(std::size_t num_bytes);

    /**
     * @brief Convert binary buffer to lowercase hex
     * @param data Buffer
     * @param length Buffer length
     * @return Hex string
     */
    static std::string BinaryToHex(const unsigned char* data, std::size_t length);
};

} // namespace utils
} // namespace cloister
