/**
 * @file hash_utils.hpp
 * @brief SHA-256 digests and random identifiers backed by OpenSSL
 *
 * Digests drive the artifact manifest (only files whose content changed
 * since the last download are pulled again) and the integrity line logged
 * for every exported artifact. Random hex identifiers name containers,
 * remote run labels and per-call pid files.
 *
 * @date 2026
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace enclave {
namespace utils {

/**
 * @class HashUtils
 * @brief Static hashing helpers
 *
 * **Usage Example**:
 * @code
 * std::string digest = HashUtils::ComputeSHA256(file_bytes);
 * std::string name = "enclave_" + HashUtils::RandomHex(6);  // enclave_3fa91c02be7d
 * @endcode
 *
 * **Thread Safety**: all functions are reentrant.
 */
class HashUtils {
public:
    /**
     * @brief SHA-256 of an in-memory buffer as lowercase hex
     */
    static std::string ComputeSHA256(const std::string& data);

    /**
     * @brief SHA-256 of a file, streamed in 8 KB chunks
     * @throws std::runtime_error if the file cannot be read
     */
    static std::string ComputeSHA256(const std::filesystem::path& file_path);

    /**
     * @brief Cryptographically random identifier
     * @param num_bytes Entropy in bytes (output has twice as many hex digits)
     * @throws std::runtime_error if the OpenSSL RNG fails
     */
    static std::string RandomHex(std::size_t num_bytes);

    static std::string BytesToHex(const uint8_t* data, std::size_t size);
};

} // namespace utils
} // namespace enclave
