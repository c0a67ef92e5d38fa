/**
 * @file hash_utils.cpp
 * @brief OpenSSL-backed SHA-256 and random identifiers
 *
 * **Hash Output Format**: lowercase hexadecimal, 64 characters.
 *
 * @date 2026
 */

#include "enclave/utils/hash_utils.hpp"

#include <openssl/rand.h>
#include <openssl/sha.h>

#include <fstream>
#include <stdexcept>
#include <vector>

namespace enclave {
namespace utils {

std::string HashUtils::BytesToHex(const uint8_t* data, std::size_t size) {
    static const char* digits = "0123456789abcdef";
    std::string hex;
    hex.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        hex += digits[data[i] >> 4];
        hex += digits[data[i] & 0x0F];
    }
    return hex;
}

std::string HashUtils::ComputeSHA256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return BytesToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::ComputeSHA256(const std::filesystem::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + file_path.string());
    }

    SHA256_CTX sha256_context;
    SHA256_Init(&sha256_context);

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
        SHA256_Update(&sha256_context, buffer, file.gcount());
    }

    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_Final(hash, &sha256_context);

    return BytesToHex(hash, SHA256_DIGEST_LENGTH);
}

std::string HashUtils::RandomHex(std::size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (num_bytes > 0 && RAND_bytes(bytes.data(), static_cast<int>(num_bytes)) != 1) {
        throw std::runtime_error("OpenSSL RAND_bytes failed");
    }
    return BytesToHex(bytes.data(), bytes.size());
}

} // namespace utils
} // namespace enclave
