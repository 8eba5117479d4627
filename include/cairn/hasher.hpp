#pragma once

/**
 * @file hasher.hpp
 * @brief Streaming SHA-256 hashing of content files
 *
 * Digests are lowercase hex, 64 characters. Input is read in 64 KiB chunks
 * so arbitrarily large game files hash in constant memory.
 *
 * @example
 * ```cpp
 * auto r = cairn::compute_sha256_file("/games/zh/generals.exe");
 * if (r.ok) std::cout << r.hex_digest << "\n";
 * ```
 */

#include "cairn/cancellation.hpp"
#include "cairn/result.hpp"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>
#include <vector>

namespace cairn {

constexpr std::size_t kHashChunkSize = 64 * 1024;

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
    uint64_t bytes_hashed = 0;
    bool cancelled = false;
};

HashResult compute_sha256(const std::vector<uint8_t>& data);
HashResult compute_sha256(const std::string& data);

// Reads until EOF; cancellation is checked between chunks when a token is given
HashResult compute_sha256(std::istream& in, const CancellationToken* token = nullptr);

HashResult compute_sha256_file(const std::string& file_path,
                               const CancellationToken* token = nullptr);

// 64 lowercase-or-uppercase hex characters
bool is_sha256_hex(const std::string& value);

// Case-insensitive digest comparison
bool hash_equals(const std::string& a, const std::string& b);

// ============================================================================
// Hash Provider
// ============================================================================

/**
 * @brief Hashing collaborator used by the storage service
 *
 * Implementations must return lowercase hex digests and fail with
 * CANCELLED when the token fires.
 */
class HashProvider {
public:
    virtual ~HashProvider() = default;

    virtual Result<std::string> computeFileHash(const std::string& path,
                                                const CancellationToken& token) = 0;
};

class Sha256HashProvider : public HashProvider {
public:
    Result<std::string> computeFileHash(const std::string& path,
                                        const CancellationToken& token) override;
};

} // namespace cairn
