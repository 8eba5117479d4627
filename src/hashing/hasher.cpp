#include "cairn/hasher.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <openssl/evp.h>

namespace cairn {

// ============================================================================
// SHA-256 Implementation (using OpenSSL 3.0+ EVP API)
// ============================================================================

namespace {

// RAII wrapper for EVP_MD_CTX
class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string bytes_to_hex(const unsigned char* data, size_t len) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        result.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[data[i] & 0x0F]);
    }
    return result;
}

bool init_digest(EvpMdCtx& ctx, HashResult& result) {
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return false;
    }
    return true;
}

bool finish_digest(EvpMdCtx& ctx, HashResult& result) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return false;
    }

    result.hex_digest = bytes_to_hex(hash, hash_len);
    result.ok = true;
    return true;
}

HashResult hash_buffer(const void* data, size_t size) {
    HashResult result;

    EvpMdCtx ctx;
    if (!init_digest(ctx, result)) return result;

    if (EVP_DigestUpdate(ctx.get(), data, size) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    result.bytes_hashed = size;
    finish_digest(ctx, result);
    return result;
}

} // namespace

HashResult compute_sha256(const std::vector<uint8_t>& data) {
    return hash_buffer(data.data(), data.size());
}

HashResult compute_sha256(const std::string& data) {
    return hash_buffer(data.data(), data.size());
}

HashResult compute_sha256(std::istream& in, const CancellationToken* token) {
    HashResult result;

    EvpMdCtx ctx;
    if (!init_digest(ctx, result)) return result;

    std::vector<char> buffer(kHashChunkSize);
    while (in.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || in.gcount() > 0) {
        if (token && token->isCancelled()) {
            result.cancelled = true;
            result.error = "hashing cancelled";
            return result;
        }
        auto count = static_cast<size_t>(in.gcount());
        if (EVP_DigestUpdate(ctx.get(), buffer.data(), count) != 1) {
            result.error = "EVP_DigestUpdate failed";
            return result;
        }
        result.bytes_hashed += count;
    }

    if (in.bad()) {
        result.error = "stream read failed";
        return result;
    }

    finish_digest(ctx, result);
    return result;
}

HashResult compute_sha256_file(const std::string& file_path, const CancellationToken* token) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        HashResult result;
        result.error = "failed to open file: " + file_path;
        return result;
    }

    HashResult result = compute_sha256(file, token);
    if (!result.ok && !result.cancelled) {
        result.error += ": " + file_path;
    }
    return result;
}

bool is_sha256_hex(const std::string& value) {
    return value.size() == 64 &&
           std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isxdigit(c); });
}

bool hash_equals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// ============================================================================
// Sha256HashProvider
// ============================================================================

Result<std::string> Sha256HashProvider::computeFileHash(const std::string& path,
                                                        const CancellationToken& token) {
    if (token.isCancelled()) {
        return Result<std::string>::err(Error(ErrorCode::CANCELLED, "hashing cancelled: " + path));
    }

    auto hashed = compute_sha256_file(path, &token);
    if (hashed.cancelled) {
        return Result<std::string>::err(Error(ErrorCode::CANCELLED, "hashing cancelled: " + path));
    }
    if (!hashed.ok) {
        return Result<std::string>::err(Error(ErrorCode::HASH_FAILED, hashed.error));
    }
    return Result<std::string>::ok(hashed.hex_digest);
}

} // namespace cairn
