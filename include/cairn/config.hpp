#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cairn {

// ============================================================================
// Pool Configuration
// ============================================================================

constexpr int64_t kDefaultGcGracePeriodSeconds = 7 * 24 * 60 * 60;
constexpr std::size_t kDefaultCacheShards = 16;

struct StorageConfig {
    std::string root;                 // storage root; manifests/, cas-objects/, data/, temp/ live here
    bool verify_integrity = true;     // re-hash staged objects before moving them into place
    int64_t gc_grace_period_seconds = kDefaultGcGracePeriodSeconds;
};

struct CacheConfig {
    std::size_t shard_count = kDefaultCacheShards;
};

struct LoggingConfig {
    std::string name = "cairn";
    std::string level = "info";       // trace, debug, info, warn, error, critical, off
    std::string pattern;              // spdlog pattern; empty keeps spdlog's default
};

struct PoolConfig {
    StorageConfig storage;
    CacheConfig cache;
    LoggingConfig logging;

    // Source path for trace
    std::string source_path;
};

struct PoolConfigParseResult {
    bool ok = false;
    std::string error;
    PoolConfig config;
    std::vector<std::string> warnings;
};

// Parse configuration JSON:
//
//   { "storage": { "root": "...", "verifyIntegrity": true, "gcGracePeriodSeconds": 604800 },
//     "cache":   { "shardCount": 16 },
//     "logging": { "name": "cairn", "level": "info", "pattern": "..." } }
//
// storage.root is required. A relative root is resolved against the
// directory of source_path when one is given. Unknown keys and out-of-range
// values produce warnings and keep the defaults.
PoolConfigParseResult parse_pool_config(const std::string& json_str,
                                        const std::string& source_path = "");

PoolConfigParseResult load_pool_config(const std::string& path);

// True for the level names accepted in logging.level
bool is_valid_log_level(const std::string& level);

} // namespace cairn
