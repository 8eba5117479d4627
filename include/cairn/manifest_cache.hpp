#pragma once

#include "cairn/config.hpp"
#include "cairn/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace cairn {

// ============================================================================
// Manifest Cache
// ============================================================================

// Concurrent ManifestId -> ContentManifest map split into independently
// locked shards. Readers take shared locks; writers lock only the shard that
// owns the id. Same-id writes are last-write-wins.
class ManifestCache {
public:
    // shard_count of 0 is treated as 1
    explicit ManifestCache(std::size_t shard_count = kDefaultCacheShards);

    ManifestCache(const ManifestCache&) = delete;
    ManifestCache& operator=(const ManifestCache&) = delete;

    std::optional<ContentManifest> get(const ManifestId& id) const;
    void upsert(const ContentManifest& manifest);
    // True when an entry was removed
    bool remove(const ManifestId& id);

    // Snapshot of every entry, ordered by id
    std::vector<ContentManifest> getAll() const;
    void clear();
    std::size_t size() const;
    std::size_t shardCount() const { return shards_.size(); }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<ManifestId, ContentManifest> entries;
    };

    Shard& shardFor(const ManifestId& id) const;

    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace cairn
