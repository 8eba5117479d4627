#include "cairn/manifest_cache.hpp"

#include <algorithm>
#include <functional>
#include <mutex>

namespace cairn {

ManifestCache::ManifestCache(std::size_t shard_count) {
    shard_count = std::max<std::size_t>(shard_count, 1);
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ManifestCache::Shard& ManifestCache::shardFor(const ManifestId& id) const {
    std::size_t index = std::hash<ManifestId>()(id) % shards_.size();
    return *shards_[index];
}

std::optional<ContentManifest> ManifestCache::get(const ManifestId& id) const {
    Shard& shard = shardFor(id);
    std::shared_lock<std::shared_mutex> lock(shard.mutex);

    auto it = shard.entries.find(id);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ManifestCache::upsert(const ContentManifest& manifest) {
    Shard& shard = shardFor(manifest.id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    shard.entries[manifest.id] = manifest;
}

bool ManifestCache::remove(const ManifestId& id) {
    Shard& shard = shardFor(id);
    std::unique_lock<std::shared_mutex> lock(shard.mutex);
    return shard.entries.erase(id) > 0;
}

std::vector<ContentManifest> ManifestCache::getAll() const {
    std::vector<ContentManifest> all;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        for (const auto& entry : shard->entries) {
            all.push_back(entry.second);
        }
    }

    std::sort(all.begin(), all.end(), [](const ContentManifest& a, const ContentManifest& b) {
        return a.id < b.id;
    });
    return all;
}

void ManifestCache::clear() {
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        shard->entries.clear();
    }
}

std::size_t ManifestCache::size() const {
    std::size_t total = 0;
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        total += shard->entries.size();
    }
    return total;
}

} // namespace cairn
