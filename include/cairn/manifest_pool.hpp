#pragma once

/**
 * @file manifest_pool.hpp
 * @brief Content Manifest Pool: public API for installed game content
 *
 * The pool validates manifests and hands their content to the storage
 * service. Reads always go to the stored record; the in-memory cache holds
 * the last successful read of each id and drops ids whose record is gone or
 * unreadable.
 * Every operation returns a Result; expected failures (validation errors,
 * missing source files, corrupt records) never throw.
 *
 * Operations are synchronous and thread-safe: any thread may call any
 * operation at any time. Operations on different manifest ids run in
 * parallel; writes to the same id are serialized by the storage service.
 *
 * @example
 * ```cpp
 * cairn::PoolConfig config;
 * config.storage.root = "/var/lib/launcher/content";
 * auto pool = cairn::ContentManifestPool::create(config);
 *
 * auto added = pool->addManifest(manifest, "/tmp/extracted/mod");
 * if (added.isErr()) {
 *     std::cerr << added.error().message() << "\n";
 *     return 1;
 * }
 *
 * auto dir = pool->getContentDirectory(manifest.id);
 * if (dir.isOk() && dir.value()) {
 *     std::cout << "content at " << *dir.value() << "\n";
 * }
 * ```
 */

#include "cairn/cancellation.hpp"
#include "cairn/config.hpp"
#include "cairn/content_storage.hpp"
#include "cairn/keyed_mutex.hpp"
#include "cairn/manifest_cache.hpp"
#include "cairn/result.hpp"
#include "cairn/types.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
}

namespace cairn {

class ContentManifestPool {
public:
    /**
     * @brief Create a pool with SHA-256 hashing over the configured storage root
     * @param config Pool configuration (storage root is required)
     * @param logger Logger for all components; null uses spdlog's default logger
     */
    static std::unique_ptr<ContentManifestPool> create(const PoolConfig& config,
                                                       std::shared_ptr<spdlog::logger> logger = nullptr);

    /// Throws std::invalid_argument when storage or cache is null
    ContentManifestPool(std::shared_ptr<ContentStorageService> storage,
                        std::shared_ptr<ManifestCache> cache,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    // ------------------------------------------------------------------------
    // Core operations
    // ------------------------------------------------------------------------

    /**
     * @brief Validate a manifest and store its content from source_directory
     *
     * Fails with VALIDATION_FAILED (all messages joined by ", ") before any
     * I/O, SOURCE_MISSING when the directory does not exist, or the storage
     * error prefixed with the manifest id.
     */
    Result<bool> addManifest(const ContentManifest& manifest,
                             const std::string& source_directory,
                             const CancellationToken& token = CancellationToken());

    /**
     * @brief Replace the record of a manifest whose content is already stored
     *
     * Fails with NOT_STORED when the id has no stored content; use the
     * overload with a source directory for first-time adds.
     */
    Result<bool> addManifest(const ContentManifest& manifest,
                             const CancellationToken& token = CancellationToken());

    /// nullopt when not stored; MANIFEST_CORRUPT when the record cannot be parsed
    Result<std::optional<ContentManifest>> getManifest(const ManifestId& id,
                                                       const CancellationToken& token = CancellationToken()) const;

    /// Every readable record; unreadable ones are logged and skipped
    Result<std::vector<ContentManifest>> getAllManifests(const CancellationToken& token = CancellationToken()) const;

    /// AND of the query's filters, ordered by name then newest version first
    Result<std::vector<ContentManifest>> searchManifests(const ContentSearchQuery& query,
                                                         const CancellationToken& token = CancellationToken()) const;

    /// Idempotent: removing an absent id succeeds without touching storage
    Result<bool> removeManifest(const ManifestId& id,
                                const CancellationToken& token = CancellationToken());

    Result<bool> isManifestAcquired(const ManifestId& id,
                                    const CancellationToken& token = CancellationToken()) const;

    /// nullopt when not stored; the external location when content is not held in the CAS
    Result<std::optional<std::string>> getContentDirectory(const ManifestId& id,
                                                           const CancellationToken& token = CancellationToken()) const;

    // ------------------------------------------------------------------------
    // Record patches
    // ------------------------------------------------------------------------

    /// Set is_executable per relative path (case-insensitive); true when the record changed
    Result<bool> setExecutableFlags(const ManifestId& id,
                                    const std::map<std::string, bool>& flags);

    /// Required dependencies with no stored manifest in the declared version range
    Result<std::vector<ContentDependency>> getMissingDependencies(const ManifestId& id,
                                                                  const CancellationToken& token = CancellationToken()) const;

    // ------------------------------------------------------------------------
    // Maintenance
    // ------------------------------------------------------------------------

    Result<StorageStats> getStorageStats(const CancellationToken& token = CancellationToken()) const;
    Result<GarbageCollectionResult> runGarbageCollection(const CancellationToken& token = CancellationToken());
    Result<IntegrityReport> verifyIntegrity(const CancellationToken& token = CancellationToken());

    /// Remove every readable manifest; returns how many were removed
    Result<std::size_t> removeAllManifests(const CancellationToken& token = CancellationToken());

    /// Reload the cache from disk; returns the number of cached manifests
    Result<std::size_t> warmCache(const CancellationToken& token = CancellationToken());

    const ContentStorageService& storage() const { return *storage_; }
    const ManifestCache& cache() const { return *cache_; }

private:
    std::shared_ptr<ContentStorageService> storage_;
    std::shared_ptr<ManifestCache> cache_;
    std::shared_ptr<spdlog::logger> logger_;

    // Orders a record read and its cache update against writes of the same id
    mutable KeyedMutex cache_locks_;
};

} // namespace cairn
