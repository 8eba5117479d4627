#pragma once

/**
 * @file content_storage.hpp
 * @brief On-disk content-addressable storage for manifests and their files
 *
 * Layout under the storage root:
 *
 *   manifests/<lower-id>.manifest.json   one JSON record per stored manifest
 *   cas-objects/<h0h1>/<hash>            file contents, named by SHA-256
 *   data/<lower-id>/                     logical content directory
 *   data/<lower-id>/source.path          external content location (optional)
 *   temp/                                staging area for object writes
 *
 * Objects are written to temp/ and renamed into place, so an object path
 * either does not exist or holds the complete content for its hash. A
 * manifest record is written only after every object it references exists.
 *
 * @example
 * ```cpp
 * cairn::StorageConfig cfg;
 * cfg.root = "/var/lib/launcher/content";
 * cairn::ContentStorageService storage(cfg, std::make_shared<cairn::Sha256HashProvider>());
 *
 * auto stored = storage.storeContent(manifest, "/tmp/extracted/mod");
 * if (stored.isErr()) {
 *     std::cerr << stored.error().toString() << "\n";
 * }
 * ```
 */

#include "cairn/cancellation.hpp"
#include "cairn/config.hpp"
#include "cairn/hasher.hpp"
#include "cairn/keyed_mutex.hpp"
#include "cairn/result.hpp"
#include "cairn/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace spdlog {
class logger;
}

namespace cairn {

// ============================================================================
// Maintenance Reports
// ============================================================================

struct StorageStats {
    uint64_t manifest_count = 0;
    uint64_t object_count = 0;
    uint64_t object_bytes = 0;
    uint64_t total_file_count = 0;    // every regular file under the root
    uint64_t total_size_bytes = 0;
    uint64_t available_bytes = 0;     // free space on the root's volume
};

struct GarbageCollectionResult {
    uint64_t objects_scanned = 0;
    uint64_t objects_referenced = 0;
    uint64_t objects_deleted = 0;
    uint64_t bytes_freed = 0;
};

enum class IntegrityIssueKind {
    HashMismatch,    // object content does not hash to its name
    Unreadable,      // object could not be read
    MissingObject,   // referenced by a manifest but absent
};

const char* integrity_issue_kind_to_string(IntegrityIssueKind kind);

struct IntegrityIssue {
    IntegrityIssueKind kind;
    std::string hash;
    std::string detail;
    std::vector<std::string> manifest_ids;  // manifests referencing the object
};

struct IntegrityReport {
    uint64_t objects_validated = 0;
    std::vector<IntegrityIssue> issues;

    bool ok() const { return issues.empty(); }
};

// Result of reading every record under manifests/
struct ManifestScan {
    std::vector<ContentManifest> manifests;
    std::vector<std::string> unreadable;    // "<path>: <reason>"
};

// ============================================================================
// Content Storage Service
// ============================================================================

class ContentStorageService {
public:
    // Patch callback for updateManifest: return true when it changed the manifest
    using ManifestPatch = std::function<Result<bool>(ContentManifest&)>;

    // Throws std::invalid_argument for an empty root or a null hash provider
    ContentStorageService(StorageConfig config,
                          std::shared_ptr<HashProvider> hasher,
                          std::shared_ptr<spdlog::logger> logger = nullptr);

    const StorageConfig& config() const { return config_; }

    // Hash and store every ContentAddressable file of manifest found under
    // source_directory, then write the manifest record. All-or-nothing: on
    // failure no record is written and objects this call created that no
    // stored manifest references are removed again.
    // Returns the stored manifest: lowercase hashes, sizes filled in and
    // missing optional files dropped.
    Result<ContentManifest> storeContent(const ContentManifest& manifest,
                                         const std::string& source_directory,
                                         const CancellationToken& token = CancellationToken());

    // Rewrite the record of an already stored manifest without touching content.
    // NOT_STORED when absent; SOURCE_MISSING when a ContentAddressable hash has no object.
    Result<ContentManifest> replaceManifest(const ContentManifest& manifest);

    // Read-modify-write of a stored record under its id lock.
    // Ok(false) means the patch made no change and nothing was written.
    Result<bool> updateManifest(const ManifestId& id, const ManifestPatch& patch);

    // Record, then content directory, then objects no remaining manifest
    // references. Removing an absent id succeeds without touching anything.
    Result<void> removeContent(const ManifestId& id,
                               const CancellationToken& token = CancellationToken());

    Result<bool> isContentStored(const ManifestId& id) const;

    // nullopt when no record exists; MANIFEST_CORRUPT when it cannot be parsed
    Result<std::optional<ContentManifest>> readManifest(const ManifestId& id) const;

    // Every record under manifests/, unreadable ones listed separately
    Result<ManifestScan> scanManifests(const CancellationToken& token = CancellationToken()) const;

    // Both throw std::invalid_argument for ids that do not name a single
    // entry below their directory (the empty id)
    std::string getManifestStoragePath(const ManifestId& id) const;
    std::string getContentDirectoryPath(const ManifestId& id) const;
    std::string getObjectPath(const std::string& hash) const;
    bool objectExists(const std::string& hash) const;

    Result<StorageStats> getStats(const CancellationToken& token = CancellationToken()) const;

    // Delete unreferenced objects older than the grace period. Deletes
    // nothing when any manifest record is unreadable.
    Result<GarbageCollectionResult> collectGarbage(const CancellationToken& token = CancellationToken());

    Result<IntegrityReport> verifyIntegrity(const CancellationToken& token = CancellationToken());

    static constexpr const char* kManifestsDir = "manifests";
    static constexpr const char* kObjectsDir = "cas-objects";
    static constexpr const char* kDataDir = "data";
    static constexpr const char* kTempDir = "temp";
    static constexpr const char* kManifestSuffix = ".manifest.json";
    static constexpr const char* kSourceMappingFile = "source.path";

private:
    struct PlannedObject {
        std::string source_path;
        std::string hash;
    };

    // RAII pin: objects pinned by an in-flight store are never rolled back by another
    class ObjectPins;

    Result<void> ensureLayout() const;
    Result<void> writeObject(const PlannedObject& object,
                             const CancellationToken& token,
                             bool& created);
    Result<void> writeRecord(const ContentManifest& manifest);
    void rollbackObjects(const ManifestId& id, const std::vector<std::string>& created);
    bool isPinnedElsewhere(const std::string& hash) const;

    // Objects referenced by any record; nullopt when a record is unreadable
    std::optional<std::unordered_map<std::string, std::vector<std::string>>>
    collectReferences(const CancellationToken& token, std::string& failure) const;

    std::vector<std::string> listObjectHashes() const;
    bool deleteObject(const std::string& hash, uint64_t* freed);

    StorageConfig config_;
    std::shared_ptr<HashProvider> hasher_;
    std::shared_ptr<spdlog::logger> logger_;

    KeyedMutex id_locks_;
    KeyedMutex object_locks_;

    // Stores hold it shared; object sweeps (removal, GC) hold it exclusively
    std::shared_mutex sweep_mutex_;

    mutable std::mutex pins_mutex_;
    std::unordered_map<std::string, std::size_t> pins_;
};

} // namespace cairn
