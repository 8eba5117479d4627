#include "cairn/content_storage.hpp"
#include "cairn/logging.hpp"
#include "cairn/manifest_json.hpp"
#include "cairn/path_utils.hpp"
#include "cairn/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <system_error>

#include <spdlog/spdlog.h>

namespace cairn {

namespace fs = std::filesystem;

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

template<typename T>
Result<T> fail(ErrorCode code, const std::string& message) {
    return Result<T>::err(Error(code, message));
}

Result<void> fail_void(ErrorCode code, const std::string& message) {
    return Result<void>::err(Error(code, message));
}

// File or directory name for an id; it must be a single entry strictly below
// its parent, never the parent itself
const std::string& entry_name(const ManifestId& id) {
    const std::string& name = id.normalized();
    if (name.find_first_not_of('.') == std::string::npos ||
        name.find_first_of("/\\") != std::string::npos) {
        throw std::invalid_argument("manifest id '" + id.value() + "' does not name a storage entry");
    }
    return name;
}

std::vector<std::string> cas_hashes(const ContentManifest& manifest) {
    std::set<std::string> unique;
    for (const auto& file : manifest.files) {
        if (file.source_type == ContentSourceType::ContentAddressable && !file.hash.empty()) {
            unique.insert(to_lower(file.hash));
        }
    }
    return {unique.begin(), unique.end()};
}

} // namespace

const char* integrity_issue_kind_to_string(IntegrityIssueKind kind) {
    switch (kind) {
        case IntegrityIssueKind::HashMismatch: return "HashMismatch";
        case IntegrityIssueKind::Unreadable: return "Unreadable";
        case IntegrityIssueKind::MissingObject: return "MissingObject";
    }
    return "Unknown";
}

// ============================================================================
// Object Pins
// ============================================================================

class ContentStorageService::ObjectPins {
public:
    ObjectPins(ContentStorageService& owner, std::vector<std::string> hashes)
        : owner_(owner), hashes_(std::move(hashes)) {
        std::lock_guard<std::mutex> guard(owner_.pins_mutex_);
        for (const auto& hash : hashes_) {
            owner_.pins_[hash]++;
        }
    }

    ~ObjectPins() {
        std::lock_guard<std::mutex> guard(owner_.pins_mutex_);
        for (const auto& hash : hashes_) {
            auto it = owner_.pins_.find(hash);
            if (it != owner_.pins_.end() && --it->second == 0) {
                owner_.pins_.erase(it);
            }
        }
    }

    ObjectPins(const ObjectPins&) = delete;
    ObjectPins& operator=(const ObjectPins&) = delete;

private:
    ContentStorageService& owner_;
    std::vector<std::string> hashes_;
};

// ============================================================================
// Construction and Paths
// ============================================================================

ContentStorageService::ContentStorageService(StorageConfig config,
                                             std::shared_ptr<HashProvider> hasher,
                                             std::shared_ptr<spdlog::logger> logger)
    : config_(std::move(config)),
      hasher_(std::move(hasher)),
      logger_(logger_or_default(std::move(logger))) {
    if (config_.root.empty()) {
        throw std::invalid_argument("storage root must not be empty");
    }
    if (!hasher_) {
        throw std::invalid_argument("hash provider must not be null");
    }
}

std::string ContentStorageService::getManifestStoragePath(const ManifestId& id) const {
    return join_path(join_path(config_.root, kManifestsDir), entry_name(id) + kManifestSuffix);
}

std::string ContentStorageService::getContentDirectoryPath(const ManifestId& id) const {
    return join_path(join_path(config_.root, kDataDir), entry_name(id));
}

std::string ContentStorageService::getObjectPath(const std::string& hash) const {
    std::string h = to_lower(hash);
    std::string shard = h.size() >= 2 ? h.substr(0, 2) : h;
    return join_path(join_path(join_path(config_.root, kObjectsDir), shard), h);
}

bool ContentStorageService::objectExists(const std::string& hash) const {
    return is_regular_file(getObjectPath(hash));
}

Result<void> ContentStorageService::ensureLayout() const {
    for (const char* dir : {kManifestsDir, kObjectsDir, kDataDir, kTempDir}) {
        std::string path = join_path(config_.root, dir);
        if (!create_directories(path)) {
            return fail_void(ErrorCode::IO_ERROR, "failed to create directory " + path);
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Store
// ============================================================================

Result<ContentManifest> ContentStorageService::storeContent(const ContentManifest& manifest,
                                                            const std::string& source_directory,
                                                            const CancellationToken& token) {
    const std::string& id = manifest.id.value();

    if (token.isCancelled()) {
        return fail<ContentManifest>(ErrorCode::CANCELLED, "store cancelled for " + id);
    }
    if (!is_directory(source_directory)) {
        return fail<ContentManifest>(ErrorCode::SOURCE_MISSING,
                                     "Source directory does not exist: " + source_directory);
    }

    auto id_lock = id_locks_.lock(manifest.id.normalized());
    logger_->info("Storing content for manifest {} from {}", id, source_directory);

    try {
        auto layout = ensureLayout();
        if (layout.isErr()) {
            return Result<ContentManifest>::err(layout.error());
        }

        // Phase 1: resolve, hash and verify every file. Nothing is written.
        ContentManifest stored = manifest;
        stored.files.clear();
        std::vector<PlannedObject> plan;
        std::set<std::string> planned_hashes;

        for (const auto& file : manifest.files) {
            if (token.isCancelled()) {
                return fail<ContentManifest>(ErrorCode::CANCELLED, "store cancelled for " + id);
            }

            if (file.source_type != ContentSourceType::ContentAddressable) {
                stored.files.push_back(file);
                continue;
            }

            auto resolved = normalize_under_root(source_directory, file.relative_path);
            if (!resolved.ok) {
                return fail<ContentManifest>(ErrorCode::PATH_TRAVERSAL,
                                             "File " + file.relative_path + ": " +
                                             path_error_to_string(resolved.error));
            }

            if (!is_regular_file(resolved.path)) {
                if (!file.is_required) {
                    logger_->warn("Optional file not found, skipping: {} ({})", file.relative_path, id);
                    continue;
                }
                return fail<ContentManifest>(ErrorCode::SOURCE_MISSING,
                                             "Required file not found: " + file.relative_path);
            }

            auto hashed = hasher_->computeFileHash(resolved.path, token);
            if (hashed.isErr()) {
                return Result<ContentManifest>::err(hashed.error());
            }
            const std::string& actual = hashed.value();

            if (!hash_equals(actual, file.hash)) {
                return fail<ContentManifest>(ErrorCode::HASH_MISMATCH,
                                             "Hash mismatch for " + file.relative_path +
                                             ": expected " + to_lower(file.hash) + ", got " + actual);
            }

            auto actual_size = file_size(resolved.path);
            if (!actual_size) {
                return fail<ContentManifest>(ErrorCode::IO_ERROR,
                                             "failed to stat " + resolved.path);
            }
            if (file.size > 0 && static_cast<uint64_t>(file.size) != *actual_size) {
                return fail<ContentManifest>(ErrorCode::SIZE_MISMATCH,
                                             "Size mismatch for " + file.relative_path +
                                             ": expected " + std::to_string(file.size) +
                                             ", got " + std::to_string(*actual_size));
            }

            ManifestFile normalized = file;
            normalized.hash = actual;
            normalized.size = static_cast<int64_t>(*actual_size);
            stored.files.push_back(normalized);

            if (planned_hashes.insert(actual).second) {
                plan.push_back({resolved.path, actual});
            }
        }

        // Phase 2: objects, content directory, record
        std::shared_lock<std::shared_mutex> sweep_guard(sweep_mutex_);
        ObjectPins pins(*this, {planned_hashes.begin(), planned_hashes.end()});

        std::vector<std::string> created_objects;
        std::string content_dir = getContentDirectoryPath(manifest.id);
        bool created_content_dir = false;

        auto abort_store = [&](const Error& error) {
            rollbackObjects(manifest.id, created_objects);
            if (created_content_dir) {
                remove_directory(content_dir);
            }
            logger_->error("Failed to store content for manifest {}: {}", id, error.message());
            return Result<ContentManifest>::err(error);
        };

        for (const auto& object : plan) {
            if (token.isCancelled()) {
                return abort_store(Error(ErrorCode::CANCELLED, "store cancelled for " + id));
            }
            bool created = false;
            auto written = writeObject(object, token, created);
            if (created) {
                created_objects.push_back(object.hash);
            }
            if (written.isErr()) {
                return abort_store(written.error());
            }
        }

        if (!is_directory(content_dir)) {
            if (!create_directories(content_dir)) {
                return abort_store(Error(ErrorCode::IO_ERROR,
                                         "failed to create content directory " + content_dir));
            }
            created_content_dir = true;
        }

        // Content that is not held in the CAS stays where it was found
        std::string mapping = join_path(content_dir, kSourceMappingFile);
        if (plan.empty()) {
            std::string source_abs = to_portable_path(fs::absolute(source_directory).lexically_normal().string());
            auto mapped = atomic_write_file(mapping, source_abs);
            if (!mapped.ok) {
                return abort_store(Error(ErrorCode::IO_ERROR, mapped.error));
            }
        } else if (path_exists(mapping)) {
            remove_file(mapping);
        }

        auto record = writeRecord(stored);
        if (record.isErr()) {
            return abort_store(record.error());
        }

        logger_->info("Stored manifest {} ({} files, {} objects written, {} deduplicated)",
                      id, stored.files.size(), created_objects.size(),
                      plan.size() - created_objects.size());
        return Result<ContentManifest>::ok(stored);

    } catch (const std::exception& e) {
        logger_->error("Failed to store content for manifest {}: {}", id, e.what());
        return fail<ContentManifest>(ErrorCode::IO_ERROR, std::string("Storage failed: ") + e.what());
    }
}

Result<void> ContentStorageService::writeObject(const PlannedObject& object,
                                                const CancellationToken& token,
                                                bool& created) {
    created = false;
    auto object_lock = object_locks_.lock(object.hash);

    std::string object_path = getObjectPath(object.hash);
    if (is_regular_file(object_path)) {
        logger_->debug("Object {} already stored", object.hash);
        return Result<void>::ok();
    }

    std::string staged = join_path(join_path(config_.root, kTempDir), random_name());
    auto copied = copy_file_synced(object.source_path, staged);
    if (!copied.ok) {
        return fail_void(ErrorCode::IO_ERROR, copied.error);
    }

    if (config_.verify_integrity) {
        auto rehashed = hasher_->computeFileHash(staged, token);
        if (rehashed.isErr()) {
            remove_file(staged);
            return Result<void>::err(rehashed.error());
        }
        if (rehashed.value() != object.hash) {
            remove_file(staged);
            return fail_void(ErrorCode::HASH_MISMATCH,
                             "Source changed while storing " + object.source_path +
                             ": expected " + object.hash + ", got " + rehashed.value());
        }
    }

    std::string shard_dir = get_parent_directory(object_path);
    if (!create_directories(shard_dir)) {
        remove_file(staged);
        return fail_void(ErrorCode::IO_ERROR, "failed to create directory " + shard_dir);
    }

    auto renamed = atomic_rename(staged, object_path);
    if (!renamed.ok) {
        remove_file(staged);
        return fail_void(ErrorCode::IO_ERROR, renamed.error);
    }

    created = true;
    logger_->debug("Stored object {}", object.hash);
    return Result<void>::ok();
}

Result<void> ContentStorageService::writeRecord(const ContentManifest& manifest) {
    std::string path = getManifestStoragePath(manifest.id);
    if (!create_directories(get_parent_directory(path))) {
        return fail_void(ErrorCode::IO_ERROR, "failed to create directory " + get_parent_directory(path));
    }
    auto written = atomic_write_file(path, serialize_manifest(manifest));
    if (!written.ok) {
        return fail_void(ErrorCode::IO_ERROR, written.error);
    }
    return Result<void>::ok();
}

bool ContentStorageService::isPinnedElsewhere(const std::string& hash) const {
    std::lock_guard<std::mutex> guard(pins_mutex_);
    auto it = pins_.find(hash);
    return it != pins_.end() && it->second > 1;
}

void ContentStorageService::rollbackObjects(const ManifestId& id,
                                            const std::vector<std::string>& created) {
    for (const auto& hash : created) {
        auto object_lock = object_locks_.lock(hash);

        // Pins first: a store that has released its pin has already written its record
        if (isPinnedElsewhere(hash)) {
            continue;
        }

        std::string failure;
        auto references = collectReferences(CancellationToken(), failure);
        if (!references) {
            logger_->warn("Keeping object {} after failed store of {}: {}", hash, id.value(), failure);
            continue;
        }
        if (references->count(hash) > 0) {
            continue;
        }

        if (deleteObject(hash, nullptr)) {
            logger_->debug("Rolled back object {} for {}", hash, id.value());
        }
    }
}

// ============================================================================
// Record Updates
// ============================================================================

Result<ContentManifest> ContentStorageService::replaceManifest(const ContentManifest& manifest) {
    auto id_lock = id_locks_.lock(manifest.id.normalized());

    try {
        if (!is_regular_file(getManifestStoragePath(manifest.id))) {
            return fail<ContentManifest>(ErrorCode::NOT_STORED,
                                         "Content for manifest " + manifest.id.value() + " is not stored");
        }

        std::shared_lock<std::shared_mutex> sweep_guard(sweep_mutex_);

        ContentManifest stored = manifest;
        for (auto& file : stored.files) {
            if (file.source_type != ContentSourceType::ContentAddressable) continue;
            file.hash = to_lower(file.hash);
            if (!objectExists(file.hash)) {
                return fail<ContentManifest>(ErrorCode::SOURCE_MISSING,
                                             "Content object " + file.hash + " for " +
                                             file.relative_path + " is not in storage");
            }
            if (file.size <= 0) {
                if (auto size = file_size(getObjectPath(file.hash))) {
                    file.size = static_cast<int64_t>(*size);
                }
            }
        }

        auto record = writeRecord(stored);
        if (record.isErr()) {
            return Result<ContentManifest>::err(record.error());
        }

        logger_->info("Updated manifest record {}", manifest.id.value());
        return Result<ContentManifest>::ok(stored);

    } catch (const std::exception& e) {
        return fail<ContentManifest>(ErrorCode::IO_ERROR, std::string("Update failed: ") + e.what());
    }
}

Result<bool> ContentStorageService::updateManifest(const ManifestId& id, const ManifestPatch& patch) {
    auto id_lock = id_locks_.lock(id.normalized());

    try {
        auto current = readManifest(id);
        if (current.isErr()) {
            return Result<bool>::err(current.error());
        }
        if (!current.value()) {
            return fail<bool>(ErrorCode::MANIFEST_NOT_FOUND, "Manifest " + id.value() + " not found");
        }

        ContentManifest manifest = *current.value();
        auto changed = patch(manifest);
        if (changed.isErr() || !changed.value()) {
            return changed;
        }

        std::shared_lock<std::shared_mutex> sweep_guard(sweep_mutex_);
        auto record = writeRecord(manifest);
        if (record.isErr()) {
            return Result<bool>::err(record.error());
        }
        return Result<bool>::ok(true);

    } catch (const std::exception& e) {
        return fail<bool>(ErrorCode::IO_ERROR, std::string("Update failed: ") + e.what());
    }
}

// ============================================================================
// Read
// ============================================================================

Result<bool> ContentStorageService::isContentStored(const ManifestId& id) const {
    return Result<bool>::ok(is_regular_file(getManifestStoragePath(id)));
}

Result<std::optional<ContentManifest>> ContentStorageService::readManifest(const ManifestId& id) const {
    using R = Result<std::optional<ContentManifest>>;

    std::string path = getManifestStoragePath(id);
    if (!path_exists(path)) {
        return R::ok(std::nullopt);
    }

    auto file = read_file(path);
    if (!file.ok) {
        return R::err(Error(ErrorCode::IO_ERROR, file.error));
    }

    auto parsed = parse_manifest_json(file.content, path);
    if (!parsed.ok) {
        logger_->warn("Manifest file {} exists but could not be parsed: {}", path, parsed.error);
        return R::err(Error(ErrorCode::MANIFEST_CORRUPT,
                            "Manifest file is corrupted or invalid: " + parsed.error));
    }
    if (parsed.manifest.id != id) {
        return R::err(Error(ErrorCode::MANIFEST_CORRUPT,
                            "Manifest file " + path + " holds id " + parsed.manifest.id.value()));
    }
    for (const auto& warning : parsed.warnings) {
        logger_->debug("{}: {}", path, warning);
    }
    return R::ok(parsed.manifest);
}

Result<ManifestScan> ContentStorageService::scanManifests(const CancellationToken& token) const {
    ManifestScan scan;
    std::string dir = join_path(config_.root, kManifestsDir);

    for (const auto& name : list_directory(dir)) {
        if (!ends_with(name, kManifestSuffix)) continue;
        if (token.isCancelled()) {
            return fail<ManifestScan>(ErrorCode::CANCELLED, "manifest scan cancelled");
        }

        std::string path = join_path(dir, name);
        auto file = read_file(path);
        if (!file.ok) {
            scan.unreadable.push_back(path + ": " + file.error);
            continue;
        }
        auto parsed = parse_manifest_json(file.content, path);
        if (!parsed.ok) {
            scan.unreadable.push_back(path + ": " + parsed.error);
            continue;
        }
        scan.manifests.push_back(std::move(parsed.manifest));
    }

    return Result<ManifestScan>::ok(std::move(scan));
}

// ============================================================================
// Remove
// ============================================================================

Result<void> ContentStorageService::removeContent(const ManifestId& id, const CancellationToken& token) {
    if (token.isCancelled()) {
        return fail_void(ErrorCode::CANCELLED, "remove cancelled for " + id.value());
    }
    if (id.empty()) {
        return fail_void(ErrorCode::INVALID_ID, "cannot remove a manifest without an id");
    }

    auto id_lock = id_locks_.lock(id.normalized());

    try {
        std::string record_path = getManifestStoragePath(id);
        std::string content_dir = getContentDirectoryPath(id);
        bool has_record = path_exists(record_path);
        bool has_content = path_exists(content_dir);

        if (!has_record && !has_content) {
            logger_->debug("Manifest {} not stored, nothing to remove", id.value());
            return Result<void>::ok();
        }

        std::vector<std::string> hashes;
        if (has_record) {
            auto current = readManifest(id);
            if (current.isOk() && current.value()) {
                hashes = cas_hashes(*current.value());
            } else if (current.isErr()) {
                logger_->warn("Removing unreadable manifest {}; its objects are left for garbage collection",
                              id.value());
            }
        }

        // The record goes last: a failure before it leaves the manifest stored
        if (has_content && !remove_directory(content_dir)) {
            return fail_void(ErrorCode::IO_ERROR, "failed to delete " + content_dir);
        }

        if (has_record && !remove_file(record_path)) {
            return fail_void(ErrorCode::IO_ERROR, "failed to delete " + record_path);
        }

        logger_->info("Removed stored content for manifest {}", id.value());

        if (hashes.empty()) {
            return Result<void>::ok();
        }

        std::unique_lock<std::shared_mutex> sweep_guard(sweep_mutex_);

        std::string failure;
        auto references = collectReferences(token, failure);
        if (!references) {
            logger_->warn("Skipping object cleanup for {}: {}", id.value(), failure);
            return Result<void>::ok();
        }

        uint64_t deleted = 0;
        for (const auto& hash : hashes) {
            if (token.isCancelled()) {
                logger_->debug("Object cleanup for {} cancelled after {} objects", id.value(), deleted);
                break;
            }
            if (references->count(hash) > 0) continue;

            auto object_lock = object_locks_.lock(hash);
            if (deleteObject(hash, nullptr)) {
                ++deleted;
            }
        }

        logger_->debug("Deleted {} unreferenced objects of {}", deleted, id.value());
        return Result<void>::ok();

    } catch (const std::exception& e) {
        logger_->error("Failed to remove content for manifest {}: {}", id.value(), e.what());
        return fail_void(ErrorCode::IO_ERROR, std::string("Removal failed: ") + e.what());
    }
}

std::optional<std::unordered_map<std::string, std::vector<std::string>>>
ContentStorageService::collectReferences(const CancellationToken& token, std::string& failure) const {
    auto scan = scanManifests(token);
    if (scan.isErr()) {
        failure = scan.error().message();
        return std::nullopt;
    }
    if (!scan.value().unreadable.empty()) {
        failure = "unreadable manifest " + scan.value().unreadable.front();
        return std::nullopt;
    }

    std::unordered_map<std::string, std::vector<std::string>> references;
    for (const auto& manifest : scan.value().manifests) {
        for (const auto& hash : cas_hashes(manifest)) {
            references[hash].push_back(manifest.id.value());
        }
    }
    return references;
}

std::vector<std::string> ContentStorageService::listObjectHashes() const {
    std::vector<std::string> hashes;
    std::string objects_dir = join_path(config_.root, kObjectsDir);

    for (const auto& shard : list_directory(objects_dir)) {
        std::string shard_dir = join_path(objects_dir, shard);
        if (!is_directory(shard_dir)) continue;
        for (const auto& name : list_directory(shard_dir)) {
            if (is_sha256_hex(name) && name.compare(0, 2, shard) == 0) {
                hashes.push_back(name);
            }
        }
    }
    return hashes;
}

bool ContentStorageService::deleteObject(const std::string& hash, uint64_t* freed) {
    std::string path = getObjectPath(hash);
    auto size = file_size(path);
    if (!remove_file(path)) {
        return false;
    }
    if (freed && size) {
        *freed += *size;
    }
    return true;
}

// ============================================================================
// Maintenance
// ============================================================================

Result<StorageStats> ContentStorageService::getStats(const CancellationToken& token) const {
    StorageStats stats;

    try {
        std::error_code ec;
        if (!fs::is_directory(config_.root, ec)) {
            return Result<StorageStats>::ok(stats);
        }

        for (const auto& name : list_directory(join_path(config_.root, kManifestsDir))) {
            if (ends_with(name, kManifestSuffix)) {
                stats.manifest_count++;
            }
        }

        for (const auto& hash : listObjectHashes()) {
            if (token.isCancelled()) {
                return fail<StorageStats>(ErrorCode::CANCELLED, "storage statistics cancelled");
            }
            stats.object_count++;
            if (auto size = file_size(getObjectPath(hash))) {
                stats.object_bytes += *size;
            }
        }

        for (fs::recursive_directory_iterator it(config_.root, ec), end; !ec && it != end; it.increment(ec)) {
            std::error_code file_ec;
            if (it->is_regular_file(file_ec)) {
                stats.total_file_count++;
                auto size = it->file_size(file_ec);
                if (!file_ec) {
                    stats.total_size_bytes += size;
                }
            }
        }

        stats.available_bytes = available_space(config_.root);
        return Result<StorageStats>::ok(stats);

    } catch (const std::exception& e) {
        return fail<StorageStats>(ErrorCode::IO_ERROR, std::string("Failed to calculate storage stats: ") + e.what());
    }
}

Result<GarbageCollectionResult> ContentStorageService::collectGarbage(const CancellationToken& token) {
    GarbageCollectionResult result;

    try {
        std::unique_lock<std::shared_mutex> sweep_guard(sweep_mutex_);

        std::string failure;
        auto references = collectReferences(token, failure);
        if (!references) {
            if (token.isCancelled()) {
                return fail<GarbageCollectionResult>(ErrorCode::CANCELLED, "garbage collection cancelled");
            }
            logger_->warn("Garbage collection aborted: {}", failure);
            return fail<GarbageCollectionResult>(ErrorCode::MANIFEST_CORRUPT,
                                                 "Garbage collection aborted: " + failure);
        }

        for (const auto& hash : listObjectHashes()) {
            if (token.isCancelled()) {
                logger_->info("Garbage collection cancelled after deleting {} objects", result.objects_deleted);
                return fail<GarbageCollectionResult>(ErrorCode::CANCELLED, "garbage collection cancelled");
            }

            result.objects_scanned++;
            if (references->count(hash) > 0) {
                result.objects_referenced++;
                continue;
            }

            auto age = file_age_seconds(getObjectPath(hash));
            if (!age || *age < config_.gc_grace_period_seconds) {
                continue;
            }

            auto object_lock = object_locks_.lock(hash);
            if (deleteObject(hash, &result.bytes_freed)) {
                result.objects_deleted++;
            }
        }

        // Staged writes are only left behind by interrupted processes
        std::string temp_dir = join_path(config_.root, kTempDir);
        for (const auto& name : list_directory(temp_dir)) {
            remove_file(join_path(temp_dir, name));
        }

        logger_->info("Garbage collection: scanned {}, referenced {}, deleted {}, freed {} bytes",
                      result.objects_scanned, result.objects_referenced,
                      result.objects_deleted, result.bytes_freed);
        return Result<GarbageCollectionResult>::ok(result);

    } catch (const std::exception& e) {
        return fail<GarbageCollectionResult>(ErrorCode::IO_ERROR,
                                             std::string("Garbage collection failed: ") + e.what());
    }
}

Result<IntegrityReport> ContentStorageService::verifyIntegrity(const CancellationToken& token) {
    IntegrityReport report;

    try {
        std::shared_lock<std::shared_mutex> sweep_guard(sweep_mutex_);

        auto scan = scanManifests(token);
        if (scan.isErr()) {
            return Result<IntegrityReport>::err(scan.error());
        }
        for (const auto& entry : scan.value().unreadable) {
            logger_->warn("Integrity check skipping unreadable manifest {}", entry);
        }

        std::unordered_map<std::string, std::vector<std::string>> references;
        for (const auto& manifest : scan.value().manifests) {
            for (const auto& hash : cas_hashes(manifest)) {
                references[hash].push_back(manifest.id.value());
            }
        }

        std::set<std::string> present;
        for (const auto& hash : listObjectHashes()) {
            if (token.isCancelled()) {
                return fail<IntegrityReport>(ErrorCode::CANCELLED, "integrity check cancelled");
            }
            present.insert(hash);

            auto it = references.find(hash);
            std::vector<std::string> owners = it != references.end() ? it->second : std::vector<std::string>();

            auto hashed = hasher_->computeFileHash(getObjectPath(hash), token);
            if (hashed.isErr()) {
                if (hashed.error().code() == ErrorCode::CANCELLED) {
                    return Result<IntegrityReport>::err(hashed.error());
                }
                report.issues.push_back({IntegrityIssueKind::Unreadable, hash,
                                         hashed.error().message(), owners});
                continue;
            }

            report.objects_validated++;
            if (hashed.value() != hash) {
                report.issues.push_back({IntegrityIssueKind::HashMismatch, hash,
                                         "content hashes to " + hashed.value(), owners});
            }
        }

        for (const auto& [hash, owners] : references) {
            if (present.count(hash) == 0) {
                report.issues.push_back({IntegrityIssueKind::MissingObject, hash,
                                         "object not found at " + getObjectPath(hash), owners});
            }
        }

        if (report.ok()) {
            logger_->info("Integrity check passed for {} objects", report.objects_validated);
        } else {
            logger_->warn("Integrity check found {} issues in {} objects",
                          report.issues.size(), report.objects_validated);
        }
        return Result<IntegrityReport>::ok(report);

    } catch (const std::exception& e) {
        return fail<IntegrityReport>(ErrorCode::IO_ERROR, std::string("Integrity check failed: ") + e.what());
    }
}

} // namespace cairn
