#include "cairn/manifest_pool.hpp"
#include "cairn/hasher.hpp"
#include "cairn/logging.hpp"
#include "cairn/platform.hpp"
#include "cairn/validator.hpp"
#include "cairn/version.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <spdlog/spdlog.h>

namespace cairn {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Lower-case, forward slashes
std::string path_key(const std::string& path) {
    return to_lower(to_portable_path(path));
}

bool contains_ci(const std::string& haystack, const std::string& needle) {
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

// Converts exceptions escaping the storage layer into results: ids that
// cannot name a storage entry become INVALID_ID, everything else IO_ERROR
template<typename T, typename F>
Result<T> guarded(spdlog::logger& logger, const std::string& what, F&& body) {
    try {
        return body();
    } catch (const std::invalid_argument& e) {
        logger.warn("Cannot {}: {}", what, e.what());
        return Result<T>::err(Error(ErrorCode::INVALID_ID, "Cannot " + what + ": " + e.what()));
    } catch (const std::exception& e) {
        logger.error("Failed to {}: {}", what, e.what());
        return Result<T>::err(Error(ErrorCode::IO_ERROR, "Failed to " + what + ": " + e.what()));
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

std::unique_ptr<ContentManifestPool> ContentManifestPool::create(const PoolConfig& config,
                                                                 std::shared_ptr<spdlog::logger> logger) {
    logger = logger_or_default(std::move(logger));
    auto storage = std::make_shared<ContentStorageService>(
        config.storage, std::make_shared<Sha256HashProvider>(), logger);
    auto cache = std::make_shared<ManifestCache>(config.cache.shard_count);
    return std::make_unique<ContentManifestPool>(std::move(storage), std::move(cache), std::move(logger));
}

ContentManifestPool::ContentManifestPool(std::shared_ptr<ContentStorageService> storage,
                                         std::shared_ptr<ManifestCache> cache,
                                         std::shared_ptr<spdlog::logger> logger)
    : storage_(std::move(storage)),
      cache_(std::move(cache)),
      logger_(logger_or_default(std::move(logger))) {
    if (!storage_) {
        throw std::invalid_argument("storage service must not be null");
    }
    if (!cache_) {
        throw std::invalid_argument("manifest cache must not be null");
    }
}

// ============================================================================
// Core operations
// ============================================================================

Result<bool> ContentManifestPool::addManifest(const ContentManifest& manifest,
                                              const std::string& source_directory,
                                              const CancellationToken& token) {
    auto validation = validate_manifest(manifest);
    if (!validation.ok) {
        logger_->warn("Rejected manifest {}: {}", manifest.id.value(), validation.joined());
        return Result<bool>::err(Error(ErrorCode::VALIDATION_FAILED,
                                       "Manifest validation failed: " + validation.joined()));
    }

    return guarded<bool>(*logger_, "add manifest " + manifest.id.value(), [&]() {
        if (!is_directory(source_directory)) {
            return Result<bool>::err(Error(ErrorCode::SOURCE_MISSING,
                                           "Source directory " + source_directory + " does not exist"));
        }

        auto cache_lock = cache_locks_.lock(manifest.id.normalized());
        auto stored = storage_->storeContent(manifest, source_directory, token);
        if (stored.isErr()) {
            Error error = stored.error();
            error.withContext("Failed to store content for manifest " + manifest.id.value());
            return Result<bool>::err(error);
        }

        cache_->upsert(stored.value());
        logger_->info("Added manifest {} ({} {})", manifest.id.value(), manifest.name, manifest.version);
        return Result<bool>::ok(true);
    });
}

Result<bool> ContentManifestPool::addManifest(const ContentManifest& manifest,
                                              const CancellationToken& token) {
    auto validation = validate_manifest(manifest);
    if (!validation.ok) {
        logger_->warn("Rejected manifest {}: {}", manifest.id.value(), validation.joined());
        return Result<bool>::err(Error(ErrorCode::VALIDATION_FAILED,
                                       "Manifest validation failed: " + validation.joined()));
    }
    if (token.isCancelled()) {
        return Result<bool>::err(Error(ErrorCode::CANCELLED, "add cancelled for " + manifest.id.value()));
    }

    return guarded<bool>(*logger_, "add manifest " + manifest.id.value(), [&]() {
        auto cache_lock = cache_locks_.lock(manifest.id.normalized());
        auto stored = storage_->isContentStored(manifest.id);
        if (stored.isErr()) {
            return Result<bool>::err(stored.error());
        }
        if (!stored.value()) {
            return Result<bool>::err(Error(
                ErrorCode::NOT_STORED,
                "Manifest " + manifest.id.value() +
                " has no stored content; add it with a source directory first"));
        }

        auto replaced = storage_->replaceManifest(manifest);
        if (replaced.isErr()) {
            Error error = replaced.error();
            error.withContext("Failed to update manifest " + manifest.id.value());
            return Result<bool>::err(error);
        }

        cache_->upsert(replaced.value());
        logger_->info("Updated manifest metadata for {}", manifest.id.value());
        return Result<bool>::ok(true);
    });
}

Result<std::optional<ContentManifest>> ContentManifestPool::getManifest(const ManifestId& id,
                                                                        const CancellationToken& token) const {
    using R = Result<std::optional<ContentManifest>>;

    if (token.isCancelled()) {
        return R::err(Error(ErrorCode::CANCELLED, "get cancelled for " + id.value()));
    }

    return guarded<std::optional<ContentManifest>>(*logger_, "read manifest " + id.value(), [&]() {
        auto cache_lock = cache_locks_.lock(id.normalized());
        auto read = storage_->readManifest(id);
        if (read.isErr()) {
            cache_->remove(id);
            Error error = read.error();
            error.withContext("Failed to read manifest " + id.value());
            return R::err(error);
        }
        if (read.value()) {
            cache_->upsert(*read.value());
        } else {
            cache_->remove(id);
        }
        return read;
    });
}

Result<std::vector<ContentManifest>> ContentManifestPool::getAllManifests(const CancellationToken& token) const {
    using R = Result<std::vector<ContentManifest>>;

    return guarded<std::vector<ContentManifest>>(*logger_, "enumerate manifests", [&]() {
        auto scan = storage_->scanManifests(token);
        if (scan.isErr()) {
            return R::err(scan.error());
        }
        for (const auto& entry : scan.value().unreadable) {
            logger_->warn("Skipping unreadable manifest {}", entry);
        }
        return R::ok(scan.value().manifests);
    });
}

Result<std::vector<ContentManifest>> ContentManifestPool::searchManifests(const ContentSearchQuery& query,
                                                                          const CancellationToken& token) const {
    auto all = getAllManifests(token);
    if (all.isErr()) {
        Error error = all.error();
        error.withContext("Failed to search manifests");
        return Result<std::vector<ContentManifest>>::err(error);
    }

    std::string term = query.search_term ? trim(*query.search_term) : std::string();

    std::vector<ContentManifest> matches;
    for (const auto& manifest : all.value()) {
        if (!term.empty() && !contains_ci(manifest.name, term) && !contains_ci(manifest.id.value(), term)) {
            continue;
        }
        if (query.content_type && manifest.content_type != *query.content_type) {
            continue;
        }
        if (query.target_game && manifest.target_game != *query.target_game) {
            continue;
        }
        matches.push_back(manifest);
    }

    std::sort(matches.begin(), matches.end(), [](const ContentManifest& a, const ContentManifest& b) {
        std::string name_a = to_lower(a.name);
        std::string name_b = to_lower(b.name);
        if (name_a != name_b) return name_a < name_b;
        int by_version = compare_versions(a.version, b.version);
        if (by_version != 0) return by_version > 0;
        return a.id < b.id;
    });

    return Result<std::vector<ContentManifest>>::ok(matches);
}

Result<bool> ContentManifestPool::removeManifest(const ManifestId& id, const CancellationToken& token) {
    return guarded<bool>(*logger_, "remove manifest " + id.value(), [&]() {
        auto cache_lock = cache_locks_.lock(id.normalized());
        auto removed = storage_->removeContent(id, token);
        if (removed.isErr()) {
            Error error = removed.error();
            error.withContext("Failed to remove content for manifest " + id.value());
            return Result<bool>::err(error);
        }
        cache_->remove(id);
        return Result<bool>::ok(true);
    });
}

Result<bool> ContentManifestPool::isManifestAcquired(const ManifestId& id, const CancellationToken& token) const {
    if (token.isCancelled()) {
        return Result<bool>::err(Error(ErrorCode::CANCELLED, "check cancelled for " + id.value()));
    }
    return guarded<bool>(*logger_, "check manifest " + id.value(), [&]() {
        auto stored = storage_->isContentStored(id);
        if (stored.isErr()) {
            Error error = stored.error();
            error.withContext("Failed to check if manifest is acquired");
            return Result<bool>::err(error);
        }
        return stored;
    });
}

Result<std::optional<std::string>> ContentManifestPool::getContentDirectory(const ManifestId& id,
                                                                            const CancellationToken& token) const {
    using R = Result<std::optional<std::string>>;

    if (token.isCancelled()) {
        return R::err(Error(ErrorCode::CANCELLED, "lookup cancelled for " + id.value()));
    }

    return guarded<std::optional<std::string>>(*logger_, "get content directory for " + id.value(), [&]() {
        auto stored = storage_->isContentStored(id);
        if (stored.isErr()) {
            return R::err(stored.error());
        }
        if (!stored.value()) {
            return R::ok(std::nullopt);
        }

        std::string content_dir = storage_->getContentDirectoryPath(id);
        std::string mapping = join_path(content_dir, ContentStorageService::kSourceMappingFile);
        if (is_regular_file(mapping)) {
            auto file = read_file(mapping);
            if (!file.ok) {
                return R::err(Error(ErrorCode::IO_ERROR, file.error));
            }
            std::string source = trim(file.content);
            if (!source.empty()) {
                return R::ok(source);
            }
        }

        if (!is_directory(content_dir)) {
            return R::ok(std::nullopt);
        }
        return R::ok(content_dir);
    });
}

// ============================================================================
// Record patches
// ============================================================================

Result<bool> ContentManifestPool::setExecutableFlags(const ManifestId& id,
                                                     const std::map<std::string, bool>& flags) {
    return guarded<bool>(*logger_, "set executable flags for " + id.value(), [&]() {
        auto cache_lock = cache_locks_.lock(id.normalized());
        auto updated = storage_->updateManifest(id, [&](ContentManifest& manifest) {
            std::map<std::string, bool> wanted;
            for (const auto& [path, executable] : flags) {
                wanted[path_key(path)] = executable;
            }

            std::vector<std::string> unknown;
            for (const auto& entry : wanted) {
                bool found = std::any_of(manifest.files.begin(), manifest.files.end(),
                                         [&](const ManifestFile& f) { return path_key(f.relative_path) == entry.first; });
                if (!found) unknown.push_back(entry.first);
            }
            if (!unknown.empty()) {
                std::string joined;
                for (const auto& path : unknown) {
                    if (!joined.empty()) joined += ", ";
                    joined += path;
                }
                return Result<bool>::err(Error(ErrorCode::VALIDATION_FAILED,
                                               "Files not in manifest " + id.value() + ": " + joined));
            }

            bool changed = false;
            for (auto& file : manifest.files) {
                auto it = wanted.find(path_key(file.relative_path));
                if (it != wanted.end() && file.is_executable != it->second) {
                    file.is_executable = it->second;
                    changed = true;
                }
            }
            return Result<bool>::ok(changed);
        });

        if (updated.isErr()) {
            return updated;
        }

        if (updated.value()) {
            cache_->remove(id);
            auto fresh = storage_->readManifest(id);
            if (fresh.isOk() && fresh.value()) {
                cache_->upsert(*fresh.value());
            }
            logger_->info("Updated executable flags for {}", id.value());
        }
        return updated;
    });
}

Result<std::vector<ContentDependency>> ContentManifestPool::getMissingDependencies(const ManifestId& id,
                                                                                   const CancellationToken& token) const {
    using R = Result<std::vector<ContentDependency>>;

    auto manifest = getManifest(id, token);
    if (manifest.isErr()) {
        return R::err(manifest.error());
    }
    if (!manifest.value()) {
        return R::err(Error(ErrorCode::MANIFEST_NOT_FOUND, "Manifest " + id.value() + " not found"));
    }

    std::vector<ContentDependency> missing;
    for (const auto& dep : manifest.value()->dependencies) {
        if (dep.install_behavior != DependencyInstallBehavior::Required) {
            continue;
        }
        if (token.isCancelled()) {
            return R::err(Error(ErrorCode::CANCELLED, "dependency check cancelled for " + id.value()));
        }

        auto installed = getManifest(dep.id, token);
        if (installed.isErr()) {
            logger_->warn("Dependency {} of {} is unreadable: {}",
                          dep.id.value(), id.value(), installed.error().message());
            missing.push_back(dep);
            continue;
        }
        if (!installed.value() ||
            !version_in_range(installed.value()->version, dep.min_version, dep.max_version)) {
            missing.push_back(dep);
        }
    }
    return R::ok(missing);
}

// ============================================================================
// Maintenance
// ============================================================================

Result<StorageStats> ContentManifestPool::getStorageStats(const CancellationToken& token) const {
    return guarded<StorageStats>(*logger_, "calculate storage stats", [&]() {
        return storage_->getStats(token);
    });
}

Result<GarbageCollectionResult> ContentManifestPool::runGarbageCollection(const CancellationToken& token) {
    return guarded<GarbageCollectionResult>(*logger_, "collect garbage", [&]() {
        return storage_->collectGarbage(token);
    });
}

Result<IntegrityReport> ContentManifestPool::verifyIntegrity(const CancellationToken& token) {
    return guarded<IntegrityReport>(*logger_, "verify integrity", [&]() {
        return storage_->verifyIntegrity(token);
    });
}

Result<std::size_t> ContentManifestPool::removeAllManifests(const CancellationToken& token) {
    auto all = getAllManifests(token);
    if (all.isErr()) {
        return Result<std::size_t>::err(all.error());
    }

    std::size_t removed = 0;
    std::vector<std::string> failures;
    for (const auto& manifest : all.value()) {
        if (token.isCancelled()) {
            return Result<std::size_t>::err(Error(ErrorCode::CANCELLED,
                "remove all cancelled after " + std::to_string(removed) + " manifests"));
        }
        auto result = removeManifest(manifest.id, token);
        if (result.isErr()) {
            failures.push_back(result.error().message());
        } else {
            ++removed;
        }
    }

    if (!failures.empty()) {
        std::string joined;
        for (const auto& failure : failures) {
            if (!joined.empty()) joined += ", ";
            joined += failure;
        }
        return Result<std::size_t>::err(Error(ErrorCode::IO_ERROR, joined));
    }

    logger_->info("Removed all {} manifests", removed);
    return Result<std::size_t>::ok(removed);
}

Result<std::size_t> ContentManifestPool::warmCache(const CancellationToken& token) {
    auto scan = guarded<ManifestScan>(*logger_, "warm manifest cache", [&]() {
        return storage_->scanManifests(token);
    });
    if (scan.isErr()) {
        return Result<std::size_t>::err(scan.error());
    }

    cache_->clear();
    for (const auto& entry : scan.value().unreadable) {
        logger_->warn("Skipping unreadable manifest {}", entry);
    }
    for (const auto& manifest : scan.value().manifests) {
        cache_->upsert(manifest);
    }

    logger_->debug("Manifest cache warmed with {} entries", cache_->size());
    return Result<std::size_t>::ok(cache_->size());
}

} // namespace cairn
