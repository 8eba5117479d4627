#pragma once

#include "cairn/manifest_id.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cairn {

// ============================================================================
// Enumerations
// ============================================================================

enum class ContentType {
    Unknown,
    GameInstallation,
    GameClient,
    Mod,
    Patch,
    Addon,
    MapPack,
    LanguagePack,
    ContentBundle,
    PublisherReferral,
    ContentReferral,
    Mission,
    Map,
};

enum class GameType {
    Unknown,
    Generals,
    ZeroHour,
};

// Where the bytes of a ManifestFile come from
enum class ContentSourceType {
    Unknown,
    ContentAddressable,   // stored in the CAS, identified by hash
    RemoteDownload,       // requires download_url
    GameInstallation,     // taken from a detected local install
    ExtractedPackage,     // taken from inside an archive
    PatchFile,            // requires patch_source_file
};

enum class DependencyInstallBehavior {
    Required,
    Optional,
    Suggested,
};

const char* content_type_to_string(ContentType type);
const char* game_type_to_string(GameType game);
const char* source_type_to_string(ContentSourceType type);
const char* install_behavior_to_string(DependencyInstallBehavior behavior);

// Case-insensitive; nullopt for unrecognized names
std::optional<ContentType> parse_content_type(const std::string& value);
std::optional<GameType> parse_game_type(const std::string& value);
std::optional<ContentSourceType> parse_source_type(const std::string& value);
std::optional<DependencyInstallBehavior> parse_install_behavior(const std::string& value);

// GameInstallation and GameClient manifests may carry no files
inline bool is_base_content_type(ContentType type) {
    return type == ContentType::GameInstallation || type == ContentType::GameClient;
}

// ============================================================================
// Manifest Model
// ============================================================================

struct FilePermissions {
    bool is_read_only = false;
    std::string unix_mode;  // e.g. "0755"; empty means platform default

    bool operator==(const FilePermissions& o) const {
        return is_read_only == o.is_read_only && unix_mode == o.unix_mode;
    }
    bool operator!=(const FilePermissions& o) const { return !(*this == o); }
};

struct ManifestFile {
    std::string relative_path;
    std::string hash;
    int64_t size = 0;
    ContentSourceType source_type = ContentSourceType::Unknown;
    bool is_executable = false;
    bool is_required = true;
    FilePermissions permissions;
    std::string download_url;
    std::string patch_source_file;
    std::string source_path;

    bool operator==(const ManifestFile& o) const;
    bool operator!=(const ManifestFile& o) const { return !(*this == o); }
};

struct PublisherInfo {
    std::string name;
    std::string publisher_type;
    std::string website;
    std::string update_endpoint;
    std::string contact_email;

    bool operator==(const PublisherInfo& o) const;
    bool operator!=(const PublisherInfo& o) const { return !(*this == o); }
};

struct ContentMetadata {
    std::string description;
    std::vector<std::string> tags;
    std::string release_date;
    std::string icon_url;

    bool operator==(const ContentMetadata& o) const;
    bool operator!=(const ContentMetadata& o) const { return !(*this == o); }
};

struct ContentDependency {
    ManifestId id;
    std::string name;
    ContentType dependency_type = ContentType::Unknown;
    std::string min_version;  // inclusive, empty = unbounded
    std::string max_version;  // inclusive, empty = unbounded
    DependencyInstallBehavior install_behavior = DependencyInstallBehavior::Required;

    bool operator==(const ContentDependency& o) const;
    bool operator!=(const ContentDependency& o) const { return !(*this == o); }
};

struct ContentManifest {
    std::string manifest_version = "1.0";
    ManifestId id;
    std::string name;
    std::string version;
    ContentType content_type = ContentType::Unknown;
    GameType target_game = GameType::Unknown;
    std::optional<PublisherInfo> publisher;
    ContentMetadata metadata;
    std::vector<ManifestFile> files;
    std::vector<ContentDependency> dependencies;
    std::vector<std::string> required_directories;

    bool operator==(const ContentManifest& o) const;
    bool operator!=(const ContentManifest& o) const { return !(*this == o); }
};

// ============================================================================
// Search Query
// ============================================================================

struct ContentSearchQuery {
    std::optional<std::string> search_term;  // substring of name or id, case-insensitive
    std::optional<ContentType> content_type;
    std::optional<GameType> target_game;
};

} // namespace cairn
