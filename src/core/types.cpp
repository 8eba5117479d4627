#include "cairn/types.hpp"

#include <algorithm>
#include <cctype>

namespace cairn {

namespace {

std::string to_lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<typename Enum, size_t N>
std::optional<Enum> parse_enum(const std::string& value,
                               const Enum (&values)[N],
                               const char* (*to_string)(Enum)) {
    std::string needle = to_lower(value);
    for (Enum candidate : values) {
        if (to_lower(to_string(candidate)) == needle) {
            return candidate;
        }
    }
    return std::nullopt;
}

const ContentType kContentTypes[] = {
    ContentType::Unknown, ContentType::GameInstallation, ContentType::GameClient,
    ContentType::Mod, ContentType::Patch, ContentType::Addon, ContentType::MapPack,
    ContentType::LanguagePack, ContentType::ContentBundle, ContentType::PublisherReferral,
    ContentType::ContentReferral, ContentType::Mission, ContentType::Map,
};

const GameType kGameTypes[] = {
    GameType::Unknown, GameType::Generals, GameType::ZeroHour,
};

const ContentSourceType kSourceTypes[] = {
    ContentSourceType::Unknown, ContentSourceType::ContentAddressable,
    ContentSourceType::RemoteDownload, ContentSourceType::GameInstallation,
    ContentSourceType::ExtractedPackage, ContentSourceType::PatchFile,
};

const DependencyInstallBehavior kInstallBehaviors[] = {
    DependencyInstallBehavior::Required, DependencyInstallBehavior::Optional,
    DependencyInstallBehavior::Suggested,
};

} // namespace

const char* content_type_to_string(ContentType type) {
    switch (type) {
        case ContentType::Unknown: return "Unknown";
        case ContentType::GameInstallation: return "GameInstallation";
        case ContentType::GameClient: return "GameClient";
        case ContentType::Mod: return "Mod";
        case ContentType::Patch: return "Patch";
        case ContentType::Addon: return "Addon";
        case ContentType::MapPack: return "MapPack";
        case ContentType::LanguagePack: return "LanguagePack";
        case ContentType::ContentBundle: return "ContentBundle";
        case ContentType::PublisherReferral: return "PublisherReferral";
        case ContentType::ContentReferral: return "ContentReferral";
        case ContentType::Mission: return "Mission";
        case ContentType::Map: return "Map";
    }
    return "Unknown";
}

const char* game_type_to_string(GameType game) {
    switch (game) {
        case GameType::Unknown: return "Unknown";
        case GameType::Generals: return "Generals";
        case GameType::ZeroHour: return "ZeroHour";
    }
    return "Unknown";
}

const char* source_type_to_string(ContentSourceType type) {
    switch (type) {
        case ContentSourceType::Unknown: return "Unknown";
        case ContentSourceType::ContentAddressable: return "ContentAddressable";
        case ContentSourceType::RemoteDownload: return "RemoteDownload";
        case ContentSourceType::GameInstallation: return "GameInstallation";
        case ContentSourceType::ExtractedPackage: return "ExtractedPackage";
        case ContentSourceType::PatchFile: return "PatchFile";
    }
    return "Unknown";
}

const char* install_behavior_to_string(DependencyInstallBehavior behavior) {
    switch (behavior) {
        case DependencyInstallBehavior::Required: return "Required";
        case DependencyInstallBehavior::Optional: return "Optional";
        case DependencyInstallBehavior::Suggested: return "Suggested";
    }
    return "Required";
}

std::optional<ContentType> parse_content_type(const std::string& value) {
    return parse_enum(value, kContentTypes, content_type_to_string);
}

std::optional<GameType> parse_game_type(const std::string& value) {
    return parse_enum(value, kGameTypes, game_type_to_string);
}

std::optional<ContentSourceType> parse_source_type(const std::string& value) {
    return parse_enum(value, kSourceTypes, source_type_to_string);
}

std::optional<DependencyInstallBehavior> parse_install_behavior(const std::string& value) {
    return parse_enum(value, kInstallBehaviors, install_behavior_to_string);
}

bool ManifestFile::operator==(const ManifestFile& o) const {
    return relative_path == o.relative_path &&
           hash == o.hash &&
           size == o.size &&
           source_type == o.source_type &&
           is_executable == o.is_executable &&
           is_required == o.is_required &&
           permissions == o.permissions &&
           download_url == o.download_url &&
           patch_source_file == o.patch_source_file &&
           source_path == o.source_path;
}

bool PublisherInfo::operator==(const PublisherInfo& o) const {
    return name == o.name &&
           publisher_type == o.publisher_type &&
           website == o.website &&
           update_endpoint == o.update_endpoint &&
           contact_email == o.contact_email;
}

bool ContentMetadata::operator==(const ContentMetadata& o) const {
    return description == o.description &&
           tags == o.tags &&
           release_date == o.release_date &&
           icon_url == o.icon_url;
}

bool ContentDependency::operator==(const ContentDependency& o) const {
    return id == o.id &&
           id.value() == o.id.value() &&
           name == o.name &&
           dependency_type == o.dependency_type &&
           min_version == o.min_version &&
           max_version == o.max_version &&
           install_behavior == o.install_behavior;
}

bool ContentManifest::operator==(const ContentManifest& o) const {
    return manifest_version == o.manifest_version &&
           id.value() == o.id.value() &&
           name == o.name &&
           version == o.version &&
           content_type == o.content_type &&
           target_game == o.target_game &&
           publisher == o.publisher &&
           metadata == o.metadata &&
           files == o.files &&
           dependencies == o.dependencies &&
           required_directories == o.required_directories;
}

} // namespace cairn
