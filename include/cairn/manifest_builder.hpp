#pragma once

#include "cairn/result.hpp"
#include "cairn/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cairn {

// ============================================================================
// Content Manifest Builder
// ============================================================================

// Setters only record values. build() parses the id and runs
// validate_manifest once; the order of setter calls never matters.
class ContentManifestBuilder {
public:
    ContentManifestBuilder& id(const std::string& value);
    ContentManifestBuilder& name(const std::string& value);
    ContentManifestBuilder& version(const std::string& value);
    ContentManifestBuilder& content_type(ContentType value);
    ContentManifestBuilder& target_game(GameType value);
    ContentManifestBuilder& publisher(const PublisherInfo& value);
    ContentManifestBuilder& description(const std::string& value);
    ContentManifestBuilder& tag(const std::string& value);

    ContentManifestBuilder& add_file(const ManifestFile& file);
    // ContentAddressable file; size 0 means "fill in when stored"
    ContentManifestBuilder& add_content_file(const std::string& relative_path,
                                             const std::string& hash,
                                             int64_t size = 0,
                                             bool is_executable = false);
    ContentManifestBuilder& add_remote_file(const std::string& relative_path,
                                            const std::string& download_url,
                                            const std::string& hash = "",
                                            int64_t size = 0);

    ContentManifestBuilder& add_dependency(const ContentDependency& dependency);
    ContentManifestBuilder& require_directory(const std::string& relative_path);

    // INVALID_ID when the id is malformed, VALIDATION_FAILED with the joined
    // validator messages otherwise
    Result<ContentManifest> build() const;

private:
    std::string id_;
    ContentManifest manifest_;
};

// Factory function for fluent building
inline ContentManifestBuilder content_manifest() {
    return ContentManifestBuilder();
}

} // namespace cairn
