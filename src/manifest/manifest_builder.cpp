#include "cairn/manifest_builder.hpp"
#include "cairn/validator.hpp"

namespace cairn {

ContentManifestBuilder& ContentManifestBuilder::id(const std::string& value) {
    id_ = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::name(const std::string& value) {
    manifest_.name = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::version(const std::string& value) {
    manifest_.version = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::content_type(ContentType value) {
    manifest_.content_type = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::target_game(GameType value) {
    manifest_.target_game = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::publisher(const PublisherInfo& value) {
    manifest_.publisher = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::description(const std::string& value) {
    manifest_.metadata.description = value;
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::tag(const std::string& value) {
    manifest_.metadata.tags.push_back(value);
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::add_file(const ManifestFile& file) {
    manifest_.files.push_back(file);
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::add_content_file(const std::string& relative_path,
                                                                 const std::string& hash,
                                                                 int64_t size,
                                                                 bool is_executable) {
    ManifestFile file;
    file.relative_path = relative_path;
    file.hash = hash;
    file.size = size;
    file.source_type = ContentSourceType::ContentAddressable;
    file.is_executable = is_executable;
    manifest_.files.push_back(file);
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::add_remote_file(const std::string& relative_path,
                                                                const std::string& download_url,
                                                                const std::string& hash,
                                                                int64_t size) {
    ManifestFile file;
    file.relative_path = relative_path;
    file.download_url = download_url;
    file.hash = hash;
    file.size = size;
    file.source_type = ContentSourceType::RemoteDownload;
    manifest_.files.push_back(file);
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::add_dependency(const ContentDependency& dependency) {
    manifest_.dependencies.push_back(dependency);
    return *this;
}

ContentManifestBuilder& ContentManifestBuilder::require_directory(const std::string& relative_path) {
    manifest_.required_directories.push_back(relative_path);
    return *this;
}

Result<ContentManifest> ContentManifestBuilder::build() const {
    ContentManifest manifest = manifest_;

    if (!id_.empty()) {
        auto parsed = ManifestId::create(id_);
        if (parsed.isErr()) {
            return Result<ContentManifest>::err(parsed.error());
        }
        manifest.id = parsed.value();
    }

    auto validation = validate_manifest(manifest);
    if (!validation.ok) {
        return Result<ContentManifest>::err(
            Error(ErrorCode::VALIDATION_FAILED, validation.joined()));
    }

    return Result<ContentManifest>::ok(manifest);
}

} // namespace cairn
