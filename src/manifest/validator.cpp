#include "cairn/validator.hpp"
#include "cairn/path_utils.hpp"

#include <cctype>

namespace cairn {

namespace {

bool is_blank(const std::string& s) {
    for (unsigned char c : s) {
        if (!std::isspace(c)) return false;
    }
    return true;
}

void add_error(ValidationResult& result, std::string message) {
    result.ok = false;
    result.errors.push_back(std::move(message));
}

} // namespace

std::string ValidationResult::joined() const {
    std::string out;
    for (size_t i = 0; i < errors.size(); ++i) {
        if (i > 0) out += ", ";
        out += errors[i];
    }
    return out;
}

ValidationResult validate_manifest(const ContentManifest& manifest) {
    ValidationResult result;

    if (manifest.id.empty()) {
        add_error(result, "Manifest ID is required");
    }
    if (is_blank(manifest.name)) {
        add_error(result, "Manifest name is required");
    }
    if (is_blank(manifest.version)) {
        add_error(result, "Manifest version is required");
    }

    if (manifest.files.empty() && manifest.required_directories.empty() &&
        !is_base_content_type(manifest.content_type)) {
        add_error(result, "Manifest must contain at least one file or required directory");
    }

    for (const auto& file : manifest.files) {
        if (file.relative_path.empty()) {
            add_error(result, "File entries must have a relative path");
        } else if (!is_safe_relative_path(file.relative_path)) {
            add_error(result, "File " + file.relative_path + " contains illegal path traversal");
        }

        const std::string& path = file.relative_path;
        switch (file.source_type) {
            case ContentSourceType::Unknown:
                add_error(result, "File " + path + " has unknown source type");
                break;
            case ContentSourceType::ContentAddressable:
                if (is_blank(file.hash)) {
                    add_error(result, "Content file " + path +
                                      " must have a hash for content-addressable storage");
                }
                break;
            case ContentSourceType::RemoteDownload:
                if (is_blank(file.download_url)) {
                    add_error(result, "Remote download file " + path + " must have a download URL");
                }
                break;
            case ContentSourceType::PatchFile:
                if (is_blank(file.patch_source_file)) {
                    add_error(result, "Patch file " + path + " must have a patch source file");
                }
                break;
            case ContentSourceType::GameInstallation:
            case ContentSourceType::ExtractedPackage:
                break;
        }
    }

    for (const auto& dir : manifest.required_directories) {
        if (!is_safe_relative_path(dir)) {
            add_error(result, "Required directory " + dir + " contains illegal path traversal");
        }
    }

    for (const auto& dep : manifest.dependencies) {
        if (dep.id.empty()) {
            add_error(result, "Dependency " + dep.name + " must have an ID");
        } else if (!manifest.id.empty() && dep.id == manifest.id) {
            add_error(result, "Manifest " + manifest.id.value() + " cannot depend on itself");
        }
    }

    return result;
}

} // namespace cairn
