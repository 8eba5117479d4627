#include "cairn/manifest_json.hpp"

#include <nlohmann/json.hpp>

namespace cairn {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<int64_t> get_int(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return std::nullopt;
}

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

template<typename Enum>
Enum get_enum(const nlohmann::json& j, const std::string& key, Enum fallback,
              std::optional<Enum> (*parse)(const std::string&),
              const std::string& where, std::vector<std::string>& warnings) {
    auto value = get_string(j, key);
    if (!value) return fallback;
    auto parsed = parse(*value);
    if (!parsed) {
        warnings.push_back(where + key + " unrecognized: " + *value);
        return fallback;
    }
    return *parsed;
}

ManifestFile parse_file(const nlohmann::json& f, size_t index, std::vector<std::string>& warnings) {
    ManifestFile file;
    std::string where = "files[" + std::to_string(index) + "].";

    if (auto v = get_string(f, "relativePath")) file.relative_path = *v;
    if (auto v = get_string(f, "hash")) file.hash = *v;
    if (auto v = get_int(f, "size")) file.size = *v;
    file.source_type = get_enum(f, "sourceType", ContentSourceType::Unknown,
                                parse_source_type, where, warnings);
    if (auto v = get_bool(f, "isExecutable")) file.is_executable = *v;
    if (auto v = get_bool(f, "isRequired")) file.is_required = *v;

    if (f.contains("permissions") && f["permissions"].is_object()) {
        const auto& perms = f["permissions"];
        if (auto v = get_bool(perms, "isReadOnly")) file.permissions.is_read_only = *v;
        if (auto v = get_string(perms, "unixMode")) file.permissions.unix_mode = *v;
    }

    if (auto v = get_string(f, "downloadUrl")) file.download_url = *v;
    if (auto v = get_string(f, "patchSourceFile")) file.patch_source_file = *v;
    if (auto v = get_string(f, "sourcePath")) file.source_path = *v;
    return file;
}

std::optional<ContentDependency> parse_dependency(const nlohmann::json& d, size_t index,
                                                  std::vector<std::string>& warnings) {
    std::string where = "dependencies[" + std::to_string(index) + "].";
    ContentDependency dep;

    auto id = get_string(d, "id");
    if (!id) {
        warnings.push_back(where + "id missing");
        return std::nullopt;
    }
    auto parsed_id = ManifestId::create(*id);
    if (parsed_id.isErr()) {
        warnings.push_back(where + "id invalid: " + parsed_id.error().message());
        return std::nullopt;
    }
    dep.id = parsed_id.value();

    if (auto v = get_string(d, "name")) dep.name = *v;
    dep.dependency_type = get_enum(d, "dependencyType", ContentType::Unknown,
                                   parse_content_type, where, warnings);
    if (auto v = get_string(d, "minVersion")) dep.min_version = *v;
    if (auto v = get_string(d, "maxVersion")) dep.max_version = *v;
    dep.install_behavior = get_enum(d, "installBehavior", DependencyInstallBehavior::Required,
                                    parse_install_behavior, where, warnings);
    return dep;
}

} // namespace

ManifestParseResult parse_manifest_json(const std::string& json_str,
                                        const std::string& source_path) {
    ManifestParseResult result;
    std::string origin = source_path.empty() ? std::string() : " (" + source_path + ")";

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "manifest JSON must be an object" + origin;
            return result;
        }

        // id (REQUIRED)
        auto id = get_string(j, "id");
        if (!id) {
            result.error = "manifest id missing" + origin;
            return result;
        }
        auto parsed_id = ManifestId::create(*id);
        if (parsed_id.isErr()) {
            result.error = parsed_id.error().message() + origin;
            return result;
        }

        auto& m = result.manifest;
        m.id = parsed_id.value();

        if (auto v = get_string(j, "manifestVersion")) m.manifest_version = *v;
        if (auto v = get_string(j, "name")) m.name = *v;
        if (auto v = get_string(j, "version")) m.version = *v;
        m.content_type = get_enum(j, "contentType", ContentType::Unknown,
                                  parse_content_type, "", result.warnings);
        m.target_game = get_enum(j, "targetGame", GameType::Unknown,
                                 parse_game_type, "", result.warnings);

        if (j.contains("publisher") && j["publisher"].is_object()) {
            const auto& pub = j["publisher"];
            PublisherInfo info;
            if (auto v = get_string(pub, "name")) info.name = *v;
            if (auto v = get_string(pub, "publisherType")) info.publisher_type = *v;
            if (auto v = get_string(pub, "website")) info.website = *v;
            if (auto v = get_string(pub, "updateEndpoint")) info.update_endpoint = *v;
            if (auto v = get_string(pub, "contactEmail")) info.contact_email = *v;
            m.publisher = info;
        }

        if (j.contains("metadata") && j["metadata"].is_object()) {
            const auto& meta = j["metadata"];
            if (auto v = get_string(meta, "description")) m.metadata.description = *v;
            m.metadata.tags = get_string_array(meta, "tags");
            if (auto v = get_string(meta, "releaseDate")) m.metadata.release_date = *v;
            if (auto v = get_string(meta, "iconUrl")) m.metadata.icon_url = *v;
        }

        if (j.contains("files") && j["files"].is_array()) {
            size_t index = 0;
            for (const auto& f : j["files"]) {
                if (f.is_object()) {
                    m.files.push_back(parse_file(f, index, result.warnings));
                } else {
                    result.warnings.push_back("files[" + std::to_string(index) + "] is not an object");
                }
                ++index;
            }
        }

        if (j.contains("dependencies") && j["dependencies"].is_array()) {
            size_t index = 0;
            for (const auto& d : j["dependencies"]) {
                if (d.is_object()) {
                    if (auto dep = parse_dependency(d, index, result.warnings)) {
                        m.dependencies.push_back(*dep);
                    }
                } else {
                    result.warnings.push_back("dependencies[" + std::to_string(index) + "] is not an object");
                }
                ++index;
            }
        }

        m.required_directories = get_string_array(j, "requiredDirectories");

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what() + origin;
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what() + origin;
        return result;
    }
}

std::string serialize_manifest(const ContentManifest& manifest) {
    nlohmann::json j;
    j["manifestVersion"] = manifest.manifest_version;
    j["id"] = manifest.id.value();
    j["name"] = manifest.name;
    j["version"] = manifest.version;
    j["contentType"] = content_type_to_string(manifest.content_type);
    j["targetGame"] = game_type_to_string(manifest.target_game);

    if (manifest.publisher) {
        const auto& pub = *manifest.publisher;
        j["publisher"] = {
            {"name", pub.name},
            {"publisherType", pub.publisher_type},
            {"website", pub.website},
            {"updateEndpoint", pub.update_endpoint},
            {"contactEmail", pub.contact_email},
        };
    }

    j["metadata"] = {
        {"description", manifest.metadata.description},
        {"tags", manifest.metadata.tags},
        {"releaseDate", manifest.metadata.release_date},
        {"iconUrl", manifest.metadata.icon_url},
    };

    j["files"] = nlohmann::json::array();
    for (const auto& file : manifest.files) {
        j["files"].push_back({
            {"relativePath", file.relative_path},
            {"hash", file.hash},
            {"size", file.size},
            {"sourceType", source_type_to_string(file.source_type)},
            {"isExecutable", file.is_executable},
            {"isRequired", file.is_required},
            {"permissions", {
                {"isReadOnly", file.permissions.is_read_only},
                {"unixMode", file.permissions.unix_mode},
            }},
            {"downloadUrl", file.download_url},
            {"patchSourceFile", file.patch_source_file},
            {"sourcePath", file.source_path},
        });
    }

    j["dependencies"] = nlohmann::json::array();
    for (const auto& dep : manifest.dependencies) {
        j["dependencies"].push_back({
            {"id", dep.id.value()},
            {"name", dep.name},
            {"dependencyType", content_type_to_string(dep.dependency_type)},
            {"minVersion", dep.min_version},
            {"maxVersion", dep.max_version},
            {"installBehavior", install_behavior_to_string(dep.install_behavior)},
        });
    }

    j["requiredDirectories"] = manifest.required_directories;

    return j.dump(2);
}

} // namespace cairn
