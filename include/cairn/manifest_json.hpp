#pragma once

#include "cairn/types.hpp"

#include <string>
#include <vector>

namespace cairn {

// ============================================================================
// Manifest Record JSON
// ============================================================================
//
// One UTF-8 JSON object per manifest, camelCase keys:
//
//   { "manifestVersion": "1.0", "id": "...", "name": "...", "version": "...",
//     "contentType": "Mod", "targetGame": "ZeroHour",
//     "publisher": { "name", "publisherType", "website", "updateEndpoint", "contactEmail" },
//     "metadata": { "description", "tags": [...], "releaseDate", "iconUrl" },
//     "files": [ { "relativePath", "hash", "size", "sourceType", "isExecutable",
//                  "isRequired", "permissions": { "isReadOnly", "unixMode" },
//                  "downloadUrl", "patchSourceFile", "sourcePath" } ],
//     "dependencies": [ { "id", "name", "dependencyType", "minVersion",
//                         "maxVersion", "installBehavior" } ],
//     "requiredDirectories": [ ... ] }
//
// Unknown keys are ignored. Missing optional keys keep their defaults.

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    ContentManifest manifest;
    std::vector<std::string> warnings;
};

// Critical errors: malformed JSON, non-object root, missing or invalid "id".
// Unrecognized enum names and invalid dependency ids are warnings.
ManifestParseResult parse_manifest_json(const std::string& json_str,
                                        const std::string& source_path = "");

// Pretty-printed (2-space indent) record text
std::string serialize_manifest(const ContentManifest& manifest);

} // namespace cairn
