#pragma once

#include "cairn/types.hpp"

#include <string>
#include <vector>

namespace cairn {

struct ValidationResult {
    bool ok = true;
    std::vector<std::string> errors;

    // Errors joined with ", "; empty when ok
    std::string joined() const;
};

// Pure structural checks, no filesystem access. Every failing check adds one
// message; nothing stops at the first error.
ValidationResult validate_manifest(const ContentManifest& manifest);

} // namespace cairn
