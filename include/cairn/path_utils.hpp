#pragma once

#include <string>

namespace cairn {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok;
    std::string path;  // normalized absolute path when ok
    PathError error;
};

// Normalize a path relative to a root without following symlinks (string-based).
// - Accepts both '/' and '\' as separators
// - Rejects NUL bytes, leading separators and drive letters ("C:")
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path);

// True when relative_path is non-empty, relative, NUL-free and has no ".."
// segment at all (stricter than normalize_under_root, which allows "a/../b").
bool is_safe_relative_path(const std::string& relative_path);

} // namespace cairn
