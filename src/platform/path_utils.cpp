#include "cairn/path_utils.hpp"
#include "cairn/platform.hpp"

#include <cctype>
#include <filesystem>
#include <string>
#include <vector>

namespace cairn {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

bool is_separator(char c) {
    return c == '/' || c == '\\';
}

std::vector<std::string> split_path(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (is_separator(c)) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

bool has_drive_letter(const std::string& s) {
    return s.size() >= 2 && std::isalpha(static_cast<unsigned char>(s[0])) && s[1] == ':';
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

} // namespace

const char* path_error_to_string(PathError error) {
    switch (error) {
        case PathError::None: return "none";
        case PathError::Empty: return "path is empty";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes root";
    }
    return "unknown path error";
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path) {
    if (relative_path.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }
    if (is_separator(relative_path[0]) || has_drive_letter(relative_path)) {
        return {false, {}, PathError::AbsoluteNotAllowed};
    }

    std::vector<std::string> normalized;
    for (const auto& part : split_path(relative_path)) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }

    std::string out = join_components(root, normalized);
    // Ensure containment: lexically compare without touching filesystem.
    std::filesystem::path root_path(root);
    std::filesystem::path out_path(out);
    auto lex_root = root_path.lexically_normal();
    auto lex_out = out_path.lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        // A trailing separator on root shows up as an empty final element
        if (root_it->empty()) break;
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

bool is_safe_relative_path(const std::string& relative_path) {
    if (relative_path.empty() || contains_nul(relative_path)) {
        return false;
    }
    if (is_separator(relative_path[0]) || has_drive_letter(relative_path)) {
        return false;
    }
    for (const auto& part : split_path(relative_path)) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace cairn
