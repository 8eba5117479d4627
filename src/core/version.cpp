#include "cairn/version.hpp"

#include <algorithm>
#include <cctype>
#include <vector>

namespace cairn {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

std::vector<std::string> split_segments(const std::string& s) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == '.' || c == '-' || c == '_') {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c); });
}

// Compare digit strings of any length without overflow
int compare_numeric(const std::string& a, const std::string& b) {
    auto strip = [](const std::string& s) {
        size_t pos = s.find_first_not_of('0');
        return pos == std::string::npos ? std::string("0") : s.substr(pos);
    };
    std::string x = strip(a);
    std::string y = strip(b);
    if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
    int c = x.compare(y);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

int compare_segments(const std::string& a, const std::string& b) {
    auto left = split_segments(a);
    auto right = split_segments(b);
    size_t count = std::max(left.size(), right.size());

    for (size_t i = 0; i < count; ++i) {
        std::string x = i < left.size() ? left[i] : "0";
        std::string y = i < right.size() ? right[i] : "0";

        int c = 0;
        if (all_digits(x) && all_digits(y)) {
            c = compare_numeric(x, y);
        } else {
            c = x.compare(y);
            c = c < 0 ? -1 : (c > 0 ? 1 : 0);
        }
        if (c != 0) return c;
    }
    return 0;
}

} // namespace

std::optional<SemanticVersion> parse_semantic_version(const std::string& str) {
    std::string s = trim(str);
    if (s.empty()) return std::nullopt;

    try {
        return semver::version::parse(s);
    } catch (const semver::semver_exception&) {
        return std::nullopt;
    }
}

int compare_versions(const std::string& a, const std::string& b) {
    std::string x = trim(a);
    std::string y = trim(b);

    if (x.empty() && y.empty()) return 0;
    if (x.empty()) return -1;
    if (y.empty()) return 1;

    auto sx = parse_semantic_version(x);
    auto sy = parse_semantic_version(y);
    if (sx && sy) {
        if (*sx < *sy) return -1;
        if (*sy < *sx) return 1;
        return 0;
    }

    return compare_segments(x, y);
}

bool version_in_range(const std::string& version,
                      const std::string& min_version,
                      const std::string& max_version) {
    if (!trim(min_version).empty() && compare_versions(version, min_version) < 0) {
        return false;
    }
    if (!trim(max_version).empty() && compare_versions(version, max_version) > 0) {
        return false;
    }
    return true;
}

} // namespace cairn
