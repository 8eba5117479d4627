#include "cairn/manifest_id.hpp"
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

bool is_id_char(unsigned char c) {
    return std::isalnum(c) || c == '.' || c == '-' || c == '_';
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Lower-case and keep only [a-z0-9]
std::string normalize_segment(const std::string& input) {
    std::string out;
    for (unsigned char c : input) {
        if (std::isalnum(c)) {
            out.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    return out;
}

bool parse_non_negative(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    out = std::stoi(s);
    return true;
}

} // namespace

ManifestId::ManifestId(std::string value)
    : value_(std::move(value)), normalized_(to_lower(value_)) {}

std::string ManifestId::check(const std::string& value) {
    if (value.empty()) {
        return "manifest id cannot be empty";
    }
    if (value.size() > kMaxLength) {
        return "manifest id exceeds " + std::to_string(kMaxLength) + " characters";
    }
    for (unsigned char c : value) {
        if (!is_id_char(c)) {
            return "manifest id '" + value + "' contains invalid character";
        }
    }
    if (value.find("..") != std::string::npos) {
        return "manifest id '" + value + "' contains invalid path traversal sequence";
    }
    if (value.find_first_not_of('.') == std::string::npos) {
        return "manifest id '" + value + "' does not name an entry";
    }
    return {};
}

Result<ManifestId> ManifestId::create(const std::string& value) {
    std::string reason = check(value);
    if (!reason.empty()) {
        return Result<ManifestId>::err(Error(ErrorCode::INVALID_ID, reason));
    }
    return Result<ManifestId>::ok(ManifestId(value));
}

// ============================================================================
// Generation
// ============================================================================

Result<ManifestId> generate_publisher_content_id(const std::string& publisher,
                                                 ContentType content_type,
                                                 const std::string& content_name,
                                                 int user_version) {
    if (user_version < 0) {
        return Result<ManifestId>::err(
            Error(ErrorCode::INVALID_ID, "user version cannot be negative"));
    }

    std::string safe_publisher = normalize_segment(publisher);
    if (safe_publisher.empty()) {
        return Result<ManifestId>::err(
            Error(ErrorCode::INVALID_ID, "publisher is empty after normalization: '" + publisher + "'"));
    }

    std::string safe_name = normalize_segment(content_name);
    if (safe_name.empty()) {
        return Result<ManifestId>::err(
            Error(ErrorCode::INVALID_ID, "content name is empty after normalization: '" + content_name + "'"));
    }

    std::string type_segment = content_type == ContentType::Unknown
        ? "unknown"
        : to_lower(content_type_to_string(content_type));

    return ManifestId::create(std::string(kManifestIdSchemaVersion) + "." +
                              std::to_string(user_version) + "." +
                              safe_publisher + "." + type_segment + "." + safe_name);
}

Result<ManifestId> generate_game_installation_id(const std::string& installation_type,
                                                 GameType game,
                                                 const std::string& user_version) {
    std::string safe_install = normalize_segment(installation_type);
    if (safe_install.empty()) {
        return Result<ManifestId>::err(
            Error(ErrorCode::INVALID_ID, "installation type is empty after normalization"));
    }

    std::string version = trim(user_version);
    std::string version_segment;
    if (version.empty()) {
        version_segment = "0";
    } else if (version.find('.') != std::string::npos) {
        auto dot = version.find('.');
        std::string major_str = version.substr(0, dot);
        std::string minor_str = version.substr(dot + 1);
        int major = 0;
        int minor = 0;
        if (minor_str.find('.') != std::string::npos ||
            !parse_non_negative(major_str, major) ||
            !parse_non_negative(minor_str, minor)) {
            return Result<ManifestId>::err(
                Error(ErrorCode::INVALID_ID,
                      "version must be 'major.minor' or a single number: " + user_version));
        }
        // "1.08" and "1.8" both become "108"
        std::string minor_padded = std::to_string(minor);
        if (minor_padded.size() < 2) minor_padded.insert(0, 1, '0');
        version_segment = std::to_string(major) + minor_padded;
    } else {
        int parsed = 0;
        if (!parse_non_negative(version, parsed)) {
            return Result<ManifestId>::err(
                Error(ErrorCode::INVALID_ID,
                      "version must be numeric and non-negative: " + user_version));
        }
        version_segment = version;
    }

    std::string game_segment = game == GameType::ZeroHour ? "zerohour" : "generals";

    return ManifestId::create(std::string(kManifestIdSchemaVersion) + "." + version_segment +
                              "." + safe_install + ".gameinstallation." + game_segment);
}

} // namespace cairn
