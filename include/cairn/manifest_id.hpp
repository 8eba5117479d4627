#pragma once

#include "cairn/result.hpp"

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>

namespace cairn {

enum class ContentType;
enum class GameType;

// ============================================================================
// Manifest Identifier
// ============================================================================

/**
 * @brief Validated, immutable manifest identifier
 *
 * A valid id is 1..255 characters of [A-Za-z0-9._-], never contains ".."
 * and is not ".", so it can be used directly as a file name under the
 * storage root.
 * Comparison and hashing are case-insensitive; value() keeps the original
 * spelling.
 */
class ManifestId {
public:
    static constexpr std::size_t kMaxLength = 255;

    /// Empty id; only meaningful as "missing" inside a manifest being validated
    ManifestId() = default;

    static Result<ManifestId> create(const std::string& value);

    /// Returns an empty string when the value is valid, otherwise the reason
    static std::string check(const std::string& value);

    const std::string& value() const { return value_; }
    const std::string& normalized() const { return normalized_; }
    bool empty() const { return value_.empty(); }

    bool operator==(const ManifestId& other) const { return normalized_ == other.normalized_; }
    bool operator!=(const ManifestId& other) const { return !(*this == other); }
    bool operator<(const ManifestId& other) const { return normalized_ < other.normalized_; }

private:
    explicit ManifestId(std::string value);

    std::string value_;
    std::string normalized_;
};

inline std::ostream& operator<<(std::ostream& os, const ManifestId& id) {
    return os << id.value();
}

// ============================================================================
// Manifest Id Generation
// ============================================================================

// Schema segment that prefixes every generated id
constexpr const char* kManifestIdSchemaVersion = "1";

// "1.<user_version>.<publisher>.<content_type>.<content_name>"
// publisher and content_name are lower-cased and stripped to [a-z0-9].
Result<ManifestId> generate_publisher_content_id(const std::string& publisher,
                                                 ContentType content_type,
                                                 const std::string& content_name,
                                                 int user_version = 0);

// "1.<version>.<installation_type>.gameinstallation.<generals|zerohour>"
// user_version accepts "", "5" or "major.minor" ("1.08" and "1.8" both -> "108").
Result<ManifestId> generate_game_installation_id(const std::string& installation_type,
                                                 GameType game,
                                                 const std::string& user_version = "");

} // namespace cairn

namespace std {

template<>
struct hash<cairn::ManifestId> {
    size_t operator()(const cairn::ManifestId& id) const noexcept {
        return hash<string>()(id.normalized());
    }
};

} // namespace std
