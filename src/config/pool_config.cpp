#include "cairn/config.hpp"
#include "cairn/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

namespace cairn {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

void warn_unknown_keys(const nlohmann::json& j, const std::string& section,
                       const std::set<std::string>& known, std::vector<std::string>& warnings) {
    for (const auto& item : j.items()) {
        if (known.find(item.key()) == known.end()) {
            warnings.push_back("unknown_key:" + section + item.key());
        }
    }
}

} // namespace

bool is_valid_log_level(const std::string& level) {
    static const std::set<std::string> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off",
    };
    return levels.count(to_lower(level)) > 0;
}

PoolConfigParseResult parse_pool_config(const std::string& json_str,
                                        const std::string& source_path) {
    PoolConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        warn_unknown_keys(j, "", {"storage", "cache", "logging"}, result.warnings);

        // "storage" section (REQUIRED)
        if (!j.contains("storage") || !j["storage"].is_object()) {
            result.error = "storage section missing";
            return result;
        }
        const auto& storage = j["storage"];
        warn_unknown_keys(storage, "storage.",
                          {"root", "verifyIntegrity", "gcGracePeriodSeconds"}, result.warnings);

        auto root = get_string(storage, "root");
        if (!root || trim(*root).empty()) {
            result.error = "storage.root missing";
            return result;
        }
        std::filesystem::path root_path(trim(*root));
        if (root_path.is_relative() && !source_path.empty()) {
            root_path = std::filesystem::path(get_parent_directory(source_path)) / root_path;
        }
        result.config.storage.root = to_portable_path(root_path.lexically_normal().string());

        if (storage.contains("verifyIntegrity")) {
            if (storage["verifyIntegrity"].is_boolean()) {
                result.config.storage.verify_integrity = storage["verifyIntegrity"].get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:storage.verifyIntegrity");
            }
        }

        if (storage.contains("gcGracePeriodSeconds")) {
            const auto& grace = storage["gcGracePeriodSeconds"];
            if (grace.is_number_integer() && grace.get<int64_t>() >= 0) {
                result.config.storage.gc_grace_period_seconds = grace.get<int64_t>();
            } else {
                result.warnings.push_back("invalid_configuration:storage.gcGracePeriodSeconds");
            }
        }

        // "cache" section
        if (j.contains("cache") && j["cache"].is_object()) {
            const auto& cache = j["cache"];
            warn_unknown_keys(cache, "cache.", {"shardCount"}, result.warnings);
            if (cache.contains("shardCount")) {
                const auto& shards = cache["shardCount"];
                if (shards.is_number_integer() && shards.get<int64_t>() > 0) {
                    result.config.cache.shard_count = shards.get<std::size_t>();
                } else {
                    result.warnings.push_back("invalid_configuration:cache.shardCount");
                }
            }
        }

        // "logging" section
        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& logging = j["logging"];
            warn_unknown_keys(logging, "logging.", {"name", "level", "pattern"}, result.warnings);
            if (auto name = get_string(logging, "name")) {
                if (!trim(*name).empty()) {
                    result.config.logging.name = trim(*name);
                }
            }
            if (auto level = get_string(logging, "level")) {
                if (is_valid_log_level(trim(*level))) {
                    result.config.logging.level = to_lower(trim(*level));
                } else {
                    result.warnings.push_back("invalid_configuration:logging.level");
                    result.config.logging.level = "info";
                }
            }
            if (auto pattern = get_string(logging, "pattern")) {
                result.config.logging.pattern = *pattern;
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

PoolConfigParseResult load_pool_config(const std::string& path) {
    auto file = read_file(path);
    if (!file.ok) {
        PoolConfigParseResult result;
        result.error = file.error;
        return result;
    }
    return parse_pool_config(file.content, path);
}

} // namespace cairn
