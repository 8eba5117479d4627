#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cairn {

// ============================================================================
// Durable Writes
// ============================================================================
//
// Nothing here throws. Every function reports failure through its result;
// std::filesystem calls go through their std::error_code overloads.

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Stage content next to path, fsync it, then atomic_rename it into place.
// Readers see either the old file or the complete new one.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Copy src to dst and fsync dst. dst is a staging path, not the final name.
AtomicWriteResult copy_file_synced(const std::string& src, const std::string& dst);

// Rename a fully written file over to, then fsync to's directory
AtomicWriteResult atomic_rename(const std::string& from, const std::string& to);

struct ReadFileResult {
    bool ok = false;
    std::string error;
    std::string content;
};

ReadFileResult read_file(const std::string& path);

// ============================================================================
// Paths
// ============================================================================

// Backslashes become forward slashes
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// ============================================================================
// Filesystem Queries
// ============================================================================

std::optional<uint64_t> file_size(const std::string& path);

// Seconds since last modification
std::optional<int64_t> file_age_seconds(const std::string& path);

// Entry names (not full paths), sorted; empty when path is not a directory
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);
bool remove_directory(const std::string& path);
bool remove_file(const std::string& path);

// Free bytes on the volume holding path, 0 when unknown
uint64_t available_space(const std::string& path);

// 32 random lowercase hex characters, for staging and scratch names
std::string random_name();

} // namespace cairn
