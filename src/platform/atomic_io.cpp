#include "cairn/platform.hpp"

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#ifndef _WIN32
#include <cerrno>
#include <fcntl.h>
#include <unistd.h>
#endif

namespace cairn {

namespace fs = std::filesystem;

namespace {

AtomicWriteResult failure(std::string message) {
    AtomicWriteResult result;
    result.error = std::move(message);
    return result;
}

AtomicWriteResult success() {
    AtomicWriteResult result;
    result.ok = true;
    return result;
}

void discard(const std::string& path) {
    std::error_code ec;
    fs::remove(path, ec);
}

#ifndef _WIN32
std::string errno_text() {
    return std::strerror(errno);
}

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

bool sync_path(const std::string& path) {
    int fd = open(path.c_str(), O_RDONLY);
    if (fd < 0) return false;
    bool synced = sync_fd(fd);
    close(fd);
    return synced;
}

// write() until everything is out; EINTR is retried
bool write_fully(int fd, const std::string& content) {
    const char* data = content.data();
    size_t left = content.size();
    while (left > 0) {
        ssize_t n = write(fd, data, left);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        left -= static_cast<size_t>(n);
    }
    return true;
}
#endif

AtomicWriteResult write_staged(const std::string& staged, const std::string& content) {
#ifdef _WIN32
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        return failure("failed to write " + staged);
    }
    return success();
#else
    int fd = open(staged.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        return failure("failed to create " + staged + ": " + errno_text());
    }
    if (!write_fully(fd, content)) {
        std::string reason = errno_text();
        close(fd);
        return failure("failed to write " + staged + ": " + reason);
    }
    bool synced = sync_fd(fd);
    close(fd);
    if (!synced) {
        return failure("failed to fsync " + staged);
    }
    return success();
#endif
}

} // namespace

// ============================================================================
// Durable Writes
// ============================================================================

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content) {
    std::string staged = path + ".tmp." + random_name().substr(0, 8);

    auto written = write_staged(staged, content);
    if (!written.ok) {
        discard(staged);
        return written;
    }

    auto renamed = atomic_rename(staged, path);
    if (!renamed.ok) {
        discard(staged);
    }
    return renamed;
}

AtomicWriteResult copy_file_synced(const std::string& src, const std::string& dst) {
    std::error_code ec;
    fs::copy_file(src, dst, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        discard(dst);
        return failure("failed to copy " + src + " to " + dst + ": " + ec.message());
    }

#ifndef _WIN32
    if (!sync_path(dst)) {
        return failure("failed to fsync " + dst);
    }
#endif
    return success();
}

AtomicWriteResult atomic_rename(const std::string& from, const std::string& to) {
    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        return failure("failed to rename " + from + " to " + to + ": " + ec.message());
    }

#ifndef _WIN32
    // The rename is durable only once the directory entry is
    std::string parent = get_parent_directory(to);
    if (!parent.empty()) {
        sync_path(parent);
    }
#endif
    return success();
}

ReadFileResult read_file(const std::string& path) {
    ReadFileResult result;

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        result.error = "failed to open " + path;
        return result;
    }

    result.content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    if (in.bad()) {
        result.content.clear();
        result.error = "failed to read " + path;
        return result;
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Paths
// ============================================================================

std::string to_portable_path(const std::string& path) {
    std::string out = path;
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    return to_portable_path((fs::path(base) / rel).string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool is_regular_file(const std::string& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

// ============================================================================
// Filesystem Queries
// ============================================================================

std::optional<uint64_t> file_size(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return static_cast<uint64_t>(size);
}

std::optional<int64_t> file_age_seconds(const std::string& path) {
    std::error_code ec;
    auto modified = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    auto age = std::chrono::duration_cast<std::chrono::seconds>(
        fs::file_time_type::clock::now() - modified);
    return static_cast<int64_t>(age.count());
}

std::vector<std::string> list_directory(const std::string& path) {
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(path, ec), end; !ec && it != end; it.increment(ec)) {
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec;
}

bool remove_directory(const std::string& path) {
    std::error_code ec;
    fs::remove_all(path, ec);
    return !ec;
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    return removed && !ec;
}

uint64_t available_space(const std::string& path) {
    std::error_code ec;
    auto info = fs::space(path, ec);
    return ec ? 0 : static_cast<uint64_t>(info.available);
}

std::string random_name() {
    static const char digits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen((static_cast<uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int> pick(0, 15);

    std::string name(32, '0');
    for (auto& c : name) {
        c = digits[pick(gen)];
    }
    return name;
}

} // namespace cairn
