#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace cairn {

// One mutex per key, created on first use and dropped when the last holder
// or waiter releases it. Locks on different keys never block each other.
class KeyedMutex {
    struct Entry {
        std::mutex mutex;
        std::size_t users = 0;
    };

public:
    class Lock {
    public:
        Lock(Lock&& other) noexcept;
        Lock& operator=(Lock&&) = delete;
        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;
        ~Lock();

    private:
        friend class KeyedMutex;
        Lock(KeyedMutex* owner, std::string key, Entry* entry);

        KeyedMutex* owner_;
        std::string key_;
        Entry* entry_;
    };

    KeyedMutex() = default;
    KeyedMutex(const KeyedMutex&) = delete;
    KeyedMutex& operator=(const KeyedMutex&) = delete;

    // Blocks until key is free
    Lock lock(const std::string& key);

    // Number of keys currently held or waited on
    std::size_t size() const;

private:
    void release(const std::string& key);

    mutable std::mutex table_mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace cairn
