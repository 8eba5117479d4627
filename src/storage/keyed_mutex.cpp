#include "cairn/keyed_mutex.hpp"

namespace cairn {

KeyedMutex::Lock::Lock(KeyedMutex* owner, std::string key, Entry* entry)
    : owner_(owner), key_(std::move(key)), entry_(entry) {}

KeyedMutex::Lock::Lock(Lock&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), entry_(other.entry_) {
    other.owner_ = nullptr;
    other.entry_ = nullptr;
}

KeyedMutex::Lock::~Lock() {
    if (entry_) {
        entry_->mutex.unlock();
        owner_->release(key_);
    }
}

KeyedMutex::Lock KeyedMutex::lock(const std::string& key) {
    Entry* entry = nullptr;
    {
        std::lock_guard<std::mutex> guard(table_mutex_);
        auto& slot = entries_[key];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        slot->users++;
        entry = slot.get();
    }

    // Entry stays alive while users > 0
    entry->mutex.lock();
    return Lock(this, key, entry);
}

void KeyedMutex::release(const std::string& key) {
    std::lock_guard<std::mutex> guard(table_mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return;
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

std::size_t KeyedMutex::size() const {
    std::lock_guard<std::mutex> guard(table_mutex_);
    return entries_.size();
}

} // namespace cairn
