#include "InMemoryStore.hpp"

#include <algorithm>

using namespace std::chrono;

InMemoryStore::InMemoryStore(size_t max_entries)
    : max_entries_(std::max<size_t>(max_entries, 1)), evictions_(0) {}

void InMemoryStore::insert(const std::string& key, CacheEntry entry) {
    // The replaced entry (and any file watch it owns) is released under the lock,
    // so readers see either the old entry or the new one.
    std::lock_guard<std::mutex> lock(mutex_);

    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
    } else {
        evictIfNeeded();
    }

    entries_.insert_or_assign(key, std::move(entry));
    lru_list_.push_front(key);
    lru_map_[key] = lru_list_.begin();
}

std::optional<CacheEntry> InMemoryStore::lookup(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (!it->second.isLive(steady_clock::now())) {
        eraseLocked(key);
        return std::nullopt;
    }
    touchLocked(key);
    return it->second;
}

bool InMemoryStore::contains(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return false;
    }
    if (!it->second.isLive(steady_clock::now())) {
        eraseLocked(key);
        return false;
    }
    touchLocked(key);
    return true;
}

bool InMemoryStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(key) == entries_.end()) {
        return false;
    }
    eraseLocked(key);
    return true;
}

std::vector<std::string> InMemoryStore::keys() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& kv : entries_) {
        result.push_back(kv.first);
    }
    return result;
}

size_t InMemoryStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t InMemoryStore::evictionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evictions_;
}

// Private helpers below expect mutex_ to be held by the caller.

void InMemoryStore::eraseLocked(const std::string& key) {
    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.erase(lru_it->second);
        lru_map_.erase(lru_it);
    }
    entries_.erase(key);
}

void InMemoryStore::touchLocked(const std::string& key) {
    auto lru_it = lru_map_.find(key);
    if (lru_it != lru_map_.end()) {
        lru_list_.splice(lru_list_.begin(), lru_list_, lru_it->second);
    }
}

void InMemoryStore::purgeDeadLocked() {
    auto now = steady_clock::now();
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (!it->second.isLive(now)) {
            auto lru_it = lru_map_.find(it->first);
            if (lru_it != lru_map_.end()) {
                lru_list_.erase(lru_it->second);
                lru_map_.erase(lru_it);
            }
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void InMemoryStore::evictIfNeeded() {
    if (entries_.size() < max_entries_) {
        return;
    }
    purgeDeadLocked();
    while (entries_.size() >= max_entries_ && !lru_list_.empty()) {
        std::string oldest_key = lru_list_.back();
        lru_list_.pop_back();
        lru_map_.erase(oldest_key);
        entries_.erase(oldest_key);
        ++evictions_;
    }
}
