#ifndef INMEMORYSTORE_HPP
#define INMEMORYSTORE_HPP

#include <chrono>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../interfaces/IStore.hpp"

// Default IStore: a mutex-guarded map with LRU eviction bounded by entry count.
// Dead entries (expired or invalidated) are purged lazily when touched, and
// before anything live is evicted.
class InMemoryStore : public IStore {
private:
    std::unordered_map<std::string, CacheEntry> entries_;  // key -> entry
    std::list<std::string> lru_list_;                      // front=most recent, back=least recent
    std::unordered_map<std::string, std::list<std::string>::iterator> lru_map_;

    mutable std::mutex mutex_;
    const size_t max_entries_;
    size_t evictions_;

    void eraseLocked(const std::string& key);
    void touchLocked(const std::string& key);
    void purgeDeadLocked();
    void evictIfNeeded();

public:
    explicit InMemoryStore(size_t max_entries = 10000);

    ~InMemoryStore() override = default;

    void insert(const std::string& key, CacheEntry entry) override;
    std::optional<CacheEntry> lookup(const std::string& key) override;
    bool contains(const std::string& key) override;
    bool remove(const std::string& key) override;
    std::vector<std::string> keys() override;
    size_t size() override;
    size_t evictionCount() const override;
};

#endif // INMEMORYSTORE_HPP
