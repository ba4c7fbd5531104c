#ifndef ISTORE_HPP
#define ISTORE_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../models/CacheEntry.hpp"

// In-process associative container behind CacheProvider.
// Implementations are thread-safe and run their own eviction.
class IStore {
public:
    virtual ~IStore() = default;
    virtual void insert(const std::string& key, CacheEntry entry) = 0;
    // Returns std::nullopt for missing entries and for entries whose retention has triggered.
    virtual std::optional<CacheEntry> lookup(const std::string& key) = 0;
    virtual bool contains(const std::string& key) = 0;
    virtual bool remove(const std::string& key) = 0;
    // Every physically present key, live or not.
    virtual std::vector<std::string> keys() = 0;
    virtual std::size_t size() = 0;
    // Live entries dropped to stay within capacity since construction.
    virtual std::size_t evictionCount() const = 0;
};

#endif // ISTORE_HPP
