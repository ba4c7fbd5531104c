#ifndef CACHEENTRY_HPP
#define CACHEENTRY_HPP

#include <any>
#include <chrono>
#include <memory>
#include <string>

#include "../watcher/DependencyMonitor.hpp"

// When an entry stops being valid. Exactly one of the two kinds applies.
struct Retention {
    enum class Kind {
        AbsoluteExpiry,
        FileDependency
    };

    Kind kind = Kind::AbsoluteExpiry;
    std::chrono::steady_clock::time_point expires_at{};   // AbsoluteExpiry
    std::shared_ptr<const DependencyMonitor> monitor;     // FileDependency

    static Retention absolute(std::chrono::steady_clock::time_point expiresAt) {
        Retention r;
        r.kind = Kind::AbsoluteExpiry;
        r.expires_at = expiresAt;
        return r;
    }

    static Retention fileDependency(std::shared_ptr<const DependencyMonitor> monitor) {
        Retention r;
        r.kind = Kind::FileDependency;
        r.monitor = std::move(monitor);
        return r;
    }

    bool isLive(std::chrono::steady_clock::time_point now) const {
        if (kind == Kind::AbsoluteExpiry) {
            return now < expires_at;
        }
        return monitor && !monitor->hasChanged();
    }
};

struct CacheEntry {
    std::any value;
    Retention retention;
    std::chrono::system_clock::time_point created_at;

    bool isLive(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now()) const {
        return retention.isLive(now);
    }
};

#endif // CACHEENTRY_HPP
