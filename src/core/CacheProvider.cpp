#include "CacheProvider.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

CacheProvider::CacheProvider(const CacheConfig& config,
                             std::shared_ptr<IStore> store,
                             std::shared_ptr<IFileWatcher> watcher,
                             std::shared_ptr<ILogger> logger,
                             std::shared_ptr<IStatsDClient> statsd_client)
    : store_(store),
    watcher_(watcher),
    logger_(logger),
    statsd_client_(statsd_client),
    counters_(std::make_shared<Counters>()),
    pool_(static_cast<size_t>(std::max(config.async_worker_threads, 1))),
    strand_(net::make_strand(pool_.get_executor())) {
    if (!store_) {
        throw std::invalid_argument("Store pointer cannot be null");
    }
    if (!watcher_) {
        throw std::invalid_argument("FileWatcher pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    logger_->debug("CacheProvider initialized with " + std::to_string(std::max(config.async_worker_threads, 1)) +
                   " async worker threads");
}

CacheProvider::~CacheProvider() {
    pool_.join();
}

bool CacheProvider::isSet(const std::string& key) {
    validateKey(key);
    return store_->contains(key);
}

void CacheProvider::remove(const std::string& key) {
    validateKey(key);
    if (store_->remove(key)) {
        counters_->removals++;
        statsd_client_->increment(MetricsDefinitions::CACHE_REMOVE);
        reportEntryCount();
        logger_->debug("Removed cache key: " + key);
    }
}

size_t CacheProvider::removeByPattern(const std::string& pattern) {
    std::regex compiled = compilePattern(pattern);
    return removeMatching(compiled, pattern);
}

CacheStats CacheProvider::stats() const {
    CacheStats stats;
    stats.hits = counters_->hits.load();
    stats.misses = counters_->misses.load();
    stats.sets = counters_->sets.load();
    stats.skipped_sets = counters_->skipped_sets.load();
    stats.removals = counters_->removals.load();
    stats.pattern_removals = counters_->pattern_removals.load();
    stats.invalidations = counters_->invalidations.load();
    stats.type_mismatches = counters_->type_mismatches.load();
    stats.evictions = store_->evictionCount();
    stats.entries = store_->size();
    return stats;
}

std::future<bool> CacheProvider::isSetAsync(const std::string& key) {
    validateKey(key);
    return schedule([this, key]() { return isSet(key); });
}

std::future<void> CacheProvider::removeAsync(const std::string& key) {
    validateKey(key);
    return schedule([this, key]() { remove(key); });
}

std::future<size_t> CacheProvider::removeByPatternAsync(const std::string& pattern) {
    std::regex compiled = compilePattern(pattern);
    return schedule([this, compiled = std::move(compiled), pattern]() {
        return removeMatching(compiled, pattern);
    });
}

// --- Private helpers ---

void CacheProvider::validateKey(const std::string& key) {
    if (key.empty()) {
        throw std::invalid_argument("key cannot be empty");
    }
}

std::regex CacheProvider::compilePattern(const std::string& pattern) {
    if (pattern.empty()) {
        throw std::invalid_argument("pattern cannot be empty");
    }
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid pattern '" + pattern + "': " + e.what());
    }
}

void CacheProvider::requireDependencyFile(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec) || fs::is_directory(path, ec)) {
        throw FileNotFoundException(path);
    }
}

Retention CacheProvider::makeAbsoluteRetention(std::uint32_t ttlMinutes) const {
    using Clock = std::chrono::steady_clock;
    const auto now = Clock::now();
    const std::chrono::minutes ttl(ttlMinutes);
    // Saturate instead of overflowing the clock's nanosecond representation.
    if (ttl >= std::chrono::duration_cast<std::chrono::minutes>(Clock::time_point::max() - now)) {
        return Retention::absolute(Clock::time_point::max());
    }
    return Retention::absolute(now + ttl);
}

Retention CacheProvider::makeFileRetention(const std::string& key, const std::string& path) {
    auto logger = logger_;
    auto statsd_client = statsd_client_;
    auto counters = counters_;
    // Runs on the watcher thread; must not touch the provider itself.
    auto on_change = [logger, statsd_client, counters, key](const std::string& changed_path) {
        counters->invalidations++;
        statsd_client->increment(MetricsDefinitions::CACHE_INVALIDATED);
        logger->warn("Cache key '" + key + "' invalidated by change to " + changed_path);
    };
    return Retention::fileDependency(std::make_shared<DependencyMonitor>(watcher_, path, on_change));
}

void CacheProvider::installEntry(const std::string& key, std::any value, Retention retention) {
    CacheEntry entry;
    entry.value = std::move(value);
    entry.retention = std::move(retention);
    entry.created_at = std::chrono::system_clock::now();
    store_->insert(key, std::move(entry));

    counters_->sets++;
    statsd_client_->increment(MetricsDefinitions::CACHE_SET);
    reportEntryCount();
    logger_->debug("Set cache key: " + key);
}

size_t CacheProvider::removeMatching(const std::regex& pattern, const std::string& pattern_text) {
    const auto started = std::chrono::steady_clock::now();
    size_t removed = 0;
    // Snapshot only: keys inserted or removed concurrently may or may not be seen.
    for (const auto& key : store_->keys()) {
        if (std::regex_search(key, pattern) && store_->remove(key)) {
            ++removed;
        }
    }

    counters_->pattern_removals += removed;
    statsd_client_->increment(MetricsDefinitions::CACHE_PATTERN_REMOVE, static_cast<int>(removed));
    statsd_client_->timing(MetricsDefinitions::CACHE_PATTERN_REMOVE_TIME,
                           std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started));
    reportEntryCount();
    logger_->info("Removed " + std::to_string(removed) + " cache entries matching pattern: " + pattern_text);
    return removed;
}

void CacheProvider::recordHit() {
    counters_->hits++;
    statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
}

void CacheProvider::recordMiss() {
    counters_->misses++;
    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
}

void CacheProvider::recordTypeMismatch(const std::string& key) {
    counters_->type_mismatches++;
    statsd_client_->increment(MetricsDefinitions::CACHE_TYPE_MISMATCH);
    logger_->warn("Type mismatch on cache key: " + key);
}

void CacheProvider::recordSkippedSet(const std::string& key) {
    counters_->skipped_sets++;
    statsd_client_->increment(MetricsDefinitions::CACHE_SET_SKIPPED);
    logger_->debug("Skipped caching empty value for key: " + key);
}

void CacheProvider::reportEntryCount() {
    statsd_client_->gauge(MetricsDefinitions::CACHE_ENTRIES, static_cast<double>(store_->size()));
}
