#ifndef CACHEPROVIDER_HPP
#define CACHEPROVIDER_HPP

#include <any>
#include <atomic>
#include <cstdint>
#include <future>
#include <memory>
#include <regex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>

#include "ValueTraits.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/IFileWatcher.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/IStore.hpp"
#include "../models/CacheEntry.hpp"
#include "../models/CacheExceptions.hpp"
#include "../models/CacheStats.hpp"
#include "../models/LookupResult.hpp"

namespace net = boost::asio;

// Process-local cache with absolute expiry, file-dependency invalidation and
// regex bulk removal. Owns no global state: construct one and share it.
//
// Missing keys are not errors: get<T>() returns T{}. Empty keys, empty patterns
// and null values throw std::invalid_argument. Values that are empty collections
// are silently not stored.
//
// Every operation has an *Async twin returning std::future. Argument validation
// (and the dependency file existence check) still happens on the calling thread;
// the rest runs on an internal strand, so async operations execute in the order
// they were submitted.
class CacheProvider {
public:
    CacheProvider(const CacheConfig& config,
                  std::shared_ptr<IStore> store,
                  std::shared_ptr<IFileWatcher> watcher,
                  std::shared_ptr<ILogger> logger,
                  std::shared_ptr<IStatsDClient> statsd_client);

    // Waits for outstanding async operations.
    ~CacheProvider();

    CacheProvider(const CacheProvider&) = delete;
    CacheProvider& operator=(const CacheProvider&) = delete;
    CacheProvider(CacheProvider&&) = delete;
    CacheProvider& operator=(CacheProvider&&) = delete;

    // --- Synchronous surface ---

    template <typename T>
    LookupResult<T> tryGet(const std::string& key) {
        validateKey(key);
        auto entry = store_->lookup(key);
        if (!entry) {
            recordMiss();
            return LookupResult<T>::notFound();
        }
        if (const T* typed = std::any_cast<T>(&entry->value)) {
            recordHit();
            return LookupResult<T>::found(*typed);
        }
        recordTypeMismatch(key);
        return LookupResult<T>::typeMismatch(entry->value.type().name());
    }

    // Throws TypeMismatchException when the stored value is not a T.
    template <typename T>
    T get(const std::string& key) {
        auto result = tryGet<T>(key);
        switch (result.status) {
            case LookupStatus::Found:
                return std::move(*result.value);
            case LookupStatus::TypeMismatch:
                throw TypeMismatchException(key, typeid(T).name(), result.stored_type);
            case LookupStatus::NotFound:
            default:
                return T{};
        }
    }

    bool isSet(const std::string& key);

    // Entry expires ttlMinutes from now; 0 stores an already expired entry.
    template <typename T>
    void set(const std::string& key, T&& value, std::uint32_t ttlMinutes) {
        validateKey(key);
        validateValue(value);
        if (ValueTraits::isEmptyCollection(value)) {
            recordSkippedSet(key);
            return;
        }
        installEntry(key, makeStoredValue(std::forward<T>(value)), makeAbsoluteRetention(ttlMinutes));
    }

    // Entry lives until dependencyFilePath is modified, deleted or moved.
    // Throws FileNotFoundException if the file does not exist now.
    template <typename T>
    void set(const std::string& key, T&& value, const std::string& dependencyFilePath) {
        validateKey(key);
        validateValue(value);
        requireDependencyFile(dependencyFilePath);
        if (ValueTraits::isEmptyCollection(value)) {
            recordSkippedSet(key);
            return;
        }
        installEntry(key, makeStoredValue(std::forward<T>(value)), makeFileRetention(key, dependencyFilePath));
    }

    void remove(const std::string& key);

    // ECMAScript regex, searched anywhere in the key. Matches every physically
    // present key, including expired ones not yet purged. Returns the number removed.
    size_t removeByPattern(const std::string& pattern);

    CacheStats stats() const;

    // --- Asynchronous surface ---

    template <typename T>
    std::future<T> getAsync(const std::string& key) {
        validateKey(key);
        return schedule([this, key]() { return get<T>(key); });
    }

    template <typename T>
    std::future<LookupResult<T>> tryGetAsync(const std::string& key) {
        validateKey(key);
        return schedule([this, key]() { return tryGet<T>(key); });
    }

    std::future<bool> isSetAsync(const std::string& key);

    template <typename T>
    std::future<void> setAsync(const std::string& key, T&& value, std::uint32_t ttlMinutes) {
        validateKey(key);
        validateValue(value);
        ValueTraits::StoredType<T> stored(std::forward<T>(value));
        return schedule([this, key, stored = std::move(stored), ttlMinutes]() mutable {
            set(key, std::move(stored), ttlMinutes);
        });
    }

    template <typename T>
    std::future<void> setAsync(const std::string& key, T&& value, const std::string& dependencyFilePath) {
        validateKey(key);
        validateValue(value);
        requireDependencyFile(dependencyFilePath);
        ValueTraits::StoredType<T> stored(std::forward<T>(value));
        return schedule([this, key, stored = std::move(stored), dependencyFilePath]() mutable {
            set(key, std::move(stored), dependencyFilePath);
        });
    }

    std::future<void> removeAsync(const std::string& key);
    std::future<size_t> removeByPatternAsync(const std::string& pattern);

private:
    struct Counters {
        std::atomic<std::uint64_t> hits{0};
        std::atomic<std::uint64_t> misses{0};
        std::atomic<std::uint64_t> sets{0};
        std::atomic<std::uint64_t> skipped_sets{0};
        std::atomic<std::uint64_t> removals{0};
        std::atomic<std::uint64_t> pattern_removals{0};
        std::atomic<std::uint64_t> invalidations{0};
        std::atomic<std::uint64_t> type_mismatches{0};
    };

    template <typename T>
    static void validateValue(const T& value) {
        if (ValueTraits::isNull(value)) {
            throw std::invalid_argument("value cannot be null");
        }
    }

    template <typename T>
    static std::any makeStoredValue(T&& value) {
        using Stored = ValueTraits::StoredType<T>;
        static_assert(std::is_copy_constructible_v<Stored>, "cached values must be copy constructible");
        return std::any(Stored(std::forward<T>(value)));
    }

    template <typename F>
    auto schedule(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>&>> {
        using R = std::invoke_result_t<std::decay_t<F>&>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        std::future<R> result = task->get_future();
        net::post(strand_, [task]() { (*task)(); });
        return result;
    }

    static void validateKey(const std::string& key);
    static std::regex compilePattern(const std::string& pattern);
    static void requireDependencyFile(const std::string& path);

    Retention makeAbsoluteRetention(std::uint32_t ttlMinutes) const;
    Retention makeFileRetention(const std::string& key, const std::string& path);
    void installEntry(const std::string& key, std::any value, Retention retention);
    size_t removeMatching(const std::regex& pattern, const std::string& pattern_text);

    void recordHit();
    void recordMiss();
    void recordTypeMismatch(const std::string& key);
    void recordSkippedSet(const std::string& key);
    void reportEntryCount();

    std::shared_ptr<IStore> store_;
    std::shared_ptr<IFileWatcher> watcher_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    std::shared_ptr<Counters> counters_;

    net::thread_pool pool_;
    net::strand<net::thread_pool::executor_type> strand_;
};

#endif // CACHEPROVIDER_HPP
