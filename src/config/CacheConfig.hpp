#ifndef CACHECONFIG_HPP
#define CACHECONFIG_HPP

#include <cstddef>
#include <sstream>
#include <string>

namespace LogUtils {
    enum LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        CERROR = 3,
        SETUP = 4
    };

    static std::string DEBUG_LOG_PREFIX = "[Debug] ";
    static std::string INFO_LOG_PREFIX = "[Info] ";
    static std::string WARN_LOG_PREFIX = "[Warning] ";
    static std::string CERROR_LOG_PREFIX = "[Error] ";
    static std::string SETUP_LOG_PREFIX = "[Setup] ";
}

namespace MetricsDefinitions {
    static std::string CACHE_HIT = "localcache.hit";
    static std::string CACHE_MISS = "localcache.miss";
    static std::string CACHE_SET = "localcache.set";
    static std::string CACHE_SET_SKIPPED = "localcache.set_skipped";
    static std::string CACHE_REMOVE = "localcache.remove";
    static std::string CACHE_PATTERN_REMOVE = "localcache.pattern_remove";
    static std::string CACHE_INVALIDATED = "localcache.invalidated";
    static std::string CACHE_TYPE_MISMATCH = "localcache.type_mismatch";
    static std::string CACHE_ENTRIES = "localcache.entries";
    static std::string CACHE_PATTERN_REMOVE_TIME = "localcache.pattern_remove.time";
}

namespace Constants {
    static constexpr auto CONFIG_FILE_NAME = "localcache.config";
    static constexpr auto STATSD_SERVER_ENV = "STATSD_SERVER";
};

// --- Configuration Struct ---
class CacheConfig {
public:
    // Store
    std::size_t store_max_entries;

    // Async surface
    int async_worker_threads;

    // File dependency watcher
    int watcher_poll_interval_millis;

    // Logging Level
    LogUtils::LogLevel log_level;

    // Metrics
    bool metrics_enabled;
    int metrics_batch_size;             // Max bytes per datagram; 0 sends every metric immediately
    int metrics_send_interval_millis;

    CacheConfig() {
        // --- Set Defaults ---
        store_max_entries = 10000;
        async_worker_threads = 2;
        watcher_poll_interval_millis = 200;
        log_level = LogUtils::LogLevel::CERROR;
        metrics_enabled = true;
        metrics_batch_size = 512;
        metrics_send_interval_millis = 1000;
    }

    std::string to_string() const {
        std::stringstream ss;
        ss << "// --- Configuration Params Start --- //" << std::endl
            << "store_max_entries: " << store_max_entries << std::endl
            << "async_worker_threads: " << async_worker_threads << std::endl
            << "watcher_poll_interval_millis: " << watcher_poll_interval_millis << std::endl
            << "// --- Logging & Metrics --- //" << std::endl
            << "log_level: " << static_cast<int>(log_level) << std::endl
            << "metrics_enabled: " << std::boolalpha << metrics_enabled << std::noboolalpha << std::endl
            << "metrics_batch_size: " << metrics_batch_size << std::endl
            << "metrics_send_interval_millis: " << metrics_send_interval_millis << std::endl
            << "// --- Configuration Params End --- //" << std::endl;
        return ss.str();
    }
};

#endif // CACHECONFIG_HPP
