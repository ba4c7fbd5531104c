#ifndef INOTIFYFILEWATCHER_HPP
#define INOTIFYFILEWATCHER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>

#include "../interfaces/IFileWatcher.hpp"
#include "../interfaces/ILogger.hpp"

// Linux inotify backed watcher. A single background thread drains the inotify
// descriptor and dispatches callbacks with no lock held.
class InotifyFileWatcher : public IFileWatcher {
public:
    InotifyFileWatcher(std::shared_ptr<ILogger> logger, std::chrono::milliseconds poll_interval);
    ~InotifyFileWatcher() override;

    InotifyFileWatcher(const InotifyFileWatcher&) = delete;
    InotifyFileWatcher& operator=(const InotifyFileWatcher&) = delete;
    InotifyFileWatcher(InotifyFileWatcher&&) = delete;
    InotifyFileWatcher& operator=(InotifyFileWatcher&&) = delete;

    WatchHandle watch(const std::string& path, ChangeCallback onChange) override;
    void unwatch(WatchHandle handle) override;

    // Number of handles still registered. Handles whose kernel watch was dropped are not counted.
    std::size_t activeWatchCount() const;

private:
    struct Registration {
        int wd;
        std::string path;
        ChangeCallback callback;
    };

    void run();
    void drainEvents();
    void shutdown();

    std::shared_ptr<ILogger> logger_;
    std::chrono::milliseconds poll_interval_;
    int inotify_fd_;

    mutable std::mutex mutex_;
    WatchHandle next_handle_;
    std::unordered_map<WatchHandle, Registration> registrations_;
    std::unordered_map<int, std::unordered_set<WatchHandle>> handles_by_wd_;

    std::atomic<bool> shutdown_;
    std::thread thread_;
};

#endif // INOTIFYFILEWATCHER_HPP
