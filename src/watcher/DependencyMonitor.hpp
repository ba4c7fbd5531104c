#ifndef DEPENDENCYMONITOR_HPP
#define DEPENDENCYMONITOR_HPP

#include <atomic>
#include <memory>
#include <string>

#include "../interfaces/IFileWatcher.hpp"

// Owns one watch on a dependency file for as long as the cache entry holding it lives.
// The change flag is shared with the watch callback so a late notification after
// destruction is harmless.
class DependencyMonitor {
public:
    using ChangeListener = std::function<void(const std::string& path)>;

    // Throws FileNotFoundException if path disappeared before the watch was registered.
    DependencyMonitor(std::shared_ptr<IFileWatcher> watcher,
                      const std::string& path,
                      ChangeListener onFirstChange = nullptr);
    ~DependencyMonitor();

    DependencyMonitor(const DependencyMonitor&) = delete;
    DependencyMonitor& operator=(const DependencyMonitor&) = delete;
    DependencyMonitor(DependencyMonitor&&) = delete;
    DependencyMonitor& operator=(DependencyMonitor&&) = delete;

    bool hasChanged() const { return changed_->load(std::memory_order_acquire); }
    const std::string& path() const { return path_; }

private:
    std::shared_ptr<IFileWatcher> watcher_;
    std::string path_;
    std::shared_ptr<std::atomic<bool>> changed_;
    IFileWatcher::WatchHandle handle_;
};

#endif // DEPENDENCYMONITOR_HPP
