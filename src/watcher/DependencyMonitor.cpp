#include "DependencyMonitor.hpp"

#include <stdexcept>

DependencyMonitor::DependencyMonitor(std::shared_ptr<IFileWatcher> watcher,
                                     const std::string& path,
                                     ChangeListener onFirstChange)
    : watcher_(std::move(watcher)),
    path_(path),
    changed_(std::make_shared<std::atomic<bool>>(false)),
    handle_(0) {
    if (!watcher_) {
        throw std::invalid_argument("FileWatcher cannot be null for DependencyMonitor");
    }
    auto changed = changed_;
    handle_ = watcher_->watch(path_, [changed, onFirstChange](const std::string& changed_path) {
        // Only the first notification matters; the entry is dead from then on.
        if (!changed->exchange(true, std::memory_order_acq_rel) && onFirstChange) {
            onFirstChange(changed_path);
        }
    });
}

DependencyMonitor::~DependencyMonitor() {
    watcher_->unwatch(handle_);
}
