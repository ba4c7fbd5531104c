#include "InotifyFileWatcher.hpp"

#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>
#include <vector>

#include "../models/CacheExceptions.hpp"

namespace {
    constexpr uint32_t WATCH_MASK =
        IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE | IN_DELETE_SELF | IN_MOVE_SELF;

    constexpr size_t EVENT_BUFFER_SIZE = 64 * (sizeof(inotify_event) + 256);
}

InotifyFileWatcher::InotifyFileWatcher(std::shared_ptr<ILogger> logger, std::chrono::milliseconds poll_interval)
    : logger_(logger),
    poll_interval_(poll_interval),
    inotify_fd_(-1),
    next_handle_(1),
    shutdown_(false) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for InotifyFileWatcher");
    }
    if (poll_interval_.count() <= 0) {
        poll_interval_ = std::chrono::milliseconds(200);
    }
    inotify_fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (inotify_fd_ < 0) {
        throw std::runtime_error("inotify_init1 failed: " + std::string(std::strerror(errno)));
    }
    thread_ = std::thread([this] { run(); });
    logger_->debug("InotifyFileWatcher started");
}

InotifyFileWatcher::~InotifyFileWatcher() {
    shutdown();
}

void InotifyFileWatcher::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    close(inotify_fd_);
    inotify_fd_ = -1;
    logger_->debug("InotifyFileWatcher stopped");
}

IFileWatcher::WatchHandle InotifyFileWatcher::watch(const std::string& path, ChangeCallback onChange) {
    std::lock_guard<std::mutex> lock(mutex_);
    int wd = inotify_add_watch(inotify_fd_, path.c_str(), WATCH_MASK);
    if (wd < 0) {
        int err = errno;
        if (err == ENOENT || err == ENOTDIR) {
            throw FileNotFoundException(path);
        }
        throw std::runtime_error("inotify_add_watch failed for '" + path + "': " + std::strerror(err));
    }

    WatchHandle handle = next_handle_++;
    registrations_.emplace(handle, Registration{wd, path, std::move(onChange)});
    handles_by_wd_[wd].insert(handle);
    logger_->debug("Watching " + path + " (wd " + std::to_string(wd) + ", handle " + std::to_string(handle) + ")");
    return handle;
}

void InotifyFileWatcher::unwatch(WatchHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registrations_.find(handle);
    if (it == registrations_.end()) {
        return;
    }
    int wd = it->second.wd;
    registrations_.erase(it);

    auto wd_it = handles_by_wd_.find(wd);
    if (wd_it == handles_by_wd_.end()) {
        return;
    }
    wd_it->second.erase(handle);
    if (wd_it->second.empty()) {
        handles_by_wd_.erase(wd_it);
        // EINVAL means the kernel already dropped the watch; IN_IGNORED is on its way.
        if (inotify_rm_watch(inotify_fd_, wd) < 0 && errno != EINVAL) {
            logger_->warn("inotify_rm_watch failed for wd " + std::to_string(wd) + ": " + std::strerror(errno));
        }
    }
}

std::size_t InotifyFileWatcher::activeWatchCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registrations_.size();
}

void InotifyFileWatcher::run() {
    pollfd pfd{};
    pfd.fd = inotify_fd_;
    pfd.events = POLLIN;

    while (!shutdown_) {
        int ready = poll(&pfd, 1, static_cast<int>(poll_interval_.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            logger_->error("InotifyFileWatcher poll failed: " + std::string(std::strerror(errno)));
            return;
        }
        if (ready > 0 && (pfd.revents & POLLIN)) {
            drainEvents();
        }
    }
}

void InotifyFileWatcher::drainEvents() {
    alignas(inotify_event) char buffer[EVENT_BUFFER_SIZE];

    while (true) {
        ssize_t length = read(inotify_fd_, buffer, sizeof(buffer));
        if (length < 0) {
            if (errno != EAGAIN && errno != EINTR) {
                logger_->error("InotifyFileWatcher read failed: " + std::string(std::strerror(errno)));
            }
            return;
        }
        if (length == 0) {
            return;
        }

        std::vector<std::pair<ChangeCallback, std::string>> to_notify;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (ssize_t offset = 0; offset < length;) {
                const auto* event = reinterpret_cast<const inotify_event*>(buffer + offset);
                offset += static_cast<ssize_t>(sizeof(inotify_event) + event->len);

                auto wd_it = handles_by_wd_.find(event->wd);
                if (wd_it == handles_by_wd_.end()) {
                    continue;
                }
                for (WatchHandle handle : wd_it->second) {
                    auto reg_it = registrations_.find(handle);
                    if (reg_it != registrations_.end() && reg_it->second.callback) {
                        to_notify.emplace_back(reg_it->second.callback, reg_it->second.path);
                    }
                }
                if (event->mask & IN_IGNORED) {
                    // Kernel dropped the watch (file deleted or unmounted); its handles go inert.
                    for (WatchHandle handle : wd_it->second) {
                        registrations_.erase(handle);
                    }
                    handles_by_wd_.erase(wd_it);
                }
            }
        }

        for (auto& [callback, path] : to_notify) {
            try {
                callback(path);
            } catch (const std::exception& e) {
                logger_->error("Exception in file change callback for " + path + ": " + e.what());
            }
        }
    }
}
