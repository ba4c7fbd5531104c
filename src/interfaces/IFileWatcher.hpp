#pragma once

#include <cstdint>
#include <functional>
#include <string>

// OS-level file change notification.
class IFileWatcher {
public:
    using WatchHandle = std::uint64_t;
    using ChangeCallback = std::function<void(const std::string& path)>;

    virtual ~IFileWatcher() = default;

    // Registers onChange for modification, attribute change, deletion or move of path.
    // Throws FileNotFoundException if path does not exist.
    virtual WatchHandle watch(const std::string& path, ChangeCallback onChange) = 0;

    // Unknown or already released handles are ignored.
    virtual void unwatch(WatchHandle handle) = 0;
};
