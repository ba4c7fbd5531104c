// tests/TestMocks.hpp
#pragma once

#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include "gmock/gmock.h"

#include "../src/interfaces/IFileWatcher.hpp"
#include "../src/interfaces/ILogger.hpp"
#include "../src/interfaces/IStatsDClient.hpp"
#include "../src/models/CacheExceptions.hpp"

// --- Mock Logger ---
class MockLogger : public ILogger {
public:
    MOCK_METHOD(void, info, (const std::string& message), (override));
    MOCK_METHOD(void, debug, (const std::string& message), (override));
    MOCK_METHOD(void, warn, (const std::string& message), (override));
    MOCK_METHOD(void, error, (const std::string& message), (override));
    MOCK_METHOD(void, setup, (const std::string& message), (override));
    MOCK_METHOD(int, getLogLevel, (), (override));
};

// --- Mock StatsD client ---
class MockStatsDClient : public IStatsDClient {
public:
    MOCK_METHOD(void, increment, (const std::string& key, int value), (override));
    MOCK_METHOD(void, gauge, (const std::string& key, double value), (override));
    MOCK_METHOD(void, timing, (const std::string& key, std::chrono::milliseconds value), (override));
};

// --- Fake watcher: changes are fired by the test instead of the kernel ---
class FakeFileWatcher : public IFileWatcher {
public:
    WatchHandle watch(const std::string& path, ChangeCallback onChange) override {
        if (!std::filesystem::exists(path)) {
            throw FileNotFoundException(path);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        WatchHandle handle = next_handle_++;
        watches_[handle] = {path, std::move(onChange)};
        return handle;
    }

    void unwatch(WatchHandle handle) override {
        std::lock_guard<std::mutex> lock(mutex_);
        watches_.erase(handle);
    }

    // Fires every callback registered for path.
    void fireChange(const std::string& path) {
        std::vector<ChangeCallback> callbacks;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto& [handle, entry] : watches_) {
                if (entry.first == path) {
                    callbacks.push_back(entry.second);
                }
            }
        }
        for (auto& callback : callbacks) {
            callback(path);
        }
    }

    size_t activeWatchCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        return watches_.size();
    }

private:
    std::mutex mutex_;
    WatchHandle next_handle_ = 1;
    std::map<WatchHandle, std::pair<std::string, ChangeCallback>> watches_;
};

// Creates a uniquely named file under the system temp directory and deletes it on destruction.
class TempFile {
public:
    explicit TempFile(const std::string& name, const std::string& contents = "v1") {
        path_ = (std::filesystem::temp_directory_path() /
                 (name + "_" + std::to_string(::getpid()) + "_" +
                  std::to_string(counter()++))).string();
        write(contents);
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    void write(const std::string& contents) const {
        std::ofstream out(path_, std::ios::trunc);
        out << contents;
    }

    const std::string& path() const { return path_; }

private:
    static int& counter() {
        static int value = 0;
        return value;
    }

    std::string path_;
};
