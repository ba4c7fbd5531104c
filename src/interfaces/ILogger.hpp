#pragma once

#include <string>

// Levelled logger shared by the provider, the store and the watcher.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    // Startup messages, printed regardless of level.
    virtual void setup(const std::string& message) = 0;
    virtual int getLogLevel() = 0;
};
