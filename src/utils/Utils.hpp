#ifndef UTILS_HPP
#define UTILS_HPP

#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/CacheConfig.hpp"

using namespace std;

class Utils {
public:
    // Converts a string to a LogLevel enum
    static LogUtils::LogLevel stringToLogLevel(const std::string& level) {
        if (level == "DEBUG") return LogUtils::LogLevel::DEBUG;
        if (level == "INFO") return LogUtils::LogLevel::INFO;
        if (level == "WARNING") return LogUtils::LogLevel::WARN;
        if (level == "CERROR") return LogUtils::LogLevel::CERROR;
        throw std::invalid_argument("Invalid log level: " + level);
    }

    // Helper to parse integer safely
    static optional<int> stringToInt(const std::string& str) {
        try {
            size_t pos;
            int val = std::stoi(str, &pos);
            // Check if the entire string was consumed
            if (pos == str.length()) {
                return val;
            }
        } catch (const std::invalid_argument&) {
            // Not an integer
        } catch (const std::out_of_range&) {
            // Integer out of range
        }
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Parses key=value startup arguments. Returns nullopt on the first malformed one.
    static optional<map<string, string>> parseArguments(const vector<string>& args) {
        map<string, string> argMap;
        for (const string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) { // Ensure key is not empty
                string key = arg.substr(0, delimiterPos);
                string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << endl;
                return nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    // Applies one configuration setting. Unknown keys and bad values are reported and ignored.
    // Returns true if the setting was applied.
    static bool applySetting(CacheConfig& config, const std::string& key, const std::string& value) {
        if (key == "store_max_entries") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.store_max_entries = static_cast<size_t>(*val);
                return true;
            }
            cerr << "Warning: Invalid positive integer for store_max_entries: " << value << endl;
        } else if (key == "async_worker_threads") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.async_worker_threads = *val;
                return true;
            }
            cerr << "Warning: Invalid positive integer for async_worker_threads: " << value << endl;
        } else if (key == "watcher_poll_interval_millis") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.watcher_poll_interval_millis = *val;
                return true;
            }
            cerr << "Warning: Invalid positive integer for watcher_poll_interval_millis: " << value << endl;
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
            }
        } else if (key == "metrics_enabled") {
            if (auto val = stringToInt(value); val && (*val == 0 || *val == 1)) {
                config.metrics_enabled = (*val == 1);
                return true;
            }
            cerr << "Warning: Expected 0 or 1 for metrics_enabled: " << value << endl;
        } else if (key == "metrics_batch_size") {
            if (auto val = stringToInt(value); val && *val >= 0) {
                config.metrics_batch_size = *val;
                return true;
            }
            cerr << "Warning: Invalid non-negative integer for metrics_batch_size: " << value << endl;
        } else if (key == "metrics_send_interval_millis") {
            if (auto val = stringToInt(value); val && *val > 0) {
                config.metrics_send_interval_millis = *val;
                return true;
            }
            cerr << "Warning: Invalid positive integer for metrics_send_interval_millis: " << value << endl;
        } else if (key != "config") {
            cerr << "Warning: Unknown configuration key: " << key << endl;
        }
        return false;
    }

    // Reads key=value lines; '#' starts a comment line. Returns false if the file cannot be opened.
    static bool readConfigFile(const std::string& path, CacheConfig& config) {
        std::ifstream configFile(path);
        if (!configFile.is_open()) {
            return false;
        }
        std::string line;
        while (getline(configFile, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t delimiterPos = line.find('=');
            if (delimiterPos != string::npos && delimiterPos > 0) {
                applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
            } else {
                cerr << "Warning: Ignoring malformed config line: " << line << endl;
            }
        }
        return true;
    }

    // Loads the first config file found (config=<path> takes precedence over the
    // standard locations), then applies startup arguments on top of it.
    static CacheConfig loadConfiguration(const map<string, string>& startupArguments) {
        CacheConfig config;

        std::vector<std::string> config_paths;
        auto explicit_path = startupArguments.find("config");
        if (explicit_path != startupArguments.end()) {
            config_paths.push_back(explicit_path->second);
        } else {
            config_paths = {
                Constants::CONFIG_FILE_NAME,                          // Current directory
                std::string("../") + Constants::CONFIG_FILE_NAME,     // Parent directory
                std::string("/etc/localcache/") + Constants::CONFIG_FILE_NAME
            };
        }

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            if (readConfigFile(config_path, config)) {
                cout << "Read configuration from " << config_path << endl;
                config_found = true;
                break;
            }
        }
        if (!config_found) {
            cerr << "Warning: Configuration file not found. Using defaults and command-line arguments." << endl;
        }

        for (const auto& [key, value] : startupArguments) {
            applySetting(config, key, value);
        }
        return config;
    }
};

#endif // UTILS_HPP
