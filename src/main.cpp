#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/CacheConfig.hpp"
#include "core/CacheProvider.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "store/InMemoryStore.hpp"
#include "utils/Utils.hpp"
#include "watcher/InotifyFileWatcher.hpp"

using json = nlohmann::json;
using namespace std;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const CacheConfig& config, std::shared_ptr<ILogger> logger_) {
    if (!config.metrics_enabled) {
        logger_->setup("Metrics disabled. Creating DummyStatsDClient instance.");
        return DummyStatsDClient::getInstance();
    }

    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv(Constants::STATSD_SERVER_ENV);
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }

    try {
        if (!statsd_server_endpoint.empty()) {
            logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
            return std::make_shared<StatsDClient>(logger_, statsd_server_endpoint,
                                                  static_cast<size_t>(config.metrics_batch_size),
                                                  std::chrono::milliseconds(config.metrics_send_interval_millis));
        }
    } catch (const std::exception& e) {
        logger_->error(std::string("StatsDClient creation failed: ") + e.what());
    }

    logger_->setup("No usable STATSD_SERVER. Creating DummyStatsDClient instance.");
    return DummyStatsDClient::getInstance();
}

// --- Command handling ---
// One command per line:
//   set <key> <value> <ttlMinutes>
//   setfile <key> <value> <path>
//   get <key> | isset <key> | remove <key>
//   removepattern <regex> | stats | quit
bool handleCommand(CacheProvider& cache, const std::string& line, std::ostream& out) {
    std::istringstream in(line);
    std::string command;
    in >> command;

    if (command.empty()) {
        return true;
    }
    if (command == "quit" || command == "exit") {
        return false;
    }

    std::string key;
    if (command == "set") {
        std::string value, ttl;
        in >> key >> value >> ttl;
        auto ttl_minutes = Utils::stringToInt(ttl);
        if (!ttl_minutes || *ttl_minutes < 0) {
            out << "ERR ttlMinutes must be a non-negative integer" << endl;
            return true;
        }
        cache.set(key, value, static_cast<std::uint32_t>(*ttl_minutes));
        out << "OK" << endl;
    } else if (command == "setfile") {
        std::string value, path;
        in >> key >> value >> path;
        cache.set(key, value, path);
        out << "OK" << endl;
    } else if (command == "get") {
        in >> key;
        auto result = cache.tryGet<std::string>(key);
        if (result.isFound()) {
            out << *result.value << endl;
        } else {
            out << "(nil)" << endl;
        }
    } else if (command == "isset") {
        in >> key;
        out << std::boolalpha << cache.isSet(key) << std::noboolalpha << endl;
    } else if (command == "remove") {
        in >> key;
        cache.remove(key);
        out << "OK" << endl;
    } else if (command == "removepattern") {
        std::string pattern;
        std::getline(in >> std::ws, pattern);
        out << cache.removeByPattern(pattern) << endl;
    } else if (command == "stats") {
        out << json(cache.stats()).dump(2) << endl;
    } else {
        out << "ERR unknown command: " << command << endl;
    }
    return true;
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        CacheConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        auto store = std::make_shared<InMemoryStore>(config_.store_max_entries);
        auto watcher = std::make_shared<InotifyFileWatcher>(
            logger_, std::chrono::milliseconds(config_.watcher_poll_interval_millis));

        CacheProvider cache(config_, store, watcher, logger_, statsd_client);
        logger_->setup("CacheProvider ready. Reading commands from stdin.");

        std::string line;
        while (std::getline(std::cin, line)) {
            try {
                if (!handleCommand(cache, Utils::trim(line), std::cout)) {
                    break;
                }
            } catch (const FileNotFoundException& e) {
                std::cout << "ERR " << e.what() << endl;
            } catch (const std::invalid_argument& e) {
                std::cout << "ERR " << e.what() << endl;
            } catch (const TypeMismatchException& e) {
                std::cout << "ERR " << e.what() << endl;
            }
        }
        logger_->setup("Shutting down.");
        return 0;
    } catch (const std::exception& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(std::string("Unhandled exception: ") + e.what());
        return 1;
    }
}
