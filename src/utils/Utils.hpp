#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../config/AppConfig.hpp"
#include "../core/CacheErrors.hpp"

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

    static optional<int64_t> stringToInt64(const std::string& str) {
        try {
            size_t pos;
            long long val = std::stoll(str, &pos);
            if (pos == str.length()) {
                return static_cast<int64_t>(val);
            }
        } catch (const std::invalid_argument&) {
        } catch (const std::out_of_range&) {
        }
        return std::nullopt;
    }

    // Accepts 1/0, true/false, yes/no
    static optional<bool> stringToBool(const std::string& str) {
        if (str == "1" || str == "true" || str == "yes") return true;
        if (str == "0" || str == "false" || str == "no") return false;
        return std::nullopt;
    }

    // Helper to trim whitespace from start and end of string
    static std::string trim(const std::string& str) {
        size_t first = str.find_first_not_of(" \t\n\r");
        if (string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
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

    // Applies one configuration key. Returns false for keys it does not know.
    // A known key with a malformed value warns and keeps the current value.
    static bool applyConfigValue(AppConfig& config, const string& key, const string& value) {
        auto intField = [&](int& field) {
            if (auto val = stringToInt(value)) {
                field = *val;
            } else {
                cerr << "Warning: Invalid integer for " << key << ": " << value << endl;
            }
        };
        auto boolField = [&](bool& field) {
            if (auto val = stringToBool(value)) {
                field = *val;
            } else {
                cerr << "Warning: Invalid boolean for " << key << ": " << value << endl;
            }
        };

        if (key == "default_ttl") {
            intField(config.default_ttl_seconds);
        } else if (key == "max_size") {
            intField(config.max_size);
        } else if (key == "track_stats") {
            boolField(config.track_stats);
        } else if (key == "sweep_interval") {
            intField(config.sweep_interval_seconds);
        } else if (key == "use_redis") {
            boolField(config.use_redis);
        } else if (key == "redis_host") {
            config.redis_host = value;
        } else if (key == "redis_port") {
            intField(config.redis_port);
        } else if (key == "redis_password") {
            config.redis_password = value;
        } else if (key == "redis_database") {
            intField(config.redis_database);
        } else if (key == "redis_connect_timeout") {
            // value provided in millis
            intField(config.redis_connect_timeout_millis);
        } else if (key == "redis_key_prefix") {
            config.redis_key_prefix = value;
        } else if (key == "redis_pool_max_total") {
            intField(config.redis_pool_max_total);
        } else if (key == "redis_pool_max_idle") {
            intField(config.redis_pool_max_idle);
        } else if (key == "redis_pool_min_idle") {
            intField(config.redis_pool_min_idle);
        } else if (key == "redis_pool_wait_timeout") {
            intField(config.redis_pool_wait_timeout_millis);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
            } catch (const std::invalid_argument& e) {
                cerr << "Warning: " << e.what() << endl;
            }
        } else if (key == "metrics_batch_size") {
            intField(config.metrics_batch_size);
        } else if (key == "metrics_send_interval") {
            // value provided in millis
            intField(config.metrics_send_interval_in_millis);
        } else {
            return false;
        }
        return true;
    }

    // Reads distcache.config from the standard locations, then applies
    // command-line overrides on top. Unknown keys are ignored.
    static AppConfig loadConfiguration(const map<string, string>& startupArguments,
                                       const vector<string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                cerr << "Reading configuration from " << config_path << "..." << endl;
                config_found = true;
                std::string line;
                while (getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != string::npos && delimiterPos > 0) {
                        string key = trim(line.substr(0, delimiterPos));
                        string value = trim(line.substr(delimiterPos + 1));
                        applyConfigValue(config, key, value);
                    }
                }
                break;
            }
        }

        if (!config_found) {
            cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << endl;
        }

        for (const auto& [key, value] : startupArguments) {
            applyConfigValue(config, key, value);
        }

        return config;
    }

    static vector<string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                          // Current directory
            string("../") + Constants::CONFIG_FILE_NAME,          // Parent directory
            string("/etc/distcache/") + Constants::CONFIG_FILE_NAME
        };
    }

    // Rejects configurations the caches can not be built from.
    static void validateConfig(const AppConfig& config) {
        if (config.default_ttl_seconds < 0) {
            throw ValidationError("default_ttl must not be negative: " + std::to_string(config.default_ttl_seconds));
        }
        if (config.max_size < 0) {
            throw ValidationError("max_size must not be negative: " + std::to_string(config.max_size));
        }
        if (config.sweep_interval_seconds <= 0) {
            throw ValidationError("sweep_interval must be positive: " + std::to_string(config.sweep_interval_seconds));
        }
        if (config.redis_port <= 0 || config.redis_port > 65535) {
            throw ValidationError("redis_port out of range: " + std::to_string(config.redis_port));
        }
        if (config.redis_database < 0) {
            throw ValidationError("redis_database must not be negative: " + std::to_string(config.redis_database));
        }
        if (config.redis_pool_max_total <= 0) {
            throw ValidationError("redis_pool_max_total must be positive");
        }
        if (config.redis_pool_min_idle < 0 || config.redis_pool_max_idle < config.redis_pool_min_idle) {
            throw ValidationError("redis pool idle bounds must satisfy 0 <= min_idle <= max_idle");
        }
    }

    // --- Contract argument checks ---

    static void validateKey(const std::string& key) {
        if (key.empty()) {
            throw ValidationError("Cache key must not be empty");
        }
    }

    static void validateTtl(int64_t ttl) {
        if (ttl < 0) {
            throw ValidationError("TTL must not be negative: " + std::to_string(ttl));
        }
    }

    static void validatePattern(const std::string& pattern) {
        if (pattern.empty()) {
            throw ValidationError("Key pattern must not be empty");
        }
    }

    // Namespaces become literal key prefixes inside glob patterns,
    // so they may not contain wildcards themselves.
    static void validateNamespace(const std::string& ns) {
        if (ns.empty()) {
            throw ValidationError("Namespace must not be empty");
        }
        if (ns.find_first_of("*?") != std::string::npos) {
            throw ValidationError("Namespace must not contain '*' or '?': " + ns);
        }
    }

    static int requireNonNegative(int value, const std::string& name) {
        if (value < 0) {
            throw ValidationError(name + " must not be negative: " + std::to_string(value));
        }
        return value;
    }

    // Parses "field:value" lines of a Redis INFO reply. Section headers
    // ("# Stats") and blank lines are skipped.
    static map<string, string> parseRedisInfo(const std::string& info) {
        map<string, string> fields;
        std::istringstream in(info);
        std::string line;
        while (getline(in, line)) {
            line = trim(line);
            if (line.empty() || line[0] == '#') {
                continue;
            }
            size_t colon = line.find(':');
            if (colon == string::npos || colon == 0) {
                continue;
            }
            fields[line.substr(0, colon)] = line.substr(colon + 1);
        }
        return fields;
    }
};

#endif // UTILS_HPP
