#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../config/AppConfig.hpp"

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
    static std::optional<int> stringToInt(const std::string& str) {
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
        if (std::string::npos == first) return "";
        size_t last = str.find_last_not_of(" \t\n\r");
        return str.substr(first, (last - first + 1));
    }

    // Function to parse key-value pairs from a string (using optional version)
    static std::optional<std::map<std::string, std::string>> parseArguments(const std::vector<std::string>& args) {
        std::map<std::string, std::string> argMap;
        for (const std::string& arg : args) {
            size_t delimiterPos = arg.find('=');
            if (delimiterPos != std::string::npos && delimiterPos > 0) { // Ensure key is not empty
                std::string key = arg.substr(0, delimiterPos);
                std::string value = arg.substr(delimiterPos + 1);
                argMap[key] = value;
            } else {
                std::cerr << "Error: Invalid argument format: '" << arg << "'. Expected non-empty key=value format." << std::endl;
                return std::nullopt; // Signal failure
            }
        }
        return argMap; // Signal success
    }

    static std::vector<std::string> defaultConfigPaths() {
        return {
            Constants::CONFIG_FILE_NAME,                                   // Current directory
            std::string("../") + Constants::CONFIG_FILE_NAME,              // Parent directory
            std::string("/etc/memocache/") + Constants::CONFIG_FILE_NAME   // System-wide
        };
    }

    // Applies one key=value setting. Unknown keys and invalid values warn on stderr and
    // leave the config untouched. Returns true if the setting was applied.
    static bool applySetting(AppConfig& config, const std::string& key, const std::string& value) {
        if (key == "cache_capacity") {
            return applyInt(key, value, 1, config.cache_capacity);
        } else if (key == "cache_ttl_millis") {
            return applyOptionalInt(key, value, 0, config.cache_ttl_millis);
        } else if (key == "wait_timeout_millis") {
            return applyOptionalInt(key, value, 1, config.wait_timeout_millis);
        } else if (key == "sweep_interval_millis") {
            return applyInt(key, value, 0, config.sweep_interval_millis);
        } else if (key == "log_level") {
            try {
                config.log_level = stringToLogLevel(value);
                return true;
            } catch (const std::invalid_argument& e) {
                std::cerr << "Warning: " << e.what() << std::endl;
                return false;
            }
        } else if (key == "metrics_batch_size") {
            return applyInt(key, value, 0, config.metrics_batch_size);
        } else if (key == "metrics_send_interval_millis") {
            return applyInt(key, value, 1, config.metrics_send_interval_millis);
        } else if (key == "worker_threads") {
            return applyInt(key, value, 1, config.worker_threads);
        } else if (key == "demo_requests") {
            return applyInt(key, value, 0, config.demo_requests);
        } else if (key == "demo_key_space") {
            return applyInt(key, value, 1, config.demo_key_space);
        } else if (key == "demo_producer_latency_millis") {
            return applyInt(key, value, 0, config.demo_producer_latency_millis);
        }
        std::cerr << "Warning: Unknown configuration key ignored: " << key << std::endl;
        return false;
    }

    // Loads the first config file found in config_paths, then applies startupArguments on top.
    static AppConfig loadConfiguration(const std::map<std::string, std::string>& startupArguments,
                                       const std::vector<std::string>& config_paths = defaultConfigPaths()) {
        AppConfig config;

        // --- Load from Config File ---
        bool config_found = false;
        for (const auto& config_path : config_paths) {
            std::ifstream configFile(config_path);
            if (configFile.is_open()) {
                std::cout << "Reading configuration from " << config_path << "..." << std::endl;
                config_found = true;
                std::string line;
                while (std::getline(configFile, line)) {
                    line = trim(line);
                    if (line.empty() || line[0] == '#') { // Skip empty lines and comments
                        continue;
                    }
                    size_t delimiterPos = line.find('=');
                    if (delimiterPos != std::string::npos && delimiterPos > 0) {
                        applySetting(config, trim(line.substr(0, delimiterPos)), trim(line.substr(delimiterPos + 1)));
                    } else {
                        std::cerr << "Warning: Malformed line in config file " << config_path << ": " << line << std::endl;
                    }
                }
                break;
            }
        }

        if (!config_found) {
            std::cerr << "Warning: Configuration file not found in any standard location. Using defaults and command-line arguments." << std::endl;
        }

        // Command-line arguments override the file
        for (const auto& [key, value] : startupArguments) {
            applySetting(config, key, value);
        }
        return config;
    }

private:
    static bool applyInt(const std::string& key, const std::string& value, int minimum, int& target) {
        auto val = stringToInt(value);
        if (!val || *val < minimum) {
            std::cerr << "Warning: Invalid integer for " << key << ": '" << value
                      << "' (minimum " << minimum << "), keeping " << target << std::endl;
            return false;
        }
        target = *val;
        return true;
    }

    // "none" or "off" clears the value.
    static bool applyOptionalInt(const std::string& key, const std::string& value, int minimum, std::optional<int>& target) {
        std::string lowered = value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
        if (lowered == "none" || lowered == "off") {
            target = std::nullopt;
            return true;
        }
        int parsed = target.value_or(0);
        if (!applyInt(key, value, minimum, parsed)) {
            return false;
        }
        target = parsed;
        return true;
    }
};

#endif // UTILS_HPP
