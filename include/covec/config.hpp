#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "covec/logging.hpp"

namespace covec {

/**
 * Process-wide runtime settings for the CLI and the ambient stack.
 *
 * Sources, later ones winning: built-in defaults, COVEC_* environment
 * variables, an optional "key = value" file, explicit set() calls (CLI flags).
 * Feature variant parameters are compile-time presets and never read from here.
 */
class Config {
public:
    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        load_from_env();

        if (!config_file.empty()) {
            if (std::filesystem::exists(config_file)) {
                load_from_file(config_file);
            } else {
                LOG_WARN("Config file not found: ", config_file);
            }
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return get_unlocked<T>(key, default_value);
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.find(key) != values_.end();
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    // Drop every value; used between CLI invocations in tests
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        values_.clear();
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    template<typename T>
    T get_unlocked(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        try {
            if constexpr (std::is_same_v<T, int>) {
                return std::stoi(it->second);
            } else if constexpr (std::is_same_v<T, size_t>) {
                return static_cast<size_t>(std::stoull(it->second));
            } else if constexpr (std::is_same_v<T, double>) {
                return std::stod(it->second);
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = it->second;
                std::transform(val.begin(), val.end(), val.begin(),
                               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return it->second;
            }
        } catch (const std::exception&) {
            LOG_WARN("Failed to parse config value for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        set_if_env("log.level", "COVEC_LOG_LEVEL", "info");
        set_if_env("log.file", "COVEC_LOG_FILE", "");

        set_if_env("data.train", "COVEC_TRAIN_PATH", "");
        set_if_env("data.test", "COVEC_TEST_PATH", "");
        set_if_env("output.dir", "COVEC_OUTPUT_DIR", ".");
    }

    void set_if_env(const std::string& key, const char* env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var);
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else if (values_.find(key) == values_.end()) {
            values_[key] = default_value;
        }
    }

    static std::string trim(std::string s) {
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
        s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(), s.end());
        return s;
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN("Could not open config file: ", filename);
            return;
        }

        std::string line;
        while (std::getline(file, line)) {
            line = trim(line);
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos == std::string::npos) {
                LOG_WARN("Ignoring malformed config line: ", line);
                continue;
            }

            std::string key = trim(line.substr(0, equals_pos));
            std::string value = trim(line.substr(equals_pos + 1));
            if (!key.empty()) {
                values_[key] = value;
            }
        }

        LOG_INFO("Loaded configuration from file: ", filename);
    }

    bool validate() {
        std::string log_level = get_unlocked<std::string>("log.level", "info");
        std::transform(log_level.begin(), log_level.end(), log_level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (log_level != "debug" && log_level != "info" && log_level != "warn" &&
            log_level != "warning" && log_level != "error" && log_level != "off") {
            LOG_WARN("Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }
        return true;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

// Load configuration and apply its logging settings
inline bool init_config(const std::string& config_file = "") {
    Config& config = Config::getInstance();

    if (!config.load(config_file)) {
        LOG_ERROR("Failed to load configuration");
        return false;
    }

    set_log_level(parse_log_level(config.get<std::string>("log.level", "info")));

    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty() && !Logger::getInstance().setOutputFile(log_file)) {
        LOG_ERROR("Could not open log file: ", log_file);
    }

    LOG_DEBUG("Configuration loaded");
    return true;
}

} // namespace covec
