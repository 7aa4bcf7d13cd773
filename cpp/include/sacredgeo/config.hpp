#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>

#include "sacredgeo/archetypes.hpp"
#include "sacredgeo/error.hpp"
#include "sacredgeo/logging.hpp"
#include "sacredgeo/waves.hpp"

namespace sacredgeo {

class Config {
public:
    // log.level.<component> keys override log.level for one component
    static inline const std::string COMPONENT_LEVEL_PREFIX = "log.level.";

    static Config& getInstance() {
        static Config instance;
        return instance;
    }

    // Load configuration from environment variables and optional config file
    bool load(const std::string& config_file = "") {
        std::lock_guard<std::mutex> lock(mutex_);

        values_.clear();
        load_from_env();

        if (!config_file.empty() && std::filesystem::exists(config_file)) {
            load_from_file(config_file);
        }

        return validate();
    }

    // Get configuration value with default
    template<typename T>
    T get(const std::string& key, T default_value = T{}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return parse<T>(key, default_value);
    }

    void set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        values_[key] = value;
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return values_.count(key) > 0;
    }

    // Print current configuration (for debugging)
    void print() const {
        std::lock_guard<std::mutex> lock(mutex_);

        LOG_INFO(Config, "Current configuration:");
        for (const auto& [key, value] : values_) {
            LOG_INFO(Config, "  ", key, " = ", value);
        }
    }

private:
    Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Caller holds mutex_.
    template<typename T>
    T parse(const std::string& key, T default_value) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return default_value;
        }

        // Numbers must use the whole value: "64px" is rejected, not read as 64.
        const std::string& raw = it->second;
        size_t consumed = 0;
        try {
            if constexpr (std::is_same_v<T, int>) {
                const int value = std::stoi(raw, &consumed);
                if (consumed != raw.size()) throw std::invalid_argument(raw);
                return value;
            } else if constexpr (std::is_same_v<T, double>) {
                const double value = std::stod(raw, &consumed);
                if (consumed != raw.size()) throw std::invalid_argument(raw);
                return value;
            } else if constexpr (std::is_same_v<T, bool>) {
                std::string val = raw;
                std::transform(val.begin(), val.end(), val.begin(), ::tolower);
                return val == "true" || val == "1" || val == "yes" || val == "on";
            } else {
                return raw;
            }
        } catch (const std::exception&) {
            LOG_WARN(Config, "Failed to parse config value '", raw, "' for key '", key, "', using default");
            return default_value;
        }
    }

    void load_from_env() {
        // Logging configuration
        set_if_env("log.level", "SG_LOG_LEVEL", "info");
        set_if_env("log.file", "SG_LOG_FILE", "");

        // Engine configuration
        set_if_env("engine.archetype", "SG_ARCHETYPE", "generator");
        set_if_env("engine.breath_pattern", "SG_BREATH_PATTERN", "coherent");
        set_if_env("engine.subdivision_levels", "SG_SUBDIVISION_LEVELS", "2");
        set_if_env("engine.field_width", "SG_FIELD_WIDTH", "64");
        set_if_env("engine.field_height", "SG_FIELD_HEIGHT", "64");

        // Frame budget tool
        set_if_env("bench.frames", "SG_BENCH_FRAMES", "120");
        set_if_env("bench.budget_ms", "SG_BUDGET_MS", "4.0");
    }

    void set_if_env(const std::string& key, const std::string& env_var, const std::string& default_value) {
        const char* env_value = std::getenv(env_var.c_str());
        if (env_value && *env_value) {
            values_[key] = env_value;
        } else {
            values_[key] = default_value;
        }
    }

    void load_from_file(const std::string& filename) {
        std::ifstream file(filename);
        if (!file.is_open()) {
            LOG_WARN(Config, "Could not open config file: ", filename);
            return;
        }

        auto trim = [](std::string& s) {
            s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](int ch) { return !std::isspace(ch); }));
            s.erase(std::find_if(s.rbegin(), s.rend(), [](int ch) { return !std::isspace(ch); }).base(), s.end());
        };

        std::string line;
        while (std::getline(file, line)) {
            // Skip comments and empty lines
            if (line.empty() || line[0] == '#' || line[0] == ';') continue;

            size_t equals_pos = line.find('=');
            if (equals_pos != std::string::npos) {
                std::string key = line.substr(0, equals_pos);
                std::string value = line.substr(equals_pos + 1);
                trim(key);
                trim(value);

                if (!key.empty()) {
                    values_[key] = value;
                }
            }
        }

        LOG_INFO(Config, "Loaded configuration from file: ", filename);
    }

    // Caller holds mutex_.
    bool validate() {
        bool valid = true;

        std::string log_level = parse<std::string>("log.level", "info");
        LogLevel parsed_level;
        if (!parse_log_level(log_level, parsed_level)) {
            LOG_WARN(Config, "Unknown log level '", log_level, "', defaulting to 'info'");
            values_["log.level"] = "info";
        }

        // log.level.<component> overrides; bad entries are dropped
        for (auto it = values_.begin(); it != values_.end();) {
            if (it->first.rfind(COMPONENT_LEVEL_PREFIX, 0) != 0) {
                ++it;
                continue;
            }
            const std::string component = it->first.substr(COMPONENT_LEVEL_PREFIX.size());
            if (!parse_log_component(component) || !parse_log_level(it->second, parsed_level)) {
                LOG_WARN(Config, "Ignoring log level override ", it->first, " = '", it->second, "'");
                it = values_.erase(it);
            } else {
                ++it;
            }
        }

        const std::string archetype = parse<std::string>("engine.archetype", "");
        if (!archetype_from_name(archetype)) {
            LOG_ERROR(Config, "Unknown archetype: '", archetype, "'");
            valid = false;
        }

        const std::string pattern = parse<std::string>("engine.breath_pattern", "");
        if (!breath_pattern_from_name(pattern)) {
            LOG_ERROR(Config, "Unknown breath pattern: '", pattern, "'");
            valid = false;
        }

        for (const char* key : {"engine.subdivision_levels", "engine.field_width",
                                "engine.field_height", "bench.frames"}) {
            const int value = parse<int>(key, 0);
            if (value <= 0) {
                LOG_ERROR(Config, "Configuration value ", key, " must be a positive integer, got '",
                          parse<std::string>(key, ""), "'");
                valid = false;
            }
        }

        const double budget = parse<double>("bench.budget_ms", 0.0);
        if (!(budget > 0.0)) {
            LOG_ERROR(Config, "Configuration value bench.budget_ms must be positive, got '",
                      parse<std::string>("bench.budget_ms", ""), "'");
            valid = false;
        }

        return valid;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> values_;
};

/**
 * Snapshot of the engine keys. Core functions take these values as plain
 * arguments and never read Config themselves.
 */
struct EngineSettings {
    ArchetypeId archetype = DEFAULT_ARCHETYPE;
    BreathPattern breath_pattern = breath_patterns::COHERENT;
    int subdivision_levels = 2;
    size_t field_width = 64;
    size_t field_height = 64;
    int bench_frames = 120;
    double budget_ms = 4.0;

    // Throws ConfigError when a key holds an unknown name or a non-positive size.
    static EngineSettings from_config(const Config& config = Config::getInstance()) {
        EngineSettings settings;

        const std::string archetype = config.get<std::string>("engine.archetype", "generator");
        auto id = archetype_from_name(archetype);
        if (!id) {
            throw ConfigError("Unknown archetype '" + archetype + "'", "engine.archetype",
                              "Use manifestor, generator, manifesting-generator, projector, "
                              "reflector or enneagram-1 .. enneagram-9");
        }
        settings.archetype = *id;

        const std::string pattern = config.get<std::string>("engine.breath_pattern", "coherent");
        auto breath = breath_pattern_from_name(pattern);
        if (!breath) {
            throw ConfigError("Unknown breath pattern '" + pattern + "'", "engine.breath_pattern",
                              "Use coherent, box, triangle, extended or natural");
        }
        settings.breath_pattern = *breath;

        settings.subdivision_levels = require_positive(config, "engine.subdivision_levels", 2);
        settings.field_width = static_cast<size_t>(require_positive(config, "engine.field_width", 64));
        settings.field_height = static_cast<size_t>(require_positive(config, "engine.field_height", 64));
        settings.bench_frames = require_positive(config, "bench.frames", 120);

        settings.budget_ms = config.contains("bench.budget_ms")
            ? config.get<double>("bench.budget_ms", 0.0) : 4.0;
        if (!(settings.budget_ms > 0.0)) {
            throw ConfigError("bench.budget_ms must be positive", "bench.budget_ms");
        }
        return settings;
    }

private:
    static int require_positive(const Config& config, const std::string& key, int fallback) {
        if (!config.contains(key)) {
            return fallback;
        }
        const int value = config.get<int>(key, 0);
        if (value <= 0) {
            throw ConfigError(key + " must be a positive integer, got '" +
                              config.get<std::string>(key) + "'", key);
        }
        return value;
    }
};

// Initialize configuration on startup
inline bool init_config(const std::string& config_file = "sacredgeo.env") {
    Config& config = Config::getInstance();

    // Set log level from environment (before loading config)
    const char* log_level_env = std::getenv("SG_LOG_LEVEL");
    LogLevel level;
    if (log_level_env && parse_log_level(log_level_env, level)) {
        set_log_level(level);
    }

    if (!config.load(config_file)) {
        LOG_ERROR(Config, "Failed to load configuration");
        return false;
    }

    // The file may have changed the level
    if (parse_log_level(config.get<std::string>("log.level", "info"), level)) {
        set_log_level(level);
    }
    for (size_t i = 0; i < LOG_COMPONENT_COUNT; ++i) {
        const auto component = static_cast<LogComponent>(i);
        const std::string key = Config::COMPONENT_LEVEL_PREFIX + to_string(component);
        if (config.contains(key) && parse_log_level(config.get<std::string>(key), level)) {
            set_log_level(component, level);
        }
    }

    // Set log output file if specified
    std::string log_file = config.get<std::string>("log.file");
    if (!log_file.empty()) {
        static std::ofstream log_stream(log_file, std::ios::app);
        if (log_stream.is_open()) {
            set_log_output(log_stream);
        } else {
            LOG_ERROR(Config, "Could not open log file: ", log_file);
        }
    }

    LOG_INFO(Config, "Configuration loaded successfully");
    return true;
}

} // namespace sacredgeo
