#pragma once

#include <array>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace sacredgeo {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    FATAL = 4
};

/**
 * Engine subsystem a log line belongs to. Every line carries the tag and
 * each subsystem has its own threshold, so e.g. per-pass subdivision output
 * can be enabled without flooding the frame loop.
 */
enum class LogComponent {
    Waves = 0,
    Subdivision,
    Archetypes,
    Transform,
    Config,
    Tools,
    COUNT
};

constexpr size_t LOG_COMPONENT_COUNT = static_cast<size_t>(LogComponent::COUNT);

inline const char* to_string(LogComponent component) noexcept {
    switch (component) {
        case LogComponent::Waves:       return "waves";
        case LogComponent::Subdivision: return "subdivision";
        case LogComponent::Archetypes:  return "archetypes";
        case LogComponent::Transform:   return "transform";
        case LogComponent::Config:      return "config";
        case LogComponent::Tools:       return "tools";
        case LogComponent::COUNT:       break;
    }
    return "unknown";
}

inline std::optional<LogComponent> parse_log_component(const std::string& name) {
    for (size_t i = 0; i < LOG_COMPONENT_COUNT; ++i) {
        const auto component = static_cast<LogComponent>(i);
        if (name == to_string(component)) {
            return component;
        }
    }
    return std::nullopt;
}

class Logger {
public:
    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    // Applies to every component, dropping per-component overrides.
    void setLevel(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        levels_.fill(level);
    }

    void setLevel(LogComponent component, LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        levels_[static_cast<size_t>(component)] = level;
    }

    LogLevel level(LogComponent component) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return levels_[static_cast<size_t>(component)];
    }

    void setOutput(std::ostream& stream) {
        std::lock_guard<std::mutex> lock(mutex_);
        output_ = &stream;
    }

    template<typename... Args>
    void log(LogLevel level, LogComponent component, const char* file, int line,
             const char* func, Args&&... args) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (level < levels_[static_cast<size_t>(component)]) return;

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count();

        const char* level_str = "UNKN";
        switch (level) {
            case LogLevel::DEBUG: level_str = "DEBG"; break;
            case LogLevel::INFO:  level_str = "INFO"; break;
            case LogLevel::WARN:  level_str = "WARN"; break;
            case LogLevel::ERROR: level_str = "EROR"; break;
            case LogLevel::FATAL: level_str = "FATL"; break;
        }

        const char* filename = std::strrchr(file, '/');
        if (!filename) filename = std::strrchr(file, '\\');
        filename = filename ? filename + 1 : file;

        std::stringstream msg;
        msg << "[" << ss.str() << "] " << level_str << " [" << to_string(component) << "] "
            << filename << ":" << line << " " << func << "() - ";
        format_message(msg, std::forward<Args>(args)...);

        *output_ << msg.str() << std::endl;

        if (level == LogLevel::FATAL) {
            *output_ << std::flush;
            std::abort();
        }
    }

private:
    Logger() : output_(&std::cout) {
        levels_.fill(LogLevel::INFO);
    }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void format_message(std::stringstream&) {}

    template<typename T, typename... Args>
    void format_message(std::stringstream& ss, T&& value, Args&&... args) {
        ss << value;
        format_message(ss, std::forward<Args>(args)...);
    }

    std::array<LogLevel, LOG_COMPONENT_COUNT> levels_;
    std::ostream* output_;
    mutable std::mutex mutex_;
};

// First argument names the component: LOG_WARN(Archetypes, "Unknown id ", id)
#define LOG_DEBUG(component, ...) sacredgeo::Logger::getInstance().log(sacredgeo::LogLevel::DEBUG, sacredgeo::LogComponent::component, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_INFO(component, ...)  sacredgeo::Logger::getInstance().log(sacredgeo::LogLevel::INFO,  sacredgeo::LogComponent::component, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_WARN(component, ...)  sacredgeo::Logger::getInstance().log(sacredgeo::LogLevel::WARN,  sacredgeo::LogComponent::component, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_ERROR(component, ...) sacredgeo::Logger::getInstance().log(sacredgeo::LogLevel::ERROR, sacredgeo::LogComponent::component, __FILE__, __LINE__, __func__, __VA_ARGS__)
#define LOG_FATAL(component, ...) sacredgeo::Logger::getInstance().log(sacredgeo::LogLevel::FATAL, sacredgeo::LogComponent::component, __FILE__, __LINE__, __func__, __VA_ARGS__)

inline void set_log_level(LogLevel level) {
    Logger::getInstance().setLevel(level);
}

inline void set_log_level(LogComponent component, LogLevel level) {
    Logger::getInstance().setLevel(component, level);
}

inline void set_log_output(std::ostream& stream) {
    Logger::getInstance().setOutput(stream);
}

// Parses "debug" / "info" / "warn" / "error" / "fatal"; false for anything else.
inline bool parse_log_level(const std::string& name, LogLevel& out) {
    if (name == "debug") { out = LogLevel::DEBUG; return true; }
    if (name == "info")  { out = LogLevel::INFO;  return true; }
    if (name == "warn")  { out = LogLevel::WARN;  return true; }
    if (name == "error") { out = LogLevel::ERROR; return true; }
    if (name == "fatal") { out = LogLevel::FATAL; return true; }
    return false;
}

} // namespace sacredgeo
