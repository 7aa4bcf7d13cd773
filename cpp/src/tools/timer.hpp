#pragma once

#include <chrono>
#include <string>

#include "sacredgeo/logging.hpp"

namespace sacredgeo::tools {

using Duration = std::chrono::nanoseconds;

class Timer {
private:
    std::chrono::steady_clock::time_point start_time_;
    std::chrono::steady_clock::time_point stop_time_;
    bool running_ = false;

public:
    void start() {
        start_time_ = std::chrono::steady_clock::now();
        stop_time_ = start_time_;
        running_ = true;
    }

    void stop() {
        if (!running_) return;
        stop_time_ = std::chrono::steady_clock::now();
        running_ = false;
    }

    // Time since start() while running, otherwise the last start/stop span.
    Duration get_elapsed() const {
        const auto end = running_ ? std::chrono::steady_clock::now() : stop_time_;
        return std::chrono::duration_cast<Duration>(end - start_time_);
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(get_elapsed()).count();
    }

    bool is_running() const { return running_; }
};

class ScopedTimer {
private:
    Timer& timer_;
    std::string label_;

public:
    ScopedTimer(Timer& timer, const std::string& label = "")
        : timer_(timer), label_(label) {
        timer_.start();
    }

    ~ScopedTimer() {
        timer_.stop();
        if (!label_.empty()) {
            LOG_DEBUG(Tools, label_, ": ", timer_.elapsed_ms(), " ms");
        }
    }
};

} // namespace sacredgeo::tools
