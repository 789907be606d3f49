#pragma once

#include <atomic>
#include <iostream>
#include <mutex>

namespace resmon {

// Developer diagnostics on stderr, toggled by monitor.debug_logging.
// The event log is the user-facing record; this is not.
class DebugLogger {
public:
    static void set_enabled(bool enabled) { enabled_ = enabled; }
    static bool is_enabled() { return enabled_; }

    template<typename... Args>
    static void log(Args&&... args) {
        if (enabled_) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::cerr << "[DEBUG] ";
            ((std::cerr << args), ...);
            std::cerr << std::endl;
        }
    }

private:
    static std::atomic<bool> enabled_;
    static std::mutex mutex_;
};

} // namespace resmon
