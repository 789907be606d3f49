#pragma once

#include <typiconf/typiconf.hpp>
#include <string>
#include <filesystem>

namespace resmon {

struct MonitorConfig {
    int update_interval = 1;          // seconds between ticks
    std::string disk_path = "/";      // filesystem sampled for disk usage
    bool debug_logging = false;

    TYPICONF_DEFINE_FIELDS(MonitorConfig,
        TYPICONF_FIELD(update_interval),
        TYPICONF_FIELD(disk_path),
        TYPICONF_FIELD(debug_logging)
    )
};

struct StorageConfig {
    std::string alarms_path = "./alarms.json";

    TYPICONF_DEFINE_FIELDS(StorageConfig,
        TYPICONF_FIELD(alarms_path)
    )
};

struct LogConfig {
    std::string log_dir = "./logs";
    std::string log_name = "resmon.log";
    std::string fallback_name = "resmon_fallback.log";
    int ring_buffer_size = 256;       // undelivered entries kept in memory
    int history_limit = 5000;         // newest entries kept in memory for queries

    TYPICONF_DEFINE_FIELDS(LogConfig,
        TYPICONF_FIELD(log_dir),
        TYPICONF_FIELD(log_name),
        TYPICONF_FIELD(fallback_name),
        TYPICONF_FIELD(ring_buffer_size),
        TYPICONF_FIELD(history_limit)
    )
};

struct NotifyConfig {
    bool enabled = true;
    bool beep_on_trigger = false;

    TYPICONF_DEFINE_FIELDS(NotifyConfig,
        TYPICONF_FIELD(enabled),
        TYPICONF_FIELD(beep_on_trigger)
    )
};

struct DisplayConfig {
    std::string color_scheme = "default";   // "default" | "mono"

    TYPICONF_DEFINE_FIELDS(DisplayConfig,
        TYPICONF_FIELD(color_scheme)
    )
};

struct ResMonConfig {
    std::string version = "1.0";
    MonitorConfig monitor;
    StorageConfig storage;
    LogConfig log;
    NotifyConfig notify;
    DisplayConfig display;

    bool validate() const;

    TYPICONF_DEFINE_FIELDS(ResMonConfig,
        TYPICONF_FIELD(version),
        TYPICONF_FIELD(monitor),
        TYPICONF_FIELD(storage),
        TYPICONF_FIELD(log),
        TYPICONF_FIELD(notify),
        TYPICONF_FIELD(display)
    )
};

class ConfigManager {
public:
    explicit ConfigManager(const std::string& config_path);

    // Load configuration
    bool load();

    // Reload if file changed (hot-reload). A changed file that fails
    // validation leaves the current config in place and sets error_msg.
    bool check_and_reload();
    bool check_and_reload(std::string& error_msg);

    // Access configuration
    const ResMonConfig& get_config() const { return config_; }
    const std::string& path() const { return config_path_; }

    // Validation
    bool validate_config(std::string& error_msg) const;
    static bool validate(const ResMonConfig& config, std::string& error_msg);

private:
    std::string config_path_;
    ResMonConfig config_;
    std::filesystem::file_time_type last_modified_;
    std::filesystem::file_time_type rejected_modified_;
};

} // namespace resmon
