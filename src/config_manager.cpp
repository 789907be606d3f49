#include "resmon/config_manager.hpp"
#include "resmon/debug_logger.hpp"
#include <iostream>
#include <fstream>
#include <sstream>

// Minimal YAML subset: top-level "section:" headers followed by indented
// "key: value" pairs. typiconf supplies the field reflection only.
namespace resmon {

bool ResMonConfig::validate() const {
    if (monitor.update_interval <= 0 || monitor.update_interval > 3600) {
        return false;
    }
    if (monitor.disk_path.empty() || storage.alarms_path.empty()) {
        return false;
    }
    if (log.log_dir.empty() || log.log_name.empty() || log.ring_buffer_size <= 0 ||
        log.history_limit <= 0) {
        return false;
    }
    return true;
}

ConfigManager::ConfigManager(const std::string& config_path)
    : config_path_(config_path)
    , last_modified_{}
    , rejected_modified_{}
{
}

// Helper function to trim whitespace
static std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\n\r");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\n\r");
    return str.substr(first, last - first + 1);
}

// Helper to parse int value from string
static int parse_int(const std::string& value) {
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        return 0;
    }
}

// Helper to parse bool value from string
static bool parse_bool(const std::string& value) {
    std::string lower = value;
    for (char& c : lower) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower == "true" || lower == "yes" || lower == "1";
}

// Value part of a "key: value" line, without quotes or a trailing comment
static std::string clean_value(const std::string& raw) {
    std::string value = trim(raw);
    if (value.empty() || value.front() == '#') {
        return "";
    }

    if (value.front() == '"') {
        size_t closing = value.find('"', 1);
        if (closing != std::string::npos) {
            return value.substr(1, closing - 1);
        }
        return value;
    }

    size_t hash = value.find(" #");
    if (hash != std::string::npos) {
        value = trim(value.substr(0, hash));
    }
    return value;
}

static void parse_config(std::istream& file, ResMonConfig& config) {
    std::string raw;
    std::string current_section;

    while (std::getline(file, raw)) {
        size_t indent = raw.find_first_not_of(' ');
        std::string line = trim(raw);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, colon_pos));
        std::string value = clean_value(line.substr(colon_pos + 1));

        // Section header (no indent, no value)
        if (indent == 0 && value.empty()) {
            current_section = key;
            continue;
        }

        if (indent == 0) {
            current_section.clear();
            if (key == "version") config.version = value;
            continue;
        }

        if (current_section == "monitor") {
            if (key == "update_interval") config.monitor.update_interval = parse_int(value);
            else if (key == "disk_path") config.monitor.disk_path = value;
            else if (key == "debug_logging") config.monitor.debug_logging = parse_bool(value);
        }
        else if (current_section == "storage") {
            if (key == "alarms_path") config.storage.alarms_path = value;
        }
        else if (current_section == "log") {
            if (key == "log_dir") config.log.log_dir = value;
            else if (key == "log_name") config.log.log_name = value;
            else if (key == "fallback_name") config.log.fallback_name = value;
            else if (key == "ring_buffer_size") config.log.ring_buffer_size = parse_int(value);
            else if (key == "history_limit") config.log.history_limit = parse_int(value);
        }
        else if (current_section == "notify") {
            if (key == "enabled") config.notify.enabled = parse_bool(value);
            else if (key == "beep_on_trigger") config.notify.beep_on_trigger = parse_bool(value);
        }
        else if (current_section == "display") {
            if (key == "color_scheme") config.display.color_scheme = value;
        }
        else {
            DebugLogger::log("Ignoring key '", key, "' in unknown section '", current_section, "'");
        }
    }
}

bool ConfigManager::load() {
    std::ifstream file(config_path_);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << config_path_ << "\n";
        return false;
    }

    // Store file modification time
    try {
        last_modified_ = std::filesystem::last_write_time(config_path_);
    } catch (const std::exception& e) {
        std::cerr << "Failed to get file modification time: " << e.what() << "\n";
        return false;
    }

    // Start from defaults so omitted keys fall back
    config_ = ResMonConfig{};
    parse_config(file, config_);
    return true;
}

bool ConfigManager::check_and_reload() {
    std::string error_msg;
    return check_and_reload(error_msg);
}

bool ConfigManager::check_and_reload(std::string& error_msg) {
    std::error_code ec;
    if (!std::filesystem::exists(config_path_, ec)) {
        // Running on defaults until the file appears
        return false;
    }

    auto current_time = std::filesystem::last_write_time(config_path_, ec);
    if (ec) {
        std::cerr << "Error checking file modification: " << ec.message() << "\n";
        return false;
    }
    if (current_time == last_modified_ || current_time == rejected_modified_) {
        return false;
    }

    std::ifstream file(config_path_);
    if (!file.is_open()) {
        return false;
    }

    ResMonConfig staged;
    parse_config(file, staged);

    if (!validate(staged, error_msg)) {
        // Keep the running config; retry once the file changes again
        rejected_modified_ = current_time;
        return false;
    }

    config_ = staged;
    last_modified_ = current_time;
    return true;
}

bool ConfigManager::validate(const ResMonConfig& config, std::string& error_msg) {
    if (config.monitor.update_interval <= 0 || config.monitor.update_interval > 3600) {
        error_msg = "monitor.update_interval must be between 1 and 3600 seconds";
        return false;
    }

    if (config.monitor.disk_path.empty()) {
        error_msg = "monitor.disk_path must not be empty";
        return false;
    }

    if (config.storage.alarms_path.empty()) {
        error_msg = "storage.alarms_path must not be empty";
        return false;
    }

    if (config.log.log_dir.empty() || config.log.log_name.empty()) {
        error_msg = "log.log_dir and log.log_name must not be empty";
        return false;
    }

    if (config.log.ring_buffer_size <= 0) {
        error_msg = "log.ring_buffer_size must be positive";
        return false;
    }

    if (config.log.history_limit <= 0) {
        error_msg = "log.history_limit must be positive";
        return false;
    }

    if (config.display.color_scheme != "default" && config.display.color_scheme != "mono") {
        error_msg = "display.color_scheme must be \"default\" or \"mono\"";
        return false;
    }

    if (!config.validate()) {
        error_msg = "Configuration validation failed";
        return false;
    }

    return true;
}

bool ConfigManager::validate_config(std::string& error_msg) const {
    return validate(config_, error_msg);
}

} // namespace resmon
