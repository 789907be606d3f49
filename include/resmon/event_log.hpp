#pragma once

#include "resmon/config_manager.hpp"
#include <chrono>
#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resmon {

enum class LogCategory {
    Status,
    AlarmTrigger,
    UserAction,
    Error
};

std::string category_to_string(LogCategory category);
std::optional<LogCategory> parse_category(const std::string& tag);

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;    // second resolution
    LogCategory category;
    std::string message;
};

// "[2024-05-01 13:45:07] [ALARM_TRIGGER] message"
std::string format_log_line(const LogEntry& entry);
std::optional<LogEntry> parse_log_line(const std::string& line);

std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// "YYYY-MM-DD" at 00:00:00, or 23:59:59 when end_of_day is set
std::optional<std::chrono::system_clock::time_point> parse_log_date(const std::string& date,
                                                                    bool end_of_day);

// Append-only event record shared by every component. Appends never throw:
// a failed write is kept in memory and retried against the fallback file.
class EventLog {
public:
    explicit EventLog(const LogConfig& config);
    ~EventLog();

    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    void append(LogCategory category, const std::string& message);
    void append(const LogEntry& entry);

    // Last n entries, chronological
    std::vector<LogEntry> recent(size_t n) const;

    // Case-insensitive substring match on the message, chronological
    std::vector<LogEntry> search(const std::string& text) const;

    // start <= timestamp <= end, chronological
    std::vector<LogEntry> in_range(const std::chrono::system_clock::time_point& start,
                                   const std::chrono::system_clock::time_point& end) const;

    std::vector<LogEntry> all() const;

    // Every entry ever recorded, including ones no longer held in memory
    size_t size() const;

    // Entries held in memory, at most log.history_limit
    size_t resident() const;

    // Entries whose durable write failed, oldest first
    std::vector<LogEntry> undelivered() const;

    const std::filesystem::path& log_path() const { return log_path_; }

private:
    void load_history();
    void remember_locked(const LogEntry& entry);
    bool complete_locked() const;
    std::vector<LogEntry> select(const std::function<bool(const LogEntry&)>& matches) const;
    void scan_file(const std::function<void(const LogEntry&)>& visit) const;
    void scan_file(const std::function<void(const LogEntry&)>& visit, size_t& skipped) const;
    bool write_line(std::ofstream& out, const std::string& line);
    void write_fallback(const std::string& line);

    LogConfig config_;
    std::filesystem::path log_path_;
    std::filesystem::path fallback_path_;

    mutable std::mutex mutex_;
    std::ofstream log_file_;
    std::deque<LogEntry> entries_;     // newest history_limit entries
    size_t total_ = 0;
    std::deque<LogEntry> undelivered_;
};

} // namespace resmon
