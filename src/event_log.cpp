#include "resmon/event_log.hpp"
#include "resmon/debug_logger.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace resmon {

namespace {

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// One entry per line: embedded line breaks would split a record
std::string sanitize(const std::string& message) {
    std::string clean = message;
    std::replace(clean.begin(), clean.end(), '\n', ' ');
    std::replace(clean.begin(), clean.end(), '\r', ' ');
    return clean;
}

std::chrono::system_clock::time_point truncate_to_seconds(
    const std::chrono::system_clock::time_point& tp) {
    return std::chrono::time_point_cast<std::chrono::seconds>(tp);
}

} // namespace

std::string category_to_string(LogCategory category) {
    switch (category) {
        case LogCategory::Status:       return "STATUS";
        case LogCategory::AlarmTrigger: return "ALARM_TRIGGER";
        case LogCategory::UserAction:   return "USER_ACTION";
        case LogCategory::Error:        return "ERROR";
    }
    return "STATUS";
}

std::optional<LogCategory> parse_category(const std::string& tag) {
    if (tag == "STATUS") return LogCategory::Status;
    if (tag == "ALARM_TRIGGER") return LogCategory::AlarmTrigger;
    if (tag == "USER_ACTION") return LogCategory::UserAction;
    if (tag == "ERROR") return LogCategory::Error;
    return std::nullopt;
}

std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string format_log_line(const LogEntry& entry) {
    return "[" + format_timestamp(entry.timestamp) + "] [" +
           category_to_string(entry.category) + "] " + entry.message;
}

std::optional<LogEntry> parse_log_line(const std::string& line) {
    if (line.size() < 2 || line[0] != '[') {
        return std::nullopt;
    }

    size_t ts_end = line.find(']');
    if (ts_end == std::string::npos || line.compare(ts_end, 3, "] [") != 0) {
        return std::nullopt;
    }

    std::tm tm{};
    std::istringstream ts_stream(line.substr(1, ts_end - 1));
    ts_stream >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (ts_stream.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }

    size_t cat_start = ts_end + 3;
    size_t cat_end = line.find(']', cat_start);
    if (cat_end == std::string::npos) {
        return std::nullopt;
    }
    auto category = parse_category(line.substr(cat_start, cat_end - cat_start));
    if (!category) {
        return std::nullopt;
    }

    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::from_time_t(time);
    entry.category = *category;
    entry.message = cat_end + 2 <= line.size() ? line.substr(cat_end + 2) : std::string{};
    return entry;
}

std::optional<std::chrono::system_clock::time_point> parse_log_date(const std::string& date,
                                                                    bool end_of_day) {
    std::tm tm{};
    std::istringstream iss(date);
    iss >> std::get_time(&tm, "%Y-%m-%d");
    if (iss.fail() || iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }

    if (end_of_day) {
        tm.tm_hour = 23;
        tm.tm_min = 59;
        tm.tm_sec = 59;
    }
    tm.tm_isdst = -1;

    std::time_t time = std::mktime(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(time);
}

EventLog::EventLog(const LogConfig& config)
    : config_(config)
    , log_path_(std::filesystem::path(config.log_dir) / config.log_name)
    , fallback_path_(std::filesystem::path(config.log_dir) / config.fallback_name)
{
    std::error_code ec;
    std::filesystem::create_directories(config_.log_dir, ec);
    if (ec) {
        std::cerr << "Warning: Failed to create log directory " << config_.log_dir
                  << ": " << ec.message() << "\n";
    }

    load_history();

    log_file_.open(log_path_, std::ios::app);
    if (!log_file_.is_open()) {
        std::cerr << "Warning: Failed to open log file: " << log_path_.string() << "\n";
    }
}

EventLog::~EventLog() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
}

void EventLog::load_history() {
    size_t skipped = 0;
    scan_file([this](const LogEntry& entry) { remember_locked(entry); }, skipped);

    DebugLogger::log("Loaded ", total_, " log entries from ", log_path_.string(),
                     " (", entries_.size(), " kept in memory, ", skipped, " unparseable)");
}

void EventLog::remember_locked(const LogEntry& entry) {
    entries_.push_back(entry);
    ++total_;
    while (entries_.size() > static_cast<size_t>(config_.history_limit)) {
        entries_.pop_front();
    }
}

bool EventLog::complete_locked() const {
    return entries_.size() == total_;
}

void EventLog::scan_file(const std::function<void(const LogEntry&)>& visit) const {
    size_t skipped = 0;
    scan_file(visit, skipped);
}

void EventLog::scan_file(const std::function<void(const LogEntry&)>& visit, size_t& skipped) const {
    std::ifstream in(log_path_);
    if (!in.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) {
            continue;
        }
        if (auto entry = parse_log_line(line)) {
            visit(*entry);
        } else {
            ++skipped;
        }
    }
}

void EventLog::append(LogCategory category, const std::string& message) {
    append(LogEntry{std::chrono::system_clock::now(), category, message});
}

void EventLog::append(const LogEntry& entry) {
    try {
        LogEntry stored{truncate_to_seconds(entry.timestamp), entry.category, sanitize(entry.message)};
        std::string line = format_log_line(stored);

        std::lock_guard<std::mutex> lock(mutex_);
        remember_locked(stored);

        if (!log_file_.is_open()) {
            log_file_.open(log_path_, std::ios::app);
        }
        if (log_file_.is_open() && write_line(log_file_, line)) {
            return;
        }

        undelivered_.push_back(stored);
        while (undelivered_.size() > static_cast<size_t>(config_.ring_buffer_size)) {
            undelivered_.pop_front();
        }
        write_fallback(line);
    } catch (const std::exception& e) {
        std::cerr << "Event log append failed: " << e.what() << "\n";
    }
}

bool EventLog::write_line(std::ofstream& out, const std::string& line) {
    out << line << '\n';
    out.flush();
    if (!out) {
        out.clear();
        return false;
    }
    return true;
}

void EventLog::write_fallback(const std::string& line) {
    std::ofstream fallback(fallback_path_, std::ios::app);
    if (fallback.is_open() && write_line(fallback, line)) {
        return;
    }
    std::cerr << "Event log unavailable: " << line << "\n";
}

// Queries answer from memory while it holds every entry; once older entries
// have been evicted they stream the log file instead.
std::vector<LogEntry> EventLog::recent(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (n <= entries_.size() || complete_locked()) {
        size_t count = std::min(n, entries_.size());
        return std::vector<LogEntry>(entries_.end() - static_cast<std::ptrdiff_t>(count), entries_.end());
    }

    std::deque<LogEntry> tail;
    scan_file([&tail, n](const LogEntry& entry) {
        tail.push_back(entry);
        if (tail.size() > n) {
            tail.pop_front();
        }
    });
    return std::vector<LogEntry>(tail.begin(), tail.end());
}

std::vector<LogEntry> EventLog::search(const std::string& text) const {
    std::string needle = to_lower(text);
    return select([&needle](const LogEntry& entry) {
        return to_lower(entry.message).find(needle) != std::string::npos;
    });
}

std::vector<LogEntry> EventLog::in_range(const std::chrono::system_clock::time_point& start,
                                         const std::chrono::system_clock::time_point& end) const {
    if (start > end) {
        return {};
    }
    return select([&start, &end](const LogEntry& entry) {
        return entry.timestamp >= start && entry.timestamp <= end;
    });
}

std::vector<LogEntry> EventLog::all() const {
    return select([](const LogEntry&) { return true; });
}

std::vector<LogEntry> EventLog::select(const std::function<bool(const LogEntry&)>& matches) const {
    std::vector<LogEntry> result;

    std::lock_guard<std::mutex> lock(mutex_);
    if (complete_locked()) {
        for (const auto& entry : entries_) {
            if (matches(entry)) {
                result.push_back(entry);
            }
        }
        return result;
    }

    scan_file([&result, &matches](const LogEntry& entry) {
        if (matches(entry)) {
            result.push_back(entry);
        }
    });
    return result;
}

size_t EventLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_;
}

size_t EventLog::resident() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<LogEntry> EventLog::undelivered() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<LogEntry>(undelivered_.begin(), undelivered_.end());
}

} // namespace resmon
