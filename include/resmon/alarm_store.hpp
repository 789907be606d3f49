#pragma once

#include "resmon/event_log.hpp"
#include "resmon/metrics_collector.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace resmon {

enum class ActivePeriod {
    Always,
    Day,        // 06:00 - 21:59
    Night,      // 22:00 - 05:59
    Office,     // 09:00 - 17:59
    NonOffice
};

std::string period_to_string(ActivePeriod period);
std::optional<ActivePeriod> parse_period(const std::string& text);
bool is_active_at(ActivePeriod period, int hour);

struct Alarm {
    int id = 0;
    Resource resource = Resource::Cpu;
    int threshold = 0;                          // 1-100%
    std::string name;                           // may be empty
    ActivePeriod active_period = ActivePeriod::Always;

    bool operator==(const Alarm& other) const {
        return id == other.id && resource == other.resource && threshold == other.threshold &&
               name == other.name && active_period == other.active_period;
    }
};

// Name for display; empty names fall back to "CPU alarm 80%"
std::string display_name(const Alarm& alarm);

using ActiveAlarms = std::array<std::optional<Alarm>, kAllResources.size()>;

// Owns the alarm set and its JSON file. Every mutation rewrites the whole
// file; a failed write is logged and the store carries on in memory.
class AlarmStore {
public:
    AlarmStore(const std::string& path, std::shared_ptr<EventLog> log);

    // Replace the in-memory set with the file contents; missing or
    // malformed files yield an empty set
    void load();

    // std::nullopt with error_msg set when threshold is outside [1, 100]
    std::optional<Alarm> create_alarm(Resource resource, int threshold, const std::string& name,
                                      std::string& error_msg,
                                      ActivePeriod period = ActivePeriod::Always);

    // false when no alarm has this id
    bool remove_alarm(int id);

    // Ascending threshold, then id
    std::vector<Alarm> list_for(Resource resource) const;

    // Grouped by resource, then ascending threshold
    std::vector<Alarm> list_all() const;

    // Highest breached threshold wins; equal thresholds go to the lowest id
    std::optional<Alarm> select_active(Resource resource, double value) const;
    std::optional<Alarm> select_active(Resource resource, double value, int hour) const;

    // All resources evaluated against one consistent view of the set
    ActiveAlarms select_active(const Sample& sample) const;

    size_t size() const;
    const std::string& path() const { return path_; }

private:
    std::optional<Alarm> select_locked(Resource resource, double value, int hour) const;
    bool save_locked();

    std::string path_;
    std::shared_ptr<EventLog> log_;

    mutable std::mutex mutex_;
    std::vector<Alarm> alarms_;
    int next_id_ = 1;
};

} // namespace resmon
