#pragma once

#include "resmon/alarm_store.hpp"
#include "resmon/config_manager.hpp"
#include "resmon/event_log.hpp"
#include "resmon/metrics_collector.hpp"
#include "resmon/monitoring_loop.hpp"
#include "resmon/snapshot.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace resmon {

// Wires the components together and exposes the foreground command surface.
// Components are shared with the monitoring thread, never global.
class ResourceMonitor {
public:
    explicit ResourceMonitor(const std::string& config_path,
                             std::unique_ptr<MetricsCollector> collector = nullptr);
    ~ResourceMonitor();

    // Load config, open the event log, load alarms. false only on an
    // invalid configuration; a missing config file falls back to defaults.
    bool initialize();

    bool start_monitoring();
    void stop();
    bool is_monitoring() const;

    std::optional<Sample> get_snapshot() const;
    std::optional<double> get_snapshot(Resource resource) const;

    std::optional<Alarm> create_alarm(Resource resource, int threshold, const std::string& name,
                                      std::string& error_msg,
                                      ActivePeriod period = ActivePeriod::Always);
    std::vector<Alarm> list_alarms() const;
    bool remove_alarm(int id);

    std::vector<LogEntry> get_recent_logs(size_t n) const;
    std::vector<LogEntry> search_logs(const std::string& text) const;
    std::vector<LogEntry> get_logs_in_range(const std::chrono::system_clock::time_point& start,
                                            const std::chrono::system_clock::time_point& end) const;
    size_t log_count() const;

    // Hot-reload: picks up a new tick interval and debug flag
    bool check_and_reload();

    void set_notifier(MonitoringLoop::Notifier notifier);
    std::optional<TriggerEvent> last_trigger() const;

    const ResMonConfig& config() const { return config_manager_.get_config(); }

private:
    void apply_runtime_config();

    std::string config_path_;
    ConfigManager config_manager_;
    std::unique_ptr<MetricsCollector> pending_collector_;

    std::shared_ptr<EventLog> event_log_;
    std::shared_ptr<AlarmStore> alarm_store_;
    std::shared_ptr<SnapshotAccessor> snapshot_;
    std::shared_ptr<MetricsCollector> metrics_collector_;
    std::unique_ptr<MonitoringLoop> loop_;
};

} // namespace resmon
