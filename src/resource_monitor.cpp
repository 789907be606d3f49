#include "resmon/resource_monitor.hpp"
#include "resmon/debug_logger.hpp"
#include <iostream>

namespace resmon {

ResourceMonitor::ResourceMonitor(const std::string& config_path,
                                 std::unique_ptr<MetricsCollector> collector)
    : config_path_(config_path)
    , config_manager_(config_path)
    , pending_collector_(std::move(collector))
{
}

ResourceMonitor::~ResourceMonitor() {
    stop();
}

bool ResourceMonitor::initialize() {
    // Load configuration
    if (!config_manager_.load()) {
        std::cerr << "Warning: using default configuration (" << config_path_ << " not loaded)\n";
    }

    // Validate configuration
    std::string validation_error;
    if (!config_manager_.validate_config(validation_error)) {
        std::cerr << "Configuration validation failed: " << validation_error << "\n";
        return false;
    }

    const auto& config = config_manager_.get_config();
    DebugLogger::set_enabled(config.monitor.debug_logging);

    // Initialize components
    event_log_ = std::make_shared<EventLog>(config.log);
    event_log_->append(LogCategory::Status, "resmon " + config.version + " starting");

    alarm_store_ = std::make_shared<AlarmStore>(config.storage.alarms_path, event_log_);
    alarm_store_->load();

    snapshot_ = std::make_shared<SnapshotAccessor>();

    if (pending_collector_) {
        metrics_collector_ = std::move(pending_collector_);
    } else {
        metrics_collector_ = create_metrics_collector(config.monitor.disk_path);
    }

    loop_ = std::make_unique<MonitoringLoop>(metrics_collector_, alarm_store_, snapshot_, event_log_,
                                             std::chrono::seconds(config.monitor.update_interval));

    DebugLogger::log("Initialized with alarms=", config.storage.alarms_path,
                     " log=", event_log_->log_path().string());
    return true;
}

bool ResourceMonitor::start_monitoring() {
    if (!loop_) {
        std::cerr << "Resource monitor not initialized. Call initialize() first.\n";
        return false;
    }
    return loop_->start();
}

void ResourceMonitor::stop() {
    if (loop_) {
        loop_->stop();
    }
}

bool ResourceMonitor::is_monitoring() const {
    return loop_ && loop_->is_running();
}

std::optional<Sample> ResourceMonitor::get_snapshot() const {
    if (!snapshot_) {
        return std::nullopt;
    }
    return snapshot_->current();
}

std::optional<double> ResourceMonitor::get_snapshot(Resource resource) const {
    auto sample = get_snapshot();
    if (!sample) {
        return std::nullopt;
    }
    return value_of(*sample, resource);
}

std::optional<Alarm> ResourceMonitor::create_alarm(Resource resource, int threshold,
                                                   const std::string& name, std::string& error_msg,
                                                   ActivePeriod period) {
    if (!alarm_store_) {
        error_msg = "Resource monitor not initialized";
        return std::nullopt;
    }
    return alarm_store_->create_alarm(resource, threshold, name, error_msg, period);
}

std::vector<Alarm> ResourceMonitor::list_alarms() const {
    return alarm_store_ ? alarm_store_->list_all() : std::vector<Alarm>{};
}

bool ResourceMonitor::remove_alarm(int id) {
    return alarm_store_ && alarm_store_->remove_alarm(id);
}

std::vector<LogEntry> ResourceMonitor::get_recent_logs(size_t n) const {
    return event_log_ ? event_log_->recent(n) : std::vector<LogEntry>{};
}

std::vector<LogEntry> ResourceMonitor::search_logs(const std::string& text) const {
    return event_log_ ? event_log_->search(text) : std::vector<LogEntry>{};
}

std::vector<LogEntry> ResourceMonitor::get_logs_in_range(
    const std::chrono::system_clock::time_point& start,
    const std::chrono::system_clock::time_point& end) const {
    return event_log_ ? event_log_->in_range(start, end) : std::vector<LogEntry>{};
}

size_t ResourceMonitor::log_count() const {
    return event_log_ ? event_log_->size() : 0;
}

bool ResourceMonitor::check_and_reload() {
    std::string validation_error;
    if (!config_manager_.check_and_reload(validation_error)) {
        if (!validation_error.empty() && event_log_) {
            event_log_->append(LogCategory::Error, "Reloaded configuration rejected: " + validation_error);
        }
        return false;
    }

    apply_runtime_config();
    if (event_log_) {
        event_log_->append(LogCategory::Status, "Configuration reloaded from " + config_path_);
    }
    return true;
}

void ResourceMonitor::apply_runtime_config() {
    const auto& config = config_manager_.get_config();
    DebugLogger::set_enabled(config.monitor.debug_logging);
    if (loop_) {
        loop_->set_interval(std::chrono::seconds(config.monitor.update_interval));
    }
}

void ResourceMonitor::set_notifier(MonitoringLoop::Notifier notifier) {
    if (loop_) {
        loop_->set_notifier(std::move(notifier));
    }
}

std::optional<TriggerEvent> ResourceMonitor::last_trigger() const {
    return loop_ ? loop_->last_trigger() : std::nullopt;
}

} // namespace resmon
