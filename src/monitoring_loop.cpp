#include "resmon/monitoring_loop.hpp"
#include "resmon/debug_logger.hpp"
#include <iomanip>
#include <sstream>

namespace resmon {

std::string describe_trigger(const TriggerEvent& event) {
    std::ostringstream oss;
    oss << "Alarm #" << event.alarm.id << " '" << display_name(event.alarm) << "' triggered: "
        << resource_to_string(event.alarm.resource) << " at " << std::fixed << std::setprecision(1)
        << event.value << "% (threshold " << event.alarm.threshold << "%)";
    return oss.str();
}

MonitoringLoop::MonitoringLoop(std::shared_ptr<MetricsCollector> collector,
                               std::shared_ptr<AlarmStore> alarms,
                               std::shared_ptr<SnapshotAccessor> snapshot,
                               std::shared_ptr<EventLog> log,
                               std::chrono::milliseconds interval)
    : collector_(std::move(collector))
    , alarms_(std::move(alarms))
    , snapshot_(std::move(snapshot))
    , log_(std::move(log))
    , interval_(interval)
{
}

MonitoringLoop::~MonitoringLoop() {
    stop();
}

bool MonitoringLoop::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) {
        log_->append(LogCategory::Status, "Monitoring already running, start request ignored");
        return false;
    }

    // A previous run that was stopped has already been joined
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
    }
    {
        std::lock_guard<std::mutex> tick_lock(tick_mutex_);
        last_fired_.fill(std::nullopt);
    }

    running_ = true;
    log_->append(LogCategory::Status,
                 "Monitoring started (interval " + std::to_string(interval().count()) + " ms)");
    thread_ = std::thread(&MonitoringLoop::run, this);
    return true;
}

void MonitoringLoop::stop() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!thread_.joinable()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    thread_.join();

    running_ = false;
    log_->append(LogCategory::Status, "Monitoring stopped");
}

void MonitoringLoop::run() {
    DebugLogger::log("Monitoring thread running");

    while (true) {
        auto tick_start = std::chrono::steady_clock::now();
        tick();

        std::unique_lock<std::mutex> lock(mutex_);
        auto deadline = tick_start + interval_;
        if (wake_.wait_until(lock, deadline, [this] { return stop_requested_; })) {
            break;
        }
    }

    DebugLogger::log("Monitoring thread exiting");
}

void MonitoringLoop::tick() {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);

    Sample sample;
    try {
        sample = collector_->sample_system();
    } catch (const std::exception& e) {
        log_->append(LogCategory::Error, std::string("Metric sampling failed, tick skipped: ") + e.what());
        return;
    }
    if (sample.timestamp == std::chrono::system_clock::time_point{}) {
        sample.timestamp = std::chrono::system_clock::now();
    }

    snapshot_->publish(sample);

    // One locked pass over the alarm set for all resources
    ActiveAlarms active = alarms_->select_active(sample);

    for (Resource resource : kAllResources) {
        size_t idx = resource_index(resource);
        const auto& selected = active[idx];

        if (!selected) {
            if (last_fired_[idx]) {
                DebugLogger::log(resource_to_string(resource), " back below all thresholds, re-armed");
            }
            last_fired_[idx].reset();
            continue;
        }

        if (last_fired_[idx] == selected->id) {
            continue;
        }
        last_fired_[idx] = selected->id;

        TriggerEvent event{*selected, value_of(sample, resource), sample.timestamp};
        log_->append(LogCategory::AlarmTrigger, describe_trigger(event));

        Notifier notifier;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_trigger_ = event;
            notifier = notifier_;
        }

        if (notifier) {
            try {
                notifier(event);
            } catch (const std::exception& e) {
                log_->append(LogCategory::Error, std::string("Trigger notification failed: ") + e.what());
            }
        }
    }
}

void MonitoringLoop::set_interval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (interval_ != interval) {
        DebugLogger::log("Tick interval changed to ", interval.count(), " ms");
    }
    interval_ = interval;
}

std::chrono::milliseconds MonitoringLoop::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

void MonitoringLoop::set_notifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(mutex_);
    notifier_ = std::move(notifier);
}

std::optional<TriggerEvent> MonitoringLoop::last_trigger() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_trigger_;
}

} // namespace resmon
