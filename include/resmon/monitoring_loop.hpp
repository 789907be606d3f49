#pragma once

#include "resmon/alarm_store.hpp"
#include "resmon/event_log.hpp"
#include "resmon/metrics_collector.hpp"
#include "resmon/snapshot.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

namespace resmon {

struct TriggerEvent {
    Alarm alarm;
    double value = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

std::string describe_trigger(const TriggerEvent& event);

// Background sampling task. Each tick publishes a sample, selects the
// most specific breached alarm per resource, and fires it only when it
// differs from what fired on the previous tick.
class MonitoringLoop {
public:
    using Notifier = std::function<void(const TriggerEvent&)>;

    MonitoringLoop(std::shared_ptr<MetricsCollector> collector,
                   std::shared_ptr<AlarmStore> alarms,
                   std::shared_ptr<SnapshotAccessor> snapshot,
                   std::shared_ptr<EventLog> log,
                   std::chrono::milliseconds interval);
    ~MonitoringLoop();

    MonitoringLoop(const MonitoringLoop&) = delete;
    MonitoringLoop& operator=(const MonitoringLoop&) = delete;

    // false (and a STATUS entry) if already running
    bool start();

    // Finishes the current tick, then joins; returns within one interval
    void stop();

    bool is_running() const { return running_; }

    // One sample/evaluate cycle on the caller's thread
    void tick();

    void set_interval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

    // Invoked on the loop thread for every trigger
    void set_notifier(Notifier notifier);

    std::optional<TriggerEvent> last_trigger() const;

private:
    void run();

    std::shared_ptr<MetricsCollector> collector_;
    std::shared_ptr<AlarmStore> alarms_;
    std::shared_ptr<SnapshotAccessor> snapshot_;
    std::shared_ptr<EventLog> log_;

    std::atomic<bool> running_{false};
    std::mutex lifecycle_mutex_;
    std::thread thread_;

    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::chrono::milliseconds interval_;
    Notifier notifier_;
    std::optional<TriggerEvent> last_trigger_;

    // Id of the alarm fired on the previous tick, per resource
    std::array<std::optional<int>, kAllResources.size()> last_fired_;
    std::mutex tick_mutex_;
};

} // namespace resmon
