#include <catch2/catch_test_macros.hpp>
#include "resmon/monitoring_loop.hpp"
#include "test_support.hpp"
#include <thread>

using resmon::test::TempDir;
using resmon::test::ScriptedCollector;
using resmon::test::make_sample;
using resmon::LogCategory;

namespace {

struct LoopFixture {
    TempDir dir;
    std::shared_ptr<resmon::EventLog> log;
    std::shared_ptr<resmon::AlarmStore> alarms;
    std::shared_ptr<resmon::SnapshotAccessor> snapshot;
    std::shared_ptr<ScriptedCollector> collector;
    std::unique_ptr<resmon::MonitoringLoop> loop;

    explicit LoopFixture(std::chrono::milliseconds interval = std::chrono::milliseconds(20)) {
        resmon::LogConfig config;
        config.log_dir = dir.file("logs");
        log = std::make_shared<resmon::EventLog>(config);
        alarms = std::make_shared<resmon::AlarmStore>(dir.file("alarms.json"), log);
        snapshot = std::make_shared<resmon::SnapshotAccessor>();
        collector = std::make_shared<ScriptedCollector>();
        loop = std::make_unique<resmon::MonitoringLoop>(collector, alarms, snapshot, log, interval);
    }

    size_t count(LogCategory category) const {
        size_t n = 0;
        for (const auto& entry : log->all()) {
            if (entry.category == category) ++n;
        }
        return n;
    }
};

} // namespace

TEST_CASE("Sustained breach fires once and re-arms after clearing", "[loop]") {
    LoopFixture f;
    std::string error;
    auto alarm = f.alarms->create_alarm(resmon::Resource::Cpu, 80, "hot", error);
    REQUIRE(alarm);

    std::vector<resmon::TriggerEvent> notified;
    f.loop->set_notifier([&notified](const resmon::TriggerEvent& e) { notified.push_back(e); });

    for (double cpu : {85.0, 87.0, 90.0}) {
        f.collector->push(make_sample(cpu));
        f.loop->tick();
    }
    REQUIRE(f.count(LogCategory::AlarmTrigger) == 1);
    REQUIRE(notified.size() == 1);
    REQUIRE(notified[0].alarm.id == alarm->id);
    REQUIRE(notified[0].value == 85.0);

    f.collector->push(make_sample(60.0));
    f.loop->tick();
    REQUIRE(f.count(LogCategory::AlarmTrigger) == 1);

    f.collector->push(make_sample(85.0));
    f.loop->tick();
    REQUIRE(f.count(LogCategory::AlarmTrigger) == 2);
    REQUIRE(notified.size() == 2);

    auto last = f.loop->last_trigger();
    REQUIRE(last);
    REQUIRE(last->alarm.id == alarm->id);
}

TEST_CASE("Escalating to a higher alarm fires the new alarm", "[loop]") {
    LoopFixture f;
    std::string error;
    auto warn = f.alarms->create_alarm(resmon::Resource::Memory, 50, "warn", error);
    auto crit = f.alarms->create_alarm(resmon::Resource::Memory, 80, "crit", error);

    std::vector<int> fired;
    f.loop->set_notifier([&fired](const resmon::TriggerEvent& e) { fired.push_back(e.alarm.id); });

    for (double mem : {60.0, 65.0, 85.0, 90.0}) {
        f.collector->push(make_sample(0.0, mem));
        f.loop->tick();
    }

    REQUIRE(fired == std::vector<int>{warn->id, crit->id});
}

TEST_CASE("Resources are tracked independently", "[loop]") {
    LoopFixture f;
    std::string error;
    f.alarms->create_alarm(resmon::Resource::Cpu, 50, "", error);
    f.alarms->create_alarm(resmon::Resource::Disk, 50, "", error);

    f.collector->push(make_sample(70.0, 0.0, 10.0));
    f.loop->tick();
    f.collector->push(make_sample(70.0, 0.0, 70.0));
    f.loop->tick();

    auto triggers = f.log->search("triggered");
    REQUIRE(triggers.size() == 2);
    REQUIRE(triggers[0].message.find("cpu") != std::string::npos);
    REQUIRE(triggers[1].message.find("disk") != std::string::npos);
}

TEST_CASE("A failed sample is logged and skipped", "[loop]") {
    LoopFixture f;
    f.collector->push(make_sample(12.0, 34.0, 56.0));
    f.loop->tick();

    f.collector->push_failure();
    f.loop->tick();

    REQUIRE(f.count(LogCategory::Error) == 1);
    REQUIRE(f.snapshot->sequence() == 1);
    REQUIRE(f.snapshot->current()->cpu == 12.0);

    f.collector->push(make_sample(20.0));
    f.loop->tick();
    REQUIRE(f.snapshot->sequence() == 2);
}

TEST_CASE("Each tick publishes to the snapshot", "[loop]") {
    LoopFixture f;
    REQUIRE_FALSE(f.snapshot->current());

    f.collector->push(make_sample(1.0, 2.0, 3.0));
    f.loop->tick();

    auto sample = f.snapshot->current();
    REQUIRE(sample);
    REQUIRE(sample->memory == 2.0);
    REQUIRE(sample->disk == 3.0);
}

TEST_CASE("Start is idempotent and stop is prompt", "[loop]") {
    LoopFixture f(std::chrono::milliseconds(2000));

    REQUIRE(f.loop->start());
    REQUIRE(f.loop->is_running());
    REQUIRE_FALSE(f.loop->start());

    // Wait for the first tick so stop interrupts the sleep, not the tick
    for (int i = 0; i < 200 && f.snapshot->sequence() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(f.snapshot->sequence() >= 1);

    auto before = std::chrono::steady_clock::now();
    f.loop->stop();
    auto elapsed = std::chrono::steady_clock::now() - before;

    REQUIRE_FALSE(f.loop->is_running());
    REQUIRE(elapsed < std::chrono::milliseconds(1000));

    auto status = f.log->search("already running");
    REQUIRE(status.size() == 1);
    REQUIRE(status[0].category == LogCategory::Status);
    REQUIRE(f.log->search("monitoring stopped").size() == 1);
}

TEST_CASE("Running loop samples repeatedly and tolerates concurrent edits", "[loop]") {
    LoopFixture f(std::chrono::milliseconds(5));
    f.collector->push(make_sample(95.0));

    REQUIRE(f.loop->start());

    std::string error;
    std::vector<int> ids;
    for (int i = 0; i < 20; ++i) {
        auto alarm = f.alarms->create_alarm(resmon::Resource::Cpu, 10 + i, "", error);
        REQUIRE(alarm);
        ids.push_back(alarm->id);
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    for (int id : ids) {
        REQUIRE(f.alarms->remove_alarm(id));
    }

    for (int i = 0; i < 200 && f.collector->calls() < 5; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    f.loop->stop();

    REQUIRE(f.collector->calls() >= 5);
    REQUIRE(f.alarms->size() == 0);
}
