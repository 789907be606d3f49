#include <catch2/catch_test_macros.hpp>
#include "resmon/config_manager.hpp"
#include "test_support.hpp"
#include <fstream>
#include <iostream>
#include <sstream>

using resmon::test::TempDir;

namespace {

void write_file(const std::string& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

} // namespace

TEST_CASE("ConfigManager loads valid YAML", "[config]") {
    const char* test_config = R"(
version: "1.2"

monitor:
  update_interval: 2      # seconds
  disk_path: "/var"
  debug_logging: true

storage:
  alarms_path: "/tmp/resmon/alarms.json"

log:
  log_dir: "/tmp/resmon/logs"
  log_name: events.log
  ring_buffer_size: 64

notify:
  enabled: false
  beep_on_trigger: yes

display:
  color_scheme: "mono"
)";

    TempDir dir;
    std::string path = dir.file("resmon.yaml");
    write_file(path, test_config);

    resmon::ConfigManager manager(path);
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.version == "1.2");
    REQUIRE(config.monitor.update_interval == 2);
    REQUIRE(config.monitor.disk_path == "/var");
    REQUIRE(config.monitor.debug_logging);
    REQUIRE(config.storage.alarms_path == "/tmp/resmon/alarms.json");
    REQUIRE(config.log.log_dir == "/tmp/resmon/logs");
    REQUIRE(config.log.log_name == "events.log");
    REQUIRE(config.log.fallback_name == "resmon_fallback.log");
    REQUIRE(config.log.ring_buffer_size == 64);
    REQUIRE_FALSE(config.notify.enabled);
    REQUIRE(config.notify.beep_on_trigger);
    REQUIRE(config.display.color_scheme == "mono");

    std::string error_msg;
    REQUIRE(manager.validate_config(error_msg));
}

TEST_CASE("ConfigManager keeps defaults for omitted keys", "[config]") {
    TempDir dir;
    std::string path = dir.file("partial.yaml");
    write_file(path, "monitor:\n  update_interval: 5\n\nunknown:\n  foo: bar\n");

    resmon::ConfigManager manager(path);
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.monitor.update_interval == 5);
    REQUIRE(config.monitor.disk_path == "/");
    REQUIRE(config.storage.alarms_path == "./alarms.json");
    REQUIRE(config.log.ring_buffer_size == 256);
    REQUIRE(config.notify.enabled);
}

TEST_CASE("ConfigManager reports a missing file", "[config]") {
    TempDir dir;
    resmon::ConfigManager manager(dir.file("absent.yaml"));
    REQUIRE_FALSE(manager.load());

    // Defaults remain usable
    std::string error_msg;
    REQUIRE(manager.validate_config(error_msg));
}

TEST_CASE("ConfigManager validates values", "[config]") {
    TempDir dir;
    std::string path = dir.file("invalid.yaml");
    std::string error_msg;

    SECTION("Interval out of range") {
        write_file(path, "monitor:\n  update_interval: 0\n");
        resmon::ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE_FALSE(manager.validate_config(error_msg));
        REQUIRE(error_msg.find("update_interval") != std::string::npos);
    }

    SECTION("Non-numeric interval") {
        write_file(path, "monitor:\n  update_interval: fast\n");
        resmon::ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE_FALSE(manager.validate_config(error_msg));
    }

    SECTION("Empty ring buffer") {
        write_file(path, "log:\n  ring_buffer_size: -3\n");
        resmon::ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE_FALSE(manager.validate_config(error_msg));
        REQUIRE(error_msg.find("ring_buffer_size") != std::string::npos);
    }

    SECTION("Unknown color scheme") {
        write_file(path, "display:\n  color_scheme: neon\n");
        resmon::ConfigManager manager(path);
        REQUIRE(manager.load());
        REQUIRE_FALSE(manager.validate_config(error_msg));
        REQUIRE(error_msg.find("color_scheme") != std::string::npos);
    }
}

TEST_CASE("ConfigManager reloads only when the file changes", "[config]") {
    TempDir dir;
    std::string path = dir.file("reload.yaml");
    write_file(path, "monitor:\n  update_interval: 1\n");

    resmon::ConfigManager manager(path);
    REQUIRE(manager.load());
    REQUIRE_FALSE(manager.check_and_reload());

    auto stamp = std::filesystem::last_write_time(path);
    write_file(path, "monitor:\n  update_interval: 7\n");
    std::filesystem::last_write_time(path, stamp + std::chrono::seconds(2));

    REQUIRE(manager.check_and_reload());
    REQUIRE(manager.get_config().monitor.update_interval == 7);
    REQUIRE_FALSE(manager.check_and_reload());
}

TEST_CASE("ConfigManager handles inline comments", "[config]") {
    TempDir dir;
    std::string path = dir.file("comments.yaml");
    write_file(path,
               "monitor:   # sampling\n"
               "  update_interval: 7 # seconds\n"
               "  disk_path: \"/home\" # root of users\n"
               "  debug_logging:   # unset\n"
               "display:\n"
               "  color_scheme: \"mono\"#tight\n");

    resmon::ConfigManager manager(path);
    REQUIRE(manager.load());

    const auto& config = manager.get_config();
    REQUIRE(config.monitor.update_interval == 7);
    REQUIRE(config.monitor.disk_path == "/home");
    REQUIRE_FALSE(config.monitor.debug_logging);
    REQUIRE(config.display.color_scheme == "mono");
}

TEST_CASE("ConfigManager keeps the running config when a reload is invalid", "[config]") {
    TempDir dir;
    std::string path = dir.file("reject.yaml");
    write_file(path, "monitor:\n  update_interval: 4\n");

    resmon::ConfigManager manager(path);
    REQUIRE(manager.load());

    auto stamp = std::filesystem::last_write_time(path);
    write_file(path, "monitor:\n  update_interval: 0\n");
    std::filesystem::last_write_time(path, stamp + std::chrono::seconds(2));

    std::string error_msg;
    REQUIRE_FALSE(manager.check_and_reload(error_msg));
    REQUIRE(error_msg.find("update_interval") != std::string::npos);
    REQUIRE(manager.get_config().monitor.update_interval == 4);

    // The same rejected file is not reported again
    error_msg.clear();
    REQUIRE_FALSE(manager.check_and_reload(error_msg));
    REQUIRE(error_msg.empty());

    // A corrected file is picked up
    write_file(path, "monitor:\n  update_interval: 9\n");
    std::filesystem::last_write_time(path, stamp + std::chrono::seconds(4));
    REQUIRE(manager.check_and_reload(error_msg));
    REQUIRE(manager.get_config().monitor.update_interval == 9);
}

TEST_CASE("ConfigManager stays quiet while the file is missing", "[config]") {
    TempDir dir;
    std::string path = dir.file("later.yaml");
    resmon::ConfigManager manager(path);
    REQUIRE_FALSE(manager.load());

    std::ostringstream captured;
    auto* previous = std::cerr.rdbuf(captured.rdbuf());
    bool reloaded = false;
    for (int i = 0; i < 3; ++i) {
        reloaded = reloaded || manager.check_and_reload();
    }
    std::cerr.rdbuf(previous);

    REQUIRE_FALSE(reloaded);
    REQUIRE(captured.str().empty());

    write_file(path, "monitor:\n  update_interval: 6\n");
    REQUIRE(manager.check_and_reload());
    REQUIRE(manager.get_config().monitor.update_interval == 6);
}
