#pragma once

#include "resmon/config_manager.hpp"
#include "resmon/resource_monitor.hpp"
#include <csignal>
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace resmon {

enum class UsageLevel {
    Normal,
    Warning,
    Critical
};

// 70% and 90% bands used for coloring
UsageLevel usage_level(double percent);

// Menu-driven front end over ResourceMonitor. Reads commands from `in`,
// renders to `out`; trigger notifications may arrive from the loop thread
// at any time and share the output lock.
class Console {
public:
    Console(ResourceMonitor& monitor, std::istream& in, std::ostream& out);

    // Returns when the user exits, input reaches EOF or the interrupt flag is set
    void run();

    // Flag written by a signal handler; checked between menu steps
    void set_interrupt_flag(const volatile std::sig_atomic_t* flag) { interrupt_flag_ = flag; }

    // Print an asynchronous trigger notification
    void notify(const TriggerEvent& event);

private:
    void render_header(const std::string& title);
    void render_main_menu();

    void show_usage();
    void render_usage(const Sample& sample);
    void render_resource(Resource resource, double percent);

    void create_alarm();
    void list_alarms();
    void remove_alarm();
    void render_alarms(const std::vector<Alarm>& alarms);

    void show_logs();
    void render_logs(const std::vector<LogEntry>& entries, const std::string& title);

    bool interrupted() const { return interrupt_flag_ && *interrupt_flag_ != 0; }
    bool prompt(const std::string& text, std::string& answer);
    bool prompt_int(const std::string& text, int& value);
    void print(const std::string& text);

    std::string create_progress_bar(double percentage, int width, UsageLevel level);
    std::string colorize(const std::string& text, UsageLevel level);
    std::string color_code(UsageLevel level);
    std::string reset_color();
    void clear_screen();

    ResourceMonitor& monitor_;
    std::istream& in_;
    std::ostream& out_;
    DisplayConfig display_config_;
    NotifyConfig notify_config_;
    std::mutex output_mutex_;
    const volatile std::sig_atomic_t* interrupt_flag_ = nullptr;
};

} // namespace resmon
