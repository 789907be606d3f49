#include "resmon/console.hpp"
#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace resmon {

UsageLevel usage_level(double percent) {
    if (percent >= 90.0) {
        return UsageLevel::Critical;
    } else if (percent >= 70.0) {
        return UsageLevel::Warning;
    }
    return UsageLevel::Normal;
}

static std::string resource_label(Resource resource) {
    switch (resource) {
        case Resource::Cpu:    return "CPU";
        case Resource::Memory: return "Memory";
        case Resource::Disk:   return "Disk";
    }
    return "?";
}

Console::Console(ResourceMonitor& monitor, std::istream& in, std::ostream& out)
    : monitor_(monitor)
    , in_(in)
    , out_(out)
    , display_config_(monitor.config().display)
    , notify_config_(monitor.config().notify)
{
}

std::string Console::color_code(UsageLevel level) {
    if (display_config_.color_scheme == "mono") {
        return "";
    }

    switch (level) {
        case UsageLevel::Normal:   return "\033[32m";  // Green
        case UsageLevel::Warning:  return "\033[33m";  // Yellow
        case UsageLevel::Critical: return "\033[31m";  // Red
    }
    return "\033[0m";
}

std::string Console::reset_color() {
    if (display_config_.color_scheme == "mono") {
        return "";
    }
    return "\033[0m";
}

std::string Console::colorize(const std::string& text, UsageLevel level) {
    return color_code(level) + text + reset_color();
}

void Console::clear_screen() {
    if (display_config_.color_scheme == "mono") {
        return;
    }
    out_ << "\033[2J\033[H" << std::flush;
}

std::string Console::create_progress_bar(double percentage, int width, UsageLevel level) {
    int filled = static_cast<int>(std::clamp(percentage, 0.0, 100.0) / 100.0 * width);
    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }
    return colorize(bar, level);
}

void Console::print(const std::string& text) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << text << "\n" << std::flush;
}

bool Console::prompt(const std::string& text, std::string& answer) {
    if (interrupted()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(output_mutex_);
        out_ << text << std::flush;
    }
    if (!std::getline(in_, answer) || interrupted()) {
        return false;
    }
    answer.erase(0, answer.find_first_not_of(" \t"));
    answer.erase(answer.find_last_not_of(" \t\r") + 1);
    return true;
}

bool Console::prompt_int(const std::string& text, int& value) {
    std::string answer;
    if (!prompt(text, answer)) {
        return false;
    }
    try {
        size_t used = 0;
        value = std::stoi(answer, &used);
        if (used != answer.size()) {
            print("Not a whole number: " + answer);
            return false;
        }
    } catch (const std::exception&) {
        print("Not a whole number: " + answer);
        return false;
    }
    return true;
}

void Console::notify(const TriggerEvent& event) {
    if (!notify_config_.enabled) {
        return;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << "\n";
    if (notify_config_.beep_on_trigger) {
        out_ << "\a";
    }
    out_ << colorize("!! " + describe_trigger(event), UsageLevel::Critical) << "\n" << std::flush;
}

void Console::render_header(const std::string& title) {
    const size_t box_width = 44;
    const size_t padding = (box_width - std::min(title.size(), box_width)) / 2;

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << "╔";
    for (size_t i = 0; i < box_width; ++i) out_ << "═";
    out_ << "╗\n║" << std::string(padding, ' ') << title
         << std::string(box_width - padding - std::min(title.size(), box_width), ' ') << "║\n╚";
    for (size_t i = 0; i < box_width; ++i) out_ << "═";
    out_ << "╝\n";
}

void Console::render_main_menu() {
    render_header("RESMON");

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << "Monitoring: " << (monitor_.is_monitoring() ? colorize("running", UsageLevel::Normal)
                                                       : colorize("stopped", UsageLevel::Warning))
         << "\n\n"
         << "1. Start monitoring\n"
         << "2. Show system usage\n"
         << "3. Create alarm\n"
         << "4. List alarms\n"
         << "5. Remove alarm\n"
         << "6. Event log\n"
         << "7. Stop monitoring\n"
         << "8. Exit\n";
}

void Console::run() {
    while (!interrupted()) {
        monitor_.check_and_reload();
        render_main_menu();

        std::string choice;
        if (!prompt("Choose option (1-8): ", choice)) {
            break;
        }

        if (choice == "1") {
            print(monitor_.start_monitoring() ? "Monitoring started." : "Monitoring is already running.");
        } else if (choice == "2") {
            show_usage();
        } else if (choice == "3") {
            create_alarm();
        } else if (choice == "4") {
            list_alarms();
        } else if (choice == "5") {
            remove_alarm();
        } else if (choice == "6") {
            show_logs();
        } else if (choice == "7") {
            monitor_.stop();
            print("Monitoring stopped.");
        } else if (choice == "8" || choice == "q") {
            break;
        } else {
            print("Invalid choice.");
        }
    }
}

void Console::render_resource(Resource resource, double percent) {
    UsageLevel level = usage_level(percent);
    std::ostringstream value;
    value << std::fixed << std::setprecision(1) << std::setw(5) << percent << "%";

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << std::setw(8) << std::left << resource_label(resource) << std::right
         << create_progress_bar(percent, 20, level) << "  " << colorize(value.str(), level) << "\n";
}

void Console::render_usage(const Sample& sample) {
    clear_screen();
    render_header("SYSTEM USAGE");
    for (Resource resource : kAllResources) {
        render_resource(resource, value_of(sample, resource));
    }
    print("Sampled at " + format_timestamp(sample.timestamp));
}

void Console::show_usage() {
    auto sample = monitor_.get_snapshot();
    if (!sample) {
        print("No sample yet. Start monitoring first.");
        return;
    }

    std::string choice;
    if (!prompt("Show (a)ll, (c)pu, (m)emory or (d)isk [a]: ", choice)) {
        return;
    }

    if (choice.empty() || choice == "a") {
        render_usage(*sample);
        return;
    }

    auto resource = parse_resource(choice == "c" ? "cpu" : choice == "m" ? "memory"
                                   : choice == "d" ? "disk" : choice);
    if (!resource) {
        print("Unknown resource: " + choice);
        return;
    }
    render_resource(*resource, value_of(*sample, *resource));
}

void Console::create_alarm() {
    render_header("CREATE ALARM");

    std::string resource_text;
    if (!prompt("Resource (cpu, memory, disk): ", resource_text)) {
        return;
    }
    auto resource = parse_resource(resource_text);
    if (!resource) {
        print("Unknown resource: " + resource_text);
        return;
    }

    int threshold = 0;
    if (!prompt_int("Threshold (1-100): ", threshold)) {
        return;
    }

    std::string name;
    if (!prompt("Name (optional): ", name)) {
        return;
    }

    std::string period_text;
    if (!prompt("Active period (always, day, night, office, non-office) [always]: ", period_text)) {
        return;
    }
    ActivePeriod period = ActivePeriod::Always;
    if (!period_text.empty()) {
        auto parsed = parse_period(period_text);
        if (!parsed) {
            print("Unknown active period: " + period_text);
            return;
        }
        period = *parsed;
    }

    std::string error_msg;
    auto alarm = monitor_.create_alarm(*resource, threshold, name, error_msg, period);
    if (!alarm) {
        print(colorize(error_msg, UsageLevel::Critical));
        return;
    }
    print("Created alarm #" + std::to_string(alarm->id) + ": " + display_name(*alarm));
}

void Console::render_alarms(const std::vector<Alarm>& alarms) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (alarms.empty()) {
        out_ << "No alarms configured.\n";
        return;
    }

    out_ << std::left << std::setw(6) << "ID" << std::setw(9) << "Resource" << std::setw(11)
         << "Threshold" << std::setw(12) << "Period" << "Name\n";
    for (const auto& alarm : alarms) {
        out_ << std::setw(6) << alarm.id << std::setw(9) << resource_to_string(alarm.resource)
             << std::setw(11) << (std::to_string(alarm.threshold) + "%") << std::setw(12)
             << period_to_string(alarm.active_period) << display_name(alarm) << "\n";
    }
    out_ << std::right << std::flush;
}

void Console::list_alarms() {
    render_header("ALARMS");
    render_alarms(monitor_.list_alarms());

    if (auto trigger = monitor_.last_trigger()) {
        print("Last trigger: " + format_timestamp(trigger->timestamp) + " " + describe_trigger(*trigger));
    }
}

void Console::remove_alarm() {
    auto alarms = monitor_.list_alarms();
    render_header("REMOVE ALARM");
    render_alarms(alarms);
    if (alarms.empty()) {
        return;
    }

    int id = 0;
    if (!prompt_int("Alarm id to remove: ", id)) {
        return;
    }
    print(monitor_.remove_alarm(id) ? "Removed alarm #" + std::to_string(id) + "."
                                    : "No alarm with id " + std::to_string(id) + ".");
}

void Console::render_logs(const std::vector<LogEntry>& entries, const std::string& title) {
    render_header(title);

    std::lock_guard<std::mutex> lock(output_mutex_);
    out_ << "Showing " << entries.size() << " of " << monitor_.log_count() << " entries\n";
    for (const auto& entry : entries) {
        std::string line = format_log_line(entry);
        if (entry.category == LogCategory::AlarmTrigger) {
            line = colorize(line, UsageLevel::Critical);
        } else if (entry.category == LogCategory::Error) {
            line = colorize(line, UsageLevel::Warning);
        }
        out_ << line << "\n";
    }
    out_ << std::flush;
}

void Console::show_logs() {
    render_header("EVENT LOG");
    print("1. Last 20\n2. Last 50\n3. Search\n4. Date range\n5. All\n6. Back");

    std::string choice;
    if (!prompt("Choose option (1-6): ", choice)) {
        return;
    }

    if (choice == "1") {
        render_logs(monitor_.get_recent_logs(20), "LAST 20");
    } else if (choice == "2") {
        render_logs(monitor_.get_recent_logs(50), "LAST 50");
    } else if (choice == "3") {
        std::string text;
        if (prompt("Search text: ", text)) {
            render_logs(monitor_.search_logs(text), "SEARCH: " + text);
        }
    } else if (choice == "4") {
        std::string start_text, end_text;
        if (!prompt("Start date (YYYY-MM-DD, empty for none): ", start_text) ||
            !prompt("End date (YYYY-MM-DD, empty for none): ", end_text)) {
            return;
        }

        auto start = start_text.empty() ? std::optional<std::chrono::system_clock::time_point>(
                                              std::chrono::system_clock::time_point::min())
                                        : parse_log_date(start_text, false);
        auto end = end_text.empty() ? std::optional<std::chrono::system_clock::time_point>(
                                          std::chrono::system_clock::time_point::max())
                                    : parse_log_date(end_text, true);
        if (!start || !end) {
            print("Dates must look like 2024-05-01.");
            return;
        }
        render_logs(monitor_.get_logs_in_range(*start, *end),
                    "DATE: " + (start_text.empty() ? "START" : start_text) + " to " +
                        (end_text.empty() ? "NOW" : end_text));
    } else if (choice == "5") {
        render_logs(monitor_.get_recent_logs(monitor_.log_count()), "ALL");
    }
}

} // namespace resmon
