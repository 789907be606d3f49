#include "resmon/metrics_collector.hpp"
#include "resmon/debug_logger.hpp"
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/statvfs.h>

namespace resmon {

class LinuxMetricsCollector : public MetricsCollector {
public:
    explicit LinuxMetricsCollector(const std::string& disk_path)
        : disk_path_(disk_path)
    {
        // Prime the CPU counters so the first sample has a delta to work with
        if (!read_cpu_stats(prev_total_, prev_idle_)) {
            DebugLogger::log("Initial /proc/stat read failed");
        }
    }

    Sample sample_system() override {
        Sample sample;
        sample.timestamp = std::chrono::system_clock::now();
        sample.cpu = collect_cpu();
        sample.memory = collect_memory();
        sample.disk = collect_disk();
        DebugLogger::log("Sampled cpu=", sample.cpu, " mem=", sample.memory, " disk=", sample.disk);
        return sample;
    }

private:
    double collect_cpu() {
        unsigned long long total, idle;
        if (!read_cpu_stats(total, idle)) {
            throw SourceError("cannot read /proc/stat");
        }

        unsigned long long total_diff = total - prev_total_;
        unsigned long long idle_diff = idle - prev_idle_;
        prev_total_ = total;
        prev_idle_ = idle;

        if (total_diff == 0) {
            return 0.0;
        }
        return 100.0 * (1.0 - static_cast<double>(idle_diff) / static_cast<double>(total_diff));
    }

    double collect_memory() {
        std::ifstream meminfo("/proc/meminfo");
        if (!meminfo.is_open()) {
            throw SourceError("cannot read /proc/meminfo");
        }

        uint64_t total = 0;
        uint64_t available = 0;
        std::string line;

        while (std::getline(meminfo, line)) {
            std::istringstream iss(line);
            std::string key;
            uint64_t value = 0;
            iss >> key >> value;

            if (key == "MemTotal:") {
                total = value;
            } else if (key == "MemAvailable:") {
                available = value;
            }
        }

        if (total == 0) {
            throw SourceError("MemTotal missing from /proc/meminfo");
        }
        return static_cast<double>(total - available) / static_cast<double>(total) * 100.0;
    }

    double collect_disk() {
        struct statvfs stat;
        if (statvfs(disk_path_.c_str(), &stat) != 0) {
            throw SourceError("statvfs(" + disk_path_ + "): " + std::strerror(errno));
        }

        uint64_t total = static_cast<uint64_t>(stat.f_blocks) * stat.f_frsize;
        uint64_t used = static_cast<uint64_t>(stat.f_blocks - stat.f_bfree) * stat.f_frsize;
        if (total == 0) {
            return 0.0;
        }
        return static_cast<double>(used) / static_cast<double>(total) * 100.0;
    }

    bool read_cpu_stats(unsigned long long& total, unsigned long long& idle) {
        std::ifstream stat_file("/proc/stat");
        std::string line;
        if (!stat_file.is_open() || !std::getline(stat_file, line)) {
            return false;
        }

        std::istringstream iss(line);
        std::string cpu;
        unsigned long long user = 0, nice = 0, system = 0, idle_val = 0;
        unsigned long long iowait = 0, irq = 0, softirq = 0, steal = 0;
        iss >> cpu >> user >> nice >> system >> idle_val >> iowait >> irq >> softirq >> steal;
        if (cpu != "cpu") {
            return false;
        }

        total = user + nice + system + idle_val + iowait + irq + softirq + steal;
        idle = idle_val + iowait;
        return true;
    }

    std::string disk_path_;
    unsigned long long prev_total_ = 0;
    unsigned long long prev_idle_ = 0;
};

std::unique_ptr<MetricsCollector> create_linux_metrics_collector(const std::string& disk_path) {
    return std::make_unique<LinuxMetricsCollector>(disk_path);
}

} // namespace resmon
