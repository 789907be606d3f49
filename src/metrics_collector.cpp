#include "resmon/metrics_collector.hpp"
#include <algorithm>
#include <cctype>

namespace resmon {

std::string resource_to_string(Resource resource) {
    switch (resource) {
        case Resource::Cpu:    return "cpu";
        case Resource::Memory: return "memory";
        case Resource::Disk:   return "disk";
    }
    return "unknown";
}

std::optional<Resource> parse_resource(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "cpu") return Resource::Cpu;
    if (lower == "memory" || lower == "mem" || lower == "ram") return Resource::Memory;
    if (lower == "disk") return Resource::Disk;
    return std::nullopt;
}

double value_of(const Sample& sample, Resource resource) {
    switch (resource) {
        case Resource::Cpu:    return sample.cpu;
        case Resource::Memory: return sample.memory;
        case Resource::Disk:   return sample.disk;
    }
    return 0.0;
}

// Platform-specific implementations are in platform/ subdirectory

#ifdef __linux__
    std::unique_ptr<MetricsCollector> create_metrics_collector(const std::string& disk_path) {
        extern std::unique_ptr<MetricsCollector> create_linux_metrics_collector(const std::string& disk_path);
        return create_linux_metrics_collector(disk_path);
    }
#else
    #error "Unsupported platform"
#endif

} // namespace resmon
