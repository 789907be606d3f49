#pragma once

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace resmon {

enum class Resource {
    Cpu,
    Memory,
    Disk
};

constexpr std::array<Resource, 3> kAllResources = {Resource::Cpu, Resource::Memory, Resource::Disk};

inline size_t resource_index(Resource resource) {
    return static_cast<size_t>(resource);
}

// "cpu" | "memory" | "disk", as used in the alarm file
std::string resource_to_string(Resource resource);

// Accepts the persisted names plus "ram" and upper-case forms
std::optional<Resource> parse_resource(const std::string& text);

struct Sample {
    double cpu = 0.0;                        // 0-100%
    double memory = 0.0;                     // 0-100%
    double disk = 0.0;                       // 0-100%
    std::chrono::system_clock::time_point timestamp;
};

double value_of(const Sample& sample, Resource resource);

// Thrown by a collector when a reading cannot be obtained
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class MetricsCollector {
public:
    virtual ~MetricsCollector() = default;

    // Point-in-time utilization; throws SourceError on failure
    virtual Sample sample_system() = 0;
};

// Factory function
std::unique_ptr<MetricsCollector> create_metrics_collector(const std::string& disk_path);

} // namespace resmon
