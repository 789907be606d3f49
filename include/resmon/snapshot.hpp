#pragma once

#include "resmon/metrics_collector.hpp"
#include <cstdint>
#include <mutex>
#include <optional>

namespace resmon {

// Latest sample, written by the monitoring loop and read by any number of
// foreground callers. A reader sees either the previous sample or the new
// one in full.
class SnapshotAccessor {
public:
    void publish(const Sample& sample);

    // std::nullopt before the first publish
    std::optional<Sample> current() const;

    // Number of publishes so far
    uint64_t sequence() const;

private:
    mutable std::mutex mutex_;
    std::optional<Sample> latest_;
    uint64_t seq_ = 0;
};

} // namespace resmon
