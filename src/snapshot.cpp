#include "resmon/snapshot.hpp"

namespace resmon {

void SnapshotAccessor::publish(const Sample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = sample;
    ++seq_;
}

std::optional<Sample> SnapshotAccessor::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

uint64_t SnapshotAccessor::sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return seq_;
}

} // namespace resmon
