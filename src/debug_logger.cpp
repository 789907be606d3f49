#include "resmon/debug_logger.hpp"

namespace resmon {

std::atomic<bool> DebugLogger::enabled_{false};
std::mutex DebugLogger::mutex_;

} // namespace resmon
