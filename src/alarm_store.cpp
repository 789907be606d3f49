#include "resmon/alarm_store.hpp"
#include "resmon/debug_logger.hpp"
#include <json/json.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <unistd.h>

namespace resmon {

namespace {

int local_hour(const std::chrono::system_clock::time_point& tp) {
    auto time_t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&time_t, &tm);
    return tm.tm_hour;
}

std::string describe(const Alarm& alarm) {
    std::ostringstream oss;
    oss << "#" << alarm.id << " " << resource_to_string(alarm.resource) << " >= "
        << alarm.threshold << "%";
    if (!alarm.name.empty()) {
        oss << " \"" << alarm.name << "\"";
    }
    if (alarm.active_period != ActivePeriod::Always) {
        oss << " (" << period_to_string(alarm.active_period) << ")";
    }
    return oss.str();
}

// Write-then-fsync-then-rename so a crash never leaves a half-written file
bool write_file_atomically(const std::string& path, const std::string& contents,
                           std::string& error_msg) {
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            error_msg = "cannot create " + target.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    std::string tmp_path = path + ".tmp";
    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        error_msg = "open " + tmp_path + ": " + std::strerror(errno);
        return false;
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            error_msg = "write " + tmp_path + ": " + std::strerror(errno);
            ::close(fd);
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::fsync(fd) != 0) {
        error_msg = "fsync " + tmp_path + ": " + std::strerror(errno);
        ::close(fd);
        return false;
    }
    if (::close(fd) != 0) {
        error_msg = "close " + tmp_path + ": " + std::strerror(errno);
        return false;
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, target, ec);
    if (ec) {
        error_msg = "rename " + tmp_path + ": " + ec.message();
        return false;
    }
    return true;
}

} // namespace

std::string period_to_string(ActivePeriod period) {
    switch (period) {
        case ActivePeriod::Always:    return "always";
        case ActivePeriod::Day:       return "day";
        case ActivePeriod::Night:     return "night";
        case ActivePeriod::Office:    return "office";
        case ActivePeriod::NonOffice: return "non-office";
    }
    return "always";
}

std::optional<ActivePeriod> parse_period(const std::string& text) {
    if (text == "always") return ActivePeriod::Always;
    if (text == "day") return ActivePeriod::Day;
    if (text == "night") return ActivePeriod::Night;
    if (text == "office") return ActivePeriod::Office;
    if (text == "non-office") return ActivePeriod::NonOffice;
    return std::nullopt;
}

bool is_active_at(ActivePeriod period, int hour) {
    switch (period) {
        case ActivePeriod::Always:    return true;
        case ActivePeriod::Day:       return hour >= 6 && hour <= 21;
        case ActivePeriod::Night:     return hour < 6 || hour > 21;
        case ActivePeriod::Office:    return hour >= 9 && hour <= 17;
        case ActivePeriod::NonOffice: return hour < 9 || hour > 17;
    }
    return true;
}

std::string display_name(const Alarm& alarm) {
    if (!alarm.name.empty()) {
        return alarm.name;
    }
    std::string resource = resource_to_string(alarm.resource);
    std::transform(resource.begin(), resource.end(), resource.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return resource + " alarm " + std::to_string(alarm.threshold) + "%";
}

AlarmStore::AlarmStore(const std::string& path, std::shared_ptr<EventLog> log)
    : path_(path)
    , log_(std::move(log))
{
}

void AlarmStore::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    alarms_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        log_->append(LogCategory::Status, "No alarm file at " + path_ + ", starting with no alarms");
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        log_->append(LogCategory::Error, "Cannot open alarm file " + path_ + ", starting with no alarms");
        return;
    }

    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errors;

    try {
        if (!Json::parseFromStream(builder, file, &root, &errors)) {
            log_->append(LogCategory::Error, "Malformed alarm file " + path_ + ": " + errors);
            return;
        }
    } catch (const std::exception& e) {
        log_->append(LogCategory::Error, "Malformed alarm file " + path_ + ": " + e.what());
        return;
    }

    if (!root.isArray()) {
        log_->append(LogCategory::Error, "Alarm file " + path_ + " is not a list, ignoring it");
        return;
    }

    int max_id = 0;
    for (const auto& entry : root) {
        if (!entry.isObject() || !entry["id"].isInt() || !entry["resource"].isString() ||
            !entry["threshold"].isInt()) {
            log_->append(LogCategory::Error, "Skipping malformed alarm record in " + path_);
            continue;
        }

        Alarm alarm;
        alarm.id = entry["id"].asInt();
        alarm.threshold = entry["threshold"].asInt();

        auto resource = parse_resource(entry["resource"].asString());
        if (!resource || alarm.threshold < 1 || alarm.threshold > 100 || alarm.id < 1 ||
            alarm.id == std::numeric_limits<int>::max()) {
            log_->append(LogCategory::Error,
                         "Skipping invalid alarm record id=" + std::to_string(alarm.id) + " in " + path_);
            continue;
        }
        alarm.resource = *resource;

        auto duplicate = std::find_if(alarms_.begin(), alarms_.end(),
                                      [&](const Alarm& a) { return a.id == alarm.id; });
        if (duplicate != alarms_.end()) {
            log_->append(LogCategory::Error,
                         "Skipping duplicate alarm id=" + std::to_string(alarm.id) + " in " + path_);
            continue;
        }

        if (entry["name"].isString()) {
            alarm.name = entry["name"].asString();
        }
        if (entry["active_period"].isString()) {
            alarm.active_period = parse_period(entry["active_period"].asString())
                                      .value_or(ActivePeriod::Always);
        }

        max_id = std::max(max_id, alarm.id);
        alarms_.push_back(std::move(alarm));
    }

    next_id_ = std::max(next_id_, max_id + 1);
    log_->append(LogCategory::Status,
                 "Loaded " + std::to_string(alarms_.size()) + " alarms from " + path_);
}

bool AlarmStore::save_locked() {
    Json::Value root(Json::arrayValue);
    for (const auto& alarm : alarms_) {
        Json::Value entry;
        entry["id"] = alarm.id;
        entry["resource"] = resource_to_string(alarm.resource);
        entry["threshold"] = alarm.threshold;
        entry["name"] = alarm.name;
        entry["active_period"] = period_to_string(alarm.active_period);
        root.append(entry);
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";

    std::string error_msg;
    if (!write_file_atomically(path_, Json::writeString(builder, root), error_msg)) {
        log_->append(LogCategory::Error, "Failed to save alarms, keeping them in memory: " + error_msg);
        return false;
    }

    DebugLogger::log("Saved ", alarms_.size(), " alarms to ", path_);
    return true;
}

std::optional<Alarm> AlarmStore::create_alarm(Resource resource, int threshold,
                                              const std::string& name, std::string& error_msg,
                                              ActivePeriod period) {
    if (threshold < 1 || threshold > 100) {
        error_msg = "Threshold must be between 1 and 100 (got " + std::to_string(threshold) + ")";
        log_->append(LogCategory::UserAction, "Rejected alarm for " + resource_to_string(resource) +
                                                  ": threshold " + std::to_string(threshold) +
                                                  " out of range");
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (next_id_ == std::numeric_limits<int>::max()) {
        error_msg = "Alarm id space exhausted";
        log_->append(LogCategory::Error, "Rejected alarm for " + resource_to_string(resource) +
                                              ": alarm id space exhausted");
        return std::nullopt;
    }

    Alarm alarm;
    alarm.id = next_id_++;
    alarm.resource = resource;
    alarm.threshold = threshold;
    alarm.name = name;
    alarm.active_period = period;

    alarms_.push_back(alarm);
    save_locked();
    log_->append(LogCategory::UserAction, "Created alarm " + describe(alarm));
    return alarm;
}

bool AlarmStore::remove_alarm(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(alarms_.begin(), alarms_.end(),
                           [id](const Alarm& a) { return a.id == id; });
    if (it == alarms_.end()) {
        return false;
    }

    Alarm removed = *it;
    alarms_.erase(it);
    save_locked();
    log_->append(LogCategory::UserAction, "Removed alarm " + describe(removed));
    return true;
}

std::vector<Alarm> AlarmStore::list_for(Resource resource) const {
    std::vector<Alarm> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::copy_if(alarms_.begin(), alarms_.end(), std::back_inserter(result),
                     [resource](const Alarm& a) { return a.resource == resource; });
    }

    std::sort(result.begin(), result.end(), [](const Alarm& a, const Alarm& b) {
        return a.threshold != b.threshold ? a.threshold < b.threshold : a.id < b.id;
    });
    return result;
}

std::vector<Alarm> AlarmStore::list_all() const {
    std::vector<Alarm> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result = alarms_;
    }

    std::sort(result.begin(), result.end(), [](const Alarm& a, const Alarm& b) {
        if (a.resource != b.resource) {
            return resource_index(a.resource) < resource_index(b.resource);
        }
        return a.threshold != b.threshold ? a.threshold < b.threshold : a.id < b.id;
    });
    return result;
}

std::optional<Alarm> AlarmStore::select_locked(Resource resource, double value, int hour) const {
    const Alarm* best = nullptr;
    for (const auto& alarm : alarms_) {
        if (alarm.resource != resource || alarm.threshold > value ||
            !is_active_at(alarm.active_period, hour)) {
            continue;
        }
        if (best == nullptr || alarm.threshold > best->threshold ||
            (alarm.threshold == best->threshold && alarm.id < best->id)) {
            best = &alarm;
        }
    }

    if (best == nullptr) {
        return std::nullopt;
    }
    return *best;
}

std::optional<Alarm> AlarmStore::select_active(Resource resource, double value) const {
    return select_active(resource, value, local_hour(std::chrono::system_clock::now()));
}

std::optional<Alarm> AlarmStore::select_active(Resource resource, double value, int hour) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return select_locked(resource, value, hour);
}

ActiveAlarms AlarmStore::select_active(const Sample& sample) const {
    int hour = local_hour(sample.timestamp);
    ActiveAlarms active;

    std::lock_guard<std::mutex> lock(mutex_);
    for (Resource resource : kAllResources) {
        active[resource_index(resource)] = select_locked(resource, value_of(sample, resource), hour);
    }
    return active;
}

size_t AlarmStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return alarms_.size();
}

} // namespace resmon
