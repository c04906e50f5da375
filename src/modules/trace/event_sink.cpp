// modules/trace/event_sink.cpp
#include "modules/trace/event_sink.h"
#include "common/logging/logger.h"
#include <algorithm>

namespace durableflow {

void RecordingEventSink::emit(const std::string& event_type, const nlohmann::json& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(EventRecord{event_type, payload, std::chrono::system_clock::now()});
}

std::vector<EventRecord> RecordingEventSink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

std::vector<EventRecord> RecordingEventSink::events_of(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<EventRecord> matching;
    for (const auto& record : events_) {
        if (record.type == event_type) matching.push_back(record);
    }
    return matching;
}

size_t RecordingEventSink::count(const std::string& event_type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(events_.begin(), events_.end(),
                                             [&](const EventRecord& r) { return r.type == event_type; }));
}

void RecordingEventSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

void LoggingEventSink::emit(const std::string& event_type, const nlohmann::json& payload) {
    DF_LOG_INFO("[Event] {} {}", event_type, payload.dump());
}

} // namespace durableflow
