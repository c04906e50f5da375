// modules/trace/event_sink.h
#ifndef DURABLEFLOW_MODULES_TRACE_EVENT_SINK_H
#define DURABLEFLOW_MODULES_TRACE_EVENT_SINK_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

namespace durableflow {

namespace events {
inline constexpr const char* kExecutionStarted = "ExecutionStarted";
inline constexpr const char* kExecutionProgress = "ExecutionProgress";
inline constexpr const char* kExecutionCompleted = "ExecutionCompleted";
inline constexpr const char* kExecutionFailed = "ExecutionFailed";
inline constexpr const char* kNodeStarted = "NodeStarted";
inline constexpr const char* kNodeCompleted = "NodeCompleted";
inline constexpr const char* kNodeFailed = "NodeFailed";
inline constexpr const char* kAgentThinking = "AgentThinking";
inline constexpr const char* kAgentMessage = "AgentMessage";
inline constexpr const char* kToolCallStarted = "ToolCallStarted";
inline constexpr const char* kToolCallCompleted = "ToolCallCompleted";
inline constexpr const char* kToolCallFailed = "ToolCallFailed";
} // namespace events

// Telemetry port. Emission is fire-and-forget; a throwing sink never
// changes control flow (the orchestrators swallow TelemetryError).
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const std::string& event_type, const nlohmann::json& payload) = 0;
};

struct EventRecord {
    std::string type;
    nlohmann::json payload;
    std::chrono::system_clock::time_point emitted_at;
};

// 记录所有事件，供测试与调试查看
class RecordingEventSink : public EventSink {
public:
    void emit(const std::string& event_type, const nlohmann::json& payload) override;

    std::vector<EventRecord> events() const;
    std::vector<EventRecord> events_of(const std::string& event_type) const;
    size_t count(const std::string& event_type) const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<EventRecord> events_;
};

// Writes every event to the durableflow logger at info level
class LoggingEventSink : public EventSink {
public:
    void emit(const std::string& event_type, const nlohmann::json& payload) override;
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_TRACE_EVENT_SINK_H
