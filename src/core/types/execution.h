#ifndef DURABLEFLOW_TYPES_EXECUTION_H
#define DURABLEFLOW_TYPES_EXECUTION_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace durableflow {

enum class ExecutionStatus : uint8_t {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED
};

// Owned by the caller; the orchestrator only moves status/outputs forward
struct ExecutionRecord {
    std::string id;
    std::string workflow_id;
    ExecutionStatus status = ExecutionStatus::PENDING;
    nlohmann::json inputs = nlohmann::json::object();
    nlohmann::json outputs = nlohmann::json::object();
    std::optional<std::string> error;
    int64_t created_at_ms = 0;
    std::optional<int64_t> started_at_ms;
    std::optional<int64_t> completed_at_ms;
};

std::string to_string(ExecutionStatus status);
ExecutionStatus parse_execution_status(const std::string& value);
bool is_terminal(ExecutionStatus status);

void to_json(nlohmann::json& j, const ExecutionRecord& record);
void from_json(const nlohmann::json& j, ExecutionRecord& record);

} // namespace durableflow

#endif // DURABLEFLOW_TYPES_EXECUTION_H
