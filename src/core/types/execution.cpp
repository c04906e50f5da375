// core/types/execution.cpp
#include "core/types/execution.h"
#include "common/errors.h"

namespace durableflow {

std::string to_string(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::PENDING:   return "pending";
        case ExecutionStatus::RUNNING:   return "running";
        case ExecutionStatus::COMPLETED: return "completed";
        case ExecutionStatus::FAILED:    return "failed";
        case ExecutionStatus::CANCELLED: return "cancelled";
    }
    return "pending";
}

ExecutionStatus parse_execution_status(const std::string& value) {
    if (value == "pending") return ExecutionStatus::PENDING;
    if (value == "running") return ExecutionStatus::RUNNING;
    if (value == "completed") return ExecutionStatus::COMPLETED;
    if (value == "failed") return ExecutionStatus::FAILED;
    if (value == "cancelled") return ExecutionStatus::CANCELLED;
    throw ConfigError("Unknown execution status '" + value + "'");
}

bool is_terminal(ExecutionStatus status) {
    return status == ExecutionStatus::COMPLETED
        || status == ExecutionStatus::FAILED
        || status == ExecutionStatus::CANCELLED;
}

void to_json(nlohmann::json& j, const ExecutionRecord& record) {
    j = nlohmann::json{
        {"id", record.id},
        {"workflow_id", record.workflow_id},
        {"status", to_string(record.status)},
        {"inputs", record.inputs},
        {"outputs", record.outputs},
        {"created_at", record.created_at_ms}
    };
    if (record.error) j["error"] = *record.error;
    if (record.started_at_ms) j["started_at"] = *record.started_at_ms;
    if (record.completed_at_ms) j["completed_at"] = *record.completed_at_ms;
}

void from_json(const nlohmann::json& j, ExecutionRecord& record) {
    record = ExecutionRecord{};
    record.id = j.at("id").get<std::string>();
    record.workflow_id = j.value("workflow_id", std::string{});
    record.status = parse_execution_status(j.value("status", std::string("pending")));
    record.inputs = j.value("inputs", nlohmann::json::object());
    record.outputs = j.value("outputs", nlohmann::json::object());
    record.created_at_ms = j.value("created_at", int64_t{0});
    if (j.contains("error") && j.at("error").is_string()) record.error = j.at("error").get<std::string>();
    if (j.contains("started_at")) record.started_at_ms = j.at("started_at").get<int64_t>();
    if (j.contains("completed_at")) record.completed_at_ms = j.at("completed_at").get<int64_t>();
}

} // namespace durableflow
