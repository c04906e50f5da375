// modules/persistence/execution_store.cpp
#include "modules/persistence/execution_store.h"
#include "common/errors.h"
#include <chrono>

namespace durableflow {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

void InMemoryExecutionStore::create(const ExecutionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(record.id) > 0) {
        throw ConfigError("Execution record already exists: " + record.id);
    }
    ExecutionRecord stored = record;
    if (stored.created_at_ms == 0) {
        stored.created_at_ms = now_ms();
    }
    records_.emplace(stored.id, std::move(stored));
}

std::optional<ExecutionRecord> InMemoryExecutionStore::get(const std::string& execution_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(execution_id);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

ExecutionRecord InMemoryExecutionStore::update_status(const std::string& execution_id,
                                                      ExecutionStatus status,
                                                      const std::optional<nlohmann::json>& outputs,
                                                      const std::optional<std::string>& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(execution_id);
    if (it == records_.end()) {
        throw ExecutionStateError("Unknown execution record: " + execution_id);
    }
    ExecutionRecord& record = it->second;

    if (record.status == status && is_terminal(status)) {
        return record; // duplicate delivery of the final update
    }
    if (is_terminal(record.status)) {
        throw ExecutionStateError("Execution " + execution_id + " is already " + to_string(record.status) +
                                  "; cannot move to " + to_string(status));
    }
    if (status == ExecutionStatus::PENDING && record.status != ExecutionStatus::PENDING) {
        throw ExecutionStateError("Execution " + execution_id + " cannot return to pending");
    }

    record.status = status;
    if (status == ExecutionStatus::RUNNING && !record.started_at_ms) {
        record.started_at_ms = now_ms();
    }
    if (is_terminal(status)) {
        record.completed_at_ms = now_ms();
    }
    if (outputs) record.outputs = *outputs;
    if (error) record.error = *error;
    return record;
}

} // namespace durableflow
