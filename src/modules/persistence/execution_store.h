// modules/persistence/execution_store.h
#ifndef DURABLEFLOW_MODULES_PERSISTENCE_EXECUTION_STORE_H
#define DURABLEFLOW_MODULES_PERSISTENCE_EXECUTION_STORE_H

#include "core/types/execution.h"
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace durableflow {

// Execution Persistence port
class ExecutionStore {
public:
    virtual ~ExecutionStore() = default;

    // Throws ConfigError if the id already exists
    virtual void create(const ExecutionRecord& record) = 0;
    virtual std::optional<ExecutionRecord> get(const std::string& execution_id) const = 0;

    // Moves the record forward. Throws ExecutionStateError for an unknown id,
    // a move out of a terminal state, or a move back to pending. Re-applying
    // the current status is accepted (activities are delivered at least once).
    virtual ExecutionRecord update_status(const std::string& execution_id,
                                          ExecutionStatus status,
                                          const std::optional<nlohmann::json>& outputs = std::nullopt,
                                          const std::optional<std::string>& error = std::nullopt) = 0;
};

class InMemoryExecutionStore : public ExecutionStore {
public:
    void create(const ExecutionRecord& record) override;
    std::optional<ExecutionRecord> get(const std::string& execution_id) const override;
    ExecutionRecord update_status(const std::string& execution_id,
                                  ExecutionStatus status,
                                  const std::optional<nlohmann::json>& outputs = std::nullopt,
                                  const std::optional<std::string>& error = std::nullopt) override;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExecutionRecord> records_;
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_PERSISTENCE_EXECUTION_STORE_H
