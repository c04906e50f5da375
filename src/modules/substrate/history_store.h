// modules/substrate/history_store.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_HISTORY_STORE_H
#define DURABLEFLOW_MODULES_SUBSTRATE_HISTORY_STORE_H

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

enum class HistoryEventType : uint8_t {
    ACTIVITY_COMPLETED,
    ACTIVITY_FAILED,
    TIMER_STARTED,
    TIMER_FIRED,
    CONDITION_STARTED,
    CONDITION_RESOLVED,
    SIGNAL_RECEIVED,
    SIDE_EFFECT
};

struct HistoryEvent {
    HistoryEventType type = HistoryEventType::SIDE_EFFECT;
    std::string name;
    nlohmann::json payload = nlohmann::json::object();
};

struct SignalRecord {
    int64_t id = 0; // per-execution, strictly increasing in arrival order
    std::string name;
    nlohmann::json payload;
};

// Durable state of one execution: the current run's input and history plus
// the signal inbox, which outlives continue-as-new.
struct ExecutionHistory {
    std::string execution_id;
    std::string workflow_type;
    int run_number = 1;
    nlohmann::json input;
    std::vector<HistoryEvent> events;
    std::vector<SignalRecord> inbox;
    int64_t next_signal_id = 1;
    bool closed = false;
    nlohmann::json outcome; // {"status": "completed"|"failed", "result"|"error": ...}
};

std::string to_string(HistoryEventType type);
HistoryEventType parse_history_event_type(const std::string& value);

void to_json(nlohmann::json& j, const HistoryEvent& event);
void from_json(const nlohmann::json& j, HistoryEvent& event);
void to_json(nlohmann::json& j, const SignalRecord& signal);
void from_json(const nlohmann::json& j, SignalRecord& signal);
void to_json(nlohmann::json& j, const ExecutionHistory& history);
void from_json(const nlohmann::json& j, ExecutionHistory& history);

class HistoryStore {
public:
    virtual ~HistoryStore() = default;

    // Creates the execution; fails with ConfigError if the id is taken
    virtual void create(const std::string& execution_id,
                        const std::string& workflow_type,
                        const nlohmann::json& input) = 0;
    // Replaces the current run (continue-as-new); the inbox is kept
    virtual void start_new_run(const std::string& execution_id, const nlohmann::json& input) = 0;
    virtual void append_event(const std::string& execution_id, const HistoryEvent& event) = 0;
    virtual void close(const std::string& execution_id, const nlohmann::json& outcome) = 0;

    virtual std::optional<ExecutionHistory> load(const std::string& execution_id) const = 0;
    virtual std::vector<std::string> list_open() const = 0;

    // Returns the assigned signal id; throws ExecutionStateError if closed or unknown
    virtual int64_t enqueue_signal(const std::string& execution_id,
                                   const std::string& signal_name,
                                   const nlohmann::json& payload) = 0;
    virtual std::vector<SignalRecord> pending_signals(const std::string& execution_id) const = 0;
    // Drops every inbox entry with id <= up_to_id
    virtual void ack_signals(const std::string& execution_id, int64_t up_to_id) = 0;
};

class InMemoryHistoryStore : public HistoryStore {
public:
    void create(const std::string& execution_id, const std::string& workflow_type, const nlohmann::json& input) override;
    void start_new_run(const std::string& execution_id, const nlohmann::json& input) override;
    void append_event(const std::string& execution_id, const HistoryEvent& event) override;
    void close(const std::string& execution_id, const nlohmann::json& outcome) override;
    std::optional<ExecutionHistory> load(const std::string& execution_id) const override;
    std::vector<std::string> list_open() const override;
    int64_t enqueue_signal(const std::string& execution_id, const std::string& signal_name, const nlohmann::json& payload) override;
    std::vector<SignalRecord> pending_signals(const std::string& execution_id) const override;
    void ack_signals(const std::string& execution_id, int64_t up_to_id) override;

protected:
    // Hook for persistent subclasses, called with mutex_ held after each mutation
    virtual void persist_locked(const ExecutionHistory& history);

    ExecutionHistory& require_locked(const std::string& execution_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ExecutionHistory> histories_;
    std::vector<std::string> order_; // creation order for list_open()
};

// One JSON document per execution under `directory`, rewritten atomically
// (write to .tmp, then rename) on every mutation. Reloaded on construction.
class FileHistoryStore : public InMemoryHistoryStore {
public:
    explicit FileHistoryStore(std::filesystem::path directory);

protected:
    void persist_locked(const ExecutionHistory& history) override;

private:
    std::filesystem::path directory_;

    std::filesystem::path path_for(const std::string& execution_id) const;
    void load_all();
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_HISTORY_STORE_H
