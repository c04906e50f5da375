// modules/substrate/local_execution_session.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_LOCAL_EXECUTION_SESSION_H
#define DURABLEFLOW_MODULES_SUBSTRATE_LOCAL_EXECUTION_SESSION_H

#include "modules/substrate/execution_host.h"
#include "modules/substrate/execution_session.h"
#include "modules/substrate/history_store.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace durableflow {

// ExecutionSession of the in-process host. Commands are first answered from
// the recorded history (replay); once the cursor reaches the end of history
// they run live and are appended to the store.
class LocalExecutionSession : public ExecutionSession {
public:
    LocalExecutionSession(ExecutionHost& host, ExecutionSlot& slot, const ExecutionHistory& history);
    ~LocalExecutionSession() override;

    const std::string& execution_id() const override { return execution_id_; }
    int run_number() const override { return run_number_; }
    bool is_replaying() const override { return cursor_ < events_.size(); }

    nlohmann::json execute_activity(const std::string& activity_name,
                                    const ActivityOptions& options,
                                    const nlohmann::json& input) override;
    void sleep(std::chrono::milliseconds duration) override;
    bool await_condition(const std::function<bool()>& predicate,
                         std::chrono::milliseconds timeout) override;

    void set_signal_handler(const std::string& signal_name, SignalHandler handler) override;
    void remove_signal_handler(const std::string& signal_name) override;
    void set_query_handler(const std::string& query_name, QueryHandler handler) override;
    void remove_query_handler(const std::string& query_name) override;

    [[noreturn]] void continue_as_new(nlohmann::json input) override;

    std::chrono::system_clock::time_point now() override;

    // Highest signal id delivered to a handler in this run
    int64_t last_signal_id() const { return last_signal_id_; }

private:
    ExecutionHost& host_;
    ExecutionSlot& slot_;
    std::string execution_id_;
    int run_number_;
    std::vector<HistoryEvent> events_;
    size_t cursor_ = 0;
    int64_t last_signal_id_ = 0;
    std::unordered_map<std::string, SignalHandler> signal_handlers_;

    // Consumes the next recorded event if it is one of `types` named `name`;
    // nullptr when live. Throws NonDeterminismError on any other event.
    const HistoryEvent* replay_next(std::initializer_list<HistoryEventType> types, const std::string& name);
    void record(HistoryEventType type, const std::string& name, nlohmann::json payload);

    // Applies recorded signals at the cursor, or drains the live inbox
    void sync_signals();
    void drain_inbox();

    bool wait_durably(HistoryEventType start_type,
                      HistoryEventType end_type,
                      const std::string& name,
                      const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout);
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_LOCAL_EXECUTION_SESSION_H
