// modules/substrate/execution_host.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_HOST_H
#define DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_HOST_H

#include "modules/substrate/activity_context.h"
#include "modules/substrate/execution_session.h"
#include "modules/substrate/history_store.h"
#include <nlohmann/json.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace durableflow {

// Per-execution runtime state shared by the host and the running session.
struct ExecutionSlot {
    std::string execution_id;

    std::mutex mutex;
    std::condition_variable cv;
    uint64_t signal_generation = 0; // bumped on every delivered signal
    bool done = false;
    bool evicted = false;
    nlohmann::json outcome;

    std::mutex query_mutex;
    std::unordered_map<std::string, QueryHandler> query_handlers;

    std::thread thread;
};

// In-process reference host: one thread per execution, event-sourced over a
// HistoryStore. Open executions left behind by a stopped host are resumed
// (replayed) by resume_pending() on a new host sharing the same store.
class ExecutionHost {
public:
    explicit ExecutionHost(std::shared_ptr<HistoryStore> store);
    ~ExecutionHost();

    ExecutionHost(const ExecutionHost&) = delete;
    ExecutionHost& operator=(const ExecutionHost&) = delete;

    void register_workflow(const std::string& workflow_type, WorkflowFunction fn);
    void register_activity(const std::string& activity_name, ActivityFunction fn);

    // Throws ConfigError for an unknown workflow type or a reused id
    void start(const std::string& execution_id, const std::string& workflow_type, const nlohmann::json& input);

    // Durable delivery; throws ExecutionStateError if the execution is closed or unknown
    void signal(const std::string& execution_id, const std::string& signal_name, const nlohmann::json& payload);

    // Throws ExecutionStateError if the execution is not live on this host or has no such handler
    nlohmann::json query(const std::string& execution_id, const std::string& query_name);

    // Returns {"status": "completed", "result": ...} or {"status": "failed", "error": ..., "kind": ...};
    // std::nullopt when the execution is still open after `timeout`
    std::optional<nlohmann::json> wait_result(const std::string& execution_id,
                                              std::chrono::milliseconds timeout = kNoTimeout);

    // Relaunches every open execution of the store not already running here
    std::vector<std::string> resume_pending();

    // Evicts every running execution and joins its thread. Idempotent.
    void stop();

    // Executions currently running on this host
    size_t live_executions() const;
    // Execution threads not yet joined, live ones included
    size_t retained_threads() const;

    bool stopping() const { return stopping_.load(); }
    HistoryStore& store() { return *store_; }

    // Runs one activity to completion under its retry policy. Each attempt
    // runs on its own worker thread and is abandoned once it overruns its
    // start-to-close or heartbeat timeout. Throws ActivityFailure when
    // exhausted, ExecutionEvicted if the host stops meanwhile.
    nlohmann::json run_activity(ExecutionSlot& slot,
                                const std::string& activity_name,
                                const ActivityOptions& options,
                                const nlohmann::json& input);

private:
    std::shared_ptr<HistoryStore> store_;
    std::atomic<bool> stopping_{false};

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WorkflowFunction> workflows_;
    std::unordered_map<std::string, ActivityFunction> activities_;
    std::unordered_map<std::string, std::shared_ptr<ExecutionSlot>> slots_;
    std::vector<std::thread> finished_threads_; // exited or exiting; joined on the next launch

    void launch(const std::string& execution_id);
    void run_execution(std::shared_ptr<ExecutionSlot> slot);
    void finish(ExecutionSlot& slot, const nlohmann::json& outcome);
    void retire(const std::shared_ptr<ExecutionSlot>& slot);
    void reap_finished_locked();
    nlohmann::json await_attempt(const std::string& activity_name,
                                 std::future<nlohmann::json>& attempt,
                                 ActivityContext& context);
    std::shared_ptr<ExecutionSlot> find_slot(const std::string& execution_id) const;
};

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_HOST_H
