// modules/substrate/execution_session.h
#ifndef DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_SESSION_H
#define DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_SESSION_H

#include "modules/substrate/retry_policy.h"
#include <nlohmann/json.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace durableflow {

using SignalHandler = std::function<void(const nlohmann::json&)>;
using QueryHandler = std::function<nlohmann::json()>;

inline constexpr std::chrono::milliseconds kNoTimeout = std::chrono::milliseconds::max();

// Thrown by continue_as_new(). Deliberately not derived from std::exception:
// orchestration code that catches std::exception must not stop the restart.
struct ContinueAsNew {
    nlohmann::json input;
};

// Thrown out of a suspended run when its host shuts down. The run stays open
// in the history store and is resumed by the next host.
struct ExecutionEvicted {};

// ExecutionSession 是一次 orchestration run 看到的全部宿主能力。
// 所有有副作用的操作都必须经过它，才能在崩溃恢复后按历史重放。
class ExecutionSession {
public:
    virtual ~ExecutionSession() = default;

    virtual const std::string& execution_id() const = 0;
    virtual int run_number() const = 0;
    // True while commands are being answered from recorded history
    virtual bool is_replaying() const = 0;

    // Retried side-effect invocation. Throws ActivityFailure once the retry
    // policy is exhausted; a completed result is never re-executed on replay.
    virtual nlohmann::json execute_activity(const std::string& activity_name,
                                            const ActivityOptions& options,
                                            const nlohmann::json& input) = 0;

    // Durable timer
    virtual void sleep(std::chrono::milliseconds duration) = 0;

    // Suspends until predicate() holds or the timeout elapses. Signal handlers
    // run while suspended. Returns false on timeout.
    virtual bool await_condition(const std::function<bool()>& predicate,
                                 std::chrono::milliseconds timeout) = 0;

    virtual void set_signal_handler(const std::string& signal_name, SignalHandler handler) = 0;
    // Later signals of this name stay buffered until a handler is set again
    virtual void remove_signal_handler(const std::string& signal_name) = 0;
    virtual void set_query_handler(const std::string& query_name, QueryHandler handler) = 0;
    virtual void remove_query_handler(const std::string& query_name) = 0;

    // Ends this run and starts a new one under the same execution id
    [[noreturn]] virtual void continue_as_new(nlohmann::json input) = 0;

    // Recorded wall clock; identical on replay
    virtual std::chrono::system_clock::time_point now() = 0;
};

using WorkflowFunction = std::function<nlohmann::json(ExecutionSession&, const nlohmann::json&)>;

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SUBSTRATE_EXECUTION_SESSION_H
