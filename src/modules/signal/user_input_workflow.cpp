// modules/signal/user_input_workflow.cpp
#include "modules/signal/user_input_workflow.h"
#include "modules/signal/signal_wait.h"
#include "common/errors.h"
#include "common/logging/logger.h"

namespace durableflow {

nlohmann::json run_user_input_workflow(ExecutionSession& session, const nlohmann::json& input) {
    if (!input.is_object()) {
        throw ConfigError("userInput workflow expects an object input");
    }
    const std::string execution_id = input.value("executionId", session.execution_id());
    const std::string node_id = input.value("nodeId", std::string());
    const std::string prompt = input.value("prompt", std::string());
    const int64_t timeout_ms = input.value("timeoutMs", int64_t{300000});
    if (timeout_ms < 0) {
        throw ConfigError("userInput timeoutMs must not be negative");
    }

    if (!session.is_replaying()) {
        DF_LOG_INFO("[UserInput] Waiting for user input: {} - {} - \"{}\"", execution_id, node_id, prompt);
    }

    SignalWait waiter(session, kUserInputSignal, kHasReceivedInputQuery);
    nlohmann::json outcome = waiter.wait(std::chrono::milliseconds{timeout_ms});

    if (!outcome.value("received", false)) {
        return nlohmann::json{
            {"success", false},
            {"timedOut", true},
            {"error", "User input timed out after " + std::to_string(timeout_ms) + "ms"}
        };
    }

    if (!session.is_replaying()) {
        DF_LOG_INFO("[UserInput] Received user input for {} - {}", execution_id, node_id);
    }
    return nlohmann::json{{"success", true}, {"userResponse", waiter.consume()}};
}

} // namespace durableflow
