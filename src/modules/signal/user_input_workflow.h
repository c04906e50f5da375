// modules/signal/user_input_workflow.h
#ifndef DURABLEFLOW_MODULES_SIGNAL_USER_INPUT_WORKFLOW_H
#define DURABLEFLOW_MODULES_SIGNAL_USER_INPUT_WORKFLOW_H

#include "modules/substrate/execution_session.h"
#include <nlohmann/json.hpp>

namespace durableflow {

inline constexpr const char* kUserInputWorkflowType = "userInput";
inline constexpr const char* kUserInputSignal = "userInput";
inline constexpr const char* kHasReceivedInputQuery = "hasReceivedInput";

// Standalone pause-for-a-human orchestration.
// input:  {executionId, nodeId, prompt, inputType?, validation?, timeoutMs = 300000}
// result: {success: true, userResponse} or {success: false, timedOut: true, error}
nlohmann::json run_user_input_workflow(ExecutionSession& session, const nlohmann::json& input);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_SIGNAL_USER_INPUT_WORKFLOW_H
