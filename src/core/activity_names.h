// core/activity_names.h
#ifndef DURABLEFLOW_CORE_ACTIVITY_NAMES_H
#define DURABLEFLOW_CORE_ACTIVITY_NAMES_H

// Activities the orchestrations call through ExecutionSession::execute_activity.
// The engine registers one implementation per name on its host.
namespace durableflow::activities {

inline constexpr const char* kExecuteNode = "executeNode";                   // {nodeId, nodeType, config, context}
inline constexpr const char* kGetAgentConfig = "getAgentConfig";             // {agentId, userId}
inline constexpr const char* kCallLlm = "callLLM";                           // LlmRequest
inline constexpr const char* kExecuteToolCall = "executeToolCall";           // {executionId, toolCall, availableTools, userId, agentId}
inline constexpr const char* kSaveConversationIncremental = "saveConversationIncremental"; // {executionId, messages}
inline constexpr const char* kSaveCheckpoint = "saveCheckpoint";             // {executionId, checkpoint}
inline constexpr const char* kEmitEvent = "emitEvent";                       // {type, payload}
inline constexpr const char* kUpdateExecutionStatus = "updateExecutionStatus"; // {executionId, status, outputs?, error?}

} // namespace durableflow::activities

#endif // DURABLEFLOW_CORE_ACTIVITY_NAMES_H
