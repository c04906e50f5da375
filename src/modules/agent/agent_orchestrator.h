// modules/agent/agent_orchestrator.h
#ifndef DURABLEFLOW_MODULES_AGENT_AGENT_ORCHESTRATOR_H
#define DURABLEFLOW_MODULES_AGENT_AGENT_ORCHESTRATOR_H

#include "modules/agent/agent_ports.h"
#include "modules/agent/conversation_state.h"
#include "modules/config/engine_config.h"
#include "modules/signal/signal_wait.h"
#include "modules/substrate/execution_session.h"
#include <nlohmann/json.hpp>
#include <string>

namespace durableflow {

inline constexpr const char* kAgentWorkflowType = "agentOrchestrator";
inline constexpr const char* kUserMessageSignal = "userMessage";
inline constexpr const char* kHasReceivedUserMessageQuery = "hasReceivedInput";

struct AgentOrchestratorOptions {
    ActivityOptions agent = ActivityOptions::standard();
    ActivityOptions events = ActivityOptions::fire_and_forget();
    AgentSettings settings;
};

// ReAct 循环：LLM 推理 -> 工具调用 -> 再推理，直到模型给出最终回答。
// 每 continue_as_new_threshold 轮把压缩后的对话带入新 run，限制历史长度。
//
// input:  {executionId, agentId, userId, initialMessage?, checkpoint?, iterations?}
// result: {success, finalMessage?, error?, iterations, conversation}
class AgentOrchestrator {
public:
    AgentOrchestrator(ExecutionSession& session, AgentOrchestratorOptions options);

    nlohmann::json run(const nlohmann::json& input);

private:
    ExecutionSession& session_;
    AgentOrchestratorOptions options_;

    std::string execution_id_;
    std::string agent_id_;
    std::string user_id_;
    AgentConfig agent_;
    ConversationState state_;

    AgentConfig load_agent();
    LlmResponse call_llm();
    void run_tool_calls(const std::vector<ToolCall>& calls, int iteration);
    void persist_unsaved();
    void save_checkpoint(const Checkpoint& checkpoint);
    [[noreturn]] void restart(SignalWait& user_input, int iteration);

    nlohmann::json finish(int iterations, const std::string& final_message);
    nlohmann::json fail(int iterations, const std::string& error);

    ConversationMessage make_message(std::string id, MessageRole role, std::string content);
    void emit(const char* event_type, nlohmann::json payload);
    int64_t now_ms();
};

// WorkflowFunction entry point for the host
nlohmann::json run_agent_workflow(ExecutionSession& session, const nlohmann::json& input,
                                  const AgentOrchestratorOptions& options);

} // namespace durableflow

#endif // DURABLEFLOW_MODULES_AGENT_AGENT_ORCHESTRATOR_H
