// durableflow/core/engine.h
#ifndef DURABLEFLOW_CORE_ENGINE_H
#define DURABLEFLOW_CORE_ENGINE_H

#include "core/types/workflow.h"
#include "modules/agent/agent_ports.h"
#include "modules/config/engine_config.h"
#include "modules/executor/node_executor.h"
#include "modules/persistence/conversation_store.h"
#include "modules/persistence/execution_store.h"
#include "modules/substrate/execution_host.h"
#include "modules/trace/event_sink.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace durableflow {

// Outbound ports the activities call. Null members get the in-process
// defaults: NodeRegistry, ToolRegistry, in-memory stores, LoggingEventSink.
// There is no default LLM client; callLLM fails with LlmError without one.
struct EnginePorts {
    std::shared_ptr<NodeExecutor> node_executor;
    std::shared_ptr<AgentConfigProvider> agent_configs;
    std::shared_ptr<LlmClient> llm;
    std::shared_ptr<ToolExecutor> tools;
    std::shared_ptr<ConversationStore> conversations;
    std::shared_ptr<ExecutionStore> executions;
    std::shared_ptr<EventSink> events;
};

// 引擎门面：持有宿主、端口与配置，注册三种 orchestration 及其 activities。
// 不使用单例，每个实例相互独立。
class DurableFlowEngine {
public:
    // A null history store is replaced by the one config.history names
    DurableFlowEngine(EngineConfig config, EnginePorts ports, std::shared_ptr<HistoryStore> history = nullptr);
    ~DurableFlowEngine();

    DurableFlowEngine(const DurableFlowEngine&) = delete;
    DurableFlowEngine& operator=(const DurableFlowEngine&) = delete;

    // Loads engine.yaml (defaults when missing) and initializes logging from it
    static std::unique_ptr<DurableFlowEngine> from_config_file(const std::string& config_path, EnginePorts ports);

    // Validates the definition, creates the execution record and starts the
    // DAG orchestration. Throws ConfigError for an invalid definition.
    void start_workflow(const std::string& execution_id,
                        const WorkflowDefinition& definition,
                        const nlohmann::json& inputs = nlohmann::json::object());

    void start_agent(const std::string& execution_id,
                     const std::string& agent_id,
                     const std::string& user_id,
                     const std::optional<std::string>& initial_message = std::nullopt);

    // request: {nodeId, prompt, inputType?, validation?, timeoutMs?}
    void start_user_input(const std::string& execution_id, const nlohmann::json& request);

    void signal(const std::string& execution_id, const std::string& signal_name, const nlohmann::json& payload);
    nlohmann::json query(const std::string& execution_id, const std::string& query_name);

    // The host outcome: {"status": "completed", "result"} or {"status": "failed", "error", "kind"}
    std::optional<nlohmann::json> wait_result(const std::string& execution_id,
                                              std::chrono::milliseconds timeout = kNoTimeout);

    std::vector<std::string> resume_pending();
    void stop();

    const EngineConfig& config() const { return config_; }
    const EnginePorts& ports() const { return ports_; }
    ExecutionHost& host() { return *host_; }

private:
    EngineConfig config_;
    EnginePorts ports_;
    std::unique_ptr<ExecutionHost> host_;

    void register_workflows();
    void register_activities();
};

} // namespace durableflow

#endif // DURABLEFLOW_CORE_ENGINE_H
